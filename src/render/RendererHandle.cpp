// SPDX-License-Identifier: Apache-2.0
#include "RendererHandle.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace manzai
{

namespace
{
    constexpr auto SnapEpsilon = 1e-3f;
    constexpr auto BokeSwayPeriodMs = 2400.0;
} // namespace

RendererHandle::RendererHandle(Performer performer,
                               std::string modelRef,
                               CharacterModel model,
                               ResourceId resourceId,
                               RendererSettings settings):
    _performer(performer),
    _modelRef(std::move(modelRef)),
    _model(std::move(model)),
    _resourceId(resourceId),
    _settings(settings)
{
    for (auto const& [id, range]: _model.parameters)
        _values.emplace(id, range.defaultValue);
    _displayedOpenness = currentOpenness();
}

auto RendererHandle::resolveName(std::string_view name) const -> std::string_view
{
    if (name == MouthOpenAlias)
        return _model.mouthParameter;
    return name;
}

auto RendererHandle::setParameter(std::string_view name, float value) -> bool
{
    auto const id = resolveName(name);
    auto const range = _model.parameters.find(id);
    auto const it = _values.find(id);
    if (range == _model.parameters.end() || it == _values.end())
        return false;

    auto const min = range->second.min;
    auto const max = range->second.max;
    if (name == MouthOpenAlias)
        value = min + std::clamp(value, 0.0f, 1.0f) * (max - min);

    auto const clamped = std::clamp(value, min, max);
    if (it->second != clamped)
    {
        it->second = clamped;
        _dirty = true;
    }
    return true;
}

auto RendererHandle::parameter(std::string_view name) const -> std::optional<float>
{
    auto const it = _values.find(resolveName(name));
    if (it == _values.end())
        return std::nullopt;
    return it->second;
}

auto RendererHandle::normalized(std::string_view id) const -> float
{
    auto const range = _model.parameters.find(id);
    auto const it = _values.find(id);
    if (range == _model.parameters.end() || it == _values.end())
        return 0.0f;

    auto const span = range->second.max - range->second.min;
    return span > 0.0f ? std::clamp((it->second - range->second.min) / span, 0.0f, 1.0f) : 0.0f;
}

auto RendererHandle::currentOpenness() const -> float
{
    return normalized(_model.mouthParameter);
}

void RendererHandle::tick(double deltaMs)
{
    _timeMs += std::max(0.0, deltaMs);

    auto const idle = _model.idle;
    if (idle.breathPeriodMs > 0.0)
    {
        auto const phase = std::fmod(_timeMs, idle.breathPeriodMs) / idle.breathPeriodMs;
        auto const breath = 0.5 - 0.5 * std::cos(2.0 * std::numbers::pi * phase);
        static_cast<void>(setParameter(param::Breath, static_cast<float>(breath)));
    }

    if (idle.blinkIntervalMs > 0.0)
    {
        auto const sinceBlink = std::fmod(_timeMs, idle.blinkIntervalMs);
        auto const blinking = sinceBlink >= idle.blinkIntervalMs - idle.blinkDurationMs;
        static_cast<void>(setParameter(param::EyeOpen, blinking ? 0.0f : 1.0f));
    }

    auto const target = currentOpenness();
    auto next = target;
    if (_settings.smoothingMs > 0.0)
    {
        auto const alpha = static_cast<float>(1.0 - std::exp(-deltaMs / _settings.smoothingMs));
        next = _displayedOpenness + (target - _displayedOpenness) * alpha;
        if (std::abs(target - next) < SnapEpsilon)
            next = target;
    }

    if (next != _displayedOpenness)
    {
        _displayedOpenness = next;
        _dirty = true;
    }
}

auto RendererHandle::pose() const -> CharacterPose
{
    return CharacterPose {
        .performer = _performer,
        .side = side(),
        .mouthOpen = _displayedOpenness,
        .eyeOpen = normalized(param::EyeOpen),
        .breath = normalized(param::Breath),
        .offset = idleOffset(_timeMs),
    };
}

// --- TsukkomiRenderer ---

TsukkomiRenderer::TsukkomiRenderer(std::string modelRef,
                                   CharacterModel model,
                                   ResourceId resourceId,
                                   RendererSettings settings):
    RendererHandle(Performer::Tsukkomi, std::move(modelRef), std::move(model), resourceId, settings)
{
}

auto TsukkomiRenderer::idleOffset(double /*timeMs*/) const -> int
{
    return 0;
}

// --- BokeRenderer ---

BokeRenderer::BokeRenderer(std::string modelRef, CharacterModel model, ResourceId resourceId, RendererSettings settings):
    RendererHandle(Performer::Boke, std::move(modelRef), std::move(model), resourceId, settings)
{
}

auto BokeRenderer::idleOffset(double timeMs) const -> int
{
    auto const phase = std::fmod(timeMs, BokeSwayPeriodMs) / BokeSwayPeriodMs;
    return static_cast<int>(std::lround(std::sin(2.0 * std::numbers::pi * phase)));
}

auto makeRenderer(Performer performer,
                  std::string modelRef,
                  CharacterModel model,
                  ResourceId resourceId,
                  RendererSettings settings) -> std::unique_ptr<RendererHandle>
{
    switch (performer)
    {
        case Performer::Tsukkomi:
            return std::make_unique<TsukkomiRenderer>(std::move(modelRef), std::move(model), resourceId, settings);
        case Performer::Boke:
            return std::make_unique<BokeRenderer>(std::move(modelRef), std::move(model), resourceId, settings);
    }
    return nullptr;
}

} // namespace manzai
