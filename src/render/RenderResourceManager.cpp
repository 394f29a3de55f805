// SPDX-License-Identifier: Apache-2.0
#include "RenderResourceManager.hpp"

#include <core/Log.hpp>

#include <format>

namespace manzai
{

RenderResourceManager::RenderResourceManager(EventLoop& loop,
                                             RenderSurface& surface,
                                             RendererSettings settings,
                                             ModelLoader loader):
    _loop(loop), _surface(surface), _settings(settings), _loader(std::move(loader))
{
    if (!_loader)
        _loader = [](std::string_view modelRef) { return loadCharacterModel(modelRef); };

    if (!_surface.hasContext())
        _state = RenderState::ContextLost;

    _surface.setContextListener([this](ContextEvent event) { onContextEvent(event); });
}

RenderResourceManager::~RenderResourceManager()
{
    _surface.setContextListener({});
    releaseAll();
}

void RenderResourceManager::loadModel(Performer role, std::string modelRef, LoadCallback callback)
{
    auto const index = performerIndex(role);
    auto const generation = ++_generations[index];
    _cachedRefs[index] = modelRef;

    log::debug("Loading model '{}' for {}", modelRef, performerToString(role));

    _loop.post([this,
                alive = std::weak_ptr<bool>(_alive),
                role,
                generation,
                modelRef = std::move(modelRef),
                callback = std::move(callback)]() mutable {
        if (alive.expired())
            return;
        completeLoad(role, generation, std::move(modelRef), std::move(callback));
    });
}

void RenderResourceManager::completeLoad(Performer role,
                                         std::uint64_t generation,
                                         std::string modelRef,
                                         LoadCallback callback)
{
    auto const deliver = [&](Result<RendererInfo> result) {
        if (!result)
            log::warning("Loading model '{}' for {} failed: {}", modelRef, performerToString(role), result.error());
        if (callback)
            callback(std::move(result));
    };

    auto const index = performerIndex(role);
    if (generation != _generations[index])
    {
        deliver(makeError(ErrorCode::InvalidState,
                          std::format("Load of '{}' was superseded", modelRef)));
        return;
    }

    freeHandle(role);

    if (_state == RenderState::ContextLost || !_surface.hasContext())
    {
        deliver(makeError(ErrorCode::DeviceUnavailable, "No rendering context available"));
        return;
    }

    auto model = _loader(modelRef);
    if (!model)
    {
        _cachedRefs[index].reset();
        deliver(std::unexpected(model.error()));
        return;
    }

    auto resource = _surface.allocate(*model, role);
    if (!resource)
    {
        deliver(std::unexpected(resource.error()));
        return;
    }

    auto info = RendererInfo { .role = role, .modelRef = modelRef, .name = model->name };
    _handles[index] = makeRenderer(role, modelRef, std::move(*model), *resource, _settings);

    log::info("Loaded model '{}' ({}) for {}", info.name, info.modelRef, performerToString(role));
    deliver(std::move(info));
}

void RenderResourceManager::setParameter(Performer role, std::string_view name, float value)
{
    if (_state != RenderState::Ready)
        return;

    auto& handle = _handles[performerIndex(role)];
    if (!handle)
        return;

    if (!handle->setParameter(name, value))
        log::trace("Model of {} has no parameter '{}'", performerToString(role), name);
}

void RenderResourceManager::tick(double deltaMs)
{
    if (_state != RenderState::Ready)
        return;

    for (auto& handle: _handles)
    {
        if (handle)
            handle->tick(deltaMs);
    }
}

void RenderResourceManager::draw()
{
    if (_state != RenderState::Ready)
        return;

    _surface.beginFrame();
    for (auto& handle: _handles)
    {
        if (!handle)
            continue;
        _surface.drawCharacter(handle->resourceId(), handle->pose());
        handle->clearDirty();
    }
    _surface.endFrame();
}

void RenderResourceManager::release(Performer role)
{
    auto const index = performerIndex(role);
    ++_generations[index];
    _cachedRefs[index].reset();
    freeHandle(role);
}

void RenderResourceManager::releaseAll()
{
    for (auto const role: AllPerformers)
        release(role);
}

void RenderResourceManager::freeHandle(Performer role)
{
    auto& handle = _handles[performerIndex(role)];
    if (!handle)
        return;

    if (_state == RenderState::Ready)
    {
        if (auto result = _surface.free(handle->resourceId()); !result)
            log::warning("Releasing renderer of {} failed: {}", performerToString(role), result.error());
    }
    handle.reset();
}

auto RenderResourceManager::isLoaded(Performer role) const noexcept -> bool
{
    return _handles[performerIndex(role)] != nullptr;
}

auto RenderResourceManager::openness(Performer role) const -> float
{
    auto const& handle = _handles[performerIndex(role)];
    return handle ? handle->currentOpenness() : 0.0f;
}

auto RenderResourceManager::modelRef(Performer role) const -> std::optional<std::string>
{
    return _cachedRefs[performerIndex(role)];
}

auto RenderResourceManager::renderer(Performer role) const noexcept -> const RendererHandle*
{
    return _handles[performerIndex(role)].get();
}

void RenderResourceManager::onContextEvent(ContextEvent event)
{
    switch (event)
    {
        case ContextEvent::Lost:
            if (_state == RenderState::ContextLost)
                return;
            log::warning("Rendering context lost");
            _state = RenderState::ContextLost;
            // Surface resources died with the context; only the CPU side is left to drop.
            for (auto& handle: _handles)
                handle.reset();
            break;

        case ContextEvent::Restored:
            if (_state == RenderState::Ready)
                return;
            log::info("Rendering context restored");
            _state = RenderState::Ready;
            for (auto const role: AllPerformers)
            {
                if (auto const& ref = _cachedRefs[performerIndex(role)])
                    loadModel(role, *ref);
            }
            break;
    }
}

} // namespace manzai
