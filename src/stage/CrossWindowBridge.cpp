// SPDX-License-Identifier: Apache-2.0
#include "CrossWindowBridge.hpp"

#include <core/Log.hpp>

namespace manzai
{

CrossWindowBridge::~CrossWindowBridge()
{
    detach();
}

void CrossWindowBridge::attach(std::shared_ptr<DisplaySurface> surface)
{
    detach();
    if (!surface || !surface->isOpen())
    {
        log::debug("Mirror display is not open, not attaching");
        return;
    }

    _surface = surface;
    _connected = true;
    surface->setCloseHandler([this, alive = std::weak_ptr<bool>(_alive)] {
        if (alive.expired())
            return;
        log::info("Mirror display closed");
        detach();
    });

    log::info("Mirror display attached");
    send(mirror::makeSnapshot(_lastKnownState));
}

void CrossWindowBridge::relay(const ProgressEvent& delta)
{
    mirror::apply(_lastKnownState, delta);
    if (_connected)
        send(mirror::makeStateUpdate(delta));
}

void CrossWindowBridge::setModelRef(Performer role, std::string modelRef)
{
    _lastKnownState.modelRefs[performerIndex(role)] = std::move(modelRef);
    if (_connected)
        send(mirror::makeSnapshot(_lastKnownState));
}

void CrossWindowBridge::detach()
{
    _connected = false;
    if (auto surface = _surface.lock())
        surface->setCloseHandler({});
    _surface.reset();
}

void CrossWindowBridge::send(const nlohmann::json& message)
{
    auto surface = _surface.lock();
    if (!surface || !surface->isOpen())
    {
        disconnect("display is gone");
        return;
    }

    if (auto result = surface->postMessage(message); !result)
        disconnect(result.error().message);
}

void CrossWindowBridge::disconnect(std::string_view reason)
{
    // Mirror failures never reach the stage; the channel just goes quiet.
    if (_connected)
        log::debug("Mirror disconnected: {}", reason);
    _connected = false;
}

} // namespace manzai
