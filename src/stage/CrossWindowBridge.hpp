// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stage/DisplaySurface.hpp>
#include <stage/MirrorProtocol.hpp>
#include <stage/PlaybackSequencer.hpp>

#include <memory>
#include <string>

namespace manzai
{

/// @brief Mirrors the stage into an optional secondary display.
///
/// The bridge never owns the display: it keeps a weak reference and treats every failure as a
/// silent disconnect. The last known state is maintained whether or not a display is attached,
/// so that a display attaching mid-performance starts from a complete snapshot.
class CrossWindowBridge
{
  public:
    CrossWindowBridge() = default;
    ~CrossWindowBridge();

    CrossWindowBridge(const CrossWindowBridge&) = delete;
    CrossWindowBridge& operator=(const CrossWindowBridge&) = delete;

    /// @brief Starts mirroring into a display and sends it a full snapshot.
    ///
    /// A previously attached display is detached first.
    void attach(std::shared_ptr<DisplaySurface> surface);

    /// @brief Records a progress event and forwards it to the display, if connected.
    void relay(const ProgressEvent& delta);

    /// @brief Records the model reference of a role and re-sends the snapshot, if connected.
    void setModelRef(Performer role, std::string modelRef);

    /// @brief Stops mirroring. Safe to call repeatedly.
    void detach();

    [[nodiscard]] auto isConnected() const noexcept -> bool { return _connected; }
    [[nodiscard]] auto lastKnownState() const noexcept -> const mirror::MirrorState& { return _lastKnownState; }

  private:
    void send(const nlohmann::json& message);
    void disconnect(std::string_view reason);

    std::weak_ptr<DisplaySurface> _surface;
    mirror::MirrorState _lastKnownState;
    bool _connected = false;
    std::shared_ptr<bool> _alive = std::make_shared<bool>(true);
};

} // namespace manzai
