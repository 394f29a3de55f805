// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <functional>

namespace manzai
{

/// @brief A secondary display the stage can mirror itself into.
///
/// The surface is opened and closed independently of the stage. Messages flow one way, from
/// the stage to the surface; the only notification flowing back is the close handler, which
/// fires on the event loop thread when the surface goes away.
class DisplaySurface
{
  public:
    using CloseHandler = std::function<void()>;

    virtual ~DisplaySurface() = default;

    /// @brief Sends one message to the surface without waiting for it to be processed.
    /// @return Success, or MirrorDisconnected if the surface is gone.
    [[nodiscard]] virtual auto postMessage(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Returns true until the surface has been closed.
    [[nodiscard]] virtual auto isOpen() const -> bool = 0;

    /// @brief Installs the handler invoked once when the surface closes (empty to remove).
    virtual void setCloseHandler(CloseHandler handler) = 0;

    /// @brief Closes the surface. Safe to call repeatedly.
    virtual void close() = 0;
};

} // namespace manzai
