// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stage/DisplaySurface.hpp>

#include <memory>
#include <string>
#include <vector>

namespace manzai
{

/// @brief Configuration for spawning a display process.
struct ProcessDisplayConfig
{
    std::string command = "manzai-display";
    std::vector<std::string> args;
};

/// @brief Display surface backed by a child process reading messages from its stdin.
///
/// Messages are written as newline-delimited JSON. Writes never block: a message that does not
/// fit into the pipe is dropped. When the process goes away the next write fails with a broken
/// pipe, which closes the surface and fires the close handler.
class ProcessDisplaySurface: public DisplaySurface
{
  public:
    ProcessDisplaySurface();
    ~ProcessDisplaySurface() override;

    ProcessDisplaySurface(const ProcessDisplaySurface&) = delete;
    ProcessDisplaySurface& operator=(const ProcessDisplaySurface&) = delete;

    /// @brief Spawns the display process.
    /// @return Success or an IoError.
    [[nodiscard]] auto start(const ProcessDisplayConfig& config) -> VoidResult;

    [[nodiscard]] auto postMessage(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto isOpen() const -> bool override;
    void setCloseHandler(CloseHandler handler) override;
    void close() override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;

    void closedByPeer();
};

} // namespace manzai
