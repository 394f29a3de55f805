// SPDX-License-Identifier: Apache-2.0
#include "ProcessDisplaySurface.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace manzai
{

struct ProcessDisplaySurface::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    bool open = false;
    std::size_t dropped = 0;
    CloseHandler closeHandler;
};

ProcessDisplaySurface::ProcessDisplaySurface(): _impl(std::make_unique<Impl>())
{
}

ProcessDisplaySurface::~ProcessDisplaySurface()
{
    _impl->closeHandler = {};
    close();
}

auto ProcessDisplaySurface::start(const ProcessDisplayConfig& config) -> VoidResult
{
    if (_impl->open)
        return makeError(ErrorCode::InvalidState, "Display process already running");

    // A vanished display must surface as EPIPE, not kill the stage.
    signal(SIGPIPE, SIG_IGN);

    int stdinPipe[2];
    if (pipe(stdinPipe) != 0)
        return makeError(ErrorCode::IoError, std::format("Failed to create pipe: {}", std::strerror(errno)));

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_addclose(&actions, stdinPipe[1]);

    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::IoError,
                         std::format("Failed to spawn display '{}': {}", config.command, std::strerror(status)));
    }

    auto const flags = fcntl(stdinPipe[1], F_GETFL);
    fcntl(stdinPipe[1], F_SETFL, flags | O_NONBLOCK);
    fcntl(stdinPipe[1], F_SETFD, FD_CLOEXEC);

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->open = true;
    log::info("Display process started: {} (pid {})", config.command, pid);
    return {};
}

auto ProcessDisplaySurface::postMessage(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->open)
        return makeError(ErrorCode::MirrorDisconnected, "Display process is not running");

    auto const data = json::dumpLine(message) + "\n";

    auto const written = ::write(_impl->stdinWrite, data.data(), data.size());
    if (written < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            ++_impl->dropped;
            log::trace("Display is not keeping up, dropped message ({} so far)", _impl->dropped);
            return {};
        }

        auto const reason = std::string(std::strerror(errno));
        closedByPeer();
        return makeError(ErrorCode::MirrorDisconnected, std::format("Display pipe closed: {}", reason));
    }

    // A partial line would corrupt the stream.
    if (static_cast<std::size_t>(written) != data.size())
    {
        closedByPeer();
        return makeError(ErrorCode::MirrorDisconnected, "Display pipe accepted a partial message");
    }

    return {};
}

auto ProcessDisplaySurface::isOpen() const -> bool
{
    return _impl->open;
}

void ProcessDisplaySurface::setCloseHandler(CloseHandler handler)
{
    _impl->closeHandler = std::move(handler);
}

void ProcessDisplaySurface::close()
{
    if (_impl->stdinWrite >= 0)
    {
        ::close(_impl->stdinWrite);
        _impl->stdinWrite = -1;
    }
    if (_impl->childPid > 0)
    {
        kill(_impl->childPid, SIGTERM);
        int status;
        waitpid(_impl->childPid, &status, 0);
        _impl->childPid = -1;
    }

    if (_impl->open)
        log::debug("Display process closed");
    _impl->open = false;
}

void ProcessDisplaySurface::closedByPeer()
{
    if (!_impl->open)
        return;

    close();
    if (auto handler = std::move(_impl->closeHandler))
        handler();
}

} // namespace manzai
