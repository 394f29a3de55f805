// SPDX-License-Identifier: Apache-2.0
#include <core/EventLoop.hpp>
#include <core/Log.hpp>
#include <render/RenderResourceManager.hpp>
#include <render/TerminalSurface.hpp>
#include <stage/MirrorDisplay.hpp>

#include <CLI/CLI.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <functional>
#include <string>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace
{
    std::atomic<bool> gTerminate { false }; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void terminateHandler(int /*sig*/)
    {
        gTerminate.store(true);
    }

    constexpr auto TerminateCheckMs = 50.0;
    constexpr auto ReaderPollMs = 100;
} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "manzai-display: mirrors a manzai-stage performance read from stdin" };

    auto outputPath = std::string {};
    auto frameRate = 60;
    auto smoothingMs = 60.0;
    auto verbose = false;

    app.add_option("-o,--output", outputPath, "Terminal device to draw on (default: stdout)");
    app.add_option("--frame-rate", frameRate, "Frames per second")->check(CLI::Range(1, 240));
    app.add_option("--smoothing-ms", smoothingMs, "Mouth smoothing time constant");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    manzai::log::setLevel(verbose ? manzai::log::Level::Debug : manzai::log::Level::Warning);

    auto fd = STDOUT_FILENO;
    if (!outputPath.empty())
    {
        fd = ::open(outputPath.c_str(), O_WRONLY | O_NOCTTY | O_CLOEXEC);
        if (fd < 0)
        {
            manzai::log::error("Cannot open {}: {}", outputPath, std::strerror(errno));
            return 1;
        }
    }

    auto loop = manzai::EventLoop {};
    auto surface = manzai::TerminalSurface(loop, fd);
    if (auto result = surface.initialize(); !result)
    {
        manzai::log::error("Display unavailable: {}", result.error());
        return 1;
    }

    auto renderer =
        manzai::RenderResourceManager(loop, surface, manzai::RendererSettings { .smoothingMs = smoothingMs });
    auto display = manzai::MirrorDisplay(renderer);

    // The stage closing its end of the pipe ends the display.
    auto reader = std::jthread([&loop, &display](std::stop_token const& token) {
        auto buffer = std::string {};
        auto chunk = std::array<char, 4096> {};
        while (!token.stop_requested())
        {
            auto pfd = pollfd { .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, ReaderPollMs);
            if (ready == 0 || (ready < 0 && errno == EINTR))
                continue;

            auto const n = ready < 0 ? -1 : ::read(STDIN_FILENO, chunk.data(), chunk.size());
            if (n <= 0)
                break;
            buffer.append(chunk.data(), static_cast<std::size_t>(n));

            for (auto pos = buffer.find('\n'); pos != std::string::npos; pos = buffer.find('\n'))
            {
                loop.post([&display, line = buffer.substr(0, pos)] {
                    if (auto result = display.handleLine(line); !result)
                        manzai::log::debug("Ignoring mirror message: {}", result.error());
                });
                buffer.erase(0, pos + 1);
            }
        }
        loop.quit();
    });

    // The stage terminates the display when it detaches; the terminal must still be restored.
    struct sigaction sa {};
    sa.sa_handler = terminateHandler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    auto checkTerminate = std::function<void()> {};
    checkTerminate = [&] {
        if (gTerminate.load())
        {
            loop.quit();
            return;
        }
        static_cast<void>(loop.setTimeout(TerminateCheckMs, checkTerminate));
    };
    checkTerminate();

    auto renderFrame = std::function<void(double)> {};
    renderFrame = [&](double deltaMs) {
        renderer.tick(deltaMs);
        renderer.draw();
        static_cast<void>(loop.requestFrame(renderFrame));
    };
    static_cast<void>(loop.requestFrame(renderFrame));

    loop.run(std::chrono::milliseconds(1000 / frameRate));

    reader.request_stop();
    reader.join();

    renderer.releaseAll();
    surface.shutdown();
    if (fd != STDOUT_FILENO)
        ::close(fd);
    return 0;
}
