// SPDX-License-Identifier: Apache-2.0
#include "EventLoop.hpp"

#include <algorithm>
#include <thread>

namespace manzai
{

void EventLoop::post(Task task)
{
    auto lock = std::lock_guard(_postMutex);
    _posted.push_back(std::move(task));
}

auto EventLoop::setTimeout(double delayMs, Task task) -> TaskId
{
    auto const id = nextId();
    auto const deadline = _now + std::max(0.0, delayMs);
    _timers.emplace(std::pair { deadline, id }, Timer { .id = id, .task = std::move(task) });
    return id;
}

void EventLoop::clearTimeout(TaskId id)
{
    if (id == 0)
        return;

    auto const it = std::ranges::find_if(_timers, [id](auto const& entry) { return entry.second.id == id; });
    if (it != _timers.end())
        _timers.erase(it);
}

auto EventLoop::requestFrame(FrameCallback callback) -> TaskId
{
    auto const id = nextId();
    _frames.emplace_back(id, std::move(callback));
    return id;
}

void EventLoop::cancelFrame(TaskId id)
{
    if (id == 0)
        return;

    std::erase_if(_frames, [id](auto const& entry) { return entry.first == id; });

    for (auto& [runningId, callback]: _runningFrames)
    {
        if (runningId == id)
            callback = nullptr;
    }
}

void EventLoop::step(double deltaMs)
{
    _now += std::max(0.0, deltaMs);
    drainPosted();
    runDueTimers();
    runFrames(deltaMs);
}

void EventLoop::advance(double totalMs, double frameMs)
{
    auto remaining = totalMs;
    while (remaining > 0.0)
    {
        auto const delta = std::min(frameMs, remaining);
        step(delta);
        remaining -= delta;
    }
}

void EventLoop::run(std::chrono::milliseconds frameInterval)
{
    using Clock = std::chrono::steady_clock;

    auto lastTick = Clock::now();
    while (true)
    {
        {
            auto lock = std::lock_guard(_postMutex);
            if (_quitRequested)
                break;
        }

        auto const frameStart = Clock::now();
        auto const deltaMs = std::chrono::duration<double, std::milli>(frameStart - lastTick).count();
        lastTick = frameStart;

        step(deltaMs);

        auto const nextFrame = frameStart + frameInterval;
        if (Clock::now() < nextFrame)
            std::this_thread::sleep_until(nextFrame);
    }
}

void EventLoop::quit()
{
    auto lock = std::lock_guard(_postMutex);
    _quitRequested = true;
}

auto EventLoop::now() const noexcept -> double
{
    return _now;
}

auto EventLoop::hasPendingWork() const -> bool
{
    if (!_timers.empty() || !_frames.empty())
        return true;

    auto lock = std::lock_guard(_postMutex);
    return !_posted.empty();
}

void EventLoop::drainPosted()
{
    auto batch = std::deque<Task> {};
    {
        auto lock = std::lock_guard(_postMutex);
        batch.swap(_posted);
    }

    for (auto& task: batch)
        task();
}

void EventLoop::runDueTimers()
{
    // Timers scheduled while timers run fire on a later step, even with zero delay.
    auto const horizon = _now;
    auto const lastIdBefore = _lastId;

    while (true)
    {
        auto const it = std::ranges::find_if(_timers, [&](auto const& entry) {
            return entry.first.first > horizon || entry.first.second <= lastIdBefore;
        });
        if (it == _timers.end() || it->first.first > horizon)
            break;

        auto task = std::move(it->second.task);
        _timers.erase(it);
        task();
    }
}

void EventLoop::runFrames(double deltaMs)
{
    // Callbacks requested while frames run belong to the next frame.
    _runningFrames = std::move(_frames);
    _frames.clear();

    for (auto i = std::size_t { 0 }; i < _runningFrames.size(); ++i)
    {
        auto callback = std::move(_runningFrames[i].second);
        if (callback)
            callback(deltaMs);
    }

    _runningFrames.clear();
}

} // namespace manzai
