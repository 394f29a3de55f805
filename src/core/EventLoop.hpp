// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace manzai
{

/// @brief Identifies a pending timer or frame callback. Zero is never a valid id.
using TaskId = std::uint64_t;

/// @brief Single-threaded cooperative scheduler driving the stage.
///
/// Three kinds of work run on the loop thread, in this order on every step:
///   1. tasks handed over by post() (the only entry point that is safe from other threads),
///   2. timers whose deadline has been reached, in deadline order,
///   3. frame callbacks requested before the step began (one-shot, like an animation frame).
///
/// Time is the loop's own clock in milliseconds. step() advances it by an explicit delta, which
/// makes the loop fully deterministic under test; run() advances it by measured wall time.
class EventLoop
{
  public:
    using Task = std::function<void()>;
    using FrameCallback = std::function<void(double deltaMs)>;

    EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// @brief Queues a task for the next step. Thread-safe.
    void post(Task task);

    /// @brief Runs a task once the loop clock has advanced by delayMs.
    [[nodiscard]] auto setTimeout(double delayMs, Task task) -> TaskId;

    /// @brief Cancels a pending timer. Unknown or already fired ids are ignored.
    void clearTimeout(TaskId id);

    /// @brief Requests a callback on the next frame.
    [[nodiscard]] auto requestFrame(FrameCallback callback) -> TaskId;

    /// @brief Cancels a pending frame callback. Unknown or already fired ids are ignored.
    void cancelFrame(TaskId id);

    /// @brief Advances the loop clock by deltaMs and runs one round of work.
    void step(double deltaMs);

    /// @brief Steps repeatedly with frameMs increments until totalMs has elapsed.
    void advance(double totalMs, double frameMs = 1000.0 / 60.0);

    /// @brief Runs in real time at the given frame interval until quit() is called.
    void run(std::chrono::milliseconds frameInterval);

    /// @brief Asks run() to return after the current step. Thread-safe.
    ///
    /// The request is sticky: a run() started after quit() returns immediately.
    void quit();

    /// @brief Returns the loop clock in milliseconds.
    [[nodiscard]] auto now() const noexcept -> double;

    /// @brief Returns true if any timer, frame callback or posted task is pending.
    [[nodiscard]] auto hasPendingWork() const -> bool;

  private:
    struct Timer
    {
        TaskId id = 0;
        Task task;
    };

    auto nextId() -> TaskId { return ++_lastId; }

    void drainPosted();
    void runDueTimers();
    void runFrames(double deltaMs);

    double _now = 0.0;
    TaskId _lastId = 0;

    // (deadline, insertion id) keeps timers with equal deadlines in scheduling order.
    std::map<std::pair<double, TaskId>, Timer> _timers;
    std::vector<std::pair<TaskId, FrameCallback>> _frames;
    std::vector<std::pair<TaskId, FrameCallback>> _runningFrames;

    mutable std::mutex _postMutex;
    std::deque<Task> _posted;
    bool _quitRequested = false;
};

} // namespace manzai
