// SPDX-License-Identifier: Apache-2.0
#include "SimulatedAudioBackend.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace manzai
{

namespace
{

    class SimulatedHandle final: public AudioHandle
    {
      public:
        SimulatedHandle(EventLoop& loop, double durationMs):
            _loop(loop), _durationMs(durationMs), _alive(std::make_shared<bool>(true))
        {
        }

        ~SimulatedHandle() override { stop(); }

        void start(AudioEvents events) override
        {
            if (_started)
                return;
            _started = true;
            _events = std::move(events);
            _startedAt = _loop.now();

            _loop.post([this, alive = std::weak_ptr<bool>(_alive)] {
                if (alive.expired() || _stopped)
                    return;
                if (auto onStarted = _events.onStarted)
                    onStarted();
            });

            _endTimer = _loop.setTimeout(_durationMs, [this] {
                _endTimer = 0;
                _ended = true;
                // The handle may be destroyed by the callback.
                if (auto onEnded = _events.onEnded)
                    onEnded();
            });
        }

        [[nodiscard]] auto elapsedMs() const -> double override
        {
            if (!_started || _stopped)
                return 0.0;
            if (_ended)
                return _durationMs;
            return std::clamp(_loop.now() - _startedAt, 0.0, _durationMs);
        }

        void stop() override
        {
            _stopped = true;
            _alive.reset();
            if (_endTimer != 0)
            {
                _loop.clearTimeout(_endTimer);
                _endTimer = 0;
            }
        }

      private:
        EventLoop& _loop;
        double _durationMs;
        std::shared_ptr<bool> _alive;
        AudioEvents _events;
        double _startedAt = 0.0;
        TaskId _endTimer = 0;
        bool _started = false;
        bool _stopped = false;
        bool _ended = false;
    };

} // namespace

SimulatedAudioBackend::SimulatedAudioBackend(EventLoop& loop, double untimedDurationMs):
    _loop(loop), _untimedDurationMs(std::max(0.0, untimedDurationMs))
{
}

auto SimulatedAudioBackend::open(const AudioClip& clip) -> Result<std::unique_ptr<AudioHandle>>
{
    auto const durationMs = clip.timing.empty() ? _untimedDurationMs : clip.timedDurationMs();
    log::debug("Simulating {:.0f} ms of audio for '{}'", durationMs, clip.line.text);
    return std::make_unique<SimulatedHandle>(_loop, durationMs);
}

} // namespace manzai
