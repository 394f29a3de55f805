// SPDX-License-Identifier: Apache-2.0
#include "MiniaudioBackend.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <format>
#include <optional>
#include <string>

namespace manzai
{

struct MiniaudioBackend::Impl
{
    EventLoop& loop;
    MiniaudioBackendConfig config;
    ma_context context {};
    bool contextInitialized = false;
    std::optional<ma_device_id> deviceId;

    explicit Impl(EventLoop& loop): loop(loop) {}
};

namespace
{

    /// @brief State shared between a handle and the tasks it posts to the loop.
    struct PlaybackShared
    {
        std::atomic<bool> cancelled { false };
        std::atomic<bool> endSignalled { false };
        std::atomic<std::uint64_t> framesPlayed { 0 };
        AudioEvents events; // Touched on the loop thread only.
    };

    auto toLower(std::string s) -> std::string
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    class MiniaudioHandle final: public AudioHandle
    {
      public:
        MiniaudioHandle(EventLoop& loop, MiniaudioBackend::Impl& backend, std::string path):
            _loop(loop), _backend(backend), _path(std::move(path)), _shared(std::make_shared<PlaybackShared>())
        {
        }

        ~MiniaudioHandle() override
        {
            _shared->cancelled.store(true, std::memory_order_relaxed);
            if (_deviceInitialized)
                ma_device_uninit(&_device);
            if (_decoderInitialized)
                ma_decoder_uninit(&_decoder);
        }

        MiniaudioHandle(const MiniaudioHandle&) = delete;
        MiniaudioHandle& operator=(const MiniaudioHandle&) = delete;

        auto openDecoder() -> VoidResult
        {
            auto config = ma_decoder_config_init(ma_format_f32, 0, 0);
            auto const result = ma_decoder_init_file(_path.c_str(), &config, &_decoder);
            if (result != MA_SUCCESS)
                return makeError(ErrorCode::AudioLoadError,
                                 std::format("Failed to decode '{}': {}", _path, static_cast<int>(result)));

            _decoderInitialized = true;
            return {};
        }

        void start(AudioEvents events) override
        {
            _shared->events = std::move(events);

            auto config = ma_device_config_init(ma_device_type_playback);
            config.playback.format = ma_format_f32;
            config.playback.channels = _decoder.outputChannels;
            config.sampleRate = _decoder.outputSampleRate;
            config.dataCallback = dataCallback;
            config.pUserData = this;
            if (_backend.deviceId)
                config.playback.pDeviceID = &*_backend.deviceId;

            auto* context = _backend.contextInitialized ? &_backend.context : nullptr;
            auto const initResult = ma_device_init(context, &config, &_device);
            if (initResult != MA_SUCCESS)
            {
                postError(makeError(ErrorCode::AudioPlaybackError,
                                    std::format("Failed to initialize playback device for '{}': {}",
                                                _path,
                                                static_cast<int>(initResult)))
                              .error());
                return;
            }
            _deviceInitialized = true;
            ma_device_set_master_volume(&_device, _backend.config.volume);

            auto const startResult = ma_device_start(&_device);
            if (startResult != MA_SUCCESS)
            {
                postError(makeError(ErrorCode::AudioPlaybackError,
                                    std::format("Failed to start playback of '{}': {}",
                                                _path,
                                                static_cast<int>(startResult)))
                              .error());
                return;
            }

            _sampleRate = _decoder.outputSampleRate;
            post([](AudioEvents& ev) {
                if (ev.onStarted)
                    ev.onStarted();
            });
        }

        [[nodiscard]] auto elapsedMs() const -> double override
        {
            if (_sampleRate == 0)
                return 0.0;
            auto const frames = _shared->framesPlayed.load(std::memory_order_relaxed);
            return static_cast<double>(frames) * 1000.0 / static_cast<double>(_sampleRate);
        }

        void stop() override
        {
            _shared->cancelled.store(true, std::memory_order_relaxed);
            if (_deviceInitialized)
                ma_device_stop(&_device);
            if (_decoderInitialized)
                ma_decoder_seek_to_pcm_frame(&_decoder, 0);
            _shared->framesPlayed.store(0, std::memory_order_relaxed);
        }

      private:
        static void dataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
        {
            auto* self = static_cast<MiniaudioHandle*>(device->pUserData);
            auto* out = static_cast<float*>(output);
            auto const channels = device->playback.channels;

            auto framesRead = ma_uint64 { 0 };
            auto const result = ma_decoder_read_pcm_frames(&self->_decoder, out, frameCount, &framesRead);

            if (framesRead < frameCount)
                std::fill_n(out + framesRead * channels, (frameCount - framesRead) * channels, 0.0f);

            self->_shared->framesPlayed.fetch_add(framesRead, std::memory_order_relaxed);

            // End of stream (or a decode failure) is reported once; the device keeps emitting silence
            // until the handle is stopped or destroyed.
            if (framesRead < frameCount && !self->_shared->endSignalled.exchange(true))
            {
                if (result != MA_SUCCESS && result != MA_AT_END)
                {
                    self->postError(Error { ErrorCode::AudioPlaybackError,
                                            std::format("Decoding '{}' failed: {}",
                                                        self->_path,
                                                        static_cast<int>(result)) });
                }
                else
                {
                    self->post([](AudioEvents& ev) {
                        if (ev.onEnded)
                            ev.onEnded();
                    });
                }
            }
        }

        template <typename F>
        void post(F deliver)
        {
            _loop.post([shared = _shared, deliver = std::move(deliver)]() mutable {
                if (!shared->cancelled.load(std::memory_order_relaxed))
                    deliver(shared->events);
            });
        }

        void postError(Error error)
        {
            post([error = std::move(error)](AudioEvents& ev) {
                if (ev.onError)
                    ev.onError(error);
            });
        }

        EventLoop& _loop;
        MiniaudioBackend::Impl& _backend;
        std::string _path;
        std::shared_ptr<PlaybackShared> _shared;
        ma_decoder _decoder {};
        ma_device _device {};
        bool _decoderInitialized = false;
        bool _deviceInitialized = false;
        unsigned _sampleRate = 0;
    };

} // namespace

MiniaudioBackend::MiniaudioBackend(EventLoop& loop): _impl(std::make_unique<Impl>(loop))
{
}

MiniaudioBackend::~MiniaudioBackend()
{
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto MiniaudioBackend::initialize(const MiniaudioBackendConfig& config) -> VoidResult
{
    _impl->config = config;
    _impl->config.volume = std::clamp(config.volume, 0.0f, 1.0f);

    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    if (config.deviceName.empty())
    {
        log::info("Audio playback uses the default output device");
        return {};
    }

    ma_device_info* playbackDevices = nullptr;
    auto playbackCount = ma_uint32 { 0 };
    auto const enumResult =
        ma_context_get_devices(&_impl->context, &playbackDevices, &playbackCount, nullptr, nullptr);
    if (enumResult != MA_SUCCESS)
    {
        log::warning("Failed to enumerate playback devices (code: {}), using default",
                     static_cast<int>(enumResult));
        return {};
    }

    auto const target = toLower(config.deviceName);
    for (auto i = ma_uint32 { 0 }; i < playbackCount; ++i)
    {
        if (toLower(playbackDevices[i].name).find(target) != std::string::npos)
        {
            log::info("Matched playback device '{}' for filter '{}'", playbackDevices[i].name, config.deviceName);
            _impl->deviceId = playbackDevices[i].id;
            return {};
        }
    }

    log::warning("No playback device matching '{}' found, using default", config.deviceName);
    return {};
}

auto MiniaudioBackend::open(const AudioClip& clip) -> Result<std::unique_ptr<AudioHandle>>
{
    if (clip.audioRef.empty())
        return makeError(ErrorCode::AudioLoadError,
                         std::format("Line '{}' has no audio", clip.line.text));

    auto handle = std::make_unique<MiniaudioHandle>(_impl->loop, *_impl, clip.audioRef);
    if (auto result = handle->openDecoder(); !result)
        return std::unexpected(result.error());

    log::debug("Opened audio '{}'", clip.audioRef);
    return handle;
}

} // namespace manzai
