/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the capture HAL.
 */

#include "alsa/AlsaDriver.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <pthread.h>
#include <sched.h>
#include <string>
#include <utility>

namespace hal {

namespace {

constexpr int kMaxProbedChannels = 32;
constexpr unsigned int kPreferredRates[] = {48000, 44100};

std::string hint_string(void* hint, const char* id) {
    char* value = snd_device_name_get_hint(hint, id);
    if (!value) return {};
    std::string out(value);
    std::free(value);
    return out;
}

std::string first_line(const std::string& text) {
    const auto pos = text.find('\n');
    return pos == std::string::npos ? text : text.substr(0, pos);
}

} // namespace

// ---------------------------------------------------------------------------
// AlsaCaptureStream
// ---------------------------------------------------------------------------

AlsaCaptureStream::AlsaCaptureStream(const std::string& device, const StreamParams& params,
                                     CaptureCallback callback, omega::Logger& logger)
    : pcm_handle_(nullptr)
    , device_name_(device)
    , sample_rate_(params.sample_rate)
    , block_size_(params.block_size)
    , num_channels_(params.num_channels)
    , use_realtime_priority_(params.use_realtime_priority)
    , sample_format_(SND_PCM_FORMAT_FLOAT_LE)
    , callback_(std::move(callback))
    , logger_(logger)
    , running_(false)
    , xrun_count_(0)
    , read_error_(0)
{
}

AlsaCaptureStream::~AlsaCaptureStream() {
    stop();
    close_pcm();
}

bool AlsaCaptureStream::open() {
    if (pcm_handle_) return true;
    return setup_pcm();
}

bool AlsaCaptureStream::start() {
    if (running_) return true;
    if (!pcm_handle_ && !setup_pcm()) {
        return false;
    }

    int err = snd_pcm_start(pcm_handle_);
    if (err < 0 && err != -EBADFD) {
        // Some plugins start implicitly on the first read
        logger_.warn("ALSA", std::string("snd_pcm_start: ") + snd_strerror(err));
    }

    read_error_ = 0;
    running_ = true;
    reader_thread_ = std::thread(&AlsaCaptureStream::thread_loop, this);

    if (use_realtime_priority_) {
        set_realtime_priority();
    }
    return true;
}

void AlsaCaptureStream::stop() {
    running_ = false;
    if (pcm_handle_) {
        // Unblock a reader waiting in snd_pcm_readi()
        snd_pcm_drop(pcm_handle_);
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }

    const int err = read_error_.exchange(0);
    if (err != 0) {
        logger_.error("ALSA", std::string("Capture read error on ") + device_name_ + ": " + snd_strerror(err));
    }

    close_pcm();
}

bool AlsaCaptureStream::fail(const char* what, int err) {
    logger_.error("ALSA", std::string(what) + " on " + device_name_ + " (" + snd_strerror(err) + ")");
    close_pcm();
    return false;
}

void AlsaCaptureStream::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaCaptureStream::setup_pcm() {
    int err;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_CAPTURE, 0)) < 0) {
        pcm_handle_ = nullptr;
        return fail("Cannot open capture device", err);
    }

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot initialize hardware parameter structure", err);
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        return fail("Cannot set access type", err);
    }

    // Prefer float, fall back to S32_LE then S16_LE
    sample_format_ = SND_PCM_FORMAT_FLOAT_LE;
    if (snd_pcm_hw_params_set_format(pcm_handle_, hw_params, sample_format_) < 0) {
        sample_format_ = SND_PCM_FORMAT_S32_LE;
        if (snd_pcm_hw_params_set_format(pcm_handle_, hw_params, sample_format_) < 0) {
            sample_format_ = SND_PCM_FORMAT_S16_LE;
            if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, sample_format_)) < 0) {
                return fail("Cannot set sample format", err);
            }
        }
    }

    unsigned int channels = static_cast<unsigned int>(num_channels_);
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_handle_, hw_params, &channels)) < 0) {
        return fail("Cannot set channel count", err);
    }
    num_channels_ = static_cast<int>(channels);

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params, &rate, nullptr)) < 0) {
        return fail("Cannot set sample rate", err);
    }
    if (static_cast<int>(rate) != sample_rate_) {
        logger_.info("ALSA", "Sample rate adjusted to " + std::to_string(rate) + " Hz");
    }
    sample_rate_ = static_cast<int>(rate);

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(block_size_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params, &frames, nullptr)) < 0) {
        return fail("Cannot set period size", err);
    }
    block_size_ = static_cast<int>(frames);

    unsigned int periods = 4;
    snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params, &periods, nullptr);

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot set parameters", err);
    }

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        return fail("Cannot prepare audio interface for use", err);
    }

    const size_t samples = static_cast<size_t>(block_size_) * static_cast<size_t>(num_channels_);
    raw_buffer_.assign(samples * static_cast<size_t>(snd_pcm_format_physical_width(sample_format_) / 8), 0);
    float_buffer_.assign(samples, 0.0f);

    logger_.info("ALSA", "Capture configured on " + device_name_ + ": " + std::to_string(sample_rate_) + " Hz, "
                 + std::to_string(block_size_) + " frames/period, " + std::to_string(num_channels_) + " ch, "
                 + snd_pcm_format_name(sample_format_));
    return true;
}

void AlsaCaptureStream::convert_to_float(size_t frames) {
    const size_t samples = frames * static_cast<size_t>(num_channels_);
    if (sample_format_ == SND_PCM_FORMAT_FLOAT_LE) {
        std::memcpy(float_buffer_.data(), raw_buffer_.data(), samples * sizeof(float));
    } else if (sample_format_ == SND_PCM_FORMAT_S32_LE) {
        const int32_t* s32_ptr = reinterpret_cast<const int32_t*>(raw_buffer_.data());
        for (size_t i = 0; i < samples; ++i) {
            float_buffer_[i] = static_cast<float>(s32_ptr[i]) / 2147483648.0f;
        }
    } else {
        const int16_t* s16_ptr = reinterpret_cast<const int16_t*>(raw_buffer_.data());
        for (size_t i = 0; i < samples; ++i) {
            float_buffer_[i] = static_cast<float>(s16_ptr[i]) / 32768.0f;
        }
    }
}

void AlsaCaptureStream::thread_loop() {
    // Buffers were sized in setup_pcm(); nothing below allocates.
    while (running_) {
        snd_pcm_sframes_t frames_read = snd_pcm_readi(pcm_handle_, raw_buffer_.data(),
                                                      static_cast<snd_pcm_uframes_t>(block_size_));
        if (frames_read < 0) {
            if (!running_) break;
            if (frames_read == -EAGAIN) continue;
            if (!recover_pcm(static_cast<int>(frames_read))) {
                read_error_ = static_cast<int>(frames_read);
                break;
            }
            continue;
        }
        if (frames_read == 0) continue;

        convert_to_float(static_cast<size_t>(frames_read));
        if (callback_) {
            callback_(std::span<const float>(float_buffer_.data(),
                                             static_cast<size_t>(frames_read) * static_cast<size_t>(num_channels_)),
                      num_channels_, sample_rate_);
        }
    }
    running_ = false;
}

bool AlsaCaptureStream::recover_pcm(int err) {
    if (err == -EPIPE) {
        xrun_count_++;
        return snd_pcm_prepare(pcm_handle_) >= 0 && snd_pcm_start(pcm_handle_) >= 0;
    }
    if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (err < 0) {
            return snd_pcm_prepare(pcm_handle_) >= 0;
        }
        return true;
    }
    return false;
}

void AlsaCaptureStream::set_realtime_priority() {
    struct sched_param param;
    param.sched_priority = 80;
    const int res = pthread_setschedparam(reader_thread_.native_handle(), SCHED_FIFO, &param);
    if (res == 0) {
        logger_.info("ALSA", "Real-Time Priority Set (SCHED_FIFO, 80)");
    } else if (res == EPERM) {
        logger_.warn("ALSA", "Priority Failed: EPERM (Need ulimit -r 80+)");
    } else {
        logger_.warn("ALSA", "Priority Failed: " + std::string(std::strerror(res)));
    }
}

// ---------------------------------------------------------------------------
// AlsaBackend
// ---------------------------------------------------------------------------

AlsaBackend::AlsaBackend(omega::Logger& logger)
    : logger_(logger)
{
}

AlsaBackend::Probe AlsaBackend::probe(const std::string& pcm_name, snd_pcm_stream_t stream) const {
    Probe result;
    snd_pcm_t* pcm = nullptr;
    if (snd_pcm_open(&pcm, pcm_name.c_str(), stream, SND_PCM_NONBLOCK) < 0) {
        return result;
    }

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    if (snd_pcm_hw_params_any(pcm, hw_params) >= 0) {
        unsigned int max_channels = 0;
        if (snd_pcm_hw_params_get_channels_max(hw_params, &max_channels) >= 0) {
            result.channels = std::min(static_cast<int>(max_channels), kMaxProbedChannels);
        }

        for (unsigned int rate : kPreferredRates) {
            if (snd_pcm_hw_params_test_rate(pcm, hw_params, rate, 0) == 0) {
                result.sample_rate = rate;
                break;
            }
        }
        if (result.sample_rate == 0.0) {
            unsigned int min_rate = 0;
            if (snd_pcm_hw_params_get_rate_min(hw_params, &min_rate, nullptr) >= 0) {
                result.sample_rate = min_rate;
            }
        }

        snd_pcm_uframes_t min_period = 0;
        if (result.sample_rate > 0.0 &&
            snd_pcm_hw_params_get_period_size_min(hw_params, &min_period, nullptr) >= 0) {
            result.latency_ms = 1000.0 * static_cast<double>(min_period) / result.sample_rate;
        }
    }
    snd_pcm_close(pcm);
    return result;
}

std::optional<std::vector<DeviceInfo>> AlsaBackend::enumerate_devices() {
    void** hints = nullptr;
    const int err = snd_device_name_hint(-1, "pcm", &hints);
    if (err < 0 || !hints) {
        logger_.error("ALSA", std::string("Cannot enumerate PCM devices (") + snd_strerror(err) + ")");
        return std::nullopt;
    }

    std::vector<DeviceInfo> devices;
    std::vector<std::string> names;
    std::optional<int> default_input;
    std::optional<int> default_output;

    for (void** n = hints; *n != nullptr; ++n) {
        const std::string name = hint_string(*n, "NAME");
        if (name.empty() || name == "null") continue;

        // IOID is absent for devices that do both directions
        const std::string ioid = hint_string(*n, "IOID");
        const bool may_capture = ioid.empty() || ioid == "Input";
        const bool may_play = ioid.empty() || ioid == "Output";

        DeviceInfo info;
        info.index = static_cast<int>(devices.size());
        const std::string desc = first_line(hint_string(*n, "DESC"));
        info.name = desc.empty() ? name : desc + " [" + name + "]";

        if (may_capture) {
            const Probe in = probe(name, SND_PCM_STREAM_CAPTURE);
            info.input_channels = in.channels;
            info.sample_rate = in.sample_rate;
            info.latency_ms = in.latency_ms;
        }
        if (may_play) {
            const Probe out = probe(name, SND_PCM_STREAM_PLAYBACK);
            info.output_channels = out.channels;
            if (info.sample_rate == 0.0) info.sample_rate = out.sample_rate;
        }
        if (!info.is_input() && !info.is_output()) continue;

        if (name == "default") {
            info.is_default_input = info.is_input();
            info.is_default_output = info.is_output();
            if (info.is_default_input) default_input = info.index;
            if (info.is_default_output) default_output = info.index;
        }

        devices.push_back(info);
        names.push_back(name);
    }
    snd_device_name_free_hint(hints);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pcm_names_ = std::move(names);
        default_input_ = default_input;
        default_output_ = default_output;
    }

    logger_.info("ALSA", "Found " + std::to_string(devices.size()) + " audio devices");
    return devices;
}

std::optional<int> AlsaBackend::default_input_device() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_input_;
}

std::optional<int> AlsaBackend::default_output_device() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_output_;
}

std::unique_ptr<CaptureStream> AlsaBackend::open_capture(int device_index,
                                                         const StreamParams& params,
                                                         CaptureStream::CaptureCallback callback) {
    std::string pcm_name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (device_index < 0 || device_index >= static_cast<int>(pcm_names_.size())) {
            logger_.error("ALSA", "Unknown device index " + std::to_string(device_index));
            return nullptr;
        }
        pcm_name = pcm_names_[static_cast<size_t>(device_index)];
    }

    auto stream = std::make_unique<AlsaCaptureStream>(pcm_name, params, std::move(callback), logger_);
    if (!stream->open()) {
        return nullptr;
    }
    return stream;
}

} // namespace hal
