/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the capture HAL.
 */

#ifndef HAL_ALSA_DRIVER_HPP
#define HAL_ALSA_DRIVER_HPP

#include "AudioDriver.hpp"
#include "Logger.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hal {

/**
 * @brief ALSA PCM capture stream.
 *
 * A reader thread blocks in snd_pcm_readi() and hands each period to the
 * capture callback as interleaved float. FLOAT_LE is preferred; S32_LE and
 * S16_LE hardware is converted in place.
 */
class AlsaCaptureStream : public CaptureStream {
public:
    /**
     * @param device ALSA PCM name (e.g. "default", "pipewire", "plughw:1,0").
     * @param params Requested rate, period size and channel count.
     * @param callback Driver-context block callback.
     * @param logger Sink for setup and teardown diagnostics.
     */
    AlsaCaptureStream(const std::string& device, const StreamParams& params,
                      CaptureCallback callback, omega::Logger& logger);
    ~AlsaCaptureStream() override;

    /**
     * @brief Open and configure the PCM. Called once by the backend.
     */
    bool open();

    bool start() override;
    void stop() override;
    bool is_running() const override { return running_.load(); }
    int sample_rate() const override { return sample_rate_; }
    int block_size() const override { return block_size_; }
    int channels() const override { return num_channels_; }
    int xruns() const override { return xrun_count_.load(); }

private:
    void thread_loop();
    bool setup_pcm();
    bool fail(const char* what, int err);
    void close_pcm();
    bool recover_pcm(int err);
    void set_realtime_priority();
    void convert_to_float(size_t frames);

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    bool use_realtime_priority_;
    snd_pcm_format_t sample_format_;
    CaptureCallback callback_;
    omega::Logger& logger_;

    std::atomic<bool> running_;
    std::atomic<int> xrun_count_;
    std::atomic<int> read_error_;
    std::thread reader_thread_;

    // Internal buffers, sized once in setup_pcm()
    std::vector<uint8_t> raw_buffer_;
    std::vector<float> float_buffer_;
};

/**
 * @brief Enumerates ALSA PCMs through the device name hints and opens
 * capture streams on them.
 */
class AlsaBackend : public AudioBackend {
public:
    explicit AlsaBackend(omega::Logger& logger);

    std::optional<std::vector<DeviceInfo>> enumerate_devices() override;
    std::optional<int> default_input_device() const override;
    std::optional<int> default_output_device() const override;
    std::unique_ptr<CaptureStream> open_capture(int device_index,
                                                const StreamParams& params,
                                                CaptureStream::CaptureCallback callback) override;

private:
    struct Probe {
        int channels = 0;
        double sample_rate = 0.0;
        double latency_ms = 0.0;
    };

    Probe probe(const std::string& pcm_name, snd_pcm_stream_t stream) const;

    omega::Logger& logger_;
    mutable std::mutex mutex_;
    std::vector<std::string> pcm_names_;    // Indexed by DeviceInfo::index
    std::optional<int> default_input_;
    std::optional<int> default_output_;
};

} // namespace hal

#endif // HAL_ALSA_DRIVER_HPP
