/**
 * @file AudioDriver.hpp
 * @brief Abstract interfaces for platform-specific audio capture.
 *
 * Hardware/OS audio code (ALSA) stays behind these interfaces so that the
 * capture core and the DSP never include a platform header.
 */

#ifndef HAL_AUDIO_DRIVER_HPP
#define HAL_AUDIO_DRIVER_HPP

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hal {

/**
 * @brief Snapshot of one enumerated device.
 */
struct DeviceInfo {
    int index = -1;                 // Opaque, stable until the next enumeration
    std::string name;
    int input_channels = 0;
    int output_channels = 0;
    double sample_rate = 0.0;       // Native/default rate in Hz
    bool is_default_input = false;
    bool is_default_output = false;
    double latency_ms = 0.0;        // Lowest input latency estimate

    bool is_input() const { return input_channels > 0; }
    bool is_output() const { return output_channels > 0; }
    bool is_default() const { return is_default_input || is_default_output; }
    int channels() const { return input_channels > output_channels ? input_channels : output_channels; }
};

/**
 * @brief Human readable one-liner, e.g. "pipewire (Input/Output, 64ch, 48000Hz) [DEFAULT]".
 */
std::string describe(const DeviceInfo& device);

/**
 * @brief Requested stream shape; the driver may negotiate different values.
 */
struct StreamParams {
    int sample_rate = 48000;
    int block_size = 512;
    int num_channels = 2;
    bool use_realtime_priority = true;
};

/**
 * @brief An opened hardware input stream.
 */
class CaptureStream {
public:
    /**
     * @brief Driver-context callback.
     *
     * Invoked once per captured period with interleaved samples. It runs in
     * the time-critical context: it must not block, log, or call back into
     * application code.
     */
    using CaptureCallback = std::function<void(std::span<const float> interleaved, int channels, int sample_rate)>;

    virtual ~CaptureStream() = default;

    /**
     * @brief Start delivering blocks to the callback.
     *
     * @return true if successfully started, false otherwise.
     */
    virtual bool start() = 0;

    /**
     * @brief Stop delivery and close the device. Safe to call repeatedly.
     */
    virtual void stop() = 0;

    virtual bool is_running() const = 0;

    /**
     * @brief Get the negotiated sample rate in Hz.
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Get the negotiated block size (frames per callback).
     */
    virtual int block_size() const = 0;

    virtual int channels() const = 0;

    /**
     * @brief Number of overruns the driver recovered from.
     */
    virtual int xruns() const = 0;
};

/**
 * @brief Host audio API entry point: device enumeration and stream factory.
 */
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    /**
     * @brief Enumerate devices.
     *
     * @return std::nullopt when the host API reports an error.
     */
    virtual std::optional<std::vector<DeviceInfo>> enumerate_devices() = 0;

    /**
     * @brief Index of the system default input from the last enumeration.
     */
    virtual std::optional<int> default_input_device() const = 0;

    /**
     * @brief Index of the system default output from the last enumeration.
     */
    virtual std::optional<int> default_output_device() const = 0;

    /**
     * @brief Open (but do not start) an input stream on a device.
     *
     * @return nullptr when the device cannot be opened with these params.
     */
    virtual std::unique_ptr<CaptureStream> open_capture(int device_index,
                                                        const StreamParams& params,
                                                        CaptureStream::CaptureCallback callback) = 0;
};

} // namespace hal

#endif // HAL_AUDIO_DRIVER_HPP
