/**
 * @file AudioManager.hpp
 * @brief Owns the input stream, the capture queue and the processing thread.
 */

#ifndef OMEGA_AUDIO_MANAGER_HPP
#define OMEGA_AUDIO_MANAGER_HPP

#include "AudioBlock.hpp"
#include "AudioDriver.hpp"
#include "CaptureQueue.hpp"
#include "CaptureSettings.hpp"
#include "CaptureStatus.hpp"
#include "Consumer.hpp"
#include "Logger.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace omega {

/**
 * @brief Capture front end.
 *
 * The driver callback copies each period into the queue and returns. One
 * processing thread per capture session drains the queue and hands every
 * block to the registered consumers in registration order.
 */
class AudioManager {
public:
    struct Stats {
        uint64_t blocks_captured = 0;
        uint64_t blocks_dispatched = 0;
        uint64_t blocks_dropped = 0;      // Evicted by a full queue
        uint64_t consumer_failures = 0;
        uint64_t stream_failures = 0;     // Streams that stopped on their own
    };

    /**
     * @param backend Host audio API. Must not be null.
     * @param logger Shared diagnostics sink; must outlive the manager.
     * @param settings Stream request and queue tuning.
     */
    AudioManager(std::unique_ptr<hal::AudioBackend> backend, Logger& logger,
                 CaptureSettings settings = CaptureSettings{});
    ~AudioManager();

    AudioManager(const AudioManager&) = delete;
    AudioManager& operator=(const AudioManager&) = delete;

    /**
     * @brief Re-enumerate devices and re-apply the selection policy.
     *
     * @return false if enumeration failed; the previous list is kept.
     */
    bool refresh_devices();

    std::vector<hal::DeviceInfo> devices() const;
    std::vector<hal::DeviceInfo> input_devices() const;
    std::vector<hal::DeviceInfo> output_devices() const;
    std::optional<hal::DeviceInfo> device(int index) const;

    std::optional<int> input_device() const;
    std::optional<int> output_device() const;

    /**
     * @brief Select the capture device, restarting capture if it is running.
     */
    CaptureStatus set_input_device(int index);

    /**
     * @brief Select the monitoring output. Selection only, nothing is opened.
     */
    CaptureStatus set_output_device(int index);

    CaptureStatus start_capture();

    /**
     * @brief Close the stream, join the processing thread and discard
     * queued blocks. Safe to call when already stopped.
     */
    void stop_capture();

    /**
     * @brief False once stopped, including when the stream died on its own
     * (counted in Stats::stream_failures).
     */
    bool is_capturing() const { return capturing_.load(); }

    void register_consumer(std::shared_ptr<Consumer> consumer);
    void unregister_consumer(const std::shared_ptr<Consumer>& consumer);
    size_t consumer_count() const;

    /**
     * @brief RMS dB (L, R) of the newest queued block, without consuming it.
     *
     * Floor (-100 dB) when stopped or when the queue is empty.
     */
    std::array<double, 2> current_level() const;

    /**
     * @brief Multi-line device listing with the current selections marked.
     */
    std::string describe_devices() const;

    Stats stats() const;
    const CaptureSettings& settings() const { return settings_; }

private:
    using ConsumerList = std::vector<std::shared_ptr<Consumer>>;

    void on_capture(std::span<const float> interleaved, int channels, int sample_rate);
    void processing_loop();
    void check_stream_alive();
    CaptureStatus start_locked();
    void stop_locked();
    void apply_selection_policy_locked();
    bool is_routable(const hal::DeviceInfo& device) const;
    std::shared_ptr<const ConsumerList> consumers_snapshot() const;

    std::unique_ptr<hal::AudioBackend> backend_;
    Logger& logger_;
    const CaptureSettings settings_;

    // Serializes start/stop/device switching
    std::mutex control_mutex_;

    mutable std::mutex devices_mutex_;
    std::vector<hal::DeviceInfo> devices_;
    std::optional<int> input_device_;
    std::optional<int> output_device_;

    mutable std::mutex consumers_mutex_;
    std::shared_ptr<const ConsumerList> consumers_;

    // Shared blocks keep latest() and evictions cheap under the queue lock
    CaptureQueue<std::shared_ptr<const AudioBlock>> queue_;
    std::unique_ptr<hal::CaptureStream> stream_;
    std::thread processing_thread_;
    std::atomic<bool> capturing_{false};
    std::atomic<bool> processing_{false};

    std::atomic<uint64_t> blocks_captured_{0};
    std::atomic<uint64_t> blocks_dispatched_{0};
    std::atomic<uint64_t> consumer_failures_{0};
    std::atomic<uint64_t> stream_failures_{0};
};

} // namespace omega

#endif // OMEGA_AUDIO_MANAGER_HPP
