/**
 * @file CaptureSettings.hpp
 * @brief Requested capture parameters and queue tuning.
 */

#ifndef OMEGA_CAPTURE_SETTINGS_HPP
#define OMEGA_CAPTURE_SETTINGS_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace omega {

/**
 * @brief Holds the stream request handed to the HAL and the queue limits.
 *
 * The hardware may negotiate different values; blocks always carry the
 * rate they were actually captured at.
 */
struct CaptureSettings {
    int sample_rate = 48000;
    int block_size = 512;       // Frames per block (10.7ms @ 48kHz)
    int num_channels = 2;
    size_t queue_capacity = 100;
    std::chrono::milliseconds queue_timeout{100};
    bool use_realtime_priority = true;

    // Substrings (case-insensitive) marking software-routable inputs
    std::vector<std::string> routing_keywords{"pipewire", "jack"};

    double block_latency_ms() const {
        return sample_rate > 0 ? 1000.0 * block_size / sample_rate : 0.0;
    }
};

} // namespace omega

#endif // OMEGA_CAPTURE_SETTINGS_HPP
