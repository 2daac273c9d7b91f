/**
 * @file AudioBlock.hpp
 * @brief One block of interleaved capture samples.
 */

#ifndef OMEGA_AUDIO_BLOCK_HPP
#define OMEGA_AUDIO_BLOCK_HPP

#include <cstddef>
#include <span>
#include <vector>

namespace omega {

/**
 * @brief Interleaved float samples (nominal range [-1, 1]) plus the rate
 * they were captured at.
 *
 * Created by the driver callback and never mutated once queued.
 */
struct AudioBlock {
    std::vector<float> samples;
    int channels = 0;
    int sample_rate = 0;

    AudioBlock() = default;

    AudioBlock(std::span<const float> interleaved, int num_channels, int rate)
        : samples(interleaved.begin(), interleaved.end())
        , channels(num_channels)
        , sample_rate(rate)
    {}

    size_t frames() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }

    bool empty() const { return frames() == 0; }

    float sample(size_t frame, int channel) const {
        return samples[frame * static_cast<size_t>(channels) + static_cast<size_t>(channel)];
    }

    /**
     * @brief De-interleave one channel.
     *
     * Channels past the last one fall back to channel 0, so a mono block
     * reads as the same signal on L and R.
     */
    std::vector<float> channel(int index) const {
        std::vector<float> out(frames());
        if (out.empty()) return out;
        const int ch = (index >= 0 && index < channels) ? index : 0;
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = sample(i, ch);
        }
        return out;
    }
};

} // namespace omega

#endif // OMEGA_AUDIO_BLOCK_HPP
