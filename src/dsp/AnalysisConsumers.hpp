/**
 * @file AnalysisConsumers.hpp
 * @brief Consumers that turn captured blocks into display data.
 */

#ifndef OMEGA_ANALYSIS_CONSUMERS_HPP
#define OMEGA_ANALYSIS_CONSUMERS_HPP

#include "Consumer.hpp"
#include "LevelMeter.hpp"
#include "Logger.hpp"
#include "SpectralTransform.hpp"
#include "SpectrumBinner.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace omega::dsp {

/**
 * @brief Rate limiter shared by the analysis consumers.
 *
 * A block is accepted when at least `interval` has passed since the last
 * accepted one. An interval of zero accepts everything.
 */
class UpdateThrottle {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultInterval{50};   // 20 fps

    bool should_update(Clock::time_point now);

    /**
     * @brief Set the interval from a refresh rate. fps <= 0 disables throttling.
     */
    void set_update_rate(double fps);
    void set_interval(Clock::duration interval);
    Clock::duration interval() const;

private:
    mutable std::mutex mutex_;
    Clock::duration interval_ = kDefaultInterval;
    std::optional<Clock::time_point> last_update_;
};

/**
 * @brief SpectralTransform followed by SpectrumBinner.
 *
 * Runs on every block so the averaging and peak-decay steps advance at the
 * capture block rate. Renderers pull bins() at their own refresh rate.
 */
class SpectrumAnalyzer : public Consumer {
public:
    explicit SpectrumAnalyzer(Logger& logger,
                              const SpectrumBinner::Config& config = SpectrumBinner::Config{});

    void on_block(const AudioBlock& block, int sample_rate) override;

    SpectrumBinner& binner() { return binner_; }
    const SpectrumBinner& binner() const { return binner_; }

    std::vector<SpectrumBin> bins() const { return binner_.bins(); }

    /**
     * @brief Non-empty blocks analysed so far.
     */
    size_t updates() const;

private:
    Logger& logger_;
    SpectralTransform transform_;
    SpectrumBinner binner_;
    size_t updates_ = 0;
    int last_rate_ = 0;
    mutable std::mutex stats_mutex_;
};

/**
 * @brief Feeds throttled blocks to a LevelMeter.
 *
 * The meter is told the throttle interval so its loudness history keeps
 * covering about three seconds of audio whatever the update rate.
 */
class MeterAnalyzer : public Consumer {
public:
    explicit MeterAnalyzer(Logger& logger);

    void on_block(const AudioBlock& block, int sample_rate) override;

    LevelMeter& meter() { return meter_; }
    const LevelMeter& meter() const { return meter_; }

    MeterReadings readings() const { return meter_.readings(); }

    UpdateThrottle& throttle() { return throttle_; }
    void set_update_rate(double fps) { throttle_.set_update_rate(fps); }

    size_t updates() const;

private:
    Logger& logger_;
    LevelMeter meter_;
    UpdateThrottle throttle_;
    size_t updates_ = 0;
    int last_rate_ = 0;
    mutable std::mutex stats_mutex_;
};

} // namespace omega::dsp

#endif // OMEGA_ANALYSIS_CONSUMERS_HPP
