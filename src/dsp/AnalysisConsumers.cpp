/**
 * @file AnalysisConsumers.cpp
 * @brief Consumers that turn captured blocks into display data.
 */

#include "AnalysisConsumers.hpp"
#include <string>

namespace omega::dsp {

bool UpdateThrottle::should_update(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_update_ && interval_ > Clock::duration::zero() && now - *last_update_ < interval_) {
        return false;
    }
    last_update_ = now;
    return true;
}

void UpdateThrottle::set_update_rate(double fps) {
    if (!(fps > 0.0)) {
        set_interval(Clock::duration::zero());
        return;
    }
    set_interval(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / fps)));
}

void UpdateThrottle::set_interval(Clock::duration interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    interval_ = interval < Clock::duration::zero() ? Clock::duration::zero() : interval;
}

UpdateThrottle::Clock::duration UpdateThrottle::interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
}

SpectrumAnalyzer::SpectrumAnalyzer(Logger& logger, const SpectrumBinner::Config& config)
    : logger_(logger)
    , binner_(config)
{
    if (!SpectrumBinner::is_valid(config)) {
        logger_.warn("Spectrum", "Invalid binner config, using defaults");
    }
}

void SpectrumAnalyzer::on_block(const AudioBlock& block, int sample_rate) {
    if (block.empty()) return;
    const auto now = UpdateThrottle::Clock::now();

    if (sample_rate != last_rate_) {
        logger_.info("Spectrum", "Analysing at " + std::to_string(sample_rate) + " Hz, "
                     + std::to_string(block.frames()) + "-point FFT");
        last_rate_ = sample_rate;
    }

    const Spectrum spectrum = transform_.transform(block.channel(0), sample_rate);
    binner_.update(spectrum.magnitudes, spectrum.frequencies, now);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++updates_;
}

size_t SpectrumAnalyzer::updates() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return updates_;
}

MeterAnalyzer::MeterAnalyzer(Logger& logger)
    : logger_(logger)
{
}

void MeterAnalyzer::on_block(const AudioBlock& block, int sample_rate) {
    if (!throttle_.should_update(UpdateThrottle::Clock::now())) return;

    if (sample_rate != last_rate_) {
        logger_.info("Meter", "Metering at " + std::to_string(sample_rate) + " Hz, "
                     + std::to_string(block.channels) + " ch");
        last_rate_ = sample_rate;
    }

    meter_.set_update_interval(std::chrono::duration<double>(throttle_.interval()).count());
    meter_.process(block);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++updates_;
}

size_t MeterAnalyzer::updates() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return updates_;
}

} // namespace omega::dsp
