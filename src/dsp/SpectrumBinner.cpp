/**
 * @file SpectrumBinner.cpp
 * @brief Log-frequency display bins with EMA smoothing and peak hold.
 */

#include "SpectrumBinner.hpp"
#include "Decibels.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace omega::dsp {

std::vector<double> log_spaced_edges(double min_freq, double max_freq, int num_bars) {
    std::vector<double> edges;
    if (num_bars < 1 || !(min_freq > 0.0) || !(max_freq > min_freq)) return edges;

    const double log_min = std::log10(min_freq);
    const double log_max = std::log10(max_freq);
    const double step = (log_max - log_min) / static_cast<double>(num_bars);

    edges.resize(static_cast<size_t>(num_bars) + 1);
    for (int i = 0; i <= num_bars; ++i) {
        edges[static_cast<size_t>(i)] = std::pow(10.0, log_min + step * static_cast<double>(i));
    }
    // pow() round-off must not move the outer edges
    edges.front() = min_freq;
    edges.back() = max_freq;
    return edges;
}

SpectrumBinner::SpectrumBinner()
    : SpectrumBinner(Config{})
{
}

SpectrumBinner::SpectrumBinner(const Config& config) {
    if (!configure(config)) {
        configure(Config{});
    }
}

bool SpectrumBinner::is_supported_bar_count(int num_bars) {
    return std::find(kBarCounts.begin(), kBarCounts.end(), num_bars) != kBarCounts.end();
}

bool SpectrumBinner::is_supported_db_range(int db_range) {
    return std::find(kDbRanges.begin(), kDbRanges.end(), db_range) != kDbRanges.end();
}

bool SpectrumBinner::is_valid(const Config& config) {
    return config.num_bars >= 1
        && config.min_freq > 0.0
        && config.max_freq > config.min_freq
        && config.db_range > 0
        && config.averaging_factor >= 0.0 && config.averaging_factor < 1.0
        && config.peak_decay > 0.0 && config.peak_decay <= 1.0
        && config.peak_hold_time.count() >= 0.0;
}

bool SpectrumBinner::configure(const Config& config) {
    if (!is_valid(config)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    rebuild_locked();
    return true;
}

void SpectrumBinner::rebuild_locked() {
    edges_ = log_spaced_edges(config_.min_freq, config_.max_freq, config_.num_bars);

    const size_t bars = static_cast<size_t>(config_.num_bars);
    centres_.resize(bars);
    for (size_t i = 0; i < bars; ++i) {
        centres_[i] = 0.5 * (edges_[i] + edges_[i + 1]);
    }

    levels_.assign(bars, 0.0);
    peaks_.assign(bars, 0.0);
    peak_times_.assign(bars, Clock::time_point{});
    raw_.assign(bars, 0.0);
}

bool SpectrumBinner::set_bar_count(int num_bars) {
    if (!is_supported_bar_count(num_bars)) return false;
    Config next = config();
    if (next.num_bars == num_bars) return true;
    next.num_bars = num_bars;
    return configure(next);
}

bool SpectrumBinner::set_db_range(int db_range) {
    if (!is_supported_db_range(db_range)) return false;
    // The floor only affects clamping, so history is kept
    std::lock_guard<std::mutex> lock(mutex_);
    config_.db_range = db_range;
    return true;
}

void SpectrumBinner::set_peak_hold(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.peak_hold = enabled;
    }
    if (!enabled) {
        reset_peaks();
    }
}

bool SpectrumBinner::set_averaging_factor(double alpha) {
    if (!(alpha >= 0.0 && alpha < 1.0)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    config_.averaging_factor = alpha;
    return true;
}

void SpectrumBinner::update(std::span<const float> magnitudes, std::span<const float> frequencies) {
    update(magnitudes, frequencies, Clock::now());
}

void SpectrumBinner::update(std::span<const float> magnitudes, std::span<const float> frequencies,
                            Clock::time_point now) {
    if (magnitudes.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    const double floor = floor_locked();
    const size_t bars = levels_.size();
    const double no_match = -std::numeric_limits<double>::infinity();

    // Max-hold per bar: one loud FFT bin among quiet ones shows loud
    std::fill(raw_.begin(), raw_.end(), no_match);
    const size_t count = std::min(magnitudes.size(), frequencies.size());
    for (size_t k = 0; k < count; ++k) {
        const double f = frequencies[k];
        auto it = std::upper_bound(edges_.begin(), edges_.end(), f);
        if (it == edges_.begin() || it == edges_.end()) continue;   // below first or at/above last edge
        const size_t bar = static_cast<size_t>(std::distance(edges_.begin(), it) - 1);
        const double db = amplitude_to_db(magnitudes[k]);
        if (!std::isfinite(db)) continue;   // An infinite level would never average out
        raw_[bar] = std::max(raw_[bar], db);
    }

    const double alpha = config_.averaging_factor;
    for (size_t i = 0; i < bars; ++i) {
        const double raw = (raw_[i] == no_match) ? floor : raw_[i];
        levels_[i] = alpha * levels_[i] + (1.0 - alpha) * raw;
    }

    if (!config_.peak_hold) return;

    for (size_t i = 0; i < bars; ++i) {
        if (levels_[i] > peaks_[i]) {
            peaks_[i] = levels_[i];
            peak_times_[i] = now;
        }
    }

    // Decay first, then clamp up to the live level
    for (size_t i = 0; i < bars; ++i) {
        if (now - peak_times_[i] > config_.peak_hold_time) {
            peaks_[i] = floor + (peaks_[i] - floor) * config_.peak_decay;
        }
        peaks_[i] = std::max(peaks_[i], levels_[i]);
    }
}

void SpectrumBinner::reset_peaks() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(peaks_.begin(), peaks_.end(), floor_locked());
    std::fill(peak_times_.begin(), peak_times_.end(), Clock::time_point{});
}

void SpectrumBinner::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    rebuild_locked();
}

std::vector<SpectrumBin> SpectrumBinner::bins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const double floor = floor_locked();
    std::vector<SpectrumBin> out(levels_.size());
    for (size_t i = 0; i < levels_.size(); ++i) {
        const double level = clamp_to_floor(levels_[i], floor);
        const double peak = config_.peak_hold ? clamp_to_floor(std::max(peaks_[i], levels_[i]), floor) : level;
        out[i] = SpectrumBin{centres_[i], level, peak};
    }
    return out;
}

std::vector<double> SpectrumBinner::edges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edges_;
}

SpectrumBinner::Config SpectrumBinner::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

double SpectrumBinner::floor_db() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return floor_locked();
}

int SpectrumBinner::num_bars() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.num_bars;
}

} // namespace omega::dsp
