/**
 * @file LevelMeter.cpp
 * @brief RMS, 4x true peak and simplified LUFS loudness per block.
 */

#include "LevelMeter.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace omega::dsp {

namespace {

double mean_square(std::span<const float> samples, double gain) {
    if (samples.empty()) return 0.0;
    double sum = 0.0;
    for (float s : samples) {
        const double x = gain * static_cast<double>(s);
        sum += x * x;
    }
    return sum / static_cast<double>(samples.size());
}

double mean(const std::deque<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace

const char* to_string(Weighting weighting) {
    switch (weighting) {
        case Weighting::K: return "K";
        case Weighting::A: return "A";
        case Weighting::C: return "C";
        case Weighting::Z: return "Z";
    }
    return "?";
}

double weighting_gain(Weighting weighting) {
    // Flat approximation for every curve
    switch (weighting) {
        case Weighting::K:
        case Weighting::A:
        case Weighting::C:
        case Weighting::Z:
            return 1.0;
    }
    return 1.0;
}

double LevelMeter::rms_db(std::span<const float> samples) {
    if (samples.empty()) return kMeterFloorDb;
    const double rms = std::sqrt(mean_square(samples, 1.0));
    return clamp_to_floor(amplitude_to_db(rms), kMeterFloorDb);
}

double LevelMeter::true_peak_db(std::span<const float> samples) {
    const size_t n = samples.size();
    if (n == 0) return kMeterFloorDb;

    const size_t points = 4 * n;
    const double last = static_cast<double>(n - 1);
    const double step = points > 1 ? static_cast<double>(n) / static_cast<double>(points - 1) : 0.0;

    double peak = 0.0;
    for (size_t j = 0; j < points; ++j) {
        const double x = step * static_cast<double>(j);
        double value;
        if (x >= last) {
            value = samples[n - 1];
        } else {
            const size_t i = static_cast<size_t>(x);
            const double frac = x - static_cast<double>(i);
            value = (1.0 - frac) * samples[i] + frac * samples[i + 1];
        }
        peak = std::max(peak, std::fabs(value));
    }
    return clamp_to_floor(amplitude_to_db(peak), kMeterFloorDb);
}

double LevelMeter::momentary_lufs(std::span<const float> left, std::span<const float> right,
                                  Weighting weighting) {
    const double gain = weighting_gain(weighting);
    const double power = 0.5 * (mean_square(left, gain) + mean_square(right, gain));
    return kLufsOffset + 10.0 * std::log10(power + kEpsilon);
}

LevelMeter::LevelMeter(size_t history_capacity)
    : history_capacity_(std::max<size_t>(history_capacity, 1))
{
}

void LevelMeter::process(const AudioBlock& block) {
    if (block.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        rms_db_.fill(kMeterFloorDb);
        true_peak_db_.fill(kMeterFloorDb);
        return;
    }

    const std::vector<float> left = block.channel(0);
    const std::vector<float> right = block.channel(1);

    std::lock_guard<std::mutex> lock(mutex_);
    if (block.sample_rate > 0) {
        const double block_seconds = static_cast<double>(block.frames()) / block.sample_rate;
        set_history_capacity_locked(history_capacity_for(block_seconds, update_interval_));
    }

    rms_db_ = {rms_db(left), rms_db(right)};
    true_peak_db_ = {true_peak_db(left), true_peak_db(right)};
    push_history_locked(momentary_lufs(left, right, weighting_));
}

size_t LevelMeter::history_capacity_for(double block_seconds, double update_interval_seconds) {
    if (!(block_seconds > 0.0)) return 1;
    double period = block_seconds;
    if (update_interval_seconds > block_seconds) {
        // Blocks arrive whole, so a throttled update lands on a block boundary
        const double blocks = std::ceil(update_interval_seconds / block_seconds - 1e-9);
        period = blocks * block_seconds;
    }
    return std::max<size_t>(static_cast<size_t>(std::ceil(kHistorySeconds / period - 1e-9)), 1);
}

void LevelMeter::set_update_interval(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_interval_ = seconds > 0.0 ? seconds : 0.0;
}

double LevelMeter::update_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_interval_;
}

void LevelMeter::add_momentary(double lufs) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_history_locked(lufs);
}

void LevelMeter::push_history_locked(double lufs) {
    momentary_ = lufs;
    history_.push_back(lufs);
    while (history_.size() > history_capacity_) {
        history_.pop_front();
    }

    short_term_ = mean(history_);

    if (gating_ && history_.size() >= kMinGatedHistory) {
        double sum = 0.0;
        size_t count = 0;
        for (double v : history_) {
            if (v > kGateThresholdLufs) {
                sum += v;
                ++count;
            }
        }
        // Nothing above the gate: keep the previous value
        if (count > 0) {
            integrated_ = sum / static_cast<double>(count);
        }
    } else {
        integrated_ = short_term_;
    }
}

void LevelMeter::set_history_capacity_locked(size_t capacity) {
    history_capacity_ = std::max<size_t>(capacity, 1);
    while (history_.size() > history_capacity_) {
        history_.pop_front();
    }
}

void LevelMeter::clear_history_locked() {
    history_.clear();
    short_term_ = kMeterFloorDb;
    integrated_ = kMeterFloorDb;
}

void LevelMeter::set_weighting(Weighting weighting) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (weighting_ == weighting) return;
    weighting_ = weighting;
    clear_history_locked();
}

Weighting LevelMeter::cycle_weighting() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (weighting_) {
        case Weighting::K: weighting_ = Weighting::A; break;
        case Weighting::A: weighting_ = Weighting::C; break;
        case Weighting::C: weighting_ = Weighting::Z; break;
        case Weighting::Z: weighting_ = Weighting::K; break;
    }
    clear_history_locked();
    return weighting_;
}

Weighting LevelMeter::weighting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return weighting_;
}

void LevelMeter::set_gating(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (gating_ == enabled) return;
    gating_ = enabled;
    clear_history_locked();
}

bool LevelMeter::gating() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gating_;
}

void LevelMeter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_history_locked();
}

MeterReadings LevelMeter::readings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MeterReadings out;
    for (size_t ch = 0; ch < 2; ++ch) {
        out.rms_db[ch] = clamp_to_floor(rms_db_[ch], kMeterFloorDb);
        out.true_peak_db[ch] = clamp_to_floor(true_peak_db_[ch], kMeterFloorDb);
    }
    out.momentary_lufs = clamp_to_floor(momentary_, kMeterFloorDb);
    out.short_term_lufs = clamp_to_floor(short_term_, kMeterFloorDb);
    out.integrated_lufs = clamp_to_floor(integrated_, kMeterFloorDb);
    return out;
}

size_t LevelMeter::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

size_t LevelMeter::history_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_capacity_;
}

} // namespace omega::dsp
