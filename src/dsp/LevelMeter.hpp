/**
 * @file LevelMeter.hpp
 * @brief RMS, 4x true peak and simplified LUFS loudness per block.
 */

#ifndef OMEGA_LEVEL_METER_HPP
#define OMEGA_LEVEL_METER_HPP

#include "AudioBlock.hpp"
#include "Decibels.hpp"
#include <array>
#include <cstddef>
#include <deque>
#include <mutex>
#include <span>

namespace omega::dsp {

/**
 * @brief Loudness weighting curve.
 *
 * Every mode currently applies a flat gain of 1.0, so K, A, C and Z read
 * the same. The mode is still tracked and switching it resets history.
 */
enum class Weighting {
    K,
    A,
    C,
    Z
};

const char* to_string(Weighting weighting);
double weighting_gain(Weighting weighting);

/**
 * @brief Snapshot published to renderers. Every value is floor-clamped.
 */
struct MeterReadings {
    std::array<double, 2> rms_db{kMeterFloorDb, kMeterFloorDb};          // L, R
    std::array<double, 2> true_peak_db{kMeterFloorDb, kMeterFloorDb};    // L, R
    double momentary_lufs = kMeterFloorDb;
    double short_term_lufs = kMeterFloorDb;
    double integrated_lufs = kMeterFloorDb;
};

/**
 * @brief Block-rate level and loudness meter.
 *
 * process() runs on the processing thread; readings() and the setters may
 * be called from any thread.
 */
class LevelMeter {
public:
    static constexpr double kGateThresholdLufs = -70.0;
    static constexpr size_t kMinGatedHistory = 10;
    static constexpr double kHistorySeconds = 3.0;
    static constexpr double kLufsOffset = -0.691;

    /**
     * @param history_capacity Initial bound on the loudness history. Reset
     * to ceil(3 s / update period) by the first processed block.
     */
    explicit LevelMeter(size_t history_capacity = 282);

    /**
     * @brief Minimum time between process() calls, in seconds.
     *
     * A caller that skips blocks sets this so the history still spans
     * three seconds. The update period becomes the smallest whole number
     * of blocks covering the interval. Zero (the default) means every
     * block is processed.
     */
    void set_update_interval(double seconds);
    double update_interval() const;

    /**
     * @brief History entries needed for three seconds of audio.
     */
    static size_t history_capacity_for(double block_seconds, double update_interval_seconds);

    /**
     * @brief Meter one block. Mono is metered as identical L and R.
     *
     * An empty block drops RMS and true peak to the floor and leaves the
     * loudness history alone.
     */
    void process(const AudioBlock& block);

    /**
     * @brief Append a precomputed momentary loudness and recompute
     * short-term and integrated values.
     */
    void add_momentary(double lufs);

    void set_weighting(Weighting weighting);

    /**
     * @brief Step K -> A -> C -> Z -> K.
     * @return The new mode.
     */
    Weighting cycle_weighting();

    Weighting weighting() const;

    void set_gating(bool enabled);
    bool gating() const;

    /**
     * @brief Clear the history; short-term and integrated return to the floor.
     */
    void reset();

    MeterReadings readings() const;

    size_t history_size() const;
    size_t history_capacity() const;

    // Stateless building blocks, also used for AudioManager::current_level()

    /** @brief 20*log10(rms), floor on empty or silent input. */
    static double rms_db(std::span<const float> samples);

    /**
     * @brief Peak of the 4x linearly interpolated signal.
     *
     * The grid is linspace(0, N, 4N) over sample positions 0..N-1; points
     * past the last sample hold its value.
     */
    static double true_peak_db(std::span<const float> samples);

    /** @brief -0.691 + 10*log10(mean channel power + eps). Not clamped. */
    static double momentary_lufs(std::span<const float> left, std::span<const float> right,
                                 Weighting weighting);

private:
    void set_history_capacity_locked(size_t capacity);
    void push_history_locked(double lufs);
    void clear_history_locked();

    mutable std::mutex mutex_;
    Weighting weighting_ = Weighting::K;
    bool gating_ = true;
    double update_interval_ = 0.0;
    size_t history_capacity_;
    std::deque<double> history_;

    std::array<double, 2> rms_db_{kMeterFloorDb, kMeterFloorDb};
    std::array<double, 2> true_peak_db_{kMeterFloorDb, kMeterFloorDb};
    double momentary_ = kMeterFloorDb;
    double short_term_ = kMeterFloorDb;
    double integrated_ = kMeterFloorDb;
};

} // namespace omega::dsp

#endif // OMEGA_LEVEL_METER_HPP
