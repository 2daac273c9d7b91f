/**
 * @file SpectrumBinner.hpp
 * @brief Log-frequency display bins with EMA smoothing and peak hold.
 */

#ifndef OMEGA_SPECTRUM_BINNER_HPP
#define OMEGA_SPECTRUM_BINNER_HPP

#include <array>
#include <chrono>
#include <mutex>
#include <span>
#include <vector>

namespace omega::dsp {

/**
 * @brief One display bar as seen by a renderer.
 */
struct SpectrumBin {
    double frequency;   // Centre of the bar in Hz
    double level_db;
    double peak_db;
};

/**
 * @brief Maps FFT magnitudes onto logarithmically spaced bars.
 *
 * Each bar takes the loudest FFT bin inside [edge[i], edge[i+1]), then
 * smooths it with level = alpha*level + (1-alpha)*raw. Peaks latch the
 * smoothed level, hold for `peak_hold_time`, then fall exponentially
 * toward the floor, and are finally clamped up to the live level.
 *
 * update() runs on the processing thread; bins() may be called from any
 * thread.
 */
class SpectrumBinner {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::array<int, 5> kBarCounts{64, 128, 256, 512, 1024};
    static constexpr std::array<int, 4> kDbRanges{60, 80, 100, 120};

    struct Config {
        int num_bars = 256;
        double min_freq = 20.0;
        double max_freq = 20000.0;
        int db_range = 80;                  // Floor is -db_range
        double averaging_factor = 0.8;      // Higher is slower
        bool peak_hold = true;
        std::chrono::duration<double> peak_hold_time{3.0};
        double peak_decay = 0.95;           // Per update once the hold expires
    };

    SpectrumBinner();
    explicit SpectrumBinner(const Config& config);

    /**
     * @brief Replace the configuration and discard all history.
     * @return false (state untouched) if the config is not usable.
     */
    bool configure(const Config& config);

    static bool is_valid(const Config& config);
    static bool is_supported_bar_count(int num_bars);
    static bool is_supported_db_range(int db_range);

    /**
     * @brief Runtime bar selector; accepts only kBarCounts.
     */
    bool set_bar_count(int num_bars);

    /**
     * @brief Runtime range selector; accepts only kDbRanges.
     */
    bool set_db_range(int db_range);

    /**
     * @brief Toggle peak hold. Turning it off resets the peaks.
     */
    void set_peak_hold(bool enabled);

    bool set_averaging_factor(double alpha);

    /**
     * @brief Feed one spectrum. No-op when `magnitudes` is empty.
     */
    void update(std::span<const float> magnitudes, std::span<const float> frequencies);
    void update(std::span<const float> magnitudes, std::span<const float> frequencies,
                Clock::time_point now);

    void reset_peaks();

    /**
     * @brief Zero every level and peak.
     */
    void reset();

    /**
     * @brief Floor-clamped snapshot for renderers.
     */
    std::vector<SpectrumBin> bins() const;

    std::vector<double> edges() const;
    Config config() const;
    double floor_db() const;
    int num_bars() const;

private:
    void rebuild_locked();
    double floor_locked() const { return -static_cast<double>(config_.db_range); }

    mutable std::mutex mutex_;
    Config config_;
    std::vector<double> edges_;
    std::vector<double> centres_;
    std::vector<double> levels_;
    std::vector<double> peaks_;
    std::vector<Clock::time_point> peak_times_;
    std::vector<double> raw_;     // Scratch, reused every update
};

/**
 * @brief num_bars+1 edges at 10^linspace(log10(min), log10(max), num_bars+1).
 */
std::vector<double> log_spaced_edges(double min_freq, double max_freq, int num_bars);

} // namespace omega::dsp

#endif // OMEGA_SPECTRUM_BINNER_HPP
