#include <gtest/gtest.h>
#include "SpectrumBinner.hpp"
#include <chrono>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace omega::dsp;
using namespace std::chrono_literals;

namespace {

// 100 Hz resolution axis, 0..24 kHz, as produced by a 480-point FFT at 48 kHz
struct TestSpectrum {
    std::vector<float> magnitudes;
    std::vector<float> frequencies;

    TestSpectrum() : magnitudes(241, 0.0f), frequencies(241) {
        for (size_t k = 0; k < frequencies.size(); ++k) {
            frequencies[k] = 100.0f * static_cast<float>(k);
        }
    }

    void set(float freq, float magnitude) {
        magnitudes[static_cast<size_t>(freq / 100.0f)] = magnitude;
    }
};

SpectrumBinner::Config four_bars(double alpha = 0.8) {
    SpectrumBinner::Config config;
    config.num_bars = 4;
    config.averaging_factor = alpha;
    return config;
}

} // namespace

TEST(LogSpacedEdgesTest, DefaultLayoutIsStrictlyIncreasingAndPinned) {
    const auto edges = log_spaced_edges(20.0, 20000.0, 256);
    ASSERT_EQ(edges.size(), 257u);
    EXPECT_EQ(edges.front(), 20.0);
    EXPECT_EQ(edges.back(), 20000.0);
    for (size_t i = 1; i < edges.size(); ++i) {
        EXPECT_GT(edges[i], edges[i - 1]);
    }
}

TEST(LogSpacedEdgesTest, EqualRatiosBetweenEdges) {
    const auto edges = log_spaced_edges(20.0, 20000.0, 3);
    ASSERT_EQ(edges.size(), 4u);
    EXPECT_NEAR(edges[1], 200.0, 1e-9);
    EXPECT_NEAR(edges[2], 2000.0, 1e-9);
}

TEST(LogSpacedEdgesTest, InvalidRangeGivesNoEdges) {
    EXPECT_TRUE(log_spaced_edges(0.0, 20000.0, 64).empty());
    EXPECT_TRUE(log_spaced_edges(100.0, 50.0, 64).empty());
    EXPECT_TRUE(log_spaced_edges(20.0, 20000.0, 0).empty());
}

TEST(SpectrumBinnerTest, EverySupportedBarCountKeepsEdgeInvariants) {
    SpectrumBinner binner;
    for (int bars : SpectrumBinner::kBarCounts) {
        ASSERT_TRUE(binner.set_bar_count(bars));
        const auto edges = binner.edges();
        ASSERT_EQ(edges.size(), static_cast<size_t>(bars) + 1);
        EXPECT_EQ(edges.front(), 20.0);
        EXPECT_EQ(edges.back(), 20000.0);
        for (size_t i = 1; i < edges.size(); ++i) {
            ASSERT_GT(edges[i], edges[i - 1]);
        }
        EXPECT_EQ(binner.bins().size(), static_cast<size_t>(bars));
    }
}

TEST(SpectrumBinnerTest, RejectsUnsupportedSelections) {
    SpectrumBinner binner;
    EXPECT_FALSE(binner.set_bar_count(100));
    EXPECT_FALSE(binner.set_bar_count(0));
    EXPECT_EQ(binner.num_bars(), 256);

    EXPECT_FALSE(binner.set_db_range(70));
    EXPECT_DOUBLE_EQ(binner.floor_db(), -80.0);
    EXPECT_TRUE(binner.set_db_range(120));
    EXPECT_DOUBLE_EQ(binner.floor_db(), -120.0);
}

TEST(SpectrumBinnerTest, InvalidConfigLeavesStateUntouched) {
    SpectrumBinner binner(four_bars());
    auto bad = four_bars();
    bad.min_freq = 0.0;
    EXPECT_FALSE(binner.configure(bad));

    bad = four_bars();
    bad.max_freq = 10.0;
    EXPECT_FALSE(binner.configure(bad));

    EXPECT_EQ(binner.num_bars(), 4);
    EXPECT_EQ(binner.edges().front(), 20.0);
}

TEST(SpectrumBinnerTest, CentreIsMeanOfEdges) {
    SpectrumBinner binner(four_bars());
    const auto edges = binner.edges();
    const auto bins = binner.bins();
    for (size_t i = 0; i < bins.size(); ++i) {
        EXPECT_DOUBLE_EQ(bins[i].frequency, 0.5 * (edges[i] + edges[i + 1]));
    }
}

TEST(SpectrumBinnerTest, UnitToneLandsInItsBarOthersReachFloor) {
    SpectrumBinner binner(four_bars());
    TestSpectrum spectrum;
    spectrum.set(1000.0f, 1.0f);

    for (int i = 0; i < 50; ++i) {
        binner.update(spectrum.magnitudes, spectrum.frequencies);
    }

    const auto bins = binner.bins();
    ASSERT_EQ(bins.size(), 4u);
    // 1 kHz falls in [632, 3557)
    EXPECT_NEAR(bins[2].level_db, 0.0, 0.01);
    EXPECT_DOUBLE_EQ(bins[0].level_db, -80.0);
    EXPECT_DOUBLE_EQ(bins[1].level_db, -80.0);
    EXPECT_DOUBLE_EQ(bins[3].level_db, -80.0);
}

TEST(SpectrumBinnerTest, ExponentialSmoothing) {
    SpectrumBinner binner(four_bars(0.8));
    TestSpectrum spectrum;
    spectrum.set(1000.0f, 0.1f);   // -20 dB

    binner.update(spectrum.magnitudes, spectrum.frequencies);
    EXPECT_NEAR(binner.bins()[2].level_db, -4.0, 1e-4);

    binner.update(spectrum.magnitudes, spectrum.frequencies);
    EXPECT_NEAR(binner.bins()[2].level_db, -7.2, 1e-4);
}

TEST(SpectrumBinnerTest, EmptyUpdateIsNoOp) {
    SpectrumBinner binner(four_bars());
    TestSpectrum spectrum;
    spectrum.set(1000.0f, 0.1f);
    binner.update(spectrum.magnitudes, spectrum.frequencies);
    const auto before = binner.bins();

    binner.update({}, {});

    const auto after = binner.bins();
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(before[i].level_db, after[i].level_db);
        EXPECT_EQ(before[i].peak_db, after[i].peak_db);
    }
}

TEST(SpectrumBinnerTest, PeakHoldsThenDecaysTowardFloor) {
    SpectrumBinner binner(four_bars(0.0));
    binner.reset_peaks();

    TestSpectrum loud;
    loud.set(1000.0f, 0.1f);    // -20 dB
    const TestSpectrum silent;
    const auto t0 = SpectrumBinner::Clock::now();

    binner.update(loud.magnitudes, loud.frequencies, t0);
    EXPECT_NEAR(binner.bins()[2].peak_db, -20.0, 1e-4);

    // Inside the hold time the peak stays put
    binner.update(silent.magnitudes, silent.frequencies, t0 + 1s);
    EXPECT_NEAR(binner.bins()[2].peak_db, -20.0, 1e-4);
    EXPECT_DOUBLE_EQ(binner.bins()[2].level_db, -80.0);

    // Past it, the distance above the floor shrinks by the decay factor
    binner.update(silent.magnitudes, silent.frequencies, t0 + 4s);
    EXPECT_NEAR(binner.bins()[2].peak_db, -80.0 + 60.0 * 0.95, 1e-4);

    binner.update(silent.magnitudes, silent.frequencies, t0 + 5s);
    EXPECT_NEAR(binner.bins()[2].peak_db, -80.0 + 60.0 * 0.95 * 0.95, 1e-4);

    for (int i = 0; i < 500; ++i) {
        binner.update(silent.magnitudes, silent.frequencies, t0 + 6s);
    }
    EXPECT_NEAR(binner.bins()[2].peak_db, -80.0, 1e-3);
    EXPECT_GE(binner.bins()[2].peak_db, -80.0);
}

TEST(SpectrumBinnerTest, PeakNeverBelowLevel) {
    SpectrumBinner binner;
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> magnitude(0.0f, 2.0f);
    std::bernoulli_distribution silent(0.3);

    std::vector<float> freqs(513);
    for (size_t k = 0; k < freqs.size(); ++k) {
        freqs[k] = 48000.0f * static_cast<float>(k) / 1024.0f;
    }
    std::vector<float> mags(freqs.size());

    auto now = SpectrumBinner::Clock::now();
    for (int round = 0; round < 200; ++round) {
        const bool quiet = silent(rng);
        for (auto& m : mags) m = quiet ? 0.0f : magnitude(rng);
        now += 250ms;
        binner.update(mags, freqs, now);

        for (const auto& bin : binner.bins()) {
            ASSERT_GE(bin.peak_db, bin.level_db);
            ASSERT_GE(bin.level_db, binner.floor_db());
        }
    }
}

TEST(SpectrumBinnerTest, PeakHoldOffReportsLevel) {
    SpectrumBinner binner(four_bars());
    TestSpectrum spectrum;
    spectrum.set(1000.0f, 1.0f);
    binner.update(spectrum.magnitudes, spectrum.frequencies);

    binner.set_peak_hold(false);
    binner.update(spectrum.magnitudes, spectrum.frequencies);
    for (const auto& bin : binner.bins()) {
        EXPECT_EQ(bin.peak_db, bin.level_db);
    }
}

TEST(SpectrumBinnerTest, NonFiniteInputNeverReachesOutput) {
    SpectrumBinner binner(four_bars());
    TestSpectrum spectrum;
    spectrum.set(1000.0f, std::numeric_limits<float>::quiet_NaN());
    spectrum.set(200.0f, std::numeric_limits<float>::infinity());
    spectrum.set(5000.0f, -1.0f);

    for (int i = 0; i < 10; ++i) {
        binner.update(spectrum.magnitudes, spectrum.frequencies);
    }
    for (const auto& bin : binner.bins()) {
        EXPECT_TRUE(std::isfinite(bin.level_db));
        EXPECT_TRUE(std::isfinite(bin.peak_db));
        EXPECT_GE(bin.level_db, -80.0);
    }
    // The bar holding the infinite bin reads as if that bin were absent
    EXPECT_DOUBLE_EQ(binner.bins()[1].level_db, -80.0);
}

TEST(SpectrumBinnerTest, ResetZeroesLevelsAndPeaks) {
    SpectrumBinner binner(four_bars());
    const TestSpectrum silent;
    for (int i = 0; i < 20; ++i) {
        binner.update(silent.magnitudes, silent.frequencies);
    }
    EXPECT_DOUBLE_EQ(binner.bins()[0].level_db, -80.0);

    binner.reset();
    for (const auto& bin : binner.bins()) {
        EXPECT_DOUBLE_EQ(bin.level_db, 0.0);
        EXPECT_DOUBLE_EQ(bin.peak_db, 0.0);
    }
}

TEST(SpectrumBinnerTest, BarCountChangeDiscardsHistory) {
    SpectrumBinner binner;
    const TestSpectrum silent;
    for (int i = 0; i < 20; ++i) {
        binner.update(silent.magnitudes, silent.frequencies);
    }

    ASSERT_TRUE(binner.set_bar_count(64));
    for (const auto& bin : binner.bins()) {
        EXPECT_DOUBLE_EQ(bin.level_db, 0.0);
    }
}
