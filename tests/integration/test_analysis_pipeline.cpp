#include <gtest/gtest.h>
#include "Engine.hpp"
#include "../TestHelper.hpp"
#include <cmath>
#include <memory>
#include <vector>

using namespace omega;

class AnalysisPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_unique<Engine>([this](Logger&) {
            auto fake = std::make_unique<test::FakeBackend>();
            state = fake->state;
            return fake;
        });
        engine->meter().set_update_rate(0.0);
    }

    void feed(const std::vector<float>& interleaved, int blocks) {
        const auto before = engine->manager().stats().blocks_dispatched;
        for (int i = 0; i < blocks; ++i) {
            ASSERT_TRUE(state->emit(interleaved, 2, 48000));
            // Keep the queue shallow so nothing is dropped
            ASSERT_TRUE(test::wait_until([&] {
                return engine->manager().stats().blocks_dispatched == before + static_cast<uint64_t>(i) + 1;
            }));
        }
    }

    std::shared_ptr<test::FakeStreamState> state;
    std::unique_ptr<Engine> engine;
};

TEST_F(AnalysisPipelineTest, ToneFlowsToSpectrumAndMeters) {
    ASSERT_EQ(engine->manager().start_capture(), CaptureStatus::Ok);
    feed(test::make_sine(1000.0, 48000, 512, 2, 0.5f), 20);
    engine->manager().stop_capture();

    const auto bins = engine->spectrum().bins();
    ASSERT_EQ(bins.size(), 256u);
    size_t loudest = 0;
    for (size_t i = 1; i < bins.size(); ++i) {
        if (bins[i].level_db > bins[loudest].level_db) loudest = i;
        EXPECT_GE(bins[i].peak_db, bins[i].level_db);
    }
    EXPECT_GT(bins[loudest].frequency, 900.0);
    EXPECT_LT(bins[loudest].frequency, 1100.0);

    const auto r = engine->meter().readings();
    const double sine_rms = 20.0 * std::log10(0.5 / std::sqrt(2.0));
    EXPECT_NEAR(r.rms_db[0], sine_rms, 0.1);
    EXPECT_NEAR(r.rms_db[1], sine_rms, 0.1);
    EXPECT_NEAR(r.true_peak_db[0], 20.0 * std::log10(0.5), 0.1);
    EXPECT_NEAR(r.momentary_lufs, -0.691 + 10.0 * std::log10(0.125), 0.1);
    EXPECT_NEAR(r.integrated_lufs, r.momentary_lufs, 0.1);
    EXPECT_EQ(engine->meter().meter().history_size(), 20u);

    const auto stats = engine->manager().stats();
    EXPECT_EQ(stats.blocks_captured, 20u);
    EXPECT_EQ(stats.blocks_dropped, 0u);
    EXPECT_EQ(stats.consumer_failures, 0u);
}

TEST_F(AnalysisPipelineTest, SilenceSettlesAtFloors) {
    ASSERT_EQ(engine->manager().start_capture(), CaptureStatus::Ok);
    feed(std::vector<float>(512 * 2, 0.0f), 30);
    engine->manager().stop_capture();

    // Bars without an FFT bin approach the floor from above
    for (const auto& bin : engine->spectrum().bins()) {
        EXPECT_NEAR(bin.level_db, -80.0, 0.5);
        EXPECT_GE(bin.level_db, -80.0);
    }
    const auto r = engine->meter().readings();
    EXPECT_DOUBLE_EQ(r.rms_db[0], -100.0);
    EXPECT_DOUBLE_EQ(r.true_peak_db[1], -100.0);
    EXPECT_DOUBLE_EQ(r.short_term_lufs, -100.0);
}

TEST_F(AnalysisPipelineTest, RestartAfterStopKeepsConsumers) {
    ASSERT_EQ(engine->manager().start_capture(), CaptureStatus::Ok);
    feed(std::vector<float>(512 * 2, 0.1f), 2);
    engine->manager().stop_capture();
    engine->manager().stop_capture();

    ASSERT_EQ(engine->manager().start_capture(), CaptureStatus::Ok);
    feed(std::vector<float>(512 * 2, 0.1f), 2);
    engine->manager().stop_capture();

    EXPECT_EQ(engine->manager().consumer_count(), 2u);
    EXPECT_EQ(engine->meter().updates(), 4u);
    EXPECT_EQ(engine->spectrum().updates(), 4u);
}
