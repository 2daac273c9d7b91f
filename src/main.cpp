/**
 * @file main.cpp
 * @brief omega6_monitor: capture from an input and print live meters.
 *
 * Usage: omega6_monitor [--list] [--device N] [--seconds S]
 */

#include "Engine.hpp"
#include "alsa/AlsaDriver.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_keep_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_keep_running = false;
    }
}

struct Options {
    bool list_only = false;
    std::optional<int> device;
    int seconds = -1;       // Run until SIGINT
};

void print_usage() {
    std::cout << "Usage: omega6_monitor [--list] [--device N] [--seconds S]\n"
              << "  --list       Print devices and exit\n"
              << "  --device N   Capture from device index N\n"
              << "  --seconds S  Stop after S seconds\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--list") {
            opts.list_only = true;
        } else if ((arg == "--device" || arg == "--seconds") && i + 1 < argc) {
            char* end = nullptr;
            const long value = std::strtol(argv[++i], &end, 10);
            if (!end || *end != '\0') return std::nullopt;
            if (arg == "--device") {
                opts.device = static_cast<int>(value);
            } else {
                opts.seconds = static_cast<int>(value);
            }
        } else {
            return std::nullopt;
        }
    }
    return opts;
}

// Horizontal bar for a dB value over [-60, 0]
std::string meter_bar(double db, int width = 30) {
    const double norm = std::clamp((db + 60.0) / 60.0, 0.0, 1.0);
    const int filled = static_cast<int>(norm * width);
    return std::string(static_cast<size_t>(filled), '#') + std::string(static_cast<size_t>(width - filled), '-');
}

void print_readings(const omega::dsp::MeterReadings& r) {
    std::cout << std::fixed << std::setprecision(1)
              << "L [" << meter_bar(r.rms_db[0]) << "] " << std::setw(6) << r.rms_db[0] << " dB"
              << "  R [" << meter_bar(r.rms_db[1]) << "] " << std::setw(6) << r.rms_db[1] << " dB"
              << "  TP " << std::setw(6) << std::max(r.true_peak_db[0], r.true_peak_db[1]) << " dBTP"
              << "  M " << std::setw(6) << r.momentary_lufs
              << "  S " << std::setw(6) << r.short_term_lufs
              << "  I " << std::setw(6) << r.integrated_lufs << " LUFS\n";
}

} // namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    std::signal(SIGINT, signal_handler);

    omega::Engine engine([](omega::Logger& logger) {
        return std::make_unique<hal::AlsaBackend>(logger);
    });
    auto& manager = engine.manager();

    std::cout << manager.describe_devices();
    engine.logger().flush(std::cerr);
    if (opts->list_only) return 0;

    if (opts->device) {
        const auto status = manager.set_input_device(*opts->device);
        if (status != omega::CaptureStatus::Ok) {
            engine.logger().flush(std::cerr);
            std::cerr << "Cannot select device " << *opts->device << ": " << omega::to_string(status) << "\n";
            return 1;
        }
    }

    const auto status = manager.start_capture();
    if (status != omega::CaptureStatus::Ok) {
        engine.logger().flush(std::cerr);
        std::cerr << "Capture failed: " << omega::to_string(status) << "\n";
        return 1;
    }

    const auto start_time = std::chrono::steady_clock::now();
    while (g_keep_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        engine.logger().flush(std::cerr);
        print_readings(engine.meter().readings());

        if (!manager.is_capturing()) {
            std::cerr << "Input stream stopped, exiting\n";
            break;
        }

        if (opts->seconds >= 0) {
            const auto elapsed = std::chrono::steady_clock::now() - start_time;
            if (elapsed >= std::chrono::seconds(opts->seconds)) break;
        }
    }

    manager.stop_capture();

    const auto stats = manager.stats();
    std::cout << "Captured " << stats.blocks_captured << " blocks, dispatched " << stats.blocks_dispatched
              << ", dropped " << stats.blocks_dropped << ", consumer failures " << stats.consumer_failures
              << ", stream failures " << stats.stream_failures << "\n";
    engine.logger().flush(std::cerr);
    return 0;
}
