/**
 * @file AudioBridge.cpp
 * @brief C-compatible API bridge for the capture engine.
 */

#include "CInterface.h"
#include "Engine.hpp"
#include "alsa/AlsaDriver.hpp"
#include <algorithm>
#include <cstring>
#include <memory>
#include <string_view>

namespace {

omega::Engine* to_engine(OmegaEngineHandle handle) {
    return static_cast<omega::Engine*>(handle);
}

int to_status(omega::CaptureStatus status) {
    switch (status) {
        case omega::CaptureStatus::Ok: return OMEGA_OK;
        case omega::CaptureStatus::InvalidDevice: return OMEGA_ERR_INVALID_DEVICE;
        case omega::CaptureStatus::NoDeviceSelected: return OMEGA_ERR_NO_DEVICE_SELECTED;
        case omega::CaptureStatus::AlreadyRunning: return OMEGA_ERR_ALREADY_RUNNING;
        case omega::CaptureStatus::DeviceOpenFailed: return OMEGA_ERR_DEVICE_OPEN_FAILED;
    }
    return OMEGA_ERR_INVALID_ARGUMENT;
}

// Truncating copy that always terminates
void copy_string(char* dst, size_t size, std::string_view src) {
    if (!dst || size == 0) return;
    const size_t n = std::min(src.size(), size - 1);
    if (n > 0) std::memcpy(dst, src.data(), n);
    dst[n] = '\0';
}

// Every entry point runs inside this: no exception crosses the C ABI
template<typename Body>
int guarded(OmegaEngineHandle handle, Body&& body) {
    auto* engine = to_engine(handle);
    if (!engine) return OMEGA_ERR_INVALID_HANDLE;
    try {
        return body(*engine);
    } catch (...) {
        return OMEGA_ERR_INTERNAL;
    }
}

} // namespace

extern "C" {

OmegaEngineHandle omega_engine_create(void) {
    try {
        auto* engine = new omega::Engine([](omega::Logger& logger) {
            return std::make_unique<hal::AlsaBackend>(logger);
        });
        return static_cast<OmegaEngineHandle>(engine);
    } catch (...) {
        return nullptr;
    }
}

void omega_engine_destroy(OmegaEngineHandle handle) {
    delete to_engine(handle);
}

int omega_engine_refresh_devices(OmegaEngineHandle handle) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        return engine.manager().refresh_devices() ? OMEGA_OK : OMEGA_ERR_ENUMERATION_FAILED;
    });
}

int omega_engine_device_count(OmegaEngineHandle handle) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        return static_cast<int>(engine.manager().devices().size());
    });
}

int omega_engine_device_info(OmegaEngineHandle handle, int position, OmegaDeviceInfo* out) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        if (!out) return OMEGA_ERR_INVALID_ARGUMENT;

        const auto devices = engine.manager().devices();
        if (position < 0 || static_cast<size_t>(position) >= devices.size()) return OMEGA_ERR_INVALID_ARGUMENT;

        const auto& d = devices[static_cast<size_t>(position)];
        out->index = d.index;
        copy_string(out->name, sizeof(out->name), d.name);
        out->input_channels = d.input_channels;
        out->output_channels = d.output_channels;
        out->sample_rate = d.sample_rate;
        out->is_default_input = d.is_default_input ? 1 : 0;
        out->is_default_output = d.is_default_output ? 1 : 0;
        out->is_selected_input = engine.manager().input_device() == d.index ? 1 : 0;
        out->latency_ms = d.latency_ms;
        return OMEGA_OK;
    });
}

int omega_engine_set_input_device(OmegaEngineHandle handle, int device_index) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        return to_status(engine.manager().set_input_device(device_index));
    });
}

int omega_engine_start_capture(OmegaEngineHandle handle) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        return to_status(engine.manager().start_capture());
    });
}

int omega_engine_stop_capture(OmegaEngineHandle handle) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        engine.manager().stop_capture();
        return OMEGA_OK;
    });
}

int omega_engine_is_capturing(OmegaEngineHandle handle) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        return engine.manager().is_capturing() ? 1 : 0;
    });
}

int omega_engine_current_level(OmegaEngineHandle handle, double* left_db, double* right_db) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        if (!left_db || !right_db) return OMEGA_ERR_INVALID_ARGUMENT;
        const auto level = engine.manager().current_level();
        *left_db = level[0];
        *right_db = level[1];
        return OMEGA_OK;
    });
}

int omega_spectrum_bin_count(OmegaEngineHandle handle) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        return engine.spectrum().binner().num_bars();
    });
}

int omega_spectrum_set_bar_count(OmegaEngineHandle handle, int num_bars) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        return engine.spectrum().binner().set_bar_count(num_bars) ? OMEGA_OK : OMEGA_ERR_INVALID_ARGUMENT;
    });
}

int omega_spectrum_set_db_range(OmegaEngineHandle handle, int db_range) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        return engine.spectrum().binner().set_db_range(db_range) ? OMEGA_OK : OMEGA_ERR_INVALID_ARGUMENT;
    });
}

int omega_spectrum_set_peak_hold(OmegaEngineHandle handle, int enabled) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        engine.spectrum().binner().set_peak_hold(enabled != 0);
        return OMEGA_OK;
    });
}

int omega_spectrum_reset_peaks(OmegaEngineHandle handle) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        engine.spectrum().binner().reset_peaks();
        return OMEGA_OK;
    });
}

int omega_spectrum_read_bins(OmegaEngineHandle handle, OmegaSpectrumBin* out, size_t capacity) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        if (!out && capacity > 0) return OMEGA_ERR_INVALID_ARGUMENT;

        const auto bins = engine.spectrum().bins();
        const size_t n = std::min(bins.size(), capacity);
        for (size_t i = 0; i < n; ++i) {
            out[i].frequency = bins[i].frequency;
            out[i].level_db = bins[i].level_db;
            out[i].peak_db = bins[i].peak_db;
        }
        return static_cast<int>(n);
    });
}

int omega_meter_readings(OmegaEngineHandle handle, OmegaMeterReadings* out) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        if (!out) return OMEGA_ERR_INVALID_ARGUMENT;

        const auto r = engine.meter().readings();
        for (size_t ch = 0; ch < 2; ++ch) {
            out->rms_db[ch] = r.rms_db[ch];
            out->true_peak_db[ch] = r.true_peak_db[ch];
        }
        out->momentary_lufs = r.momentary_lufs;
        out->short_term_lufs = r.short_term_lufs;
        out->integrated_lufs = r.integrated_lufs;
        return OMEGA_OK;
    });
}

int omega_meter_set_weighting(OmegaEngineHandle handle, int weighting) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        omega::dsp::Weighting mode;
        switch (weighting) {
            case OMEGA_WEIGHTING_K: mode = omega::dsp::Weighting::K; break;
            case OMEGA_WEIGHTING_A: mode = omega::dsp::Weighting::A; break;
            case OMEGA_WEIGHTING_C: mode = omega::dsp::Weighting::C; break;
            case OMEGA_WEIGHTING_Z: mode = omega::dsp::Weighting::Z; break;
            default: return OMEGA_ERR_INVALID_ARGUMENT;
        }
        engine.meter().meter().set_weighting(mode);
        return OMEGA_OK;
    });
}

int omega_meter_set_gating(OmegaEngineHandle handle, int enabled) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        engine.meter().meter().set_gating(enabled != 0);
        return OMEGA_OK;
    });
}

int omega_meter_reset(OmegaEngineHandle handle) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        engine.meter().meter().reset();
        return OMEGA_OK;
    });
}

int omega_log_pop(OmegaEngineHandle handle, int* level,
                  char* tag, size_t tag_size,
                  char* message, size_t message_size) {
    return guarded(handle, [&](omega::Engine& engine) -> int {
        auto entry = engine.logger().pop_entry();
        if (!entry) return 0;

        if (level) *level = static_cast<int>(entry->level);
        copy_string(tag, tag_size, entry->tag);
        copy_string(message, message_size, entry->message);
        return 1;
    });
}

} // extern "C"
