/**
 * @file CInterface.h
 * @brief C-compatible API for driving the capture engine from a GUI layer.
 *
 * Every function taking a handle returns OMEGA_OK (0) or a negative
 * OmegaStatus, unless documented otherwise. Analysis results are pulled:
 * call the read functions at the display refresh rate.
 */

#ifndef C_INTERFACE_H
#define C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

enum OmegaStatus {
    OMEGA_OK                     = 0,
    OMEGA_ERR_INVALID_HANDLE     = -1,
    OMEGA_ERR_INVALID_ARGUMENT   = -2,
    OMEGA_ERR_INVALID_DEVICE     = -3,
    OMEGA_ERR_NO_DEVICE_SELECTED = -4,
    OMEGA_ERR_ALREADY_RUNNING    = -5,
    OMEGA_ERR_DEVICE_OPEN_FAILED = -6,
    OMEGA_ERR_ENUMERATION_FAILED = -7,
    OMEGA_ERR_INTERNAL           = -8    // Unexpected C++ exception, call had no effect or partial effect
};

enum OmegaWeighting {
    OMEGA_WEIGHTING_K = 0,
    OMEGA_WEIGHTING_A = 1,
    OMEGA_WEIGHTING_C = 2,
    OMEGA_WEIGHTING_Z = 3
};

enum OmegaLogLevel {
    OMEGA_LOG_DEBUG   = 0,
    OMEGA_LOG_INFO    = 1,
    OMEGA_LOG_WARNING = 2,
    OMEGA_LOG_ERROR   = 3
};

typedef struct {
    int index;
    char name[128];         // Truncated, always NUL terminated
    int input_channels;
    int output_channels;
    double sample_rate;
    int is_default_input;
    int is_default_output;
    int is_selected_input;
    double latency_ms;
} OmegaDeviceInfo;

typedef struct {
    double frequency;
    double level_db;
    double peak_db;
} OmegaSpectrumBin;

typedef struct {
    double rms_db[2];           // L, R
    double true_peak_db[2];     // L, R
    double momentary_lufs;
    double short_term_lufs;
    double integrated_lufs;
} OmegaMeterReadings;

// Opaque handle type
typedef void* OmegaEngineHandle;

// Engine lifecycle (ALSA backend). Returns NULL on failure.
OmegaEngineHandle omega_engine_create(void);
void omega_engine_destroy(OmegaEngineHandle handle);

// Devices
int omega_engine_refresh_devices(OmegaEngineHandle handle);
int omega_engine_device_count(OmegaEngineHandle handle);   // Count, or negative status
int omega_engine_device_info(OmegaEngineHandle handle, int position, OmegaDeviceInfo* out);
int omega_engine_set_input_device(OmegaEngineHandle handle, int device_index);

// Capture
int omega_engine_start_capture(OmegaEngineHandle handle);
int omega_engine_stop_capture(OmegaEngineHandle handle);
int omega_engine_is_capturing(OmegaEngineHandle handle);   // 1, 0, or negative status
int omega_engine_current_level(OmegaEngineHandle handle, double* left_db, double* right_db);

// Spectrum
int omega_spectrum_bin_count(OmegaEngineHandle handle);    // Count, or negative status
int omega_spectrum_set_bar_count(OmegaEngineHandle handle, int num_bars);    // 64..1024, powers of two
int omega_spectrum_set_db_range(OmegaEngineHandle handle, int db_range);     // 60, 80, 100 or 120
int omega_spectrum_set_peak_hold(OmegaEngineHandle handle, int enabled);
int omega_spectrum_reset_peaks(OmegaEngineHandle handle);

// Copies up to `capacity` bins. Returns the number written, or negative status.
int omega_spectrum_read_bins(OmegaEngineHandle handle, OmegaSpectrumBin* out, size_t capacity);

// Meters
int omega_meter_readings(OmegaEngineHandle handle, OmegaMeterReadings* out);
int omega_meter_set_weighting(OmegaEngineHandle handle, int weighting);
int omega_meter_set_gating(OmegaEngineHandle handle, int enabled);
int omega_meter_reset(OmegaEngineHandle handle);

// Logging. Returns 1 if an entry was popped, 0 if none, or negative status.
int omega_log_pop(OmegaEngineHandle handle, int* level,
                  char* tag, size_t tag_size,
                  char* message, size_t message_size);

#ifdef __cplusplus
}
#endif

#endif // C_INTERFACE_H
