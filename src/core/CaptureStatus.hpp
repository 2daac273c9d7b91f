/**
 * @file CaptureStatus.hpp
 * @brief Result codes for capture control calls.
 */

#ifndef OMEGA_CAPTURE_STATUS_HPP
#define OMEGA_CAPTURE_STATUS_HPP

namespace omega {

enum class CaptureStatus {
    Ok,
    InvalidDevice,      // Unknown index or not input-capable
    NoDeviceSelected,
    AlreadyRunning,
    DeviceOpenFailed    // Stream could not be opened/started; capture stays stopped
};

inline const char* to_string(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::Ok: return "Ok";
        case CaptureStatus::InvalidDevice: return "InvalidDevice";
        case CaptureStatus::NoDeviceSelected: return "NoDeviceSelected";
        case CaptureStatus::AlreadyRunning: return "AlreadyRunning";
        case CaptureStatus::DeviceOpenFailed: return "DeviceOpenFailed";
    }
    return "Unknown";
}

} // namespace omega

#endif // OMEGA_CAPTURE_STATUS_HPP
