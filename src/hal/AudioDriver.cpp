/**
 * @file AudioDriver.cpp
 * @brief Shared helpers for the HAL interfaces.
 */

#include "AudioDriver.hpp"
#include <sstream>

namespace hal {

std::string describe(const DeviceInfo& device) {
    std::ostringstream out;
    out << device.name << " (";
    if (device.is_input()) {
        out << "Input";
        if (device.is_output()) out << "/";
    }
    if (device.is_output()) out << "Output";
    out << ", " << device.channels() << "ch, " << device.sample_rate << "Hz)";
    if (device.is_default()) out << " [DEFAULT]";
    return out.str();
}

} // namespace hal
