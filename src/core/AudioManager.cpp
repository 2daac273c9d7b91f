/**
 * @file AudioManager.cpp
 * @brief Owns the input stream, the capture queue and the processing thread.
 */

#include "AudioManager.hpp"
#include "LevelMeter.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace omega {

namespace {

constexpr const char* kTag = "AudioManager";

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const hal::DeviceInfo* find_device(const std::vector<hal::DeviceInfo>& devices, std::optional<int> index) {
    if (!index) return nullptr;
    for (const auto& d : devices) {
        if (d.index == *index) return &d;
    }
    return nullptr;
}

} // namespace

AudioManager::AudioManager(std::unique_ptr<hal::AudioBackend> backend, Logger& logger,
                           CaptureSettings settings)
    : backend_(std::move(backend))
    , logger_(logger)
    , settings_(std::move(settings))
    , consumers_(std::make_shared<const ConsumerList>())
    , queue_(settings_.queue_capacity)
{
    if (!backend_) {
        throw std::invalid_argument("AudioManager requires an audio backend");
    }
    refresh_devices();
}

AudioManager::~AudioManager() {
    stop_capture();
}

// --- Devices ---------------------------------------------------------------

bool AudioManager::refresh_devices() {
    std::optional<std::vector<hal::DeviceInfo>> found;
    try {
        found = backend_->enumerate_devices();
    } catch (const std::exception& e) {
        logger_.error(kTag, std::string("DeviceEnumerationFailed: ") + e.what());
        return false;
    }
    if (!found) {
        logger_.error(kTag, "DeviceEnumerationFailed: backend reported an error");
        return false;
    }

    std::lock_guard<std::mutex> lock(devices_mutex_);
    devices_ = std::move(*found);
    apply_selection_policy_locked();

    logger_.info(kTag, "Found " + std::to_string(devices_.size()) + " devices");
    if (const auto* in = find_device(devices_, input_device_)) {
        logger_.info(kTag, "Input: " + in->name);
    } else {
        logger_.warn(kTag, "No input device available");
    }
    return true;
}

bool AudioManager::is_routable(const hal::DeviceInfo& device) const {
    const std::string name = to_lower(device.name);
    for (const auto& keyword : settings_.routing_keywords) {
        if (!keyword.empty() && name.find(to_lower(keyword)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void AudioManager::apply_selection_policy_locked() {
    const auto* current_in = find_device(devices_, input_device_);
    if (!current_in || !current_in->is_input()) {
        input_device_.reset();
        for (const auto& d : devices_) {
            if (d.is_input() && is_routable(d)) {
                input_device_ = d.index;
                break;
            }
        }
        if (!input_device_) {
            const auto* fallback = find_device(devices_, backend_->default_input_device());
            if (fallback && fallback->is_input()) input_device_ = fallback->index;
        }
    }

    const auto* current_out = find_device(devices_, output_device_);
    if (!current_out || !current_out->is_output()) {
        output_device_.reset();
        const auto* fallback = find_device(devices_, backend_->default_output_device());
        if (fallback && fallback->is_output()) output_device_ = fallback->index;
    }
}

std::vector<hal::DeviceInfo> AudioManager::devices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    return devices_;
}

std::vector<hal::DeviceInfo> AudioManager::input_devices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    std::vector<hal::DeviceInfo> out;
    std::copy_if(devices_.begin(), devices_.end(), std::back_inserter(out),
                 [](const hal::DeviceInfo& d) { return d.is_input(); });
    return out;
}

std::vector<hal::DeviceInfo> AudioManager::output_devices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    std::vector<hal::DeviceInfo> out;
    std::copy_if(devices_.begin(), devices_.end(), std::back_inserter(out),
                 [](const hal::DeviceInfo& d) { return d.is_output(); });
    return out;
}

std::optional<hal::DeviceInfo> AudioManager::device(int index) const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    if (const auto* d = find_device(devices_, index)) return *d;
    return std::nullopt;
}

std::optional<int> AudioManager::input_device() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    return input_device_;
}

std::optional<int> AudioManager::output_device() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    return output_device_;
}

CaptureStatus AudioManager::set_input_device(int index) {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        const auto* d = find_device(devices_, index);
        if (!d || !d->is_input()) {
            logger_.warn(kTag, "Rejected input device " + std::to_string(index));
            return CaptureStatus::InvalidDevice;
        }
        if (input_device_ == index) return CaptureStatus::Ok;
        input_device_ = index;
        logger_.info(kTag, "Input device set to " + d->name);
    }

    if (!capturing_.load()) return CaptureStatus::Ok;

    // Never two streams: the old one is fully closed before reopening
    stop_locked();
    return start_locked();
}

CaptureStatus AudioManager::set_output_device(int index) {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    const auto* d = find_device(devices_, index);
    if (!d || !d->is_output()) {
        logger_.warn(kTag, "Rejected output device " + std::to_string(index));
        return CaptureStatus::InvalidDevice;
    }
    output_device_ = index;
    logger_.info(kTag, "Output device set to " + d->name);
    return CaptureStatus::Ok;
}

// --- Capture ---------------------------------------------------------------

CaptureStatus AudioManager::start_capture() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (capturing_.load()) return CaptureStatus::AlreadyRunning;
    return start_locked();
}

void AudioManager::stop_capture() {
    std::lock_guard<std::mutex> control(control_mutex_);
    stop_locked();
}

CaptureStatus AudioManager::start_locked() {
    // A stream that died on its own still has a thread to join
    if (stream_ || processing_thread_.joinable()) {
        stop_locked();
    }

    const std::optional<int> index = input_device();
    if (!index) {
        logger_.warn(kTag, "Start requested with no input device");
        return CaptureStatus::NoDeviceSelected;
    }

    hal::StreamParams params;
    params.sample_rate = settings_.sample_rate;
    params.block_size = settings_.block_size;
    params.num_channels = settings_.num_channels;
    params.use_realtime_priority = settings_.use_realtime_priority;

    try {
        stream_ = backend_->open_capture(*index, params,
            [this](std::span<const float> interleaved, int channels, int sample_rate) {
                on_capture(interleaved, channels, sample_rate);
            });
    } catch (const std::exception& e) {
        logger_.error(kTag, std::string("DeviceOpenFailed: ") + e.what());
        return CaptureStatus::DeviceOpenFailed;
    }
    if (!stream_) {
        logger_.error(kTag, "DeviceOpenFailed: could not open input " + std::to_string(*index));
        return CaptureStatus::DeviceOpenFailed;
    }

    queue_.clear();
    processing_.store(true);
    try {
        processing_thread_ = std::thread(&AudioManager::processing_loop, this);
    } catch (const std::system_error& e) {
        logger_.error(kTag, std::string("DeviceOpenFailed: no processing thread: ") + e.what());
        processing_.store(false);
        stream_.reset();
        return CaptureStatus::DeviceOpenFailed;
    }

    if (!stream_->start()) {
        logger_.error(kTag, "DeviceOpenFailed: could not start input " + std::to_string(*index));
        processing_.store(false);
        processing_thread_.join();
        stream_.reset();
        queue_.clear();
        return CaptureStatus::DeviceOpenFailed;
    }

    capturing_.store(true);
    logger_.info(kTag, "Capture started: " + std::to_string(stream_->sample_rate()) + " Hz, "
                 + std::to_string(stream_->block_size()) + " frames, "
                 + std::to_string(stream_->channels()) + " ch");
    return CaptureStatus::Ok;
}

void AudioManager::stop_locked() {
    const bool was_capturing = capturing_.exchange(false);
    if (stream_) {
        stream_->stop();
        const int xruns = stream_->xruns();
        if (xruns > 0) {
            logger_.warn(kTag, "Driver recovered from " + std::to_string(xruns) + " overruns");
        }
    }

    processing_.store(false);
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }

    stream_.reset();
    const size_t discarded = queue_.clear();
    if (was_capturing) {
        logger_.info(kTag, "Capture stopped, discarded " + std::to_string(discarded) + " blocks");
    }
}

// Driver context: copy and enqueue only
void AudioManager::on_capture(std::span<const float> interleaved, int channels, int sample_rate) {
    queue_.push(std::make_shared<const AudioBlock>(interleaved, channels, sample_rate));
    blocks_captured_.fetch_add(1, std::memory_order_relaxed);
}

void AudioManager::processing_loop() {
    while (processing_.load()) {
        std::optional<std::shared_ptr<const AudioBlock>> next = queue_.pop(settings_.queue_timeout);
        if (!next || !*next) {
            check_stream_alive();
            continue;   // Timeout, check the flag and retry
        }
        const AudioBlock& block = **next;

        const auto consumers = consumers_snapshot();
        for (const auto& consumer : *consumers) {
            try {
                consumer->on_block(block, block.sample_rate);
            } catch (const std::exception& e) {
                consumer_failures_.fetch_add(1, std::memory_order_relaxed);
                logger_.error(kTag, std::string("ConsumerFailure: ") + e.what());
            } catch (...) {
                consumer_failures_.fetch_add(1, std::memory_order_relaxed);
                logger_.error(kTag, "ConsumerFailure: unknown exception");
            }
        }
        blocks_dispatched_.fetch_add(1, std::memory_order_relaxed);
    }
}

// stream_ is only replaced while this thread is stopped and joined
void AudioManager::check_stream_alive() {
    if (!capturing_.load() || !stream_ || stream_->is_running()) return;

    // stop_locked() clears the flag before stopping the stream, so only a
    // stream that died on its own gets past this exchange
    bool expected = true;
    if (!capturing_.compare_exchange_strong(expected, false)) return;

    stream_failures_.fetch_add(1, std::memory_order_relaxed);
    logger_.error(kTag, "StreamFailed: input stream stopped unexpectedly, capture stopped");
    processing_.store(false);
}

// --- Consumers -------------------------------------------------------------

void AudioManager::register_consumer(std::shared_ptr<Consumer> consumer) {
    if (!consumer) return;
    std::lock_guard<std::mutex> lock(consumers_mutex_);
    if (std::find(consumers_->begin(), consumers_->end(), consumer) != consumers_->end()) return;

    auto next = std::make_shared<ConsumerList>(*consumers_);
    next->push_back(std::move(consumer));
    consumers_ = std::move(next);
}

void AudioManager::unregister_consumer(const std::shared_ptr<Consumer>& consumer) {
    std::lock_guard<std::mutex> lock(consumers_mutex_);
    auto it = std::find(consumers_->begin(), consumers_->end(), consumer);
    if (it == consumers_->end()) return;

    auto next = std::make_shared<ConsumerList>(*consumers_);
    next->erase(next->begin() + std::distance(consumers_->begin(), it));
    consumers_ = std::move(next);
}

size_t AudioManager::consumer_count() const {
    return consumers_snapshot()->size();
}

std::shared_ptr<const AudioManager::ConsumerList> AudioManager::consumers_snapshot() const {
    std::lock_guard<std::mutex> lock(consumers_mutex_);
    return consumers_;
}

// --- Queries ---------------------------------------------------------------

std::array<double, 2> AudioManager::current_level() const {
    std::array<double, 2> level{dsp::kMeterFloorDb, dsp::kMeterFloorDb};
    if (!capturing_.load()) return level;

    const std::optional<std::shared_ptr<const AudioBlock>> newest = queue_.latest();
    if (!newest || !*newest || (*newest)->empty()) return level;

    const AudioBlock& block = **newest;
    level[0] = dsp::LevelMeter::rms_db(block.channel(0));
    level[1] = dsp::LevelMeter::rms_db(block.channel(1));
    return level;
}

std::string AudioManager::describe_devices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    std::ostringstream out;

    out << "Input devices:\n";
    for (const auto& d : devices_) {
        if (!d.is_input()) continue;
        out << (input_device_ == d.index ? "  * " : "    ")
            << "[" << d.index << "] " << hal::describe(d) << "\n";
    }
    out << "Output devices:\n";
    for (const auto& d : devices_) {
        if (!d.is_output()) continue;
        out << (output_device_ == d.index ? "  * " : "    ")
            << "[" << d.index << "] " << hal::describe(d) << "\n";
    }
    out << "Capture: " << settings_.sample_rate << " Hz, " << settings_.block_size << " frames ("
        << std::fixed << std::setprecision(1) << settings_.block_latency_ms() << " ms), "
        << settings_.num_channels << " ch\n";
    return out.str();
}

AudioManager::Stats AudioManager::stats() const {
    Stats s;
    s.blocks_captured = blocks_captured_.load(std::memory_order_relaxed);
    s.blocks_dispatched = blocks_dispatched_.load(std::memory_order_relaxed);
    s.blocks_dropped = queue_.dropped();
    s.consumer_failures = consumer_failures_.load(std::memory_order_relaxed);
    s.stream_failures = stream_failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace omega
