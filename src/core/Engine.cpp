/**
 * @file Engine.cpp
 * @brief Wires a backend, the capture manager and the analysis consumers.
 */

#include "Engine.hpp"
#include <utility>

namespace omega {

Engine::Engine(const BackendFactory& make_backend, CaptureSettings settings)
    : spectrum_(std::make_shared<dsp::SpectrumAnalyzer>(logger_))
    , meter_(std::make_shared<dsp::MeterAnalyzer>(logger_))
    , manager_(std::make_unique<AudioManager>(make_backend(logger_), logger_, std::move(settings)))
{
    manager_->register_consumer(spectrum_);
    manager_->register_consumer(meter_);
}

Engine::~Engine() {
    manager_.reset();
}

} // namespace omega
