/**
 * @file Engine.hpp
 * @brief Wires a backend, the capture manager and the analysis consumers.
 */

#ifndef OMEGA_ENGINE_HPP
#define OMEGA_ENGINE_HPP

#include "AnalysisConsumers.hpp"
#include "AudioManager.hpp"
#include "Logger.hpp"
#include <functional>
#include <memory>

namespace omega {

/**
 * @brief One capture pipeline with a spectrum and a meter consumer
 * registered.
 *
 * The C bridge hands out `Engine*` as its opaque handle. The manager is
 * destroyed first so capture is stopped before the consumers go away.
 */
class Engine {
public:
    /**
     * @brief Builds the backend against the engine's own logger.
     */
    using BackendFactory = std::function<std::unique_ptr<hal::AudioBackend>(Logger&)>;

    explicit Engine(const BackendFactory& make_backend,
                    CaptureSettings settings = CaptureSettings{});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    Logger& logger() { return logger_; }
    AudioManager& manager() { return *manager_; }
    dsp::SpectrumAnalyzer& spectrum() { return *spectrum_; }
    dsp::MeterAnalyzer& meter() { return *meter_; }

private:
    Logger logger_;
    std::shared_ptr<dsp::SpectrumAnalyzer> spectrum_;
    std::shared_ptr<dsp::MeterAnalyzer> meter_;
    std::unique_ptr<AudioManager> manager_;
};

} // namespace omega

#endif // OMEGA_ENGINE_HPP
