/**
 * @file SpectralTransform.cpp
 * @brief Hann-windowed real FFT of one channel of a block.
 */

#include "SpectralTransform.hpp"
#include <cmath>
#include <mutex>
#include <new>
#include <stdexcept>

namespace omega::dsp {

namespace {

// The FFTW planner is not thread-safe; only fftwf_execute is.
std::mutex g_planner_mutex;

} // namespace

std::vector<float> hann_window(size_t length) {
    std::vector<float> window(length, 1.0f);
    if (length < 2) return window;
    const double two_pi = 6.28318530717958647692;
    const double denom = static_cast<double>(length - 1);
    for (size_t i = 0; i < length; ++i) {
        window[i] = static_cast<float>(0.5 - 0.5 * std::cos(two_pi * static_cast<double>(i) / denom));
    }
    return window;
}

SpectralTransform::~SpectralTransform() {
    release();
}

void SpectralTransform::release() {
    std::lock_guard<std::mutex> lock(g_planner_mutex);
    if (plan_) {
        fftwf_destroy_plan(plan_);
        plan_ = nullptr;
    }
    if (input_) {
        fftwf_free(input_);
        input_ = nullptr;
    }
    if (output_) {
        fftwf_free(output_);
        output_ = nullptr;
    }
    length_ = 0;
}

void SpectralTransform::prepare(size_t length) {
    if (length == length_ && plan_) return;
    release();

    std::lock_guard<std::mutex> lock(g_planner_mutex);
    input_ = fftwf_alloc_real(length);
    output_ = fftwf_alloc_complex(length / 2 + 1);
    if (!input_ || !output_) {
        throw std::bad_alloc();
    }
    plan_ = fftwf_plan_dft_r2c_1d(static_cast<int>(length), input_, output_, FFTW_ESTIMATE);
    if (!plan_) {
        throw std::runtime_error("fftwf_plan_dft_r2c_1d failed");
    }
    window_ = hann_window(length);
    length_ = length;
}

Spectrum SpectralTransform::transform(const AudioBlock& block, int channel) {
    const std::vector<float> mono = block.channel(channel);
    return transform(std::span<const float>(mono), block.sample_rate);
}

Spectrum SpectralTransform::transform(std::span<const float> samples, int sample_rate) {
    Spectrum spectrum;
    const size_t n = samples.size();
    if (n == 0) return spectrum;

    prepare(n);
    for (size_t i = 0; i < n; ++i) {
        input_[i] = samples[i] * window_[i];
    }
    fftwf_execute(plan_);

    const size_t bins = n / 2 + 1;
    const double resolution = static_cast<double>(sample_rate) / static_cast<double>(n);
    spectrum.magnitudes.resize(bins);
    spectrum.frequencies.resize(bins);
    for (size_t k = 0; k < bins; ++k) {
        const float re = output_[k][0];
        const float im = output_[k][1];
        spectrum.magnitudes[k] = std::sqrt(re * re + im * im);
        spectrum.frequencies[k] = static_cast<float>(static_cast<double>(k) * resolution);
    }
    return spectrum;
}

} // namespace omega::dsp
