/**
 * @file SpectralTransform.hpp
 * @brief Hann-windowed real FFT of one channel of a block.
 */

#ifndef OMEGA_SPECTRAL_TRANSFORM_HPP
#define OMEGA_SPECTRAL_TRANSFORM_HPP

#include "AudioBlock.hpp"
#include <fftw3.h>
#include <cstddef>
#include <span>
#include <vector>

namespace omega::dsp {

/**
 * @brief Magnitude per FFT bin and the matching frequency axis (bins 0..N/2).
 */
struct Spectrum {
    std::vector<float> magnitudes;
    std::vector<float> frequencies;

    size_t size() const { return magnitudes.size(); }
    bool empty() const { return magnitudes.empty(); }
};

/**
 * @brief Symmetric Hann window: zero at both ends, unity at the centre.
 * A window of length 1 is {1}.
 */
std::vector<float> hann_window(size_t length);

/**
 * @brief Turns a block into a magnitude spectrum.
 *
 * The output depends only on (samples, sample_rate). FFTW plans and
 * aligned buffers are cached per transform length; one instance must not
 * be used from two threads at once.
 */
class SpectralTransform {
public:
    SpectralTransform() = default;
    ~SpectralTransform();

    SpectralTransform(const SpectralTransform&) = delete;
    SpectralTransform& operator=(const SpectralTransform&) = delete;

    /**
     * @brief Transform one channel of a block (channel 0 by convention).
     */
    Spectrum transform(const AudioBlock& block, int channel = 0);

    /**
     * @brief Transform a mono signal captured at `sample_rate`.
     */
    Spectrum transform(std::span<const float> samples, int sample_rate);

private:
    void prepare(size_t length);
    void release();

    size_t length_ = 0;
    float* input_ = nullptr;
    fftwf_complex* output_ = nullptr;
    fftwf_plan plan_ = nullptr;
    std::vector<float> window_;
};

} // namespace omega::dsp

#endif // OMEGA_SPECTRAL_TRANSFORM_HPP
