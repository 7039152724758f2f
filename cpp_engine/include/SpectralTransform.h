#pragma once

#include <complex>
#include <cstddef>
#include <vector>

#include <unsupported/Eigen/FFT>

namespace cuf {

// FFT-backed spectral helpers shared by the spectral backend and the snapshot codec.
// Holds an Eigen::FFT instance so twiddle plans are reused across calls of the same length.
class SpectralTransform {
public:
    SpectralTransform();

    // Orthonormal DCT-II. Same length as x.
    std::vector<double> dct(const std::vector<double>& x);

    // Orthonormal DCT-III (inverse of dct). `coeffs` may be shorter than n: missing
    // high-frequency coefficients are treated as zero (truncated spectrum).
    std::vector<double> idct(const std::vector<double>& coeffs, std::size_t n);

    // Real low-pass: bin k scaled by exp(-decay * min(k, n-k) / n).
    std::vector<double> lowPass(const std::vector<double>& x, double decay);

private:
    Eigen::FFT<double> fft_;
    std::vector<std::complex<double>> work_in_;
    std::vector<std::complex<double>> work_out_;
};

} // namespace cuf
