#include "SpectralTransform.h"

#include <algorithm>
#include <cmath>

namespace cuf {

namespace {
constexpr double kPi = 3.141592653589793238463;
} // namespace

SpectralTransform::SpectralTransform() {
    // Inverse transforms below apply their own normalization.
    fft_.SetFlag(Eigen::FFT<double>::Unscaled);
}

std::vector<double> SpectralTransform::dct(const std::vector<double>& x) {
    const std::size_t n = x.size();
    std::vector<double> out(n, 0.0);
    if (n == 0) return out;

    // Even extension y = [x, reverse(x)] of length 2n; then
    //   sum_j x_j cos(pi k (2j+1) / 2n) = 0.5 * Re(exp(-i pi k / 2n) * FFT(y)_k)
    const std::size_t m = 2 * n;
    work_in_.assign(m, std::complex<double>(0.0, 0.0));
    for (std::size_t j = 0; j < n; ++j) {
        work_in_[j] = std::complex<double>(x[j], 0.0);
        work_in_[m - 1 - j] = std::complex<double>(x[j], 0.0);
    }
    work_out_.assign(m, std::complex<double>(0.0, 0.0));
    fft_.fwd(work_out_.data(), work_in_.data(), static_cast<Eigen::Index>(m));

    const double s0 = std::sqrt(1.0 / static_cast<double>(n));
    const double sk = std::sqrt(2.0 / static_cast<double>(n));
    for (std::size_t k = 0; k < n; ++k) {
        const double phase = -kPi * static_cast<double>(k) / static_cast<double>(m);
        const std::complex<double> tw(std::cos(phase), std::sin(phase));
        const double sum = 0.5 * (tw * work_out_[k]).real();
        out[k] = (k == 0 ? s0 : sk) * sum;
    }
    return out;
}

std::vector<double> SpectralTransform::idct(const std::vector<double>& coeffs, std::size_t n) {
    std::vector<double> out(n, 0.0);
    if (n == 0) return out;

    const std::size_t m = 2 * n;
    const std::size_t kept = std::min(coeffs.size(), n);
    const double s0 = std::sqrt(1.0 / static_cast<double>(n));
    const double sk = std::sqrt(2.0 / static_cast<double>(n));

    //   x_j = Re( sum_k W_k exp(+2 pi i k j / 2n) ),  W_k = s_k X_k exp(i pi k / 2n)
    work_in_.assign(m, std::complex<double>(0.0, 0.0));
    for (std::size_t k = 0; k < kept; ++k) {
        const double phase = kPi * static_cast<double>(k) / static_cast<double>(m);
        const std::complex<double> tw(std::cos(phase), std::sin(phase));
        work_in_[k] = (k == 0 ? s0 : sk) * coeffs[k] * tw;
    }
    work_out_.assign(m, std::complex<double>(0.0, 0.0));
    fft_.inv(work_out_.data(), work_in_.data(), static_cast<Eigen::Index>(m));

    for (std::size_t j = 0; j < n; ++j) {
        out[j] = work_out_[j].real();
    }
    return out;
}

std::vector<double> SpectralTransform::lowPass(const std::vector<double>& x, double decay) {
    const std::size_t n = x.size();
    std::vector<double> out(n, 0.0);
    if (n == 0) return out;

    work_in_.assign(n, std::complex<double>(0.0, 0.0));
    for (std::size_t j = 0; j < n; ++j) {
        work_in_[j] = std::complex<double>(x[j], 0.0);
    }
    work_out_.assign(n, std::complex<double>(0.0, 0.0));
    fft_.fwd(work_out_.data(), work_in_.data(), static_cast<Eigen::Index>(n));

    // Symmetric attenuation keeps the spectrum Hermitian, so the result stays real.
    for (std::size_t k = 0; k < n; ++k) {
        const double f = static_cast<double>(std::min(k, n - k)) / static_cast<double>(n);
        work_out_[k] *= std::exp(-decay * f);
    }
    fft_.inv(work_in_.data(), work_out_.data(), static_cast<Eigen::Index>(n));

    const double scale = 1.0 / static_cast<double>(n);
    for (std::size_t j = 0; j < n; ++j) {
        out[j] = work_in_[j].real() * scale;
    }
    return out;
}

} // namespace cuf
