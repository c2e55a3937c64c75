#include <cmath>
#include <string>
#include <utility>
#include "errors.hpp"
#include "spectrum.hpp"

namespace ACC{

    std::size_t next_pow2(std::size_t n){
        std::size_t p = 1;
        while (p < n) p <<= 1;
        return p;
    }

    void fft(std::vector<std::complex<double>>& x){
        const std::size_t N = x.size();
        if (N == 0 || (N & (N - 1)) != 0) {
            throw ConfigError("fft size must be a power of two, got " + std::to_string(N));
        }

        // bit reversal permutation
        for (std::size_t i = 1, j = 0; i < N; ++i) {
            std::size_t bit = N >> 1;
            for (; j & bit; bit >>= 1) j ^= bit;
            j ^= bit;
            if (i < j) std::swap(x[i], x[j]);
        }

        const double pi = std::acos(-1.0);
        for (std::size_t len = 2; len <= N; len <<= 1) {
            const double ang = -2.0 * pi / static_cast<double>(len);
            const std::complex<double> wlen(std::cos(ang), std::sin(ang));
            for (std::size_t i = 0; i < N; i += len) {
                std::complex<double> w(1.0, 0.0);
                for (std::size_t k = 0; k < len / 2; ++k) {
                    const std::complex<double> u = x[i + k];
                    const std::complex<double> v = x[i + k + len / 2] * w;
                    x[i + k]           = u + v;
                    x[i + k + len / 2] = u - v;
                    w *= wlen;
                }
            }
        }
    }

    std::vector<double> amplitude_spectrum(const std::vector<double>& signal, std::size_t nfft){
        std::vector<std::complex<double>> X(nfft);
        for (std::size_t i = 0; i < nfft && i < signal.size(); ++i) {
            X[i] = std::complex<double>(signal[i], 0.0);
        }
        fft(X);

        std::vector<double> amp(nfft / 2);
        for (std::size_t k = 0; k < amp.size(); ++k) {
            amp[k] = 2.0 * std::abs(X[k]);
        }
        return amp;
    }

    std::vector<double> frequency_axis(double fs, std::size_t nfft){
        const std::size_t n = nfft / 2;
        std::vector<double> f(n);
        if (n == 1) {
            f[0] = 0.0;
            return f;
        }
        for (std::size_t i = 0; i < n; ++i) {
            f[i] = fs / 2.0 * static_cast<double>(i) / static_cast<double>(n - 1);
        }
        return f;
    }
}
