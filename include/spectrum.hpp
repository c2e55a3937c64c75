#pragma once

#include <complex>
#include <cstddef>
#include <vector>

namespace ACC{
    // Smallest power of two >= n (1 for n <= 1).
    std::size_t next_pow2(std::size_t n);

    // In-place iterative radix-2 FFT. Size must be a power of two.
    void fft(std::vector<std::complex<double>>& x);

    // 2*|X[k]| for k < nfft/2, signal zero-padded (or cut) to nfft.
    std::vector<double> amplitude_spectrum(const std::vector<double>& signal, std::size_t nfft);

    // nfft/2 frequencies evenly spaced from 0 to fs/2 inclusive.
    std::vector<double> frequency_axis(double fs, std::size_t nfft);
}
