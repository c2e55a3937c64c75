#pragma once

#include <string>
#include <vector>
#include "batchAligner.hpp"
#include "diagnostics.hpp"

namespace ACC{

    // Filtered matrices, shared sample count and the trial of each column.
    using Dataset = AxisSet;

    struct ProcessOptions {
        int windowSize = 3;
        // only used for diagnostics
        double sampleRateHz = 32.0;
        std::vector<int> spectrumOrders{1, 3, 5, 7, 9};
    };

    // Plots every column of the three matrices of set, one panel per axis.
    Figure dataset_figure(const std::string& title, const AxisSet& set);

    // Amplitude spectra of the first column of noisyX median filtered with
    // each order. Even, non-positive and oversized orders are left out.
    Figure spectrum_figure(const AxisMatrix& noisyX, const std::vector<int>& orders, double fs);

    // Decode -> convert -> align -> median filter. Diagnostics, if a sink is
    // given, get the per-trial figures, the noisy and filtered datasets and
    // the spectrum comparison. Throws IOError, FormatError, AlignmentError or
    // ConfigError.
    Dataset process(const std::string& dir, int windowSize = 3, DiagnosticsSink* diagnostics = nullptr);
    Dataset process(const std::string& dir, const ProcessOptions& opt, DiagnosticsSink* diagnostics = nullptr);
}
