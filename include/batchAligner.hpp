#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "axisMatrix.hpp"
#include "diagnostics.hpp"
#include "unitConverter.hpp"

namespace ACC{

    // Extension that marks a file in the data directory as a trial.
    constexpr const char* TRIAL_EXTENSION = ".txt";

    // Per-axis matrices of one batch. Column j of x, y and z is trials[j].
    struct AxisSet {
        AxisMatrix x, y, z;
        std::size_t numSamples = 0;
        std::vector<std::string> trials;
    };

    // Trial files of dir sorted by file name. Throws IOError when dir is not
    // a readable directory or holds no trial file.
    std::vector<std::string> list_trial_files(const std::string& dir);

    // "Trial i - Noisy accelerations" figure, index is 1-based.
    Figure trial_figure(std::size_t index, const Trial& trial);

    // Decodes, converts and stacks every trial of dir. All trials must have
    // the sample count of the first one, otherwise AlignmentError.
    // If diagnostics is set, one trial_figure is emitted per trial in
    // column order.
    AxisSet align(const std::string& dir, DiagnosticsSink* diagnostics = nullptr);
}
