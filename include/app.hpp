#pragma once

#include "config.hpp"
#include "diagnostics.hpp"

namespace ACC{

    enum ExitStatus {
        EXIT_OK        = 0,
        EXIT_INTERNAL  = 1,
        EXIT_CONFIG    = 2,
        EXIT_IO        = 3,
        EXIT_FORMAT    = 4,
        EXIT_ALIGNMENT = 5
    };

    // Runs the pipeline for cfg, writes the requested outputs and reports on
    // stderr. extra receives the diagnostic figures next to the JSON sink.
    // Returns an ExitStatus.
    int run(const Config& cfg, DiagnosticsSink* extra = nullptr);

    // parse_args + usage handling shared by the executables. Returns -1 when
    // the program should go on, an ExitStatus otherwise.
    int parse_command_line(int argc, const char* const argv[], Config& cfg);
}
