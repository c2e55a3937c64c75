#include <cstdio>
#include <memory>
#include "app.hpp"
#include "datasetWriter.hpp"
#include "errors.hpp"
#include "pipeline.hpp"

namespace ACC{

    int run(const Config& cfg, DiagnosticsSink* extra){
        try {
            TeeSink tee;
            std::unique_ptr<JsonDiagnosticsSink> json_sink;
            if (!cfg.diagnosticsJson.empty()) {
                // diagnostics never stop the pipeline
                try {
                    json_sink = std::make_unique<JsonDiagnosticsSink>(cfg.diagnosticsJson);
                    tee.add(json_sink.get());
                } catch (const IOError& e) {
                    std::fprintf(stderr, "[preprocess] diagnostics disabled: %s\n", e.what());
                }
            }
            tee.add(extra);

            if (!cfg.quiet) {
                std::fprintf(stderr, "[preprocess] reading %s (window %d)\n", cfg.dataDir.c_str(), cfg.windowSize);
            }

            const Dataset data = process(cfg.dataDir, process_options(cfg), tee.empty() ? nullptr : &tee);

            if (!cfg.output.empty()) {
                write_dataset(data, cfg.output);
            }

            if (!cfg.quiet) {
                std::fprintf(stderr, "[preprocess] %zu trials, %zu samples each\n",
                             data.trials.size(), data.numSamples);
                for (std::size_t j = 0; j < data.trials.size(); ++j) {
                    std::fprintf(stderr, "[preprocess]   column %zu: %s\n", j, data.trials[j].c_str());
                }
                if (!cfg.output.empty()) {
                    std::fprintf(stderr, "[preprocess] dataset written to %s\n", cfg.output.c_str());
                }
                if (json_sink) {
                    std::fprintf(stderr, "[preprocess] %zu figures written to %s\n",
                                 json_sink->count(), cfg.diagnosticsJson.c_str());
                }
            }
            return EXIT_OK;

        } catch (const ConfigError& e) {
            std::fprintf(stderr, "[preprocess] configuration error: %s\n", e.what());
            return EXIT_CONFIG;
        } catch (const IOError& e) {
            std::fprintf(stderr, "[preprocess] I/O error: %s\n", e.what());
            return EXIT_IO;
        } catch (const FormatError& e) {
            std::fprintf(stderr, "[preprocess] format error: %s\n", e.what());
            return EXIT_FORMAT;
        } catch (const AlignmentError& e) {
            std::fprintf(stderr, "[preprocess] alignment error: %s\n", e.what());
            return EXIT_ALIGNMENT;
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[preprocess] error: %s\n", e.what());
            return EXIT_INTERNAL;
        }
    }

    int parse_command_line(int argc, const char* const argv[], Config& cfg){
        const char* prog = argc > 0 ? argv[0] : "accel_preprocess";
        try {
            if (!parse_args(argc, argv, cfg)) {
                std::fputs(usage(prog).c_str(), stdout);
                return EXIT_OK;
            }
        } catch (const ConfigError& e) {
            std::fprintf(stderr, "%s: %s\n%s", prog, e.what(), usage(prog).c_str());
            return EXIT_CONFIG;
        }
        return -1;
    }
}
