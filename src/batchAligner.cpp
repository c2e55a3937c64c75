#include <algorithm>
#include <filesystem>
#include <system_error>
#include "batchAligner.hpp"
#include "errors.hpp"
#include "trialDecoder.hpp"

namespace fs = std::filesystem;

namespace ACC{

    // y range of the per-trial plots, +/-2 g
    static constexpr double TRIAL_PLOT_RANGE = 19.6133;

    std::vector<std::string> list_trial_files(const std::string& dir){
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            throw IOError(dir, ec ? ec.message() : "not a directory");
        }

        std::vector<fs::path> found;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            throw IOError(dir, ec.message());
        }
        const auto end = fs::directory_iterator();
        for (; it != end; it.increment(ec)) {
            if (ec) break;
            std::error_code fec;
            if (!it->is_regular_file(fec)) continue;
            if (it->path().extension() == TRIAL_EXTENSION) {
                found.push_back(it->path());
            }
        }
        if (ec) {
            throw IOError(dir, ec.message());
        }
        if (found.empty()) {
            throw IOError(dir, std::string("no *") + TRIAL_EXTENSION + " trial files");
        }

        std::sort(found.begin(), found.end(), [](const fs::path& a, const fs::path& b) {
            return a.filename().string() < b.filename().string();
        });

        std::vector<std::string> files;
        files.reserve(found.size());
        for (const auto& p : found) files.push_back(p.string());
        return files;
    }

    Figure trial_figure(std::size_t index, const Trial& trial){
        std::vector<double> time(trial.size());
        for (std::size_t i = 0; i < time.size(); ++i) time[i] = static_cast<double>(i + 1);

        const std::string prefix = "Trial " + std::to_string(index) + " - Noisy accelerations along the ";
        auto panel = [&](const char* axis, const std::vector<double>& v) {
            Panel p;
            p.title  = prefix + axis + " axis";
            p.xlabel = "time [samples]";
            p.ylabel = "acceleration [m/s^2]";
            p.y_min  = -TRIAL_PLOT_RANGE;
            p.y_max  = TRIAL_PLOT_RANGE;
            p.series.push_back({axis, time, v});
            return p;
        };

        Figure fig;
        fig.title = "Trial " + std::to_string(index) + " - Noisy accelerations (" + trial.source + ")";
        fig.panels.push_back(panel("x", trial.x));
        fig.panels.push_back(panel("y", trial.y));
        fig.panels.push_back(panel("z", trial.z));
        return fig;
    }

    AxisSet align(const std::string& dir, DiagnosticsSink* diagnostics){
        const std::vector<std::string> files = list_trial_files(dir);

        AxisSet set;
        set.trials.reserve(files.size());

        for (std::size_t j = 0; j < files.size(); ++j) {
            const std::string& file = files[j];
            Trial trial = convert_trial(decode_trial(file), fs::path(file).filename().string());

            if (j == 0) {
                // the first trial fixes the shape of the batch
                set.numSamples = trial.size();
                set.x = AxisMatrix(set.numSamples, files.size());
                set.y = AxisMatrix(set.numSamples, files.size());
                set.z = AxisMatrix(set.numSamples, files.size());
            } else if (trial.size() != set.numSamples) {
                throw AlignmentError(set.trials.front(), set.numSamples, trial.source, trial.size());
            }

            set.x.setColumn(j, trial.x);
            set.y.setColumn(j, trial.y);
            set.z.setColumn(j, trial.z);
            set.trials.push_back(trial.source);

            if (diagnostics) {
                emit_safely(diagnostics, trial_figure(j + 1, trial));
            }
        }
        return set;
    }
}
