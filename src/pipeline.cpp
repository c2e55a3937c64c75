#include <cstdio>
#include "errors.hpp"
#include "medianFilter.hpp"
#include "pipeline.hpp"
#include "spectrum.hpp"

namespace ACC{

    Figure dataset_figure(const std::string& title, const AxisSet& set){
        std::vector<double> time(set.numSamples);
        for (std::size_t i = 0; i < time.size(); ++i) time[i] = static_cast<double>(i + 1);

        auto panel = [&](const char* axis, const AxisMatrix& m) {
            Panel p;
            p.title  = title + " - " + axis + " axis";
            p.xlabel = "time [samples]";
            p.ylabel = "acceleration [m/s^2]";
            p.y_min  = -FULL_SCALE;
            p.y_max  = FULL_SCALE;
            for (std::size_t c = 0; c < m.cols(); ++c) {
                const std::string label = c < set.trials.size() ? set.trials[c] : std::to_string(c + 1);
                p.series.push_back({label, time, m.column(c)});
            }
            return p;
        };

        Figure fig;
        fig.title = title;
        fig.panels.push_back(panel("x", set.x));
        fig.panels.push_back(panel("y", set.y));
        fig.panels.push_back(panel("z", set.z));
        return fig;
    }

    Figure spectrum_figure(const AxisMatrix& noisyX, const std::vector<int>& orders, double fs){
        Figure fig;
        fig.title = "Power spectra of filtered acceleration data";

        Panel p;
        p.title  = fig.title;
        p.xlabel = "frequency [Hz]";
        p.ylabel = "amplitude";

        const std::size_t nfft = next_pow2(noisyX.rows());
        if (noisyX.cols() > 0 && nfft >= 2) {
            const std::vector<double> f = frequency_axis(fs, nfft);
            for (int n : orders) {
                if (n <= 0 || n % 2 == 0) {
                    std::fprintf(stderr, "[pipeline] spectrum: order %d skipped, not a positive odd number\n", n);
                    continue;
                }
                if (static_cast<std::size_t>(n) > noisyX.rows()) {
                    std::fprintf(stderr, "[pipeline] spectrum: order %d skipped, only %zu samples\n",
                                 n, noisyX.rows());
                    continue;
                }
                const std::vector<double> filtered = median_filter_column(noisyX.column(0), n);
                const std::string label = n == 1 ? "NO filtering" : "filter n = " + std::to_string(n);
                p.series.push_back({label, f, amplitude_spectrum(filtered, nfft)});
            }
        }
        fig.panels.push_back(p);
        return fig;
    }

    Dataset process(const std::string& dir, int windowSize, DiagnosticsSink* diagnostics){
        ProcessOptions opt;
        opt.windowSize = windowSize;
        return process(dir, opt, diagnostics);
    }

    Dataset process(const std::string& dir, const ProcessOptions& opt, DiagnosticsSink* diagnostics){
        check_window_order(opt.windowSize);

        const AxisSet noisy = align(dir, diagnostics);

        // Bad window sizes fail before any filtering
        check_window(opt.windowSize, noisy.numSamples);

        Dataset out;
        out.x = median_filter(noisy.x, opt.windowSize);
        out.y = median_filter(noisy.y, opt.windowSize);
        out.z = median_filter(noisy.z, opt.windowSize);
        out.numSamples = out.x.rows();
        out.trials = noisy.trials;

        if (diagnostics) {
            emit_safely(diagnostics, dataset_figure("Noisy modeling dataset", noisy));
            emit_safely(diagnostics, dataset_figure("Filtered modeling dataset", out));
            if (!opt.spectrumOrders.empty()) {
                emit_safely(diagnostics, spectrum_figure(noisy.x, opt.spectrumOrders, opt.sampleRateHz));
            }
        }
        return out;
    }
}
