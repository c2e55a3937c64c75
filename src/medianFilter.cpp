#include <algorithm>
#include <string>
#include "errors.hpp"
#include "medianFilter.hpp"

namespace ACC{

    void check_window_order(int n){
        if (n <= 0) {
            throw ConfigError("median filter window must be positive, got " + std::to_string(n));
        }
        if (n % 2 == 0) {
            throw ConfigError("median filter window must be odd, got " + std::to_string(n));
        }
    }

    void check_window(int n, std::size_t rows){
        check_window_order(n);
        if (static_cast<std::size_t>(n) > rows) {
            throw ConfigError("median filter window " + std::to_string(n)
                              + " exceeds sample count " + std::to_string(rows));
        }
    }

    double median(std::vector<double> v, std::size_t n){
        if (n == 0) return 0.0;
        auto begin = v.begin();
        auto mid = begin + static_cast<std::ptrdiff_t>(n / 2);
        std::nth_element(begin, mid, begin + static_cast<std::ptrdiff_t>(n));
        double m = *mid;
        if (n % 2 == 0) {
            auto mid2 = begin + static_cast<std::ptrdiff_t>(n / 2 - 1);
            std::nth_element(begin, mid2, begin + static_cast<std::ptrdiff_t>(n));
            m = 0.5 * (m + *mid2);
        }
        return m;
    }

    // filter rows samples starting at x into out, window already validated
    static void filter_range(const double* x, std::size_t rows, int n, double* out){
        if (n == 1) {
            std::copy(x, x + rows, out);
            return;
        }
        const std::ptrdiff_t half = (n - 1) / 2;
        const std::ptrdiff_t len  = static_cast<std::ptrdiff_t>(rows);
        std::vector<double> win(static_cast<std::size_t>(n));

        for (std::ptrdiff_t i = 0; i < len; ++i) {
            for (std::ptrdiff_t k = 0; k < n; ++k) {
                const std::ptrdiff_t j = i - half + k;
                // zero padding beyond both ends
                win[k] = (j < 0 || j >= len) ? 0.0 : x[j];
            }
            out[i] = median(win, win.size());
        }
    }

    std::vector<double> median_filter_column(const std::vector<double>& x, int n){
        check_window(n, x.size());
        std::vector<double> out(x.size());
        filter_range(x.data(), x.size(), n, out.data());
        return out;
    }

    AxisMatrix median_filter(const AxisMatrix& m, int n){
        check_window(n, m.rows());
        AxisMatrix out(m.rows(), m.cols());
        std::vector<double> col(m.rows());

        for (std::size_t c = 0; c < m.cols(); ++c) {
            filter_range(m.columnData(c), m.rows(), n, col.data());
            out.setColumn(c, col);
        }
        return out;
    }
}
