#pragma once

#include <cstddef>
#include <vector>
#include "axisMatrix.hpp"

namespace ACC{

    // Throws ConfigError unless n is odd and positive.
    void check_window_order(int n);

    // check_window_order, plus n <= rows.
    void check_window(int n, std::size_t rows);

    // Median of the first n entries of v (v is taken by value).
    double median(std::vector<double> v, std::size_t n);

    // 1-D median filter of order n. Output i is the median of
    // x[i - (n-1)/2 .. i + (n-1)/2], samples outside the signal count as 0.
    std::vector<double> median_filter_column(const std::vector<double>& x, int n);

    // Applies median_filter_column down every column (trial) of m.
    AxisMatrix median_filter(const AxisMatrix& m, int n);
}
