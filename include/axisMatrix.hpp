#pragma once

#include <cstddef>
#include <vector>

namespace ACC{

    // Sample-index x trial-index matrix for one axis. Storage is
    // column-major so each trial column is contiguous.
    class AxisMatrix {
    public:
        AxisMatrix() = default;
        AxisMatrix(std::size_t rows, std::size_t cols, double fill = 0.0);

        std::size_t rows() const { return rows_; }
        std::size_t cols() const { return cols_; }
        bool empty() const { return data_.empty(); }

        double& operator()(std::size_t r, std::size_t c) { return data_[c * rows_ + r]; }
        double operator()(std::size_t r, std::size_t c) const { return data_[c * rows_ + r]; }

        // Bounds checked access, throws std::out_of_range.
        double at(std::size_t r, std::size_t c) const;

        std::vector<double> column(std::size_t c) const;
        void setColumn(std::size_t c, const std::vector<double>& values);

        const double* columnData(std::size_t c) const { return data_.data() + c * rows_; }

        friend bool operator==(const AxisMatrix& a, const AxisMatrix& b);

    private:
        std::size_t rows_ = 0;
        std::size_t cols_ = 0;
        std::vector<double> data_;
    };
}
