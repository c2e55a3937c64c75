#include <stdexcept>
#include <string>
#include "axisMatrix.hpp"

namespace ACC{

    AxisMatrix::AxisMatrix(std::size_t rows, std::size_t cols, double fill)
        : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

    double AxisMatrix::at(std::size_t r, std::size_t c) const {
        if (r >= rows_ || c >= cols_) {
            throw std::out_of_range("AxisMatrix index (" + std::to_string(r) + ", " + std::to_string(c)
                                    + ") outside " + std::to_string(rows_) + "x" + std::to_string(cols_));
        }
        return (*this)(r, c);
    }

    std::vector<double> AxisMatrix::column(std::size_t c) const {
        if (c >= cols_) throw std::out_of_range("AxisMatrix column " + std::to_string(c));
        const double* first = columnData(c);
        return std::vector<double>(first, first + rows_);
    }

    void AxisMatrix::setColumn(std::size_t c, const std::vector<double>& values){
        if (c >= cols_) throw std::out_of_range("AxisMatrix column " + std::to_string(c));
        if (values.size() != rows_) {
            throw std::invalid_argument("AxisMatrix column of " + std::to_string(values.size())
                                        + " values, expected " + std::to_string(rows_));
        }
        for (std::size_t r = 0; r < rows_; ++r) {
            data_[c * rows_ + r] = values[r];
        }
    }

    bool operator==(const AxisMatrix& a, const AxisMatrix& b){
        return a.rows_ == b.rows_ && a.cols_ == b.cols_ && a.data_ == b.data_;
    }
}
