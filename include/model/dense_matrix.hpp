#pragma once

#include <cstddef>
#include <vector>

namespace mpmm {

// Row-major dense matrix of doubles.
class Matrix {
public:
    Matrix() = default;
    Matrix(size_t rows, size_t cols, double fill = 0.0);

    static Matrix identity(size_t n);

    double&       operator()(size_t r, size_t c)       { return data_[r * cols_ + c]; }
    const double& operator()(size_t r, size_t c) const { return data_[r * cols_ + c]; }

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }

    double row_sum(size_t r) const;

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<double> data_;
};

Matrix operator*(const Matrix& a, const Matrix& b);
Matrix operator-(const Matrix& a, const Matrix& b);
std::vector<double> operator*(const Matrix& a, const std::vector<double>& v);

// Gauss-Jordan with partial pivoting. Throws NumericalInstabilityError when a pivot
// magnitude drops below pivot_eps (matrix singular or nearly so).
Matrix inverse(const Matrix& a, double pivot_eps = 1e-12);

} // namespace mpmm
