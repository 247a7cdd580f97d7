#include "model/dense_matrix.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace mpmm {

Matrix::Matrix(size_t rows, size_t cols, double fill)
    : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

Matrix Matrix::identity(size_t n) {
    Matrix m(n, n);
    for (size_t i = 0; i < n; ++i) m(i, i) = 1.0;
    return m;
}

double Matrix::row_sum(size_t r) const {
    double sum = 0.0;
    for (size_t c = 0; c < cols_; ++c) sum += (*this)(r, c);
    return sum;
}

Matrix operator*(const Matrix& a, const Matrix& b) {
    if (a.cols() != b.rows()) {
        throw std::invalid_argument("matrix product shape mismatch");
    }
    Matrix out(a.rows(), b.cols());
    for (size_t i = 0; i < a.rows(); ++i) {
        for (size_t k = 0; k < a.cols(); ++k) {
            double aik = a(i, k);
            if (aik == 0.0) continue;
            for (size_t j = 0; j < b.cols(); ++j) {
                out(i, j) += aik * b(k, j);
            }
        }
    }
    return out;
}

Matrix operator-(const Matrix& a, const Matrix& b) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        throw std::invalid_argument("matrix difference shape mismatch");
    }
    Matrix out(a.rows(), a.cols());
    for (size_t i = 0; i < a.rows(); ++i) {
        for (size_t j = 0; j < a.cols(); ++j) {
            out(i, j) = a(i, j) - b(i, j);
        }
    }
    return out;
}

std::vector<double> operator*(const Matrix& a, const std::vector<double>& v) {
    if (a.cols() != v.size()) {
        throw std::invalid_argument("matrix-vector product shape mismatch");
    }
    std::vector<double> out(a.rows(), 0.0);
    for (size_t i = 0; i < a.rows(); ++i) {
        double acc = 0.0;
        for (size_t j = 0; j < a.cols(); ++j) acc += a(i, j) * v[j];
        out[i] = acc;
    }
    return out;
}

Matrix inverse(const Matrix& a, double pivot_eps) {
    if (a.rows() != a.cols()) {
        throw std::invalid_argument("cannot invert a non-square matrix");
    }
    const size_t n = a.rows();
    Matrix work = a;
    Matrix inv = Matrix::identity(n);

    for (size_t col = 0; col < n; ++col) {
        size_t pivot = col;
        double best = std::abs(work(col, col));
        for (size_t r = col + 1; r < n; ++r) {
            double mag = std::abs(work(r, col));
            if (mag > best) {
                best = mag;
                pivot = r;
            }
        }
        if (!(best > pivot_eps)) {
            throw NumericalInstabilityError(
                "matrix is singular: pivot " + std::to_string(best) +
                " in column " + std::to_string(col));
        }

        if (pivot != col) {
            for (size_t c = 0; c < n; ++c) {
                std::swap(work(col, c), work(pivot, c));
                std::swap(inv(col, c), inv(pivot, c));
            }
        }

        double scale = 1.0 / work(col, col);
        for (size_t c = 0; c < n; ++c) {
            work(col, c) *= scale;
            inv(col, c) *= scale;
        }

        for (size_t r = 0; r < n; ++r) {
            if (r == col) continue;
            double factor = work(r, col);
            if (factor == 0.0) continue;
            for (size_t c = 0; c < n; ++c) {
                work(r, c) -= factor * work(col, c);
                inv(r, c) -= factor * inv(col, c);
            }
        }
    }
    return inv;
}

} // namespace mpmm
