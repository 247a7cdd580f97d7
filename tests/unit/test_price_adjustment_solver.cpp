#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "model/dense_matrix.hpp"
#include "model/price_adjustment_solver.hpp"

#include <stdexcept>

using namespace mpmm;

namespace {

Matrix from_rows(const std::vector<std::vector<double>>& rows) {
    Matrix m(rows.size(), rows.front().size());
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < rows[r].size(); ++c) m(r, c) = rows[r][c];
    }
    return m;
}

const std::vector<double> kUnitMoves{-1.0, 0.0, 1.0};

} // namespace

TEST(DenseMatrixTest, Inverse2x2) {
    Matrix inv = inverse(from_rows({{4.0, 7.0}, {2.0, 6.0}}));
    EXPECT_NEAR(inv(0, 0),  0.6, 1e-12);
    EXPECT_NEAR(inv(0, 1), -0.7, 1e-12);
    EXPECT_NEAR(inv(1, 0), -0.2, 1e-12);
    EXPECT_NEAR(inv(1, 1),  0.4, 1e-12);
}

TEST(DenseMatrixTest, InverseNeedsPivoting) {
    Matrix a = from_rows({{0.0, 1.0}, {1.0, 0.0}});
    Matrix inv = inverse(a);
    Matrix prod = a * inv;
    EXPECT_DOUBLE_EQ(prod(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(prod(0, 1), 0.0);
    EXPECT_DOUBLE_EQ(prod(1, 1), 1.0);
}

TEST(DenseMatrixTest, SingularMatrixThrows) {
    EXPECT_THROW(inverse(from_rows({{1.0, 2.0}, {2.0, 4.0}})), NumericalInstabilityError);
}

TEST(DenseMatrixTest, ShapeMismatchThrows) {
    Matrix a(2, 3);
    Matrix b(2, 3);
    EXPECT_THROW(a * b, std::invalid_argument);
    EXPECT_THROW(a - Matrix(3, 2), std::invalid_argument);
    EXPECT_THROW(a * std::vector<double>(2, 1.0), std::invalid_argument);
    EXPECT_THROW(inverse(a), std::invalid_argument);
}

TEST(PriceAdjustmentSolverTest, NoStateChangeReducesToExpectedMove) {
    Matrix Q(3, 3);
    Matrix T(3, 3);
    Matrix R = from_rows({{1.0, 0.0, 0.0},
                          {0.0, 1.0, 0.0},
                          {0.25, 0.25, 0.5}});

    PriceAdjustmentSolver solver;
    auto adj = solver.solve(Q, R, T, kUnitMoves);

    ASSERT_EQ(adj.by_state.size(), 3u);
    EXPECT_DOUBLE_EQ(adj.by_state[0], -1.0);
    EXPECT_DOUBLE_EQ(adj.by_state[1], 0.0);
    EXPECT_DOUBLE_EQ(adj.by_state[2], 0.25);
    EXPECT_EQ(adj.terms_used, 20u);
}

TEST(PriceAdjustmentSolverTest, SingleStateGeometricSeries) {
    // Qi = 2, G = 2, B = 0.5: adjustment = 2 * (1 + 0.5 + 0.25 + ...) -> 4
    Matrix Q = from_rows({{0.5}});
    Matrix T = from_rows({{0.25}});
    Matrix R = from_rows({{0.0, 0.0, 1.0}});

    PriceAdjustmentSolver solver;
    auto adj = solver.solve(Q, R, T, kUnitMoves);
    EXPECT_NEAR(adj.by_state[0], 4.0, 1e-5);
    EXPECT_LT(adj.by_state[0], 4.0);
}

TEST(PriceAdjustmentSolverTest, ToleranceStopsEarly) {
    Matrix Q = from_rows({{0.5}});
    Matrix T = from_rows({{0.25}});
    Matrix R = from_rows({{0.0, 0.0, 1.0}});

    PriceAdjustmentSolver solver(SolverOptions{.iterations = 20, .convergence_tolerance = 1e-3});
    auto adj = solver.solve(Q, R, T, kUnitMoves);
    // term i = 2 * 0.5^i, first below 1e-3 at i = 11
    EXPECT_EQ(adj.terms_used, 12u);
    EXPECT_NEAR(adj.by_state[0], 4.0, 1e-3);
}

TEST(PriceAdjustmentSolverTest, SingularQThrows) {
    Matrix Q = from_rows({{1.0}});
    Matrix T(1, 1);
    Matrix R = from_rows({{0.0, 1.0, 0.0}});

    PriceAdjustmentSolver solver;
    EXPECT_THROW(solver.solve(Q, R, T, kUnitMoves), NumericalInstabilityError);
}

TEST(PriceAdjustmentSolverTest, InconsistentShapesThrow) {
    PriceAdjustmentSolver solver;
    EXPECT_THROW(solver.solve(Matrix(2, 2), Matrix(2, 3), Matrix(2, 2), {-1.0, 1.0}),
                 std::invalid_argument);
    EXPECT_THROW(solver.solve(Matrix(2, 2), Matrix(2, 3), Matrix(3, 3), kUnitMoves),
                 std::invalid_argument);
}
