#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "nla/algebra/matrixDense.hpp"
#include "nla/decomposition/svd.hpp"
#include "nla/exception.hpp"
#include "test_util.hpp"

using namespace nlatest;
using nla::algebra::MatrixDense;
using nla::decomposition::SingularValueDecomposition;

static bool orthonormalColumns(const MatrixDense& Q, double tol)
{
    return max_abs_diff_mat(Q.transpose().multiply(Q), MatrixDense::Identity(Q.cols())) < tol;
}

static MatrixDense reconstruct(const SingularValueDecomposition& svd)
{
    return svd.U().multiply(svd.S()).multiply(svd.VT());
}

static void testSquare()
{
    // singular values 3 and 1
    const MatrixDense A{{24.0 / 25.0, 43.0 / 25.0}, {57.0 / 25.0, 24.0 / 25.0}};
    SingularValueDecomposition svd(A);

    const std::vector<double>& s = svd.singularValues();
    expect_near(s[0], 3.0, 1e-13, __func__, "sigma0", "3");
    expect_near(s[1], 1.0, 1e-13, __func__, "sigma1", "1");

    expect_true(max_abs_diff_mat(reconstruct(svd), A) < 1e-13, __func__, "U*S*Vt = A");
    expect_true(orthonormalColumns(svd.U(), 1e-13), __func__, "U orthonormal");
    expect_true(orthonormalColumns(svd.V(), 1e-13), __func__, "V orthonormal");
    expect_true(max_abs_diff_mat(svd.UT(), svd.U().transpose()) == 0.0, __func__, "UT");

    expect_near(svd.norm(), 3.0, 1e-13, __func__, "norm", "3");
    expect_near(svd.conditionNumber(), 3.0, 1e-13, __func__, "cond", "3");
    expect_near(svd.inverseConditionNumber(), 1.0 / 3.0, 1e-13, __func__, "1/cond", "1/3");
    expect_eq(svd.rank(), static_cast<std::size_t>(2), __func__, "rank", "2");

    auto solver = svd.solver();
    expect_true(solver->isNonSingular(), __func__, "full-rank square is non-singular");
    const std::vector<double> xRef = {1.0, -1.0};
    expect_true(max_abs_diff(solver->solve(A.gemv(xRef)), xRef) < 1e-13, __func__, "solve(vector)");
    expect_true(max_abs_diff_mat(A.multiply(solver->inverse()), MatrixDense::Identity(2)) < 1e-13,
                __func__, "A * inverse = I");
}

static void testTallAndWide()
{
    const MatrixDense A{{1.0, 2.0, 3.0},
                        {4.0, 5.0, 6.0},
                        {7.0, 8.0, 10.0},
                        {-1.0, 0.5, 2.0}};

    SingularValueDecomposition tall(A);
    expect_eq(tall.U().rows(), static_cast<std::size_t>(4), __func__, "U rows", "4");
    expect_eq(tall.U().cols(), static_cast<std::size_t>(3), __func__, "U cols", "3");
    expect_eq(tall.V().rows(), static_cast<std::size_t>(3), __func__, "V rows", "3");
    expect_true(max_abs_diff_mat(reconstruct(tall), A) < 1e-12, __func__, "tall: U*S*Vt = A");
    expect_true(orthonormalColumns(tall.U(), 1e-13), __func__, "tall: U orthonormal");

    const std::vector<double>& s = tall.singularValues();
    expect_true(s[0] >= s[1] && s[1] >= s[2] && s[2] >= 0.0, __func__, "non-increasing");

    const MatrixDense At = A.transpose();
    SingularValueDecomposition wide(At);
    expect_eq(wide.U().rows(), static_cast<std::size_t>(3), __func__, "wide U rows", "3");
    expect_eq(wide.V().rows(), static_cast<std::size_t>(4), __func__, "wide V rows", "4");
    expect_true(max_abs_diff_mat(reconstruct(wide), At) < 1e-12, __func__, "wide: U*S*Vt = At");
    for (std::size_t i = 0; i < 3; ++i)
        expect_near(wide.singularValues()[i], s[i], 1e-12, __func__, "same singular values", "tall");

    expect_true(!tall.solver()->isNonSingular(), __func__, "rectangular is never non-singular");
}

enum class Shape { Random, ZeroRow, DuplicateColumn, AllZero };

static void testRandomShapes()
{
    std::mt19937 gen(424242u);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    const Shape shapes[] = {Shape::Random, Shape::ZeroRow, Shape::DuplicateColumn, Shape::AllZero};

    for (std::size_t m = 1; m <= 7; ++m) {
        for (std::size_t n = 1; n <= 7; ++n) {
            for (Shape shape : shapes) {
                const std::size_t p = std::min(m, n);
                std::size_t expectedRank = p;

                MatrixDense A(m, n, 0.0);
                if (shape != Shape::AllZero) {
                    for (std::size_t i = 0; i < m; ++i)
                        for (std::size_t j = 0; j < n; ++j)
                            A(i, j) = dist(gen);
                }
                if (shape == Shape::ZeroRow) {
                    std::fill(A.row(m - 1), A.row(m - 1) + n, 0.0);
                    expectedRank = std::min(m - 1, n);
                } else if (shape == Shape::DuplicateColumn) {
                    if (n < 2) continue;
                    for (std::size_t i = 0; i < m; ++i) A(i, n - 1) = A(i, 0);
                    expectedRank = std::min(m, n - 1);
                } else if (shape == Shape::AllZero) {
                    expectedRank = 0;
                }

                const std::string tag = std::to_string(m) + "x" + std::to_string(n)
                                      + " shape " + std::to_string(static_cast<int>(shape));
                SingularValueDecomposition svd(A);

                expect_eq(svd.U().rows(), m, __func__, "U rows", "m");
                expect_eq(svd.U().cols(), p, __func__, "U cols", "min(m,n)");
                expect_eq(svd.V().rows(), n, __func__, "V rows", "n");
                expect_eq(svd.V().cols(), p, __func__, "V cols", "min(m,n)");

                const std::vector<double>& s = svd.singularValues();
                bool ordered = s.back() >= 0.0;
                for (std::size_t i = 1; i < s.size(); ++i) ordered = ordered && s[i - 1] >= s[i];
                expect_true(ordered, __func__, "non-negative, non-increasing, " + tag);

                const double scale = std::max(1.0, s.front());
                expect_true(max_abs_diff_mat(reconstruct(svd), A) < 1e-12 * scale, __func__, "U*S*Vt = A, " + tag);
                expect_true(orthonormalColumns(svd.U(), 1e-12), __func__, "U orthonormal, " + tag);
                expect_true(orthonormalColumns(svd.V(), 1e-12), __func__, "V orthonormal, " + tag);

                // exactly dependent rows or columns leave rounding-level singular values
                bool deficient = true;
                for (std::size_t i = expectedRank; i < p; ++i)
                    deficient = deficient && s[i] <= 1e-13 * scale;
                expect_true(deficient, __func__, "trailing singular values vanish, " + tag);

                if (shape == Shape::Random)
                    expect_eq(svd.rank(), p, __func__, ("rank, " + tag).c_str(), "min(m,n)");
                if (shape == Shape::AllZero) {
                    expect_eq(svd.rank(), static_cast<std::size_t>(0), __func__, "rank of zero", "0");
                    expect_true(max_abs_diff_mat(svd.solver()->inverse(), MatrixDense(n, m, 0.0)) == 0.0,
                                __func__, "pseudo-inverse of zero is zero, " + tag);
                }
            }
        }
    }
}

static void testLeastSquares()
{
    const MatrixDense A{{1.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}};
    SingularValueDecomposition svd(A);
    auto solver = svd.solver();

    const std::vector<double> x = solver->solve(std::vector<double>{1.0, 1.0, 0.0});
    expect_near(x[0], 1.0 / 3.0, 1e-13, __func__, "x[0]", "1/3");
    expect_near(x[1], 1.0 / 3.0, 1e-13, __func__, "x[1]", "1/3");

    // pseudo-inverse: A⁺·A = I
    expect_true(max_abs_diff_mat(solver->inverse().multiply(A), MatrixDense::Identity(2)) < 1e-13,
                __func__, "pinv(A)*A = I");

    expect_throw<nla::DimensionMismatchException>([&] {
        (void)solver->solve(std::vector<double>{1.0, 2.0});
    }, __func__, "b must have rows(A) entries");
    expect_throw<nla::DimensionMismatchException>([&] {
        (void)solver->solve(MatrixDense(2, 1, 1.0));
    }, __func__, "B must have rows(A) rows");
}

static void testCovariance()
{
    const MatrixDense A{{1.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}};
    SingularValueDecomposition svd(A);

    // all singular values kept: (AᵗA)⁻¹
    const MatrixDense cov = svd.covariance(0.0);
    const MatrixDense ref{{2.0 / 3.0, -1.0 / 3.0}, {-1.0 / 3.0, 2.0 / 3.0}};
    expect_true(max_abs_diff_mat(cov, ref) < 1e-13, __func__, "covariance = inv(At*A)");

    // only sigma = sqrt(3) kept
    const MatrixDense cov1 = svd.covariance(1.5);
    expect_near(cov1(0, 0), 1.0 / 6.0, 1e-13, __func__, "truncated covariance", "1/6");

    try {
        (void)svd.covariance(2.0);
        expect_true(false, __func__, "cutoff above sigma_max accepted");
    } catch (const nla::NumberIsTooLargeException& e) {
        expect_eq(e.value(), 2.0, __func__, "value", "2");
        expect_near(e.bound(), std::sqrt(3.0), 1e-13, __func__, "bound", "sqrt(3)");
    }
}

static void testRankDeficient()
{
    const MatrixDense A{{1.0, 2.0}, {2.0, 4.0}};
    SingularValueDecomposition svd(A);
    expect_eq(svd.rank(), static_cast<std::size_t>(1), __func__, "rank", "1");
    expect_near(svd.singularValues()[0], 5.0, 1e-13, __func__, "sigma0", "5");
    expect_true(svd.singularValues()[1] <= svd.tolerance(), __func__, "sigma1 negligible");

    auto solver = svd.solver();
    expect_true(!solver->isNonSingular(), __func__, "rank-deficient is singular");

    // pinv(v·vᵗ) = v·vᵗ / |v|⁴
    MatrixDense ref(A);
    ref.scale(1.0 / 25.0);
    expect_true(max_abs_diff_mat(solver->inverse(), ref) < 1e-13, __func__, "pseudo-inverse");

    const double tolMin = std::sqrt(std::numeric_limits<double>::min());
    expect_true(svd.tolerance() >= tolMin, __func__, "tolerance floor");
}

static void testRejections()
{
    expect_throw<std::invalid_argument>([] {
        SingularValueDecomposition svd{MatrixDense()};
    }, __func__, "empty matrix");

    // NaN entries must not hang the QR sweeps
    const double nan = std::numeric_limits<double>::quiet_NaN();
    SingularValueDecomposition svd(MatrixDense{{1.0, nan}, {0.0, 1.0}});
    expect_eq(svd.singularValues().size(), static_cast<std::size_t>(2), __func__, "NaN input terminates", "2");
}

int main()
{
    testSquare();
    testTallAndWide();
    testRandomShapes();
    testLeastSquares();
    testCovariance();
    testRankDeficient();
    testRejections();
    return summarize_and_exit();
}
