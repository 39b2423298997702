#include <cmath>
#include <stdexcept>
#include <vector>

#include "nla/algebra/matrixDense.hpp"
#include "nla/exception.hpp"
#include "test_util.hpp"

using namespace nlatest;
using nla::algebra::MatrixDense;

static void testConstructors()
{
    // default
    MatrixDense A;
    expect_true(A.rows() == 0 && A.cols() == 0 && A.empty(), __func__, "default ctor yields 0x0");
    // sized with init value
    MatrixDense B(2, 3, 1.5);
    expect_eq(B.rows(), static_cast<MatrixDense::Index>(2), __func__, "B.rows()", "2");
    expect_eq(B.cols(), static_cast<MatrixDense::Index>(3), __func__, "B.cols()", "3");
    expect_eq(B(1, 2), 1.5, __func__, "B(1,2)", "1.5");
    // initializer list
    MatrixDense C{{1.0, 2.0}, {3.0, 4.0}};
    expect_eq(C(0, 1), 2.0, __func__, "C(0,1)", "2.0");
    expect_eq(C(1, 0), 3.0, __func__, "C(1,0)", "3.0");
    // ragged initializer throws
    expect_throw<std::invalid_argument>([] {
        MatrixDense X{{1.0}, {2.0, 3.0}};
    }, __func__, "ragged initializer should throw");
    // row-major data of the wrong size
    expect_throw<nla::DimensionMismatchException>([] {
        MatrixDense X(2, 2, std::vector<double>{1.0, 2.0, 3.0});
    }, __func__, "data size must be rows*cols");
}

static void testFactories()
{
    MatrixDense I = MatrixDense::Identity(3);
    expect_eq(I(0, 0), 1.0, __func__, "I(0,0)", "1.0");
    expect_eq(I(0, 2), 0.0, __func__, "I(0,2)", "0.0");

    MatrixDense D = MatrixDense::Diagonal({2.0, 5.0});
    expect_eq(D(1, 1), 5.0, __func__, "D(1,1)", "5.0");
    expect_eq(D(1, 0), 0.0, __func__, "D(1,0)", "0.0");
}

static void testAtAndBlock()
{
    MatrixDense M{{1, 2, 3}, {4, 5, 6}, {7, 8, 9}};
    expect_eq(M.at(2, 1), 8.0, __func__, "M.at(2,1)", "8.0");
    expect_throw<std::out_of_range>([&] { (void)M.at(3, 0); }, __func__, "at() out of range");

    MatrixDense S = M.block(1, 1, 2, 2);
    expect_eq(S(0, 0), 5.0, __func__, "S(0,0)", "5.0");
    expect_eq(S(1, 1), 9.0, __func__, "S(1,1)", "9.0");
    expect_throw<std::out_of_range>([&] { (void)M.block(2, 2, 2, 2); }, __func__, "block past the edge");

    M.swapRows(0, 2);
    expect_eq(M(0, 0), 7.0, __func__, "M(0,0) after swap", "7.0");
    expect_eq(M(2, 2), 3.0, __func__, "M(2,2) after swap", "3.0");
}

static void testGemv()
{
    MatrixDense M{{1, 2, 3}, {4, 5, 6}};
    double x[] = {1.0, 1.0, 1.0};
    double y[] = {0.0, 0.0};
    M.gemv(x, y);
    expect_eq(y[0], 6.0, __func__, "y[0]", "6.0");
    expect_eq(y[1], 15.0, __func__, "y[1]", "15.0");
    // gemv with alpha and beta
    double y2[] = {1.0, 2.0};
    M.gemv(x, y2, 2.0, 3.0); // y2 = 2*M*x + 3*y2
    expect_eq(y2[0], 15.0, __func__, "y2[0]", "15.0");
    expect_eq(y2[1], 36.0, __func__, "y2[1]", "36.0");

    // vector overloads
    std::vector<double> v = M.gemv(std::vector<double>{1.0, 0.0, -1.0});
    expect_eq(v[0], -2.0, __func__, "v[0]", "-2.0");
    expect_eq(v[1], -2.0, __func__, "v[1]", "-2.0");
    expect_throw<nla::DimensionMismatchException>([&] {
        (void)M.gemv(std::vector<double>{1.0, 2.0});
    }, __func__, "gemv with short x");

    // transpose product
    std::vector<double> t = M.gemvTranspose(std::vector<double>{1.0, 1.0});
    expect_eq(t.size(), static_cast<std::size_t>(3), __func__, "t.size()", "3");
    expect_eq(t[2], 9.0, __func__, "t[2]", "9.0");
}

static void testGemmAndTranspose()
{
    MatrixDense A{{1, 2}, {3, 4}, {5, 6}};
    MatrixDense B{{1, 0, 2}, {0, 1, 3}};
    MatrixDense C = A.multiply(B);
    expect_eq(C.rows(), static_cast<MatrixDense::Index>(3), __func__, "C.rows()", "3");
    expect_eq(C(0, 2), 8.0, __func__, "C(0,2)", "8.0");
    expect_eq(C(2, 2), 28.0, __func__, "C(2,2)", "28.0");

    MatrixDense At = A.transpose();
    expect_eq(At.rows(), static_cast<MatrixDense::Index>(2), __func__, "At.rows()", "2");
    expect_eq(At(1, 2), 6.0, __func__, "At(1,2)", "6.0");

    expect_throw<nla::DimensionMismatchException>([&] {
        (void)A.multiply(A);
    }, __func__, "3x2 * 3x2 must throw");

    MatrixDense E(3, 3, 1.0);
    expect_throw<nla::DimensionMismatchException>([&] {
        MatrixDense::gemm(A, B, E, 1.0, 0.0);
        MatrixDense::gemm(A, A, E, 1.0, 0.0);
    }, __func__, "gemm with inner mismatch");
}

static void testScaleAndDiagonal()
{
    MatrixDense A{{3, 0}, {1, -4}, {2, 2}};
    A.scale(2.0);
    expect_eq(A(1, 1), -8.0, __func__, "A(1,1) after scale", "-8");

    std::vector<double> d;
    A.extractDiagonal(d);
    expect_eq(d.size(), static_cast<std::size_t>(2), __func__, "diag size", "2");
    expect_eq(d[0], 6.0, __func__, "d[0]", "6");
    expect_eq(d[1], -8.0, __func__, "d[1]", "-8");
}

static void testBetaZeroOverwritesOutput()
{
    // y holds garbage (NaN) and beta == 0 must discard it
    MatrixDense M{{1, 2}, {3, 4}};
    const double nan = std::nan("");
    double x[] = {1.0, 1.0};
    double y[] = {nan, nan};
    M.gemv(x, y, 1.0, 0.0);
    expect_eq(y[0], 3.0, __func__, "y[0]", "3");
    y[0] = y[1] = nan;
    M.gemvTranspose(x, y, 1.0, 0.0);
    expect_eq(y[1], 6.0, __func__, "yt[1]", "6");
}

int main()
{
    testConstructors();
    testFactories();
    testAtAndBlock();
    testGemv();
    testGemmAndTranspose();
    testScaleAndDiagonal();
    testBetaZeroOverwritesOutput();
    return summarize_and_exit();
}
