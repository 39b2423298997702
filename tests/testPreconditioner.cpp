#include <cmath>
#include <stdexcept>
#include <vector>

#include "nla/algebra/COO.hpp"
#include "nla/algebra/CSR.hpp"
#include "nla/algebra/linearOperator.hpp"
#include "nla/algebra/matrixDense.hpp"
#include "nla/exception.hpp"
#include "nla/preconditioner/block_jacobi.hpp"
#include "nla/preconditioner/identity.hpp"
#include "nla/preconditioner/jacobi.hpp"
#include "test_util.hpp"

using namespace nlatest;
using nla::algebra::LinearOperator;
using nla::algebra::MatrixCOO;
using nla::algebra::MatrixCSR;
using nla::algebra::MatrixDense;
using nla::preconditioner::BlockJacobi;
using nla::preconditioner::IdentityPreconditioner;
using nla::preconditioner::JacobiPreconditioner;

// Matrix-free tridiagonal operator tridiag(-1, d, -1)
class Tridiagonal final : public LinearOperator {
public:
    using LinearOperator::gemv;

    Tridiagonal(Index n, double d) : m_n(n), m_d(d) {}

    Index rows() const noexcept override { return m_n; }
    Index cols() const noexcept override { return m_n; }

    void gemv(const Scalar* x, Scalar* y, Scalar alpha, Scalar beta) const override
    {
        for (Index i = 0; i < m_n; ++i) {
            Scalar v = m_d * x[i];
            if (i > 0)       v -= x[i - 1];
            if (i + 1 < m_n) v -= x[i + 1];
            y[i] = alpha * v + beta * y[i];
        }
    }

private:
    Index  m_n;
    double m_d;
};

static void testIdentity()
{
    IdentityPreconditioner M;
    std::vector<double> r = {1.0, -2.0, 3.0}, z;
    M.apply(r, z);
    expect_true(z == r, __func__, "z = r");

    M.setup(MatrixCSR::Identity(3));
    expect_eq(M.rows(), static_cast<std::size_t>(3), __func__, "sized by setup", "3");
    expect_true(M.gemv(r) == r, __func__, "gemv goes through apply");

    expect_throw<nla::NonSquareOperatorException>([&] {
        M.setup(MatrixDense(2, 3, 1.0));
    }, __func__, "non-square operator");
}

static void testJacobiSparse()
{
    MatrixCSR A(MatrixCOO::Poisson2D(3));
    JacobiPreconditioner M;
    M.setup(A);
    expect_eq(M.diagonal().size(), static_cast<std::size_t>(9), __func__, "diag size", "9");

    std::vector<double> r(9, 2.0), z;
    M.apply(r, z);
    for (double v : z)
        expect_eq(v, 0.5, __func__, "z = r / 4", "0.5");

    expect_throw<nla::DimensionMismatchException>([&] {
        M.apply(std::vector<double>(4, 1.0), z);
    }, __func__, "residual of the wrong size");
}

static void testJacobiDenseAndMatrixFree()
{
    JacobiPreconditioner dense;
    dense.setup(MatrixDense{{2.0, 1.0}, {1.0, 8.0}});
    std::vector<double> z;
    dense.apply({4.0, 4.0}, z);
    expect_eq(z[0], 2.0, __func__, "z[0]", "2");
    expect_eq(z[1], 0.5, __func__, "z[1]", "0.5");

    // diagonal recovered by probing
    JacobiPreconditioner probed;
    probed.setup(Tridiagonal(5, 3.0));
    for (double d : probed.diagonal())
        expect_eq(d, 3.0, __func__, "probed diagonal", "3");

    JacobiPreconditioner root = dense.sqrt();
    root.apply({4.0, 4.0}, z);
    expect_near(z[0], 4.0 / std::sqrt(2.0), 1e-15, __func__, "sqrt z[0]", "4/sqrt(2)");
    expect_near(z[1], 1.0, 1e-15, __func__, "sqrt z[1]", "1");
}

static void testJacobiRejections()
{
    MatrixCOO A(2, 2, {{0, 0, 1.0}, {0, 1, 1.0}, {1, 0, 1.0}});
    JacobiPreconditioner M;
    expect_throw<std::runtime_error>([&] { M.setup(A); }, __func__, "zero diagonal");
    expect_throw<std::runtime_error>([] {
        JacobiPreconditioner bad(std::vector<double>{1.0, 0.0});
    }, __func__, "zero diagonal given directly");
    expect_throw<nla::NonSquareOperatorException>([&] {
        M.setup(MatrixCOO(2, 3));
    }, __func__, "non-square operator");
}

static void testBlockJacobiLayout()
{
    expect_throw<std::invalid_argument>([] { BlockJacobi M(0); }, __func__, "block size 0");
    expect_throw<std::invalid_argument>([] { BlockJacobi M(-3); }, __func__, "negative block size");

    BlockJacobi M(2);
    M.setup(Tridiagonal(5, 4.0));
    expect_eq(M.parts(), 3, __func__, "parts", "3");
    const std::vector<int>& s = M.blockStarts();
    expect_true(s.size() == 4 && s[0] == 0 && s[1] == 2 && s[2] == 4 && s[3] == 5,
                __func__, "block starts 0,2,4,5");
}

static void testBlockJacobiExactOnBlockDiagonal()
{
    // two 2x2 blocks, no coupling: M = A⁻¹
    MatrixCOO coo(4, 4, {{0, 0, 4.0}, {0, 1, 1.0}, {1, 0, 2.0}, {1, 1, 3.0},
                         {2, 2, 5.0}, {2, 3, -1.0}, {3, 2, -1.0}, {3, 3, 2.0}});
    MatrixCSR A(coo);

    BlockJacobi M(2);
    M.setup(A);

    const std::vector<double> x = {1.0, -1.0, 2.0, 0.5};
    std::vector<double> z;
    M.apply(A.gemv(x), z);
    expect_true(max_abs_diff(z, x) < 1e-14, __func__, "M * A * x = x (sparse)");

    BlockJacobi D(2);
    D.setup(coo.toDense());
    D.apply(A.gemv(x), z);
    expect_true(max_abs_diff(z, x) < 1e-14, __func__, "M * A * x = x (dense)");

    // one block covering everything is an exact solve
    BlockJacobi whole(10);
    whole.setup(Tridiagonal(6, 3.0));
    const std::vector<double> y = {1, 2, 3, 4, 5, 6};
    whole.apply(Tridiagonal(6, 3.0).gemv(y), z);
    expect_true(max_abs_diff(z, y) < 1e-13, __func__, "single block inverts A");
    expect_eq(whole.parts(), 1, __func__, "parts", "1");
}

static void testBlockJacobiIgnoresCoupling()
{
    // off-block entries do not reach the factors
    MatrixCOO coo(2, 2, {{0, 0, 2.0}, {0, 1, 7.0}, {1, 0, 7.0}, {1, 1, 4.0}});
    BlockJacobi M(1);
    M.setup(coo);
    std::vector<double> z;
    M.apply({2.0, 2.0}, z);
    expect_near(z[0], 1.0, 1e-15, __func__, "z[0]", "1");
    expect_near(z[1], 0.5, 1e-15, __func__, "z[1]", "0.5");

    expect_throw<nla::DimensionMismatchException>([&] {
        M.apply({1.0}, z);
    }, __func__, "residual of the wrong size");
}

static void testBlockJacobiSingularBlock()
{
    MatrixCOO coo(4, 4, {{0, 0, 1.0}, {0, 1, 2.0}, {1, 0, 2.0}, {1, 1, 4.0},
                         {2, 2, 1.0}, {3, 3, 1.0}});
    BlockJacobi M(2);
    expect_throw<nla::SingularMatrixException>([&] { M.setup(coo); }, __func__, "singular diagonal block");
}

int main()
{
    testIdentity();
    testJacobiSparse();
    testJacobiDenseAndMatrixFree();
    testJacobiRejections();
    testBlockJacobiLayout();
    testBlockJacobiExactOnBlockDiagonal();
    testBlockJacobiIgnoresCoupling();
    testBlockJacobiSingularBlock();
    return summarize_and_exit();
}
