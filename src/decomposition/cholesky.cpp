#include "nla/decomposition/cholesky.hpp"
#include "nla/exception.hpp"

#include <algorithm>
#include <cmath>

namespace nla { namespace decomposition {

using algebra::MatrixDense;

CholeskyDecomposition::CholeskyDecomposition(const MatrixDense& A,
                                             Scalar relativeSymmetryThreshold,
                                             Scalar absolutePositivityThreshold)
    : m_lT(A)
{
    if (!A.isSquare())
        throw NonSquareMatrixException(A.rows(), A.cols());

    const Index n = A.rows();
    MatrixDense& l = m_lT;

    // symmetry check; the strict lower triangle is never read again
    for (Index i = 0; i < n; ++i) {
        Scalar* lI = l.row(i);
        for (Index j = i + 1; j < n; ++j) {
            Scalar* lJ = l.row(j);
            const Scalar lIJ = lI[j];
            const Scalar lJI = lJ[i];
            const Scalar maxDelta =
                relativeSymmetryThreshold * std::max(std::fabs(lIJ), std::fabs(lJI));
            if (std::fabs(lIJ - lJI) > maxDelta)
                throw NonSymmetricMatrixException(i, j, relativeSymmetryThreshold);
            lJ[i] = 0;
        }
    }

    // outer-product elimination on the upper triangle
    for (Index i = 0; i < n; ++i) {
        Scalar* ltI = l.row(i);

        if (ltI[i] <= absolutePositivityThreshold)
            throw NonPositiveDefiniteMatrixException(ltI[i], i, absolutePositivityThreshold);

        ltI[i] = std::sqrt(ltI[i]);
        const Scalar inverse = 1.0 / ltI[i];

        for (Index q = n - 1; q > i; --q) {
            ltI[q] *= inverse;
            Scalar* ltQ = l.row(q);
            for (Index p = q; p < n; ++p) {
                ltQ[p] -= ltI[q] * ltI[p];
            }
        }
    }
}

const MatrixDense& CholeskyDecomposition::L() const
{
    if (!m_cachedL)
        m_cachedL = std::make_unique<MatrixDense>(m_lT.transpose());
    return *m_cachedL;
}

CholeskyDecomposition::Scalar CholeskyDecomposition::determinant() const noexcept
{
    Scalar det = 1.0;
    for (Index i = 0; i < m_lT.rows(); ++i) {
        const Scalar lTii = m_lT(i, i);
        det *= lTii * lTii;
    }
    return det;
}

std::unique_ptr<DecompositionSolver> CholeskyDecomposition::solver() const
{
    return std::make_unique<CholeskySolver>(m_lT);
}

std::vector<DecompositionSolver::Scalar>
CholeskySolver::solve(const std::vector<Scalar>& b) const
{
    const std::size_t m = m_lT.rows();
    if (b.size() != m)
        throw DimensionMismatchException(b.size(), m);

    std::vector<Scalar> x(b);

    // L·y = b
    for (std::size_t j = 0; j < m; ++j) {
        const Scalar* lJ = m_lT.row(j);
        x[j] /= lJ[j];
        const Scalar xJ = x[j];
        for (std::size_t i = j + 1; i < m; ++i) {
            x[i] -= xJ * lJ[i];
        }
    }

    // Lᵗ·x = y
    for (std::size_t j = m; j-- > 0;) {
        x[j] /= m_lT(j, j);
        const Scalar xJ = x[j];
        for (std::size_t i = 0; i < j; ++i) {
            x[i] -= xJ * m_lT(i, j);
        }
    }

    return x;
}

MatrixDense CholeskySolver::solve(const MatrixDense& b) const
{
    const std::size_t m = m_lT.rows();
    if (b.rows() != m)
        throw DimensionMismatchException(b.rows(), m);

    const std::size_t nColB = b.cols();
    MatrixDense x(b);

    // L·Y = B, all columns per step
    for (std::size_t j = 0; j < m; ++j) {
        const Scalar* lJ = m_lT.row(j);
        const Scalar lJJ = lJ[j];
        Scalar* xJ = x.row(j);
        for (std::size_t k = 0; k < nColB; ++k) {
            xJ[k] /= lJJ;
        }
        for (std::size_t i = j + 1; i < m; ++i) {
            Scalar* xI = x.row(i);
            const Scalar lJI = lJ[i];
            for (std::size_t k = 0; k < nColB; ++k) {
                xI[k] -= xJ[k] * lJI;
            }
        }
    }

    // Lᵗ·X = Y
    for (std::size_t j = m; j-- > 0;) {
        const Scalar lJJ = m_lT(j, j);
        Scalar* xJ = x.row(j);
        for (std::size_t k = 0; k < nColB; ++k) {
            xJ[k] /= lJJ;
        }
        for (std::size_t i = 0; i < j; ++i) {
            Scalar* xI = x.row(i);
            const Scalar lIJ = m_lT(i, j);
            for (std::size_t k = 0; k < nColB; ++k) {
                xI[k] -= xJ[k] * lIJ;
            }
        }
    }

    return x;
}

MatrixDense CholeskySolver::inverse() const
{
    return solve(MatrixDense::Identity(m_lT.rows()));
}

}} // namespace nla::decomposition
