#include "nla/decomposition/lu.hpp"
#include "nla/decomposition/lu_kernel.hpp"
#include "nla/exception.hpp"

#include <cmath>
#include <limits>

namespace nla { namespace decomposition {

using algebra::MatrixDense;

LUDecomposition::LUDecomposition(const MatrixDense& A, Scalar singularityThreshold)
    : m_n(A.rows()), m_lu(A.data(), A.data() + A.size())
{
    if (!A.isSquare())
        throw NonSquareMatrixException(A.rows(), A.cols());

    // partial pivoting: largest candidate in magnitude
    auto largestCandidate = [singularityThreshold](const std::vector<Scalar>& lu, Index n, Index col) {
        Index max = col;
        Scalar largest = -std::numeric_limits<Scalar>::infinity();
        for (Index row = col; row < n; ++row) {
            const Scalar a = std::fabs(lu[row * n + col]);
            if (a > largest) {
                largest = a;
                max = row;
            }
        }
        if (std::fabs(lu[max * n + col]) < singularityThreshold)
            return n;
        return max;
    };

    m_singular = detail::luFactorInPlace(m_lu, m_n, m_pivot, m_even, largestCandidate);
}

const MatrixDense& LUDecomposition::L() const
{
    if (!m_cachedL) {
        m_cachedL = m_singular
            ? std::make_unique<MatrixDense>()
            : std::make_unique<MatrixDense>(m_n, m_n, detail::luLower(m_lu, m_n));
    }
    return *m_cachedL;
}

const MatrixDense& LUDecomposition::U() const
{
    if (!m_cachedU) {
        m_cachedU = m_singular
            ? std::make_unique<MatrixDense>()
            : std::make_unique<MatrixDense>(m_n, m_n, detail::luUpper(m_lu, m_n));
    }
    return *m_cachedU;
}

const MatrixDense& LUDecomposition::P() const
{
    if (!m_cachedP) {
        m_cachedP = m_singular
            ? std::make_unique<MatrixDense>()
            : std::make_unique<MatrixDense>(m_n, m_n, detail::luPermutation<Scalar>(m_pivot));
    }
    return *m_cachedP;
}

LUDecomposition::Scalar LUDecomposition::determinant() const noexcept
{
    if (m_singular)
        return 0.0;
    return detail::luDeterminant(m_lu, m_n, m_even);
}

std::unique_ptr<DecompositionSolver> LUDecomposition::solver() const
{
    return std::make_unique<LUSolver>(m_lu, m_pivot, m_singular);
}

std::vector<DecompositionSolver::Scalar>
LUSolver::solve(const std::vector<Scalar>& b) const
{
    const std::size_t m = m_pivot.size();
    if (b.size() != m)
        throw DimensionMismatchException(b.size(), m);
    if (m_singular)
        throw SingularMatrixException();
    return detail::luSolve(m_lu, m_pivot, b, 1);
}

MatrixDense LUSolver::solve(const MatrixDense& b) const
{
    const std::size_t m = m_pivot.size();
    if (b.rows() != m)
        throw DimensionMismatchException(b.rows(), m);
    if (m_singular)
        throw SingularMatrixException();

    std::vector<Scalar> rhs(b.data(), b.data() + b.size());
    return MatrixDense(m, b.cols(), detail::luSolve(m_lu, m_pivot, rhs, b.cols()));
}

MatrixDense LUSolver::inverse() const
{
    return solve(MatrixDense::Identity(m_pivot.size()));
}

}} // namespace nla::decomposition
