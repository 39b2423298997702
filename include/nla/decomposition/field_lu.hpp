#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "nla/algebra/fieldMatrix.hpp"
#include "nla/decomposition/decomposition_solver.hpp"
#include "nla/decomposition/lu_kernel.hpp"
#include "nla/exception.hpp"

namespace nla { namespace decomposition {

template <class T> class FieldLUSolver;

/**
 * @brief LU decomposition P·A = L·U over a generic field.
 *
 * Fields carry no ordering, so the pivot of each column is simply the
 * first non-zero candidate; a column without one flags the matrix
 * singular.  The elimination itself is the same kernel as the real
 * LUDecomposition.
 */
template <class T>
class FieldLUDecomposition {
public:
    using Index  = std::size_t;
    using Matrix = algebra::FieldMatrix<T>;

    /// Throws NonSquareMatrixException if @p A is not square.
    explicit FieldLUDecomposition(const Matrix& A)
        : m_n(A.rows()), m_lu(A.data())
    {
        if (!A.isSquare())
            throw NonSquareMatrixException(A.rows(), A.cols());

        auto firstNonZero = [](const std::vector<T>& lu, Index n, Index col) {
            Index nonZero = col;
            while (nonZero < n && algebra::FieldTraits<T>::isZero(lu[nonZero * n + col]))
                ++nonZero;
            return nonZero;
        };

        m_singular = detail::luFactorInPlace(m_lu, m_n, m_pivot, m_even, firstNonZero);
    }

    Index order() const noexcept { return m_n; }
    bool isSingular() const noexcept { return m_singular; }

    /// Unit lower factor; empty when singular.
    const Matrix& L() const
    {
        if (!m_cachedL)
            m_cachedL = std::make_unique<Matrix>(factor(detail::luLower(m_lu, m_n)));
        return *m_cachedL;
    }

    /// Upper factor; empty when singular.
    const Matrix& U() const
    {
        if (!m_cachedU)
            m_cachedU = std::make_unique<Matrix>(factor(detail::luUpper(m_lu, m_n)));
        return *m_cachedU;
    }

    /// Row permutation; empty when singular.
    const Matrix& P() const
    {
        if (!m_cachedP)
            m_cachedP = std::make_unique<Matrix>(factor(detail::luPermutation<T>(m_pivot)));
        return *m_cachedP;
    }

    const std::vector<Index>& pivot() const noexcept { return m_pivot; }

    /// Additive identity when singular.
    T determinant() const
    {
        if (m_singular)
            return algebra::FieldTraits<T>::zero();
        return detail::luDeterminant(m_lu, m_n, m_even);
    }

    /// Solver borrowing this decomposition's storage; must not outlive it.
    std::unique_ptr<FieldDecompositionSolver<T>> solver() const
    {
        return std::make_unique<FieldLUSolver<T>>(m_lu, m_pivot, m_singular);
    }

private:
    Matrix factor(std::vector<T> data) const
    {
        if (m_singular)
            return Matrix();
        return Matrix(m_n, m_n, std::move(data));
    }

    Index              m_n;
    std::vector<T>     m_lu;
    std::vector<Index> m_pivot;
    bool               m_even{true};
    bool               m_singular{false};

    mutable std::unique_ptr<Matrix> m_cachedL;
    mutable std::unique_ptr<Matrix> m_cachedU;
    mutable std::unique_ptr<Matrix> m_cachedP;
};

template <class T>
class FieldLUSolver final : public FieldDecompositionSolver<T> {
public:
    using Matrix = algebra::FieldMatrix<T>;

    FieldLUSolver(const std::vector<T>& lu, const std::vector<std::size_t>& pivot, bool singular)
        : m_lu(lu), m_pivot(pivot), m_singular(singular) {}

    std::vector<T> solve(const std::vector<T>& b) const override
    {
        const std::size_t m = m_pivot.size();
        if (b.size() != m)
            throw DimensionMismatchException(b.size(), m);
        if (m_singular)
            throw SingularMatrixException();
        return detail::luSolve(m_lu, m_pivot, b, 1);
    }

    Matrix solve(const Matrix& b) const override
    {
        const std::size_t m = m_pivot.size();
        if (b.rows() != m)
            throw DimensionMismatchException(b.rows(), m);
        if (m_singular)
            throw SingularMatrixException();
        return Matrix(m, b.cols(), detail::luSolve(m_lu, m_pivot, b.data(), b.cols()));
    }

    bool isNonSingular() const override { return !m_singular; }

    Matrix inverse() const override
    {
        return solve(Matrix::Identity(m_pivot.size()));
    }

private:
    const std::vector<T>&           m_lu;
    const std::vector<std::size_t>& m_pivot;
    bool                            m_singular;
};

}} // namespace nla::decomposition
