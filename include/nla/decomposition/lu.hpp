#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "nla/algebra/matrixDense.hpp"
#include "nla/decomposition/decomposition_solver.hpp"

namespace nla { namespace decomposition {

/**
 * @brief LU decomposition P·A = L·U with partial pivoting.
 *
 * L is unit lower triangular, U upper triangular.  At every column the
 * candidate of largest magnitude becomes the pivot; if its magnitude is
 * below the singularity threshold the matrix is flagged singular and
 * elimination stops.  A singular decomposition is still a valid object:
 * L(), U() and P() are empty, determinant() is 0, and its solver throws
 * SingularMatrixException.
 */
class LUDecomposition {
public:
    using Scalar = double;
    using Index  = std::size_t;

    /// Default bound below which a pivot is considered zero.
    static constexpr Scalar DEFAULT_TOO_SMALL = 1e-11;

    /// Throws NonSquareMatrixException if @p A is not square.
    explicit LUDecomposition(const algebra::MatrixDense& A,
                             Scalar singularityThreshold = DEFAULT_TOO_SMALL);

    Index order() const noexcept { return m_n; }
    bool isSingular() const noexcept { return m_singular; }

    const algebra::MatrixDense& L() const;
    const algebra::MatrixDense& U() const;
    const algebra::MatrixDense& P() const;

    /// pivot()[i] is the row of A that ended up in row i.
    const std::vector<Index>& pivot() const noexcept { return m_pivot; }

    Scalar determinant() const noexcept;

    /// Solver borrowing this decomposition's storage; must not outlive it.
    std::unique_ptr<DecompositionSolver> solver() const;

private:
    Index               m_n;
    std::vector<Scalar> m_lu;    // row-major, L below / U on and above the diagonal
    std::vector<Index>  m_pivot;
    bool                m_even{true};
    bool                m_singular{false};

    mutable std::unique_ptr<algebra::MatrixDense> m_cachedL;
    mutable std::unique_ptr<algebra::MatrixDense> m_cachedU;
    mutable std::unique_ptr<algebra::MatrixDense> m_cachedP;
};

/// Solver reading the factors of an LUDecomposition.
class LUSolver final : public DecompositionSolver {
public:
    LUSolver(const std::vector<Scalar>& lu, const std::vector<std::size_t>& pivot, bool singular)
        : m_lu(lu), m_pivot(pivot), m_singular(singular) {}

    std::vector<Scalar> solve(const std::vector<Scalar>& b) const override;
    algebra::MatrixDense solve(const algebra::MatrixDense& b) const override;
    bool isNonSingular() const override { return !m_singular; }
    algebra::MatrixDense inverse() const override;

private:
    const std::vector<Scalar>&      m_lu;
    const std::vector<std::size_t>& m_pivot;
    bool                            m_singular;
};

}} // namespace nla::decomposition
