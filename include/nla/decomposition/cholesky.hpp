#pragma once

#include <memory>
#include <vector>

#include "nla/algebra/matrixDense.hpp"
#include "nla/decomposition/decomposition_solver.hpp"

namespace nla { namespace decomposition {

/**
 * @brief Cholesky decomposition A = L·Lᵗ of a symmetric positive definite matrix.
 *
 * The factorization runs in the constructor on a private copy of A.
 * Construction fails with NonSquareMatrixException,
 * NonSymmetricMatrixException or NonPositiveDefiniteMatrixException;
 * there is no partially factored state.
 */
class CholeskyDecomposition {
public:
    using Scalar = double;
    using Index  = std::size_t;

    /// Default relative threshold on |A(i,j) - A(j,i)|.
    static constexpr Scalar DEFAULT_RELATIVE_SYMMETRY_THRESHOLD = 1.0e-15;
    /// Default absolute threshold a diagonal pivot must exceed.
    static constexpr Scalar DEFAULT_ABSOLUTE_POSITIVITY_THRESHOLD = 1.0e-10;

    explicit CholeskyDecomposition(const algebra::MatrixDense& A,
                                   Scalar relativeSymmetryThreshold = DEFAULT_RELATIVE_SYMMETRY_THRESHOLD,
                                   Scalar absolutePositivityThreshold = DEFAULT_ABSOLUTE_POSITIVITY_THRESHOLD);

    Index order() const noexcept { return m_lT.rows(); }

    /// Lower triangular factor (built on first call).
    const algebra::MatrixDense& L() const;

    /// Upper triangular factor Lᵗ; this is the factorized storage itself.
    const algebra::MatrixDense& LT() const noexcept { return m_lT; }

    /// det(A) = prod (Lᵗ_ii)^2.
    Scalar determinant() const noexcept;

    /// Solver borrowing this decomposition's storage; must not outlive it.
    std::unique_ptr<DecompositionSolver> solver() const;

private:
    algebra::MatrixDense                          m_lT;
    mutable std::unique_ptr<algebra::MatrixDense> m_cachedL;
};

/**
 * @brief Forward/back substitution against a Cholesky factor.
 *
 * Holds a read-only reference to the factor owned by the decomposition.
 */
class CholeskySolver final : public DecompositionSolver {
public:
    explicit CholeskySolver(const algebra::MatrixDense& lT) : m_lT(lT) {}

    std::vector<Scalar> solve(const std::vector<Scalar>& b) const override;
    algebra::MatrixDense solve(const algebra::MatrixDense& b) const override;

    /// Always true: construction already proved positive definiteness.
    bool isNonSingular() const override { return true; }

    algebra::MatrixDense inverse() const override;

private:
    const algebra::MatrixDense& m_lT;
};

}} // namespace nla::decomposition
