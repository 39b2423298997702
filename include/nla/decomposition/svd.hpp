#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "nla/algebra/matrixDense.hpp"
#include "nla/decomposition/decomposition_solver.hpp"

namespace nla { namespace decomposition {

/**
 * @brief Singular value decomposition A = U·Σ·Vᵗ of an m×n matrix.
 *
 * With p = min(m, n), U is m×p, Σ is p×p and V is n×p; U and V have
 * orthonormal columns and the singular values are sorted in
 * non-increasing order.  The matrix is first reduced to bidiagonal form
 * with Householder reflections, then diagonalized by implicit-shift QR
 * sweeps.  Wide matrices are factored through their transpose.
 *
 * Throws std::invalid_argument for an empty matrix.
 */
class SingularValueDecomposition {
public:
    using Scalar = double;
    using Index  = std::size_t;

    explicit SingularValueDecomposition(const algebra::MatrixDense& A);

    const algebra::MatrixDense& U() const noexcept { return m_U; }
    const algebra::MatrixDense& UT() const;
    const algebra::MatrixDense& V() const noexcept { return m_V; }
    const algebra::MatrixDense& VT() const;

    /// Diagonal matrix of the singular values.
    const algebra::MatrixDense& S() const;

    /// Singular values, non-negative and non-increasing.
    const std::vector<Scalar>& singularValues() const noexcept { return m_singularValues; }

    /**
     * @brief V·diag(1/σ²)·Vᵗ over the singular values σ ≥ @p minSingularValue.
     *
     * Throws NumberIsTooLargeException if no singular value reaches the cutoff.
     */
    algebra::MatrixDense covariance(Scalar minSingularValue) const;

    /// L2 norm of the matrix, i.e. its largest singular value.
    Scalar norm() const noexcept { return m_singularValues.front(); }

    /// σ_max / σ_min.
    Scalar conditionNumber() const noexcept;

    /// σ_min / σ_max.
    Scalar inverseConditionNumber() const noexcept;

    /// Number of singular values above tolerance().
    Index rank() const noexcept;

    /// max(m·σ_max·eps, sqrt(smallest normal double)) with m the larger dimension.
    Scalar tolerance() const noexcept { return m_tol; }

    /// Least-squares solver through the pseudo-inverse.
    std::unique_ptr<DecompositionSolver> solver() const;

private:
    Index                m_m; // larger dimension
    Index                m_n; // smaller dimension
    bool                 m_transposed;
    std::vector<Scalar>  m_singularValues;
    algebra::MatrixDense m_U;
    algebra::MatrixDense m_V;
    Scalar               m_tol;

    mutable std::unique_ptr<algebra::MatrixDense> m_cachedUt;
    mutable std::unique_ptr<algebra::MatrixDense> m_cachedVt;
    mutable std::unique_ptr<algebra::MatrixDense> m_cachedS;
};

/**
 * @brief Least-squares solver holding the Moore-Penrose pseudo-inverse V·Σ⁺·Uᵗ.
 *
 * Singular values at or below the tolerance are treated as zero.
 */
class SVDSolver final : public DecompositionSolver {
public:
    SVDSolver(const std::vector<Scalar>& singularValues,
              const algebra::MatrixDense& uT,
              const algebra::MatrixDense& v,
              bool nonSingular, Scalar tol);

    std::vector<Scalar> solve(const std::vector<Scalar>& b) const override;
    algebra::MatrixDense solve(const algebra::MatrixDense& b) const override;

    /// True only for square matrices of full rank.
    bool isNonSingular() const override { return m_nonSingular; }

    /// The pseudo-inverse.
    algebra::MatrixDense inverse() const override { return m_pseudoInverse; }

private:
    algebra::MatrixDense m_pseudoInverse;
    bool                 m_nonSingular;
};

}} // namespace nla::decomposition
