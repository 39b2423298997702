#pragma once

#include <cstddef>

#include "nla/algebra/matrixDense.hpp"

namespace nla { namespace decomposition {

/**
 * @brief Pivoted Cholesky root of a symmetric positive semidefinite matrix.
 *
 * Computes a rectangular B (order × rank) with B·Bᵗ = A.  Rows are
 * eliminated in order of decreasing remaining diagonal; elimination
 * stops once every remaining diagonal element is at most @p small,
 * which fixes the rank.  Throws NonPositiveDefiniteMatrixException if
 * the very first pivot is already below @p small or if a remaining
 * diagonal element is below -small.
 */
class RectangularCholeskyDecomposition {
public:
    using Scalar = double;
    using Index  = std::size_t;

    explicit RectangularCholeskyDecomposition(const algebra::MatrixDense& A, Scalar small = 0.0);

    /// B such that B·Bᵗ = A (order × rank).
    const algebra::MatrixDense& rootMatrix() const noexcept { return m_root; }

    /// Number of independent rows of A, i.e. columns of the root.
    Index rank() const noexcept { return m_rank; }

private:
    algebra::MatrixDense m_root;
    Index                m_rank{0};
};

}} // namespace nla::decomposition
