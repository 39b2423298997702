#pragma once

#include <cstddef>
#include <initializer_list>
#include <vector>

#include "nla/algebra/linearOperator.hpp"

namespace nla { namespace algebra {

/**
 * @brief Row-major dense matrix (double precision).
 *
 * Values are stored contiguously in row-major order, so data() is the
 * row-major snapshot the decompositions copy from.  The matrix is also
 * a LinearOperator and can be handed to the iterative solvers directly.
 * Products are plain nested loops.
 */
class MatrixDense final : public LinearOperator {
public:
    using Scalar = LinearOperator::Scalar;
    using Index  = LinearOperator::Index;

    using LinearOperator::gemv;
    using LinearOperator::gemvTranspose;

    /// 0×0 matrix.
    MatrixDense() = default;

    /// rows×cols matrix with every element set to @p init_value.
    MatrixDense(Index rows, Index cols, Scalar init_value = 0.0);

    /**
     * @brief Construct from nested rows, e.g. {{1, 2}, {3, 4}}.
     *
     * Rows of different lengths throw std::invalid_argument.
     */
    MatrixDense(std::initializer_list<std::initializer_list<Scalar>> rows);

    /// Adopt a row-major buffer; its size must be rows*cols.
    MatrixDense(Index rows, Index cols, std::vector<Scalar> data);

    static MatrixDense Identity(Index n);

    /// Square matrix with @p d on the diagonal.
    static MatrixDense Diagonal(const std::vector<Scalar>& d);

    Index rows() const noexcept override { return m_rows; }
    Index cols() const noexcept override { return m_cols; }
    Index size() const noexcept { return m_data.size(); }
    bool  empty() const noexcept { return m_data.empty(); }

    Scalar*       data()       noexcept { return m_data.data(); }
    const Scalar* data() const noexcept { return m_data.data(); }

    /// Start of row @p i (unchecked).
    Scalar*       row(Index i)       noexcept { return m_data.data() + i * m_cols; }
    const Scalar* row(Index i) const noexcept { return m_data.data() + i * m_cols; }

    Scalar&       operator()(Index i, Index j) noexcept { return m_data[i * m_cols + j]; }
    const Scalar& operator()(Index i, Index j) const noexcept { return m_data[i * m_cols + j]; }

    /// Checked access; throws std::out_of_range.
    Scalar&       at(Index i, Index j);
    const Scalar& at(Index i, Index j) const;

    void swapRows(Index i, Index j) noexcept;

    /// y = α·A·x + β·y with x of length cols() and y of length rows().
    void gemv(const Scalar* x, Scalar* y, Scalar alpha = 1.0, Scalar beta = 0.0) const noexcept override;

    bool isTransposable() const noexcept override { return true; }

    /// y = α·Aᵗ·x + β·y with x of length rows() and y of length cols().
    void gemvTranspose(const Scalar* x, Scalar* y, Scalar alpha = 1.0, Scalar beta = 0.0) const noexcept override;

    /**
     * @brief C = α·A·B + β·C.
     *
     * A is m×k, B is k×n and C is m×n; other shapes throw
     * DimensionMismatchException.
     */
    static void gemm(const MatrixDense& A, const MatrixDense& B, MatrixDense& C,
                     Scalar alpha = 1.0, Scalar beta = 0.0);

    /// A·B.
    MatrixDense multiply(const MatrixDense& B) const;

    void scale(Scalar alpha) noexcept;

    MatrixDense transpose() const;

    void extractDiagonal(std::vector<Scalar>& d) const override;

    /// Copy of the r×c block at (i0, j0); throws std::out_of_range past the edge.
    MatrixDense block(Index i0, Index j0, Index r, Index c) const;

private:
    Index m_rows{0};
    Index m_cols{0};
    std::vector<Scalar> m_data;
};

}} // namespace nla::algebra
