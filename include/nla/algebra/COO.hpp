#pragma once

#include <cstddef>
#include <initializer_list>
#include <tuple>
#include <vector>

#include "nla/algebra/matrixSparse.hpp"

namespace nla { namespace algebra {

/**
 * @brief Sparse matrix in coordinate (COO) format.
 *
 * Entries are appended as (row, col, value) triplets in any order and may
 * repeat.  This is the assembly format; products on large systems should
 * go through MatrixCSR.
 */
class MatrixCOO final : public MatrixSparse {
public:
    using Scalar  = MatrixSparse::Scalar;
    using Index   = MatrixSparse::Index;
    using Triplet = std::tuple<Index, Index, Scalar>;

    using MatrixSparse::gemv;
    using MatrixSparse::gemvTranspose;

    MatrixCOO() = default;

    /// Empty rows×cols matrix.
    MatrixCOO(Index rows, Index cols) : m_rows(rows), m_cols(cols) {}

    /**
     * @brief Take ownership of parallel triplet arrays.
     *
     * Throws std::invalid_argument if the arrays differ in length and
     * std::out_of_range if an index falls outside rows×cols.
     */
    MatrixCOO(Index rows, Index cols,
              std::vector<Index> row, std::vector<Index> col,
              std::vector<Scalar> val);

    /// Build from a list of {i, j, v} triplets.
    MatrixCOO(Index rows, Index cols, std::initializer_list<Triplet> triplets);

    /**
     * @brief Five-point finite-difference Laplacian on an nx×nx grid.
     *
     * The result has order nx², 4 on the diagonal and -1 for every
     * horizontal or vertical grid neighbour (Dirichlet boundary), so it
     * is symmetric positive definite.
     */
    static MatrixCOO Poisson2D(Index nx);

    void reserve(Index nnz);

    /// Append (i,j) += v; throws std::out_of_range outside the matrix.
    void add(Index i, Index j, Scalar v);

    Index rows() const noexcept override { return m_rows; }
    Index cols() const noexcept override { return m_cols; }
    Index nnz()  const noexcept override { return m_val.size(); }

    void gemv(const Scalar* x, Scalar* y,
              Scalar alpha = 1.0, Scalar beta = 0.0) const override;

    void gemvTranspose(const Scalar* x, Scalar* y,
                       Scalar alpha = 1.0, Scalar beta = 0.0) const override;

    void extractDiagonal(std::vector<Scalar>& d) const override;

    void forEachNZ(const TripletVisitor& f) const override;

    const std::vector<Index>&  rowIndex() const noexcept { return m_row; }
    const std::vector<Index>&  colIndex() const noexcept { return m_col; }
    const std::vector<Scalar>& values()   const noexcept { return m_val; }

private:
    Index m_rows{0};
    Index m_cols{0};
    std::vector<Index>  m_row;
    std::vector<Index>  m_col;
    std::vector<Scalar> m_val;
};

}} // namespace nla::algebra
