#pragma once

#include <cstddef>
#include <vector>

#include "nla/algebra/matrixSparse.hpp"

namespace nla { namespace algebra {

/**
 * @brief Sparse matrix in compressed sparse row (CSR) format.
 *
 * Row i owns the entries ptr[i]..ptr[i+1]-1 of the col/val arrays.  This
 * is the format the solvers and benches multiply with.
 */
class MatrixCSR final : public MatrixSparse {
public:
    using Scalar = MatrixSparse::Scalar;
    using Index  = MatrixSparse::Index;

    using MatrixSparse::gemv;
    using MatrixSparse::gemvTranspose;

    MatrixCSR() = default;

    /**
     * @brief Take ownership of the three CSR arrays.
     *
     * Throws std::invalid_argument if ptr does not have rows+1 entries,
     * col and val differ in length or ptr.back() is not the entry count,
     * and std::out_of_range for a column index past cols.
     */
    MatrixCSR(Index rows, Index cols,
              std::vector<Index> ptr,
              std::vector<Index> col,
              std::vector<Scalar> val);

    /// Compress any sparse matrix; duplicates are kept as separate entries.
    explicit MatrixCSR(const MatrixSparse& A);

    static MatrixCSR Identity(Index n);

    Index rows() const noexcept override { return m_rows; }
    Index cols() const noexcept override { return m_cols; }
    Index nnz()  const noexcept override { return m_val.size(); }

    void gemv(const Scalar* x, Scalar* y,
              Scalar alpha = 1.0, Scalar beta = 0.0) const override;

    void gemvTranspose(const Scalar* x, Scalar* y,
                       Scalar alpha = 1.0, Scalar beta = 0.0) const override;

    void extractDiagonal(std::vector<Scalar>& d) const override;

    void forEachNZ(const TripletVisitor& f) const override;

    const std::vector<Index>&  rowPtr()   const noexcept { return m_ptr; }
    const std::vector<Index>&  colIndex() const noexcept { return m_col; }
    const std::vector<Scalar>& values()   const noexcept { return m_val; }

private:
    Index m_rows{0};
    Index m_cols{0};
    std::vector<Index>  m_ptr{0};
    std::vector<Index>  m_col;
    std::vector<Scalar> m_val;
};

}} // namespace nla::algebra
