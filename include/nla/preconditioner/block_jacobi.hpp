#pragma once

/**
 * @file block_jacobi.hpp
 *
 * Block Jacobi (non-overlapping additive Schwarz) preconditioner.
 *
 * The rows are split into contiguous blocks of a fixed size (the last
 * one may be smaller).  Each diagonal block of A is copied into a dense
 * matrix and factored with LUDecomposition; apply() solves every block
 * independently against its slice of the residual.
 */

#include <memory>
#include <vector>

#include "nla/decomposition/lu.hpp"
#include "nla/preconditioner/preconditioner.hpp"

namespace nla { namespace preconditioner {

class BlockJacobi final : public Preconditioner {
public:
    /// Throws std::invalid_argument if @p block_size is not positive.
    explicit BlockJacobi(int block_size = 1);

    /// Extract and factor the diagonal blocks of A.  A singular block
    /// throws SingularMatrixException.
    void setup(const algebra::LinearOperator& A) override;

    void apply(const std::vector<Scalar>& r, std::vector<Scalar>& z) const override;

    int blockSize() const noexcept { return m_blockSize; }

    /// Number of blocks.
    int parts() const noexcept { return m_nparts; }

    /// Block starting indices (size = parts()+1).
    const std::vector<int>& blockStarts() const noexcept { return m_starts; }

private:
    void fillBlocks_(const algebra::LinearOperator& A,
                     std::vector<algebra::MatrixDense>& blocks) const;

    int m_blockSize;
    int m_nparts;
    std::vector<int> m_starts;
    std::vector<int> m_blockSizes;
    std::vector<int> m_rowToBlock;

    std::vector<std::unique_ptr<decomposition::LUDecomposition>>     m_lu;
    std::vector<std::unique_ptr<decomposition::DecompositionSolver>> m_solvers;

    mutable std::vector<Scalar> m_rhs; // apply() workspace
};

}} // namespace nla::preconditioner
