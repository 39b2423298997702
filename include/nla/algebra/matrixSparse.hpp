#pragma once

#include <cstddef>
#include <functional>

#include "nla/algebra/linearOperator.hpp"
#include "nla/algebra/matrixDense.hpp"

namespace nla { namespace algebra {

/**
 * @brief Abstract base for sparse matrices.
 *
 * A sparse matrix is a transposable LinearOperator whose stored entries
 * can be enumerated.  Duplicated (i,j) entries are allowed and are summed
 * by every operation that reads them.
 */
class MatrixSparse : public LinearOperator {
public:
    using Scalar = LinearOperator::Scalar;
    using Index  = LinearOperator::Index;
    using TripletVisitor = std::function<void(Index i, Index j, Scalar v)>;

    using LinearOperator::gemv;
    using LinearOperator::gemvTranspose;

    ~MatrixSparse() override = default;

    /// Number of stored entries, duplicates included.
    virtual Index nnz() const noexcept = 0;

    bool isTransposable() const noexcept override { return true; }

    // Visit all stored entries (i,j,val). Order is implementation-defined.
    virtual void forEachNZ(const TripletVisitor& f) const = 0;

    /// Dense copy with duplicates summed.
    MatrixDense toDense() const;
};

}} // namespace nla::algebra
