#pragma once

#include <cstddef>
#include <vector>

namespace nla { namespace algebra {

/**
 * @brief Abstract matrix-free linear operator.
 *
 * The only mandatory operation is the product y = α·A·x + β·y.  Dense
 * and sparse matrices implement it directly; preconditioners implement
 * it through their apply().  Iterative solvers never look at entries,
 * only at products, so any object honouring this contract can be
 * solved for.
 */
class LinearOperator {
public:
    using Scalar = double;
    using Index  = std::size_t;

    virtual ~LinearOperator();

    // ----- Shape -----
    virtual Index rows() const noexcept = 0;
    virtual Index cols() const noexcept = 0;
    bool isSquare() const noexcept { return rows() == cols(); }

    // ----- Core operation -----
    // Compute y = alpha * A * x + beta * y, where x length = cols(), y length = rows().
    virtual void gemv(const Scalar* x, Scalar* y,
                      Scalar alpha = 1.0, Scalar beta = 0.0) const = 0;

    // Vector convenience overloads; x of wrong size throws DimensionMismatchException.
    void gemv(const std::vector<Scalar>& x, std::vector<Scalar>& y,
              Scalar alpha = 1.0, Scalar beta = 0.0) const;
    std::vector<Scalar> gemv(const std::vector<Scalar>& x) const;

    // ----- Transpose product (optional) -----
    virtual bool isTransposable() const noexcept { return false; }

    // Compute y = alpha * A' * x + beta * y.  Throws MathUnsupportedOperationException
    // unless the operator is transposable.
    virtual void gemvTranspose(const Scalar* x, Scalar* y,
                               Scalar alpha = 1.0, Scalar beta = 0.0) const;
    std::vector<Scalar> gemvTranspose(const std::vector<Scalar>& x) const;

    /**
     * @brief Fill @p d with the diagonal (length min(rows, cols)).
     *
     * The default probes the operator with unit vectors, which costs one
     * product per row; storage-backed operators override it.
     */
    virtual void extractDiagonal(std::vector<Scalar>& d) const;
};

}} // namespace nla::algebra
