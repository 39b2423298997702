#pragma once

#include <vector>
#include <cstddef>

#include "nla/algebra/linearOperator.hpp"

namespace nla { namespace preconditioner {

/**
 * @brief Abstract preconditioner base class.
 *
 * A preconditioner M approximates A^{-1}.  Given a residual r, it
 * computes z = M r via @ref apply().  It is itself a square linear
 * operator, so solvers treat it like any other operand; gemv() is
 * routed through apply().
 */
class Preconditioner : public algebra::LinearOperator {
public:
    using Scalar = algebra::LinearOperator::Scalar;
    using Index  = algebra::LinearOperator::Index;

    using algebra::LinearOperator::gemv;

    ~Preconditioner() override;

    /// (Re)build internal structures for the operator A.  The default
    /// only records the size; A must be square (NonSquareOperatorException).
    virtual void setup(const algebra::LinearOperator& A);

    /// Compute z = M r. Must be implemented by derived classes.
    virtual void apply(const std::vector<Scalar>& r,
                       std::vector<Scalar>& z) const = 0;

    Index rows() const noexcept override { return m_n; }
    Index cols() const noexcept override { return m_n; }

    void gemv(const Scalar* x, Scalar* y,
              Scalar alpha = 1.0, Scalar beta = 0.0) const override;

protected:
    Index m_n{0};
};

}} // namespace nla::preconditioner
