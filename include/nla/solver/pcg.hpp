#pragma once

#include "nla/solver/solver.hpp"

namespace nla { namespace solver {

/**
 * @brief Preconditioned Conjugate Gradient for symmetric positive definite A.
 *
 * The iteration stops as soon as ||r|| <= delta * ||b||.  Setting up the
 * initial residual counts as the first iteration, so a converged initial
 * guess returns 1.
 *
 * With @p check enabled, the quadratic forms r'·M·r and p'·A·p are
 * verified to be positive and a NonPositiveDefiniteOperatorException
 * names the operand that failed.  Checking is off by default.
 */
class ConjugateGradient final : public PreconditionedIterativeLinearSolver {
public:
    ConjugateGradient(std::size_t maxIterations, Scalar delta, bool check = false);
    ConjugateGradient(util::IterationManager manager, Scalar delta, bool check = false);

    using PreconditionedIterativeLinearSolver::solveInPlace;

    std::size_t solveInPlace(const algebra::LinearOperator& a,
                             const algebra::LinearOperator* m,
                             const std::vector<Scalar>& b,
                             std::vector<Scalar>& x) override;

    /// Relative tolerance on the residual norm.
    Scalar delta() const noexcept { return m_delta; }

    bool shouldCheck() const noexcept { return m_check; }

private:
    Scalar m_delta;
    bool   m_check;
};

}} // namespace nla::solver
