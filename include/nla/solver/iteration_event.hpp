#pragma once

#include <cstddef>
#include <vector>

#include "nla/exception.hpp"
#include "nla/util/iteration_manager.hpp"

namespace nla { namespace solver {

/**
 * @brief Snapshot of an iterative linear solver handed to its listeners.
 *
 * The vectors are borrowed from the running solver and are only valid
 * for the duration of the callback.
 */
class IterativeLinearSolverEvent final : public util::IterationEvent {
public:
    using Scalar = double;

    IterativeLinearSolverEvent(std::size_t iterations,
                               const std::vector<Scalar>& x,
                               const std::vector<Scalar>& b,
                               const std::vector<Scalar>* r,
                               Scalar rnorm)
      : util::IterationEvent(iterations),
        m_x(x), m_b(b), m_r(r), m_rnorm(rnorm) {}

    /// Current estimate of the solution.
    const std::vector<Scalar>& solution() const noexcept { return m_x; }

    const std::vector<Scalar>& rightHandSide() const noexcept { return m_b; }

    bool providesResidual() const noexcept { return m_r != nullptr; }

    /// Current residual b - A x; throws MathUnsupportedOperationException
    /// if the solver does not expose it.
    const std::vector<Scalar>& residual() const
    {
        if (m_r == nullptr)
            throw MathUnsupportedOperationException("IterativeLinearSolverEvent: residual not available");
        return *m_r;
    }

    /// Norm of the residual, available even when the residual itself is not.
    Scalar normOfResidual() const noexcept { return m_rnorm; }

private:
    const std::vector<Scalar>& m_x;
    const std::vector<Scalar>& m_b;
    const std::vector<Scalar>* m_r;
    Scalar                     m_rnorm;
};

}} // namespace nla::solver
