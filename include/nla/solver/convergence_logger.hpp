#pragma once

#include <cstddef>
#include <iostream>

#include "nla/util/iteration_manager.hpp"

namespace nla { namespace solver {

/**
 * @brief Listener printing the progress of an iterative linear solver.
 *
 * Prints "Converged in N iterations, final residual = r" on termination
 * and, when verbose, the residual norm after every iteration.  Events
 * that are not IterativeLinearSolverEvent only report their count.
 */
class ConvergenceLogger final : public util::IterationListener {
public:
    explicit ConvergenceLogger(std::ostream& os = std::cout, bool verbose = false)
      : m_os(os), m_verbose(verbose) {}

    void initializationPerformed(const util::IterationEvent& e) override;
    void iterationPerformed(const util::IterationEvent& e) override;
    void terminationPerformed(const util::IterationEvent& e) override;

    /// Residual norm seen in the last event, 0 before any.
    double lastResidualNorm() const noexcept { return m_lastResidual; }

private:
    std::ostream& m_os;
    bool          m_verbose;
    double        m_lastResidual{0.0};
};

}} // namespace nla::solver
