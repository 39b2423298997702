#include "nla/solver/convergence_logger.hpp"

#include "nla/solver/iteration_event.hpp"

namespace nla { namespace solver {

void ConvergenceLogger::initializationPerformed(const util::IterationEvent& e)
{
    if (auto evt = dynamic_cast<const IterativeLinearSolverEvent*>(&e)) {
        m_lastResidual = evt->normOfResidual();
        if (m_verbose)
            m_os << "initial residual = " << m_lastResidual << "\n";
    }
}

void ConvergenceLogger::iterationPerformed(const util::IterationEvent& e)
{
    auto evt = dynamic_cast<const IterativeLinearSolverEvent*>(&e);
    if (evt) m_lastResidual = evt->normOfResidual();

    if (!m_verbose) return;
    m_os << "iter " << e.iterations();
    if (evt) m_os << ": ||r|| = " << m_lastResidual;
    m_os << "\n";
}

void ConvergenceLogger::terminationPerformed(const util::IterationEvent& e)
{
    m_os << "Converged in " << e.iterations() << " iterations";
    if (auto evt = dynamic_cast<const IterativeLinearSolverEvent*>(&e)) {
        m_lastResidual = evt->normOfResidual();
        m_os << ", final residual = " << m_lastResidual;
    }
    m_os << "\n";
}

}} // namespace nla::solver
