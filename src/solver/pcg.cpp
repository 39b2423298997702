#include "nla/solver/pcg.hpp"

#include <utility>

#include "nla/algebra/vectorOps.hpp"
#include "nla/exception.hpp"
#include "nla/solver/iteration_event.hpp"

namespace nla { namespace solver {

using algebra::combineToSelf;
using algebra::dot;
using algebra::nrm2;

ConjugateGradient::ConjugateGradient(std::size_t maxIterations, Scalar delta, bool check)
  : PreconditionedIterativeLinearSolver(maxIterations),
    m_delta(delta),
    m_check(check)
{
}

ConjugateGradient::ConjugateGradient(util::IterationManager manager, Scalar delta, bool check)
  : PreconditionedIterativeLinearSolver(std::move(manager)),
    m_delta(delta),
    m_check(check)
{
}

std::size_t ConjugateGradient::solveInPlace(const algebra::LinearOperator& a,
                                            const algebra::LinearOperator* m,
                                            const std::vector<Scalar>& b,
                                            std::vector<Scalar>& x)
{
    checkParameters(a, m, b, x);

    util::IterationManager& manager = iterationManager();
    manager.resetIterationCount();
    const Scalar rmax = m_delta * nrm2(b);

    // r0 = b - A x0; counts as the first iteration
    manager.incrementIterationCount();
    std::vector<Scalar> p = x;
    std::vector<Scalar> q = a.gemv(p);
    std::vector<Scalar> r = b;
    combineToSelf(1.0, r, -1.0, q);
    std::vector<Scalar> z;
    Scalar rnorm = nrm2(r);

    manager.fireInitializationEvent(
        IterativeLinearSolverEvent(manager.iterations(), x, b, &r, rnorm));
    if (rnorm <= rmax) {
        manager.fireTerminationEvent(
            IterativeLinearSolverEvent(manager.iterations(), x, b, &r, rnorm));
        return manager.iterations();
    }

    Scalar rhoPrev = 0.0;
    while (true) {
        manager.incrementIterationCount();
        manager.fireIterationStartedEvent(
            IterativeLinearSolverEvent(manager.iterations(), x, b, &r, rnorm));

        // z = M r
        if (m != nullptr) m->gemv(r, z); else z = r;

        const Scalar rhoNext = dot(r, z);
        if (m_check && rhoNext <= 0.0) {
            throw NonPositiveDefiniteOperatorException(
                NonPositiveDefiniteOperatorException::Role::Preconditioner, m, r);
        }

        // p = z + (rhoNext / rhoPrev) p
        if (manager.iterations() == 2) {
            p = z;
        } else {
            combineToSelf(rhoNext / rhoPrev, p, 1.0, z);
        }

        a.gemv(p, q);
        const Scalar pq = dot(p, q);
        if (m_check && pq <= 0.0) {
            throw NonPositiveDefiniteOperatorException(
                NonPositiveDefiniteOperatorException::Role::Operator, &a, p);
        }

        const Scalar alpha = rhoNext / pq;
        combineToSelf(1.0, x, alpha, p);
        combineToSelf(1.0, r, -alpha, q);
        rhoPrev = rhoNext;
        rnorm = nrm2(r);

        manager.fireIterationPerformedEvent(
            IterativeLinearSolverEvent(manager.iterations(), x, b, &r, rnorm));
        if (rnorm <= rmax) {
            manager.fireTerminationEvent(
                IterativeLinearSolverEvent(manager.iterations(), x, b, &r, rnorm));
            return manager.iterations();
        }
    }
}

}} // namespace nla::solver
