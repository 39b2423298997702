#pragma once

#include <cstddef>
#include <vector>

#include "nla/algebra/linearOperator.hpp"
#include "nla/util/iteration_manager.hpp"

namespace nla { namespace solver {

/**
 * @brief Base class of the matrix-free iterative solvers for A x = b.
 *
 * Progress is counted and reported through an IterationManager: every
 * solve fires one initialization event, a started/performed pair per
 * iteration and a termination event on success.
 */
class IterativeLinearSolver {
public:
    using Scalar = double;
    using Index  = std::size_t;

    explicit IterativeLinearSolver(std::size_t maxIterations);
    explicit IterativeLinearSolver(util::IterationManager manager);

    virtual ~IterativeLinearSolver();

    util::IterationManager& iterationManager() noexcept { return m_manager; }
    const util::IterationManager& iterationManager() const noexcept { return m_manager; }

    /// Solve starting from x0 = 0.
    std::vector<Scalar> solve(const algebra::LinearOperator& a,
                              const std::vector<Scalar>& b);

    /// Solve starting from @p x0, which is left untouched.
    std::vector<Scalar> solve(const algebra::LinearOperator& a,
                              const std::vector<Scalar>& b,
                              const std::vector<Scalar>& x0);

    /// Solve using @p x as initial guess and overwrite it with the solution.
    /// Returns the number of iterations.
    virtual std::size_t solveInPlace(const algebra::LinearOperator& a,
                                     const std::vector<Scalar>& b,
                                     std::vector<Scalar>& x) = 0;

protected:
    /// a square, b and x0 of matching size.
    static void checkParameters(const algebra::LinearOperator& a,
                                const std::vector<Scalar>& b,
                                const std::vector<Scalar>& x0);

private:
    util::IterationManager m_manager;
};

/**
 * @brief Iterative solver accepting an optional preconditioner M ≈ A^{-1}.
 *
 * A null @p m means no preconditioning.
 */
class PreconditionedIterativeLinearSolver : public IterativeLinearSolver {
public:
    using IterativeLinearSolver::IterativeLinearSolver;
    using IterativeLinearSolver::solve;

    std::vector<Scalar> solve(const algebra::LinearOperator& a,
                              const algebra::LinearOperator* m,
                              const std::vector<Scalar>& b);

    std::vector<Scalar> solve(const algebra::LinearOperator& a,
                              const algebra::LinearOperator* m,
                              const std::vector<Scalar>& b,
                              const std::vector<Scalar>& x0);

    std::size_t solveInPlace(const algebra::LinearOperator& a,
                             const std::vector<Scalar>& b,
                             std::vector<Scalar>& x) override;

    virtual std::size_t solveInPlace(const algebra::LinearOperator& a,
                                     const algebra::LinearOperator* m,
                                     const std::vector<Scalar>& b,
                                     std::vector<Scalar>& x) = 0;

protected:
    using IterativeLinearSolver::checkParameters;

    /// Base checks plus: m square and of the same size as a.
    static void checkParameters(const algebra::LinearOperator& a,
                                const algebra::LinearOperator* m,
                                const std::vector<Scalar>& b,
                                const std::vector<Scalar>& x0);
};

}} // namespace nla::solver
