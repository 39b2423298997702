#include "nla/solver/solver.hpp"

#include <utility>

#include "nla/exception.hpp"

namespace nla { namespace solver {

IterativeLinearSolver::IterativeLinearSolver(std::size_t maxIterations)
  : m_manager(maxIterations)
{
}

IterativeLinearSolver::IterativeLinearSolver(util::IterationManager manager)
  : m_manager(std::move(manager))
{
}

IterativeLinearSolver::~IterativeLinearSolver() = default;

std::vector<IterativeLinearSolver::Scalar>
IterativeLinearSolver::solve(const algebra::LinearOperator& a,
                             const std::vector<Scalar>& b)
{
    std::vector<Scalar> x(a.cols(), 0.0);
    solveInPlace(a, b, x);
    return x;
}

std::vector<IterativeLinearSolver::Scalar>
IterativeLinearSolver::solve(const algebra::LinearOperator& a,
                             const std::vector<Scalar>& b,
                             const std::vector<Scalar>& x0)
{
    std::vector<Scalar> x = x0;
    solveInPlace(a, b, x);
    return x;
}

void IterativeLinearSolver::checkParameters(const algebra::LinearOperator& a,
                                            const std::vector<Scalar>& b,
                                            const std::vector<Scalar>& x0)
{
    if (!a.isSquare())
        throw NonSquareOperatorException(a.rows(), a.cols());
    if (b.size() != a.rows())
        throw DimensionMismatchException(b.size(), a.rows());
    if (x0.size() != a.cols())
        throw DimensionMismatchException(x0.size(), a.cols());
}

std::vector<IterativeLinearSolver::Scalar>
PreconditionedIterativeLinearSolver::solve(const algebra::LinearOperator& a,
                                           const algebra::LinearOperator* m,
                                           const std::vector<Scalar>& b)
{
    std::vector<Scalar> x(a.cols(), 0.0);
    solveInPlace(a, m, b, x);
    return x;
}

std::vector<IterativeLinearSolver::Scalar>
PreconditionedIterativeLinearSolver::solve(const algebra::LinearOperator& a,
                                           const algebra::LinearOperator* m,
                                           const std::vector<Scalar>& b,
                                           const std::vector<Scalar>& x0)
{
    std::vector<Scalar> x = x0;
    solveInPlace(a, m, b, x);
    return x;
}

std::size_t PreconditionedIterativeLinearSolver::solveInPlace(const algebra::LinearOperator& a,
                                                              const std::vector<Scalar>& b,
                                                              std::vector<Scalar>& x)
{
    return solveInPlace(a, nullptr, b, x);
}

void PreconditionedIterativeLinearSolver::checkParameters(const algebra::LinearOperator& a,
                                                          const algebra::LinearOperator* m,
                                                          const std::vector<Scalar>& b,
                                                          const std::vector<Scalar>& x0)
{
    IterativeLinearSolver::checkParameters(a, b, x0);
    if (m != nullptr) {
        if (!m->isSquare())
            throw NonSquareOperatorException(m->rows(), m->cols());
        if (m->rows() != a.rows())
            throw DimensionMismatchException(m->rows(), a.rows());
    }
}

}} // namespace nla::solver
