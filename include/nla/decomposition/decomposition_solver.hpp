#pragma once

#include <vector>

#include "nla/algebra/matrixDense.hpp"
#include "nla/algebra/fieldMatrix.hpp"

namespace nla { namespace decomposition {

/**
 * @brief Solver for A·X = B obtained from a decomposition of A.
 *
 * Implementations read the factors of the decomposition that created
 * them; right-hand sides are never modified.
 */
class DecompositionSolver {
public:
    using Scalar = double;

    virtual ~DecompositionSolver();

    /// Solve A·x = b.
    virtual std::vector<Scalar> solve(const std::vector<Scalar>& b) const = 0;

    /// Solve A·X = B, one column of X per column of B.
    virtual algebra::MatrixDense solve(const algebra::MatrixDense& b) const = 0;

    virtual bool isNonSingular() const = 0;

    /// A⁻¹ (the pseudo-inverse for least-squares solvers).
    virtual algebra::MatrixDense inverse() const = 0;
};

/// DecompositionSolver over a generic field element type.
template <class T>
class FieldDecompositionSolver {
public:
    virtual ~FieldDecompositionSolver() = default;

    virtual std::vector<T> solve(const std::vector<T>& b) const = 0;
    virtual algebra::FieldMatrix<T> solve(const algebra::FieldMatrix<T>& b) const = 0;
    virtual bool isNonSingular() const = 0;
    virtual algebra::FieldMatrix<T> inverse() const = 0;
};

}} // namespace nla::decomposition
