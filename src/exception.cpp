#include "nla/exception.hpp"

#include <sstream>
#include <utility>

namespace nla {

DimensionMismatchException::DimensionMismatchException(std::size_t actual, std::size_t expected)
    : MathException("dimension mismatch: " + std::to_string(actual) + " != " + std::to_string(expected)),
      m_actual(actual), m_expected(expected)
{
}

NonSquareMatrixException::NonSquareMatrixException(std::size_t rows, std::size_t cols)
    : MathException("non square (" + std::to_string(rows) + "x" + std::to_string(cols) + ") matrix"),
      m_rows(rows), m_cols(cols)
{
}

NonSquareOperatorException::NonSquareOperatorException(std::size_t rows, std::size_t cols)
    : MathException("non square (" + std::to_string(rows) + "x" + std::to_string(cols) + ") linear operator"),
      m_rows(rows), m_cols(cols)
{
}

static std::string nonSymmetricMessage(std::size_t row, std::size_t col, double threshold)
{
    std::ostringstream oss;
    oss << "not symmetric matrix: entries (" << row << "," << col << ") and ("
        << col << "," << row << ") differ by more than relative threshold " << threshold;
    return oss.str();
}

NonSymmetricMatrixException::NonSymmetricMatrixException(std::size_t row, std::size_t col, double threshold)
    : MathException(nonSymmetricMessage(row, col, threshold)),
      m_row(row), m_col(col), m_threshold(threshold)
{
}

static std::string nonPositiveDefiniteMessage(double value, std::size_t index, double threshold)
{
    std::ostringstream oss;
    oss << "not positive definite matrix: value " << value << " at index " << index
        << " is not above threshold " << threshold;
    return oss.str();
}

NonPositiveDefiniteMatrixException::NonPositiveDefiniteMatrixException(double value, std::size_t index,
                                                                       double threshold)
    : MathException(nonPositiveDefiniteMessage(value, index, threshold)),
      m_value(value), m_index(index), m_threshold(threshold)
{
}

NonPositiveDefiniteOperatorException::NonPositiveDefiniteOperatorException(Role role,
                                                                           const algebra::LinearOperator* op,
                                                                           std::vector<double> vector)
    : MathException(role == Role::Operator
                        ? "non positive definite linear operator"
                        : "non positive definite preconditioner"),
      m_role(role), m_op(op), m_vector(std::move(vector))
{
}

SingularMatrixException::SingularMatrixException()
    : MathException("matrix is singular")
{
}

MaxCountExceededException::MaxCountExceededException(std::size_t max)
    : MathException("maximal count (" + std::to_string(max) + ") exceeded"),
      m_max(max)
{
}

static std::string tooLargeMessage(double value, double bound, bool boundIsAllowed)
{
    std::ostringstream oss;
    oss << value << " is larger than" << (boundIsAllowed ? " " : ", or equal to, ")
        << "the maximum (" << bound << ")";
    return oss.str();
}

NumberIsTooLargeException::NumberIsTooLargeException(double value, double bound, bool boundIsAllowed)
    : MathException(tooLargeMessage(value, bound, boundIsAllowed)),
      m_value(value), m_bound(bound), m_boundIsAllowed(boundIsAllowed)
{
}

} // namespace nla
