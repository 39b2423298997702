#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace nla {

namespace algebra { class LinearOperator; }

/**
 * @brief Root of the numerical error hierarchy.
 *
 * Every error raised by a decomposition or an iterative solver derives
 * from this class, so callers may catch either the precise kind or
 * all of them at once.  Utility classes keep reporting plain argument
 * errors with std::invalid_argument / std::out_of_range.
 */
class MathException : public std::runtime_error {
public:
    explicit MathException(const std::string& what) : std::runtime_error(what) {}
};

/// An operand's size disagrees with the size the operation expects.
class DimensionMismatchException : public MathException {
public:
    DimensionMismatchException(std::size_t actual, std::size_t expected);

    std::size_t actual() const noexcept { return m_actual; }
    std::size_t expected() const noexcept { return m_expected; }

private:
    std::size_t m_actual;
    std::size_t m_expected;
};

/// A decomposition requiring a square matrix received a rectangular one.
class NonSquareMatrixException : public MathException {
public:
    NonSquareMatrixException(std::size_t rows, std::size_t cols);

    std::size_t rows() const noexcept { return m_rows; }
    std::size_t cols() const noexcept { return m_cols; }

private:
    std::size_t m_rows;
    std::size_t m_cols;
};

/// An iterative solver's operator (or preconditioner) is not square.
class NonSquareOperatorException : public MathException {
public:
    NonSquareOperatorException(std::size_t rows, std::size_t cols);

    std::size_t rows() const noexcept { return m_rows; }
    std::size_t cols() const noexcept { return m_cols; }

private:
    std::size_t m_rows;
    std::size_t m_cols;
};

/// Entries (row, col) and (col, row) differ by more than the relative threshold.
class NonSymmetricMatrixException : public MathException {
public:
    NonSymmetricMatrixException(std::size_t row, std::size_t col, double threshold);

    std::size_t row() const noexcept { return m_row; }
    std::size_t column() const noexcept { return m_col; }
    double threshold() const noexcept { return m_threshold; }

private:
    std::size_t m_row;
    std::size_t m_col;
    double      m_threshold;
};

/// A pivot (diagonal element) fell at or below the positivity threshold.
class NonPositiveDefiniteMatrixException : public MathException {
public:
    NonPositiveDefiniteMatrixException(double value, std::size_t index, double threshold);

    double value() const noexcept { return m_value; }
    std::size_t index() const noexcept { return m_index; }
    double threshold() const noexcept { return m_threshold; }

private:
    double      m_value;
    std::size_t m_index;
    double      m_threshold;
};

/**
 * @brief A quadratic form v'·O·v computed by an iterative solver was not positive.
 *
 * The payload names which operand failed (the system operator or the
 * preconditioner), keeps a non-owning pointer to it (null when the
 * solver ran unpreconditioned) and a copy of the offending vector.
 */
class NonPositiveDefiniteOperatorException : public MathException {
public:
    enum class Role { Operator, Preconditioner };

    NonPositiveDefiniteOperatorException(Role role,
                                         const algebra::LinearOperator* op,
                                         std::vector<double> vector);

    Role role() const noexcept { return m_role; }
    const algebra::LinearOperator* linearOperator() const noexcept { return m_op; }
    const std::vector<double>& vector() const noexcept { return m_vector; }

private:
    Role                           m_role;
    const algebra::LinearOperator* m_op;
    std::vector<double>            m_vector;
};

/// Solve or inverse requested from a decomposition flagged singular.
class SingularMatrixException : public MathException {
public:
    SingularMatrixException();
};

/// An iteration budget was exhausted.
class MaxCountExceededException : public MathException {
public:
    explicit MaxCountExceededException(std::size_t max);

    std::size_t max() const noexcept { return m_max; }

private:
    std::size_t m_max;
};

/// A value exceeds its admissible upper bound.
class NumberIsTooLargeException : public MathException {
public:
    NumberIsTooLargeException(double value, double bound, bool boundIsAllowed);

    double value() const noexcept { return m_value; }
    double bound() const noexcept { return m_bound; }
    bool boundIsAllowed() const noexcept { return m_boundIsAllowed; }

private:
    double m_value;
    double m_bound;
    bool   m_boundIsAllowed;
};

/// The object does not support the requested operation.
class MathUnsupportedOperationException : public MathException {
public:
    explicit MathUnsupportedOperationException(const std::string& what = "unsupported operation")
        : MathException(what) {}
};

} // namespace nla
