#include "nla/algebra/matrixDense.hpp"
#include "nla/exception.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace nla { namespace algebra {

MatrixDense::MatrixDense(Index rows, Index cols, Scalar init_value)
    : m_rows(rows), m_cols(cols), m_data(rows * cols, init_value)
{
}

MatrixDense::MatrixDense(std::initializer_list<std::initializer_list<Scalar>> rows)
    : m_rows(rows.size()), m_cols(rows.size() ? rows.begin()->size() : 0)
{
    m_data.reserve(m_rows * m_cols);
    for (const auto& r : rows) {
        if (r.size() != m_cols)
            throw std::invalid_argument("MatrixDense: ragged initializer_list");
        m_data.insert(m_data.end(), r.begin(), r.end());
    }
}

MatrixDense::MatrixDense(Index rows, Index cols, std::vector<Scalar> data)
    : m_rows(rows), m_cols(cols), m_data(std::move(data))
{
    if (m_data.size() != rows * cols)
        throw DimensionMismatchException(m_data.size(), rows * cols);
}

MatrixDense MatrixDense::Identity(Index n)
{
    return Diagonal(std::vector<Scalar>(n, 1.0));
}

MatrixDense MatrixDense::Diagonal(const std::vector<Scalar>& d)
{
    MatrixDense D(d.size(), d.size());
    for (Index i = 0; i < d.size(); ++i)
        D(i, i) = d[i];
    return D;
}

MatrixDense::Scalar& MatrixDense::at(Index i, Index j)
{
    if (i >= m_rows || j >= m_cols)
        throw std::out_of_range("MatrixDense::at out of range");
    return (*this)(i, j);
}

const MatrixDense::Scalar& MatrixDense::at(Index i, Index j) const
{
    if (i >= m_rows || j >= m_cols)
        throw std::out_of_range("MatrixDense::at out of range");
    return (*this)(i, j);
}

void MatrixDense::swapRows(Index i, Index j) noexcept
{
    if (i != j)
        std::swap_ranges(row(i), row(i) + m_cols, row(j));
}

void MatrixDense::gemv(const Scalar* x, Scalar* y, Scalar alpha, Scalar beta) const noexcept
{
    for (Index i = 0; i < m_rows; ++i) {
        const Scalar* a = row(i);
        Scalar sum = 0.0;
        for (Index j = 0; j < m_cols; ++j)
            sum += a[j] * x[j];
        y[i] = (beta == 0.0) ? alpha * sum : alpha * sum + beta * y[i];
    }
}

void MatrixDense::gemvTranspose(const Scalar* x, Scalar* y, Scalar alpha, Scalar beta) const noexcept
{
    if (beta == 0.0)
        std::fill(y, y + m_cols, 0.0);
    else if (beta != 1.0)
        std::transform(y, y + m_cols, y, [beta](Scalar v) { return beta * v; });

    for (Index i = 0; i < m_rows; ++i) {
        const Scalar* a = row(i);
        const Scalar axi = alpha * x[i];
        for (Index j = 0; j < m_cols; ++j)
            y[j] += axi * a[j];
    }
}

void MatrixDense::gemm(const MatrixDense& A, const MatrixDense& B, MatrixDense& C,
                       Scalar alpha, Scalar beta)
{
    if (A.m_cols != B.m_rows)
        throw DimensionMismatchException(B.m_rows, A.m_cols);
    if (C.m_rows != A.m_rows)
        throw DimensionMismatchException(C.m_rows, A.m_rows);
    if (C.m_cols != B.m_cols)
        throw DimensionMismatchException(C.m_cols, B.m_cols);

    if (beta == 0.0)
        std::fill(C.m_data.begin(), C.m_data.end(), 0.0);
    else if (beta != 1.0)
        C.scale(beta);

    for (Index i = 0; i < A.m_rows; ++i) {
        const Scalar* a = A.row(i);
        Scalar* c = C.row(i);
        for (Index k = 0; k < A.m_cols; ++k) {
            const Scalar aik = alpha * a[k];
            const Scalar* b = B.row(k);
            for (Index j = 0; j < B.m_cols; ++j)
                c[j] += aik * b[j];
        }
    }
}

MatrixDense MatrixDense::multiply(const MatrixDense& B) const
{
    MatrixDense C(m_rows, B.m_cols);
    gemm(*this, B, C);
    return C;
}

void MatrixDense::scale(Scalar alpha) noexcept
{
    for (Scalar& v : m_data)
        v *= alpha;
}

MatrixDense MatrixDense::transpose() const
{
    MatrixDense T(m_cols, m_rows);
    for (Index i = 0; i < m_rows; ++i) {
        const Scalar* a = row(i);
        for (Index j = 0; j < m_cols; ++j)
            T(j, i) = a[j];
    }
    return T;
}

void MatrixDense::extractDiagonal(std::vector<Scalar>& d) const
{
    d.resize(std::min(m_rows, m_cols));
    for (Index i = 0; i < d.size(); ++i)
        d[i] = (*this)(i, i);
}

MatrixDense MatrixDense::block(Index i0, Index j0, Index r, Index c) const
{
    if (i0 + r > m_rows || j0 + c > m_cols)
        throw std::out_of_range("MatrixDense::block out of range");
    MatrixDense B(r, c);
    for (Index i = 0; i < r; ++i)
        std::copy_n(row(i0 + i) + j0, c, B.row(i));
    return B;
}

}} // namespace nla::algebra
