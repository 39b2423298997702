#include "nla/algebra/CSR.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace nla { namespace algebra {

MatrixCSR::MatrixCSR(Index rows, Index cols,
                     std::vector<Index> ptr,
                     std::vector<Index> col,
                     std::vector<Scalar> val)
    : m_rows(rows), m_cols(cols),
      m_ptr(std::move(ptr)), m_col(std::move(col)), m_val(std::move(val))
{
    if (m_ptr.size() != m_rows + 1)
        throw std::invalid_argument("MatrixCSR: ptr size must equal rows+1");
    if (m_col.size() != m_val.size())
        throw std::invalid_argument("MatrixCSR: col and val sizes mismatch");
    if (m_ptr.back() != m_val.size())
        throw std::invalid_argument("MatrixCSR: ptr.back() must equal nnz");
    for (Index c : m_col) {
        if (c >= m_cols)
            throw std::out_of_range("MatrixCSR: column index out of bounds");
    }
}

MatrixCSR::MatrixCSR(const MatrixSparse& A)
    : m_rows(A.rows()), m_cols(A.cols()),
      m_ptr(A.rows() + 1, 0), m_col(A.nnz()), m_val(A.nnz())
{
    // row counts shifted by one, then prefix-summed into row starts
    A.forEachNZ([this](Index i, Index, Scalar) { ++m_ptr[i + 1]; });
    for (Index i = 0; i < m_rows; ++i)
        m_ptr[i + 1] += m_ptr[i];

    std::vector<Index> fill(m_ptr.begin(), m_ptr.end() - 1);
    A.forEachNZ([&](Index i, Index j, Scalar v) {
        const Index pos = fill[i]++;
        m_col[pos] = j;
        m_val[pos] = v;
    });
}

MatrixCSR MatrixCSR::Identity(Index n)
{
    std::vector<Index> ptr(n + 1);
    std::vector<Index> col(n);
    for (Index i = 0; i <= n; ++i) ptr[i] = i;
    for (Index i = 0; i < n; ++i) col[i] = i;
    return MatrixCSR(n, n, std::move(ptr), std::move(col), std::vector<Scalar>(n, 1.0));
}

void MatrixCSR::gemv(const Scalar* x, Scalar* y,
                     Scalar alpha, Scalar beta) const
{
    for (Index i = 0; i < m_rows; ++i) {
        Scalar sum = 0.0;
        for (Index k = m_ptr[i]; k < m_ptr[i + 1]; ++k)
            sum += m_val[k] * x[m_col[k]];
        y[i] = (beta == 0.0) ? alpha * sum : alpha * sum + beta * y[i];
    }
}

void MatrixCSR::gemvTranspose(const Scalar* x, Scalar* y,
                              Scalar alpha, Scalar beta) const
{
    if (beta == 0.0)
        std::fill(y, y + m_cols, 0.0);
    else if (beta != 1.0)
        std::transform(y, y + m_cols, y, [beta](Scalar v) { return beta * v; });

    for (Index i = 0; i < m_rows; ++i) {
        const Scalar axi = alpha * x[i];
        for (Index k = m_ptr[i]; k < m_ptr[i + 1]; ++k)
            y[m_col[k]] += axi * m_val[k];
    }
}

void MatrixCSR::extractDiagonal(std::vector<Scalar>& d) const
{
    const Index n = std::min(m_rows, m_cols);
    d.assign(n, 0.0);
    for (Index i = 0; i < n; ++i) {
        for (Index k = m_ptr[i]; k < m_ptr[i + 1]; ++k) {
            if (m_col[k] == i)
                d[i] += m_val[k];
        }
    }
}

void MatrixCSR::forEachNZ(const TripletVisitor& f) const
{
    for (Index i = 0; i < m_rows; ++i) {
        for (Index k = m_ptr[i]; k < m_ptr[i + 1]; ++k)
            f(i, m_col[k], m_val[k]);
    }
}

}} // namespace nla::algebra
