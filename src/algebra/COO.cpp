#include "nla/algebra/COO.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace nla { namespace algebra {

namespace {

// y <- beta*y, with beta == 0 overwriting whatever y held (NaN included).
void scaleOutput(MatrixCOO::Scalar* y, MatrixCOO::Index n, MatrixCOO::Scalar beta)
{
    if (beta == 0.0)
        std::fill(y, y + n, 0.0);
    else if (beta != 1.0)
        for (MatrixCOO::Index i = 0; i < n; ++i) y[i] *= beta;
}

} // namespace

MatrixCOO::MatrixCOO(Index rows, Index cols,
                     std::vector<Index> row, std::vector<Index> col,
                     std::vector<Scalar> val)
    : m_rows(rows), m_cols(cols),
      m_row(std::move(row)), m_col(std::move(col)), m_val(std::move(val))
{
    if (m_row.size() != m_val.size() || m_col.size() != m_val.size())
        throw std::invalid_argument("MatrixCOO: row/col/value sizes mismatch");
    for (Index k = 0; k < m_val.size(); ++k) {
        if (m_row[k] >= m_rows || m_col[k] >= m_cols)
            throw std::out_of_range("MatrixCOO: index out of bounds");
    }
}

MatrixCOO::MatrixCOO(Index rows, Index cols, std::initializer_list<Triplet> triplets)
    : m_rows(rows), m_cols(cols)
{
    reserve(triplets.size());
    for (const Triplet& t : triplets)
        add(std::get<0>(t), std::get<1>(t), std::get<2>(t));
}

MatrixCOO MatrixCOO::Poisson2D(Index nx)
{
    const Index n = nx * nx;
    MatrixCOO A(n, n);
    A.reserve(5 * n);
    for (Index iy = 0; iy < nx; ++iy) {
        for (Index ix = 0; ix < nx; ++ix) {
            const Index k = iy * nx + ix;
            if (iy > 0)      A.add(k, k - nx, -1.0);
            if (ix > 0)      A.add(k, k - 1,  -1.0);
            A.add(k, k, 4.0);
            if (ix + 1 < nx) A.add(k, k + 1,  -1.0);
            if (iy + 1 < nx) A.add(k, k + nx, -1.0);
        }
    }
    return A;
}

void MatrixCOO::reserve(Index nnz)
{
    m_row.reserve(nnz);
    m_col.reserve(nnz);
    m_val.reserve(nnz);
}

void MatrixCOO::add(Index i, Index j, Scalar v)
{
    if (i >= m_rows || j >= m_cols)
        throw std::out_of_range("MatrixCOO::add: index out of bounds");
    m_row.push_back(i);
    m_col.push_back(j);
    m_val.push_back(v);
}

void MatrixCOO::gemv(const Scalar* x, Scalar* y, Scalar alpha, Scalar beta) const
{
    scaleOutput(y, m_rows, beta);
    for (Index k = 0; k < m_val.size(); ++k)
        y[m_row[k]] += alpha * m_val[k] * x[m_col[k]];
}

void MatrixCOO::gemvTranspose(const Scalar* x, Scalar* y, Scalar alpha, Scalar beta) const
{
    scaleOutput(y, m_cols, beta);
    for (Index k = 0; k < m_val.size(); ++k)
        y[m_col[k]] += alpha * m_val[k] * x[m_row[k]];
}

void MatrixCOO::extractDiagonal(std::vector<Scalar>& d) const
{
    d.assign(std::min(m_rows, m_cols), 0.0);
    for (Index k = 0; k < m_val.size(); ++k) {
        if (m_row[k] == m_col[k])
            d[m_row[k]] += m_val[k];
    }
}

void MatrixCOO::forEachNZ(const TripletVisitor& f) const
{
    for (Index k = 0; k < m_val.size(); ++k)
        f(m_row[k], m_col[k], m_val[k]);
}

}} // namespace nla::algebra
