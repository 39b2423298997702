#pragma once

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

#include "nla/exception.hpp"

namespace nla { namespace algebra {

/**
 * @brief Identities of a field element type.
 *
 * The generic algorithms only need + - * /, equality and the two
 * identities.  The primary template builds the identities from the
 * integer literals 0 and 1; specialise it for element types that are
 * not constructible that way.
 */
template <class T>
struct FieldTraits {
    static T zero() { return T(0); }
    static T one()  { return T(1); }
    static bool isZero(const T& v) { return v == zero(); }
};

/**
 * @brief Row-major dense matrix over a generic field element type.
 */
template <class T>
class FieldMatrix {
public:
    using Element = T;
    using Index   = std::size_t;

    FieldMatrix() : m_rows(0), m_cols(0) {}

    FieldMatrix(Index rows, Index cols)
        : m_rows(rows), m_cols(cols), m_data(rows * cols, FieldTraits<T>::zero()) {}

    FieldMatrix(Index rows, Index cols, std::vector<T> data)
        : m_rows(rows), m_cols(cols), m_data(std::move(data))
    {
        if (m_data.size() != rows * cols)
            throw DimensionMismatchException(m_data.size(), rows * cols);
    }

    FieldMatrix(std::initializer_list<std::initializer_list<T>> rows_il)
        : m_rows(rows_il.size()), m_cols(rows_il.size() ? rows_il.begin()->size() : 0)
    {
        m_data.reserve(m_rows * m_cols);
        for (const auto& row : rows_il) {
            if (row.size() != m_cols)
                throw std::invalid_argument("FieldMatrix: ragged initializer_list");
            m_data.insert(m_data.end(), row.begin(), row.end());
        }
    }

    static FieldMatrix Identity(Index n)
    {
        FieldMatrix I(n, n);
        for (Index i = 0; i < n; ++i) I(i, i) = FieldTraits<T>::one();
        return I;
    }

    Index rows() const noexcept { return m_rows; }
    Index cols() const noexcept { return m_cols; }
    bool isSquare() const noexcept { return m_rows == m_cols; }
    bool empty() const noexcept { return m_data.empty(); }

    const std::vector<T>& data() const noexcept { return m_data; }

    T& operator()(Index i, Index j) { return m_data[i * m_cols + j]; }
    const T& operator()(Index i, Index j) const { return m_data[i * m_cols + j]; }

    const T& at(Index i, Index j) const
    {
        if (i >= m_rows || j >= m_cols)
            throw std::out_of_range("FieldMatrix::at out of range");
        return m_data[i * m_cols + j];
    }

    FieldMatrix transpose() const
    {
        FieldMatrix Tm(m_cols, m_rows);
        for (Index i = 0; i < m_rows; ++i)
            for (Index j = 0; j < m_cols; ++j)
                Tm(j, i) = (*this)(i, j);
        return Tm;
    }

    /// Return this·B; throws DimensionMismatchException on inner size mismatch.
    FieldMatrix multiply(const FieldMatrix& B) const
    {
        if (m_cols != B.m_rows)
            throw DimensionMismatchException(B.m_rows, m_cols);
        FieldMatrix C(m_rows, B.m_cols);
        for (Index i = 0; i < m_rows; ++i) {
            for (Index k = 0; k < m_cols; ++k) {
                const T aik = (*this)(i, k);
                for (Index j = 0; j < B.m_cols; ++j)
                    C(i, j) = C(i, j) + aik * B(k, j);
            }
        }
        return C;
    }

    /// Return this·v.
    std::vector<T> operate(const std::vector<T>& v) const
    {
        if (v.size() != m_cols)
            throw DimensionMismatchException(v.size(), m_cols);
        std::vector<T> out(m_rows, FieldTraits<T>::zero());
        for (Index i = 0; i < m_rows; ++i) {
            T sum = FieldTraits<T>::zero();
            for (Index j = 0; j < m_cols; ++j) sum = sum + (*this)(i, j) * v[j];
            out[i] = sum;
        }
        return out;
    }

    bool operator==(const FieldMatrix& o) const
    {
        return m_rows == o.m_rows && m_cols == o.m_cols && m_data == o.m_data;
    }
    bool operator!=(const FieldMatrix& o) const { return !(*this == o); }

private:
    Index          m_rows;
    Index          m_cols;
    std::vector<T> m_data; // row-major storage
};

}} // namespace nla::algebra
