#pragma once

#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>

#include "nla/algebra/fieldMatrix.hpp"

namespace nla { namespace decomposition { namespace detail {

// Row-major LU kernels shared by LUDecomposition (double) and
// FieldLUDecomposition<T>.  Only + - * /, the two identities and the
// pivot policy differ between the two, so the elimination is written
// once against FieldTraits<T>.

/**
 * @brief In-place Crout elimination with row pivoting.
 *
 * @p selectPivot(lu, n, col) is called once the candidates of column
 * @p col (rows col..n-1) are computed; it returns the pivot row, or n
 * when the column has no acceptable pivot.  On return @p pivot holds
 * the row permutation and @p even its parity.
 *
 * @return true if the matrix was found singular (elimination stopped).
 */
template <class T, class PivotSelector>
bool luFactorInPlace(std::vector<T>& lu, std::size_t n,
                     std::vector<std::size_t>& pivot, bool& even,
                     PivotSelector selectPivot)
{
    pivot.resize(n);
    std::iota(pivot.begin(), pivot.end(), std::size_t{0});
    even = true;

    for (std::size_t col = 0; col < n; ++col) {

        // upper
        for (std::size_t row = 0; row < col; ++row) {
            T* luRow = &lu[row * n];
            T sum = luRow[col];
            for (std::size_t i = 0; i < row; ++i) {
                sum = sum - luRow[i] * lu[i * n + col];
            }
            luRow[col] = sum;
        }

        // lower (pivot candidates)
        for (std::size_t row = col; row < n; ++row) {
            T* luRow = &lu[row * n];
            T sum = luRow[col];
            for (std::size_t i = 0; i < col; ++i) {
                sum = sum - luRow[i] * lu[i * n + col];
            }
            luRow[col] = sum;
        }

        const std::size_t best = selectPivot(lu, n, col);
        if (best >= n)
            return true;

        if (best != col) {
            for (std::size_t i = 0; i < n; ++i) {
                std::swap(lu[best * n + i], lu[col * n + i]);
            }
            std::swap(pivot[best], pivot[col]);
            even = !even;
        }

        const T luDiag = lu[col * n + col];
        for (std::size_t row = col + 1; row < n; ++row) {
            lu[row * n + col] = lu[row * n + col] / luDiag;
        }
    }
    return false;
}

/// Unit lower triangular factor, row-major n×n.
template <class T>
std::vector<T> luLower(const std::vector<T>& lu, std::size_t n)
{
    using Traits = algebra::FieldTraits<T>;
    std::vector<T> l(n * n, Traits::zero());
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            l[i * n + j] = lu[i * n + j];
        }
        l[i * n + i] = Traits::one();
    }
    return l;
}

/// Upper triangular factor, row-major n×n.
template <class T>
std::vector<T> luUpper(const std::vector<T>& lu, std::size_t n)
{
    std::vector<T> u(n * n, algebra::FieldTraits<T>::zero());
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i; j < n; ++j) {
            u[i * n + j] = lu[i * n + j];
        }
    }
    return u;
}

/// Permutation matrix P with P·A = L·U, row-major n×n.
template <class T>
std::vector<T> luPermutation(const std::vector<std::size_t>& pivot)
{
    using Traits = algebra::FieldTraits<T>;
    const std::size_t n = pivot.size();
    std::vector<T> p(n * n, Traits::zero());
    for (std::size_t i = 0; i < n; ++i) {
        p[i * n + pivot[i]] = Traits::one();
    }
    return p;
}

/// ±prod(U_ii); the sign follows the parity of the row permutation.
template <class T>
T luDeterminant(const std::vector<T>& lu, std::size_t n, bool even)
{
    using Traits = algebra::FieldTraits<T>;
    T determinant = even ? Traits::one() : Traits::zero() - Traits::one();
    for (std::size_t i = 0; i < n; ++i) {
        determinant = determinant * lu[i * n + i];
    }
    return determinant;
}

/**
 * @brief Solve L·U·X = P·B for @p nColB right-hand sides stored row-major in @p b.
 *
 * Sizes are not checked here; the caller validates them first.
 */
template <class T>
std::vector<T> luSolve(const std::vector<T>& lu, const std::vector<std::size_t>& pivot,
                       const std::vector<T>& b, std::size_t nColB)
{
    const std::size_t m = pivot.size();

    // apply permutations to b
    std::vector<T> bp(m * nColB, algebra::FieldTraits<T>::zero());
    for (std::size_t row = 0; row < m; ++row) {
        const T* bRow = b.data() + pivot[row] * nColB;
        T* bpRow = bp.data() + row * nColB;
        for (std::size_t k = 0; k < nColB; ++k) bpRow[k] = bRow[k];
    }

    // solve L·Y = P·B (unit diagonal)
    for (std::size_t col = 0; col < m; ++col) {
        const T* bpCol = bp.data() + col * nColB;
        for (std::size_t i = col + 1; i < m; ++i) {
            T* bpI = bp.data() + i * nColB;
            const T luICol = lu[i * m + col];
            for (std::size_t k = 0; k < nColB; ++k) {
                bpI[k] = bpI[k] - bpCol[k] * luICol;
            }
        }
    }

    // solve U·X = Y
    for (std::size_t col = m; col-- > 0;) {
        T* bpCol = bp.data() + col * nColB;
        const T luDiag = lu[col * m + col];
        for (std::size_t k = 0; k < nColB; ++k) {
            bpCol[k] = bpCol[k] / luDiag;
        }
        for (std::size_t i = 0; i < col; ++i) {
            T* bpI = bp.data() + i * nColB;
            const T luICol = lu[i * m + col];
            for (std::size_t k = 0; k < nColB; ++k) {
                bpI[k] = bpI[k] - bpCol[k] * luICol;
            }
        }
    }

    return bp;
}

}}} // namespace nla::decomposition::detail
