#include "nla/decomposition/rectangular_cholesky.hpp"
#include "nla/exception.hpp"

#include <cmath>
#include <numeric>
#include <utility>
#include <vector>

namespace nla { namespace decomposition {

using algebra::MatrixDense;

RectangularCholeskyDecomposition::RectangularCholeskyDecomposition(const MatrixDense& A, Scalar small)
{
    if (!A.isSquare())
        throw NonSquareMatrixException(A.rows(), A.cols());

    const Index order = A.rows();
    MatrixDense c(A);
    MatrixDense b(order, order, 0.0);

    std::vector<Index> index(order);
    std::iota(index.begin(), index.end(), Index{0});

    Index r = 0;
    for (bool loop = order > 0; loop;) {

        // largest remaining diagonal element
        Index swapR = r;
        for (Index i = r + 1; i < order; ++i) {
            const Index ii  = index[i];
            const Index isr = index[swapR];
            if (c(ii, ii) > c(isr, isr))
                swapR = i;
        }

        if (swapR != r) {
            std::swap(index[r], index[swapR]);
            b.swapRows(r, swapR);
        }

        const Index ir = index[r];
        if (c(ir, ir) <= small) {

            if (r == 0)
                throw NonPositiveDefiniteMatrixException(c(ir, ir), ir, small);

            for (Index i = r; i < order; ++i) {
                if (c(index[i], index[i]) < -small)
                    throw NonPositiveDefiniteMatrixException(c(index[i], index[i]), i, small);
            }

            // every remaining diagonal element is negligible: rank found
            loop = false;

        } else {

            const Scalar root = std::sqrt(c(ir, ir));
            b(r, r) = root;
            const Scalar inverse  = 1.0 / root;
            const Scalar inverse2 = 1.0 / c(ir, ir);
            for (Index i = r + 1; i < order; ++i) {
                const Index ii = index[i];
                const Scalar e = inverse * c(ii, ir);
                b(i, r) = e;
                c(ii, ii) -= c(ii, ir) * c(ii, ir) * inverse2;
                for (Index j = r + 1; j < i; ++j) {
                    const Index ij = index[j];
                    const Scalar f = c(ii, ij) - e * b(j, r);
                    c(ii, ij) = f;
                    c(ij, ii) = f;
                }
            }

            loop = ++r < order;
        }
    }

    m_rank = r;
    m_root = MatrixDense(order, r, 0.0);
    for (Index i = 0; i < order; ++i) {
        for (Index j = 0; j < r; ++j) {
            m_root(index[i], j) = b(i, j);
        }
    }
}

}} // namespace nla::decomposition
