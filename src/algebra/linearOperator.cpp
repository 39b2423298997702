#include "nla/algebra/linearOperator.hpp"
#include "nla/exception.hpp"

#include <algorithm>

namespace nla { namespace algebra {

LinearOperator::~LinearOperator() = default;

void LinearOperator::gemv(const std::vector<Scalar>& x, std::vector<Scalar>& y,
                          Scalar alpha, Scalar beta) const
{
    if (x.size() != cols())
        throw DimensionMismatchException(x.size(), cols());
    if (y.size() != rows())
        y.assign(rows(), Scalar{0});
    gemv(x.data(), y.data(), alpha, beta);
}

std::vector<LinearOperator::Scalar>
LinearOperator::gemv(const std::vector<Scalar>& x) const
{
    if (x.size() != cols())
        throw DimensionMismatchException(x.size(), cols());
    std::vector<Scalar> y(rows());
    gemv(x.data(), y.data(), Scalar{1}, Scalar{0});
    return y;
}

void LinearOperator::gemvTranspose(const Scalar* /*x*/, Scalar* /*y*/,
                                   Scalar /*alpha*/, Scalar /*beta*/) const
{
    throw MathUnsupportedOperationException("LinearOperator::gemvTranspose: operator is not transposable");
}

std::vector<LinearOperator::Scalar>
LinearOperator::gemvTranspose(const std::vector<Scalar>& x) const
{
    if (x.size() != rows())
        throw DimensionMismatchException(x.size(), rows());
    std::vector<Scalar> y(cols());
    gemvTranspose(x.data(), y.data(), Scalar{1}, Scalar{0});
    return y;
}

void LinearOperator::extractDiagonal(std::vector<Scalar>& d) const
{
    const Index n = std::min(rows(), cols());
    d.resize(n);
    std::vector<Scalar> e(cols(), Scalar{0});
    std::vector<Scalar> col(rows());
    for (Index i = 0; i < n; ++i) {
        e[i] = Scalar{1};
        gemv(e.data(), col.data(), Scalar{1}, Scalar{0});
        d[i] = col[i];
        e[i] = Scalar{0};
    }
}

}} // namespace nla::algebra
