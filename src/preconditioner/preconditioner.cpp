#include "nla/preconditioner/preconditioner.hpp"
#include "nla/exception.hpp"

namespace nla { namespace preconditioner {

Preconditioner::~Preconditioner() = default;

void Preconditioner::setup(const algebra::LinearOperator& A)
{
    if (!A.isSquare())
        throw NonSquareOperatorException(A.rows(), A.cols());
    m_n = A.rows();
}

void Preconditioner::gemv(const Scalar* x, Scalar* y, Scalar alpha, Scalar beta) const
{
    std::vector<Scalar> r(x, x + m_n);
    std::vector<Scalar> z;
    apply(r, z);
    for (Index i = 0; i < m_n; ++i) {
        y[i] = alpha * z[i] + beta * y[i];
    }
}

}} // namespace nla::preconditioner
