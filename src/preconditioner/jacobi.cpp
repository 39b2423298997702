#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "nla/algebra/vectorOps.hpp"
#include "nla/preconditioner/jacobi.hpp"

namespace nla { namespace preconditioner {

JacobiPreconditioner::JacobiPreconditioner(std::vector<Scalar> diag)
    : m_diag(std::move(diag))
{
    m_n = m_diag.size();
    checkDiagonal_();
}

void JacobiPreconditioner::checkDiagonal_() const
{
    for (Index i = 0; i < m_diag.size(); ++i) {
        if (m_diag[i] == Scalar{0}) {
            throw std::runtime_error(
                "JacobiPreconditioner: zero diagonal at row " + std::to_string(i));
        }
    }
}

void JacobiPreconditioner::setup(const algebra::LinearOperator& A)
{
    Preconditioner::setup(A);
    A.extractDiagonal(m_diag);
    checkDiagonal_();
}

void JacobiPreconditioner::apply(const std::vector<Scalar>& r,
                                 std::vector<Scalar>&       z) const
{
    algebra::checkDimension(r, m_n);
    z.resize(m_n);
    for (Index i = 0; i < m_n; ++i) {
        z[i] = r[i] / m_diag[i];
    }
}

JacobiPreconditioner JacobiPreconditioner::sqrt() const
{
    std::vector<Scalar> sqrtDiag(m_diag.size());
    for (Index i = 0; i < m_diag.size(); ++i) {
        sqrtDiag[i] = std::sqrt(m_diag[i]);
    }
    return JacobiPreconditioner(std::move(sqrtDiag));
}

}} // namespace nla::preconditioner
