#pragma once

#include <vector>

#include "nla/preconditioner/preconditioner.hpp"

namespace nla { namespace preconditioner {

/**
 * @brief Diagonal (Jacobi) preconditioner: z_i = r_i / a_ii.
 *
 * The diagonal is taken from the operator: storage-backed matrices
 * hand it over directly, anything else is probed with unit vectors.
 * A zero diagonal entry is rejected in setup().
 */
class JacobiPreconditioner final : public Preconditioner {
public:
    JacobiPreconditioner() = default;

    /// Build directly from a diagonal; zero entries throw std::runtime_error.
    explicit JacobiPreconditioner(std::vector<Scalar> diag);

    void setup(const algebra::LinearOperator& A) override;

    void apply(const std::vector<Scalar>& r,
               std::vector<Scalar>& z) const override;

    const std::vector<Scalar>& diagonal() const noexcept { return m_diag; }

    /// Square root of this preconditioner: divides by sqrt(a_ii).
    JacobiPreconditioner sqrt() const;

private:
    void checkDiagonal_() const;

    std::vector<Scalar> m_diag;
};

}} // namespace nla::preconditioner
