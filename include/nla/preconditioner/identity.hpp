#pragma once
#include "nla/preconditioner/preconditioner.hpp"

namespace nla { namespace preconditioner {

/// Identity preconditioner: z = r.
class IdentityPreconditioner final : public Preconditioner {
public:
    using Preconditioner::Scalar;
    using Preconditioner::Index;

    explicit IdentityPreconditioner(Index n = 0) { m_n = n; }
    ~IdentityPreconditioner() override = default;

    void apply(const std::vector<Scalar>& r,
               std::vector<Scalar>& z) const override
    {
        z = r;
    }
};

}} // namespace nla::preconditioner
