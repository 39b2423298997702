#include "nla/algebra/matrixSparse.hpp"

namespace nla { namespace algebra {

MatrixDense MatrixSparse::toDense() const
{
    MatrixDense dense(rows(), cols());
    forEachNZ([&dense](Index i, Index j, Scalar v) { dense(i, j) += v; });
    return dense;
}

}} // namespace nla::algebra
