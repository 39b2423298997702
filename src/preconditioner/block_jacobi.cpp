#include <algorithm>
#include <cstddef>
#include <stdexcept>

#include "nla/algebra/matrixDense.hpp"
#include "nla/algebra/matrixSparse.hpp"
#include "nla/algebra/vectorOps.hpp"
#include "nla/exception.hpp"
#include "nla/preconditioner/block_jacobi.hpp"

namespace nla { namespace preconditioner {

using algebra::MatrixDense;
using algebra::MatrixSparse;

BlockJacobi::BlockJacobi(int block_size)
    : m_blockSize(block_size),
      m_nparts(0)
{
    if (m_blockSize <= 0) {
        throw std::invalid_argument("BlockJacobi: block_size must be > 0");
    }
}

void BlockJacobi::fillBlocks_(const algebra::LinearOperator& A,
                              std::vector<MatrixDense>& blocks) const
{
    auto scatter = [&](Index r, Index c, Scalar v) {
        const int pRow = m_rowToBlock[r];
        const int pCol = m_rowToBlock[c];
        if (pRow != pCol) return;  // off-diagonal block ignored

        const int s = m_starts[static_cast<std::size_t>(pRow)];
        blocks[static_cast<std::size_t>(pRow)](r - static_cast<Index>(s),
                                               c - static_cast<Index>(s)) += v;
    };

    if (auto sparse = dynamic_cast<const MatrixSparse*>(&A)) {
        // one pass over the stored entries
        sparse->forEachNZ(scatter);
    } else if (auto dense = dynamic_cast<const MatrixDense*>(&A)) {
        for (int p = 0; p < m_nparts; ++p) {
            const Index s  = static_cast<Index>(m_starts[static_cast<std::size_t>(p)]);
            const Index bs = static_cast<Index>(m_blockSizes[static_cast<std::size_t>(p)]);
            blocks[static_cast<std::size_t>(p)] = dense->block(s, s, bs, bs);
        }
    } else {
        // matrix-free operator: sample the block columns with unit vectors
        std::vector<Scalar> e(m_n, Scalar{0});
        std::vector<Scalar> col(m_n);
        for (Index j = 0; j < m_n; ++j) {
            e[j] = Scalar{1};
            A.gemv(e.data(), col.data(), Scalar{1}, Scalar{0});
            e[j] = Scalar{0};
            const int p = m_rowToBlock[j];
            const Index s = static_cast<Index>(m_starts[static_cast<std::size_t>(p)]);
            const Index bs = static_cast<Index>(m_blockSizes[static_cast<std::size_t>(p)]);
            for (Index i = s; i < s + bs; ++i) {
                scatter(i, j, col[i]);
            }
        }
    }
}

void BlockJacobi::setup(const algebra::LinearOperator& A)
{
    Preconditioner::setup(A);
    const int n = static_cast<int>(m_n);

    // 1) contiguous blocks of m_blockSize rows (last may be smaller)
    m_nparts = (n + m_blockSize - 1) / m_blockSize;

    m_starts.resize(static_cast<std::size_t>(m_nparts + 1));
    m_blockSizes.resize(static_cast<std::size_t>(m_nparts));

    int pos = 0;
    for (int p = 0; p < m_nparts; ++p) {
        m_starts[static_cast<std::size_t>(p)] = pos;
        int bs = std::min(m_blockSize, n - pos);
        m_blockSizes[static_cast<std::size_t>(p)] = bs;
        pos += bs;
    }
    m_starts[static_cast<std::size_t>(m_nparts)] = n;

    m_rowToBlock.resize(m_n);
    for (int p = 0; p < m_nparts; ++p) {
        for (int i = m_starts[static_cast<std::size_t>(p)]; i < m_starts[static_cast<std::size_t>(p + 1)]; ++i) {
            m_rowToBlock[static_cast<std::size_t>(i)] = p;
        }
    }

    // 2) dense diagonal blocks
    std::vector<MatrixDense> blocks;
    blocks.reserve(static_cast<std::size_t>(m_nparts));
    for (int p = 0; p < m_nparts; ++p) {
        const Index bs = static_cast<Index>(m_blockSizes[static_cast<std::size_t>(p)]);
        blocks.emplace_back(bs, bs, Scalar{0});
    }
    fillBlocks_(A, blocks);

    // 3) factor each block
    m_solvers.clear();
    m_lu.clear();
    for (int p = 0; p < m_nparts; ++p) {
        auto lu = std::make_unique<decomposition::LUDecomposition>(blocks[static_cast<std::size_t>(p)]);
        if (lu->isSingular()) {
            throw SingularMatrixException();
        }
        m_solvers.push_back(lu->solver());
        m_lu.push_back(std::move(lu));
    }

    m_rhs.resize(static_cast<std::size_t>(m_blockSize));
}

void BlockJacobi::apply(const std::vector<Scalar>& r,
                        std::vector<Scalar>& z) const
{
    algebra::checkDimension(r, m_n);

    z.assign(r.size(), 0.0);

    for (int p = 0; p < m_nparts; ++p) {
        const std::size_t s  = static_cast<std::size_t>(m_starts[static_cast<std::size_t>(p)]);
        const std::size_t bs = static_cast<std::size_t>(m_blockSizes[static_cast<std::size_t>(p)]);

        m_rhs.assign(r.begin() + static_cast<std::ptrdiff_t>(s),
                     r.begin() + static_cast<std::ptrdiff_t>(s + bs));

        const std::vector<Scalar> sol = m_solvers[static_cast<std::size_t>(p)]->solve(m_rhs);

        std::copy(sol.begin(), sol.end(), z.begin() + static_cast<std::ptrdiff_t>(s));
    }
}

}} // namespace nla::preconditioner
