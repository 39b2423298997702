#include "nla/decomposition/svd.hpp"
#include "nla/exception.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace nla { namespace decomposition {

using algebra::MatrixDense;

namespace {

constexpr double EPS  = 0x1.0p-52;
constexpr double TINY = 0x1.0p-966;

} // namespace

SingularValueDecomposition::SingularValueDecomposition(const MatrixDense& matrix)
{
    if (matrix.empty())
        throw std::invalid_argument("SingularValueDecomposition: empty matrix");

    // m is always the larger dimension
    MatrixDense A;
    if (matrix.rows() < matrix.cols()) {
        m_transposed = true;
        A   = matrix.transpose();
        m_m = matrix.cols();
        m_n = matrix.rows();
    } else {
        m_transposed = false;
        A   = matrix;
        m_m = matrix.rows();
        m_n = matrix.cols();
    }

    const int m = static_cast<int>(m_m);
    const int n = static_cast<int>(m_n);

    std::vector<Scalar> s(m_n, 0.0);
    MatrixDense U(m_m, m_n, 0.0);
    MatrixDense V(m_n, m_n, 0.0);
    std::vector<Scalar> e(m_n, 0.0);
    std::vector<Scalar> work(m_m, 0.0);

    // Householder reduction to bidiagonal form: diagonal in s, super-diagonal in e.
    const int nct = std::min(m - 1, n);
    const int nrt = std::max(0, n - 2);
    for (int k = 0; k < std::max(nct, nrt); k++) {
        if (k < nct) {
            // k-th column transformation, s[k] = 2-norm of the column
            s[k] = 0;
            for (int i = k; i < m; i++) {
                s[k] = std::hypot(s[k], A(i, k));
            }
            if (s[k] != 0) {
                if (A(k, k) < 0) {
                    s[k] = -s[k];
                }
                for (int i = k; i < m; i++) {
                    A(i, k) /= s[k];
                }
                A(k, k) += 1;
            }
            s[k] = -s[k];
        }
        for (int j = k + 1; j < n; j++) {
            if (k < nct && s[k] != 0) {
                double t = 0;
                for (int i = k; i < m; i++) {
                    t += A(i, k) * A(i, j);
                }
                t = -t / A(k, k);
                for (int i = k; i < m; i++) {
                    A(i, j) += t * A(i, k);
                }
            }
            // row k of A feeds the row transformation
            e[j] = A(k, j);
        }
        if (k < nct) {
            for (int i = k; i < m; i++) {
                U(i, k) = A(i, k);
            }
        }
        if (k < nrt) {
            // k-th row transformation, e[k] = 2-norm of the row tail
            e[k] = 0;
            for (int i = k + 1; i < n; i++) {
                e[k] = std::hypot(e[k], e[i]);
            }
            if (e[k] != 0) {
                if (e[k + 1] < 0) {
                    e[k] = -e[k];
                }
                for (int i = k + 1; i < n; i++) {
                    e[i] /= e[k];
                }
                e[k + 1] += 1;
            }
            e[k] = -e[k];
            if (k + 1 < m && e[k] != 0) {
                for (int i = k + 1; i < m; i++) {
                    work[i] = 0;
                }
                for (int j = k + 1; j < n; j++) {
                    for (int i = k + 1; i < m; i++) {
                        work[i] += e[j] * A(i, j);
                    }
                }
                for (int j = k + 1; j < n; j++) {
                    const double t = -e[j] / e[k + 1];
                    for (int i = k + 1; i < m; i++) {
                        A(i, j) += t * work[i];
                    }
                }
            }
            for (int i = k + 1; i < n; i++) {
                V(i, k) = e[i];
            }
        }
    }

    // final bidiagonal matrix of order p
    int p = n;
    if (nct < n) {
        s[nct] = A(nct, nct);
    }
    if (m < p) {
        s[p - 1] = 0;
    }
    if (nrt + 1 < p) {
        e[nrt] = A(nrt, p - 1);
    }
    e[p - 1] = 0;

    // generate U
    for (int j = nct; j < n; j++) {
        for (int i = 0; i < m; i++) {
            U(i, j) = 0;
        }
        U(j, j) = 1;
    }
    for (int k = nct - 1; k >= 0; k--) {
        if (s[k] != 0) {
            for (int j = k + 1; j < n; j++) {
                double t = 0;
                for (int i = k; i < m; i++) {
                    t += U(i, k) * U(i, j);
                }
                t = -t / U(k, k);
                for (int i = k; i < m; i++) {
                    U(i, j) += t * U(i, k);
                }
            }
            for (int i = k; i < m; i++) {
                U(i, k) = -U(i, k);
            }
            U(k, k) = 1 + U(k, k);
            for (int i = 0; i < k - 1; i++) {
                U(i, k) = 0;
            }
        } else {
            for (int i = 0; i < m; i++) {
                U(i, k) = 0;
            }
            U(k, k) = 1;
        }
    }

    // generate V
    for (int k = n - 1; k >= 0; k--) {
        if (k < nrt && e[k] != 0) {
            for (int j = k + 1; j < n; j++) {
                double t = 0;
                for (int i = k + 1; i < n; i++) {
                    t += V(i, k) * V(i, j);
                }
                t = -t / V(k + 1, k);
                for (int i = k + 1; i < n; i++) {
                    V(i, j) += t * V(i, k);
                }
            }
        }
        for (int i = 0; i < n; i++) {
            V(i, k) = 0;
        }
        V(k, k) = 1;
    }

    // implicit-shift QR on the bidiagonal form
    const int pp = p - 1;
    while (p > 0) {
        int k;
        int kase;

        // kase = 1: s(p) and e[k-1] are negligible and k < p
        // kase = 2: s(k) is negligible and k < p
        // kase = 3: e[k-1] is negligible, k < p, and s(k), ..., s(p) are not (qr step)
        // kase = 4: e(p-1) is negligible (convergence)
        for (k = p - 2; k >= 0; k--) {
            const double threshold = TINY + EPS * (std::fabs(s[k]) + std::fabs(s[k + 1]));
            // must stay negated: a NaN in e[k] has to end the scan
            if (!(std::fabs(e[k]) > threshold)) {
                e[k] = 0;
                break;
            }
        }

        if (k == p - 2) {
            kase = 4;
        } else {
            int ks;
            for (ks = p - 1; ks >= k; ks--) {
                if (ks == k) {
                    break;
                }
                const double t = (ks != p ? std::fabs(e[ks]) : 0) +
                                 (ks != k + 1 ? std::fabs(e[ks - 1]) : 0);
                if (std::fabs(s[ks]) <= TINY + EPS * t) {
                    s[ks] = 0;
                    break;
                }
            }
            if (ks == k) {
                kase = 3;
            } else if (ks == p - 1) {
                kase = 1;
            } else {
                kase = 2;
                k = ks;
            }
        }
        k++;

        switch (kase) {
        // deflate negligible s(p)
        case 1: {
            double f = e[p - 2];
            e[p - 2] = 0;
            for (int j = p - 2; j >= k; j--) {
                double t = std::hypot(s[j], f);
                const double cs = s[j] / t;
                const double sn = f / t;
                s[j] = t;
                if (j != k) {
                    f = -sn * e[j - 1];
                    e[j - 1] = cs * e[j - 1];
                }
                for (int i = 0; i < n; i++) {
                    t = cs * V(i, j) + sn * V(i, p - 1);
                    V(i, p - 1) = -sn * V(i, j) + cs * V(i, p - 1);
                    V(i, j) = t;
                }
            }
        }
        break;

        // split at negligible s(k)
        case 2: {
            double f = e[k - 1];
            e[k - 1] = 0;
            for (int j = k; j < p; j++) {
                double t = std::hypot(s[j], f);
                const double cs = s[j] / t;
                const double sn = f / t;
                s[j] = t;
                f = -sn * e[j];
                e[j] = cs * e[j];
                for (int i = 0; i < m; i++) {
                    t = cs * U(i, j) + sn * U(i, k - 1);
                    U(i, k - 1) = -sn * U(i, j) + cs * U(i, k - 1);
                    U(i, j) = t;
                }
            }
        }
        break;

        // one qr step
        case 3: {
            // shift from the trailing 2x2 block
            const double maxPm1Pm2 = std::max(std::fabs(s[p - 1]), std::fabs(s[p - 2]));
            const double scale = std::max(std::max(std::max(maxPm1Pm2, std::fabs(e[p - 2])),
                                                   std::fabs(s[k])),
                                          std::fabs(e[k]));
            const double sp   = s[p - 1] / scale;
            const double spm1 = s[p - 2] / scale;
            const double epm1 = e[p - 2] / scale;
            const double sk   = s[k] / scale;
            const double ek   = e[k] / scale;
            const double b    = ((spm1 + sp) * (spm1 - sp) + epm1 * epm1) / 2.0;
            const double c    = (sp * epm1) * (sp * epm1);
            double shift = 0;
            if (b != 0 || c != 0) {
                shift = std::sqrt(b * b + c);
                if (b < 0) {
                    shift = -shift;
                }
                shift = c / (b + shift);
            }
            double f = (sk + sp) * (sk - sp) + shift;
            double g = sk * ek;

            // chase zeros
            for (int j = k; j < p - 1; j++) {
                double t = std::hypot(f, g);
                double cs = f / t;
                double sn = g / t;
                if (j != k) {
                    e[j - 1] = t;
                }
                f = cs * s[j] + sn * e[j];
                e[j] = cs * e[j] - sn * s[j];
                g = sn * s[j + 1];
                s[j + 1] = cs * s[j + 1];
                for (int i = 0; i < n; i++) {
                    t = cs * V(i, j) + sn * V(i, j + 1);
                    V(i, j + 1) = -sn * V(i, j) + cs * V(i, j + 1);
                    V(i, j) = t;
                }
                t = std::hypot(f, g);
                cs = f / t;
                sn = g / t;
                s[j] = t;
                f = cs * e[j] + sn * s[j + 1];
                s[j + 1] = -sn * e[j] + cs * s[j + 1];
                g = sn * e[j + 1];
                e[j + 1] = cs * e[j + 1];
                if (j < m - 1) {
                    for (int i = 0; i < m; i++) {
                        t = cs * U(i, j) + sn * U(i, j + 1);
                        U(i, j + 1) = -sn * U(i, j) + cs * U(i, j + 1);
                        U(i, j) = t;
                    }
                }
            }
            e[p - 2] = f;
        }
        break;

        // convergence
        default: {
            // make the singular value positive
            if (s[k] <= 0) {
                s[k] = s[k] < 0 ? -s[k] : 0;
                for (int i = 0; i <= pp; i++) {
                    V(i, k) = -V(i, k);
                }
            }
            // keep the values sorted, moving U and V columns along
            while (k < pp) {
                if (s[k] >= s[k + 1]) {
                    break;
                }
                std::swap(s[k], s[k + 1]);
                if (k < n - 1) {
                    for (int i = 0; i < n; i++) {
                        std::swap(V(i, k), V(i, k + 1));
                    }
                }
                if (k < m - 1) {
                    for (int i = 0; i < m; i++) {
                        std::swap(U(i, k), U(i, k + 1));
                    }
                }
                k++;
            }
            p--;
        }
        break;
        }
    }

    m_tol = std::max(static_cast<double>(m) * s[0] * EPS,
                     std::sqrt(std::numeric_limits<double>::min()));
    m_singularValues = std::move(s);

    if (!m_transposed) {
        m_U = std::move(U);
        m_V = std::move(V);
    } else {
        m_U = std::move(V);
        m_V = std::move(U);
    }
}

const MatrixDense& SingularValueDecomposition::UT() const
{
    if (!m_cachedUt)
        m_cachedUt = std::make_unique<MatrixDense>(m_U.transpose());
    return *m_cachedUt;
}

const MatrixDense& SingularValueDecomposition::VT() const
{
    if (!m_cachedVt)
        m_cachedVt = std::make_unique<MatrixDense>(m_V.transpose());
    return *m_cachedVt;
}

const MatrixDense& SingularValueDecomposition::S() const
{
    if (!m_cachedS)
        m_cachedS = std::make_unique<MatrixDense>(MatrixDense::Diagonal(m_singularValues));
    return *m_cachedS;
}

MatrixDense SingularValueDecomposition::covariance(Scalar minSingularValue) const
{
    const Index p = m_singularValues.size();
    Index dimension = 0;
    while (dimension < p && m_singularValues[dimension] >= minSingularValue) {
        ++dimension;
    }

    if (dimension == 0)
        throw NumberIsTooLargeException(minSingularValue, m_singularValues[0], true);

    // jv = rows of Vᵗ scaled by 1/σ; covariance = jvᵗ·jv
    const MatrixDense& vT = VT();
    MatrixDense jv(dimension, vT.cols(), 0.0);
    for (Index i = 0; i < dimension; ++i) {
        const Scalar* src = vT.row(i);
        Scalar* dst = jv.row(i);
        for (Index j = 0; j < vT.cols(); ++j) {
            dst[j] = src[j] / m_singularValues[i];
        }
    }
    return jv.transpose().multiply(jv);
}

SingularValueDecomposition::Scalar SingularValueDecomposition::conditionNumber() const noexcept
{
    return m_singularValues.front() / m_singularValues.back();
}

SingularValueDecomposition::Scalar SingularValueDecomposition::inverseConditionNumber() const noexcept
{
    return m_singularValues.back() / m_singularValues.front();
}

SingularValueDecomposition::Index SingularValueDecomposition::rank() const noexcept
{
    Index r = 0;
    for (Scalar sv : m_singularValues) {
        if (sv > m_tol)
            ++r;
    }
    return r;
}

std::unique_ptr<DecompositionSolver> SingularValueDecomposition::solver() const
{
    return std::make_unique<SVDSolver>(m_singularValues, UT(), m_V, rank() == m_m, m_tol);
}

SVDSolver::SVDSolver(const std::vector<Scalar>& singularValues,
                     const MatrixDense& uT,
                     const MatrixDense& v,
                     bool nonSingular, Scalar tol)
    : m_nonSingular(nonSingular)
{
    // Σ⁺·Uᵗ, dropping the singular values at or below tol
    MatrixDense suT(uT);
    for (std::size_t i = 0; i < singularValues.size(); ++i) {
        const Scalar a = singularValues[i] > tol ? 1.0 / singularValues[i] : 0.0;
        Scalar* row = suT.row(i);
        for (std::size_t j = 0; j < suT.cols(); ++j) {
            row[j] *= a;
        }
    }
    m_pseudoInverse = v.multiply(suT);
}

std::vector<DecompositionSolver::Scalar>
SVDSolver::solve(const std::vector<Scalar>& b) const
{
    return m_pseudoInverse.gemv(b);
}

MatrixDense SVDSolver::solve(const MatrixDense& b) const
{
    if (b.rows() != m_pseudoInverse.cols())
        throw DimensionMismatchException(b.rows(), m_pseudoInverse.cols());
    return m_pseudoInverse.multiply(b);
}

}} // namespace nla::decomposition
