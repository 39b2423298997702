#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "nla/algebra/matrixDense.hpp"
#include "nla/algebra/vectorOps.hpp"
#include "nla/decomposition/cholesky.hpp"
#include "nla/decomposition/lu.hpp"
#include "nla/decomposition/svd.hpp"
#include "nla/util/arg_parser.hpp"
#include "nla/util/timing.hpp"

using namespace nla;
using algebra::MatrixDense;

// Dense SPD test matrix: Bᵗ·B + n·I with uniform random B
static MatrixDense randomSPD(std::size_t n, unsigned seed)
{
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);

    MatrixDense B(n, n);
    for (std::size_t i = 0; i < n; ++i)
        for (std::size_t j = 0; j < n; ++j)
            B(i, j) = dist(gen);

    MatrixDense A = B.transpose().multiply(B);
    for (std::size_t i = 0; i < n; ++i) A(i, i) += static_cast<double>(n);
    return A;
}

static double residualNorm(const MatrixDense& A, const std::vector<double>& x,
                           const std::vector<double>& b)
{
    std::vector<double> r = b;
    A.gemv(x, r, -1.0, 1.0);
    return algebra::nrm2(r);
}

int main(int argc, char** argv)
{
    util::BenchConfig cfg = util::BenchConfig::from_cli(argc, argv);
    if (cfg.n <= 0) {
        std::cerr << "--n must be positive\n";
        return EXIT_FAILURE;
    }
    const std::size_t n = static_cast<std::size_t>(cfg.n);

    util::Registry reg;

    std::cout << "Dense SPD matrix of order " << n << std::endl;
    const MatrixDense A = randomSPD(n, 42u);
    std::vector<double> b(n);
    for (std::size_t i = 0; i < n; ++i) b[i] = (i & 1) ? -1.0 : 1.0;

    try {
        {
            NLA_TIMED_SCOPE("cholesky", reg, n, 0, "factor+solve");
            decomposition::CholeskyDecomposition chol(A);
            const std::vector<double> x = chol.solver()->solve(b);
            std::cout << "Cholesky: ||b - A x|| = " << residualNorm(A, x, b) << "\n";
        }
        {
            NLA_TIMED_SCOPE("lu", reg, n, 0, "factor+solve");
            decomposition::LUDecomposition lu(A);
            const std::vector<double> x = lu.solver()->solve(b);
            std::cout << "LU:       ||b - A x|| = " << residualNorm(A, x, b)
                      << ", det sign = " << (lu.determinant() > 0 ? "+" : "-") << "\n";
        }
        {
            NLA_TIMED_SCOPE("svd", reg, n, 0, "factor+solve");
            decomposition::SingularValueDecomposition svd(A);
            const std::vector<double> x = svd.solver()->solve(b);
            std::cout << "SVD:      ||b - A x|| = " << residualNorm(A, x, b)
                      << ", cond = " << svd.conditionNumber()
                      << ", rank = " << svd.rank() << "\n";
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Decomposition failed: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    reg.print_table();
    reg.to_csv("decomposition_perf.csv");
    return 0;
}
