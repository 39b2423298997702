#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "nla/algebra/COO.hpp"
#include "nla/algebra/CSR.hpp"
#include "nla/exception.hpp"
#include "nla/preconditioner/block_jacobi.hpp"
#include "nla/preconditioner/identity.hpp"
#include "nla/preconditioner/jacobi.hpp"
#include "nla/solver/convergence_logger.hpp"
#include "nla/solver/pcg.hpp"
#include "nla/util/arg_parser.hpp"
#include "nla/util/timing.hpp"

using namespace nla;

int main(int argc, char** argv)
{
    // ============================
    // 1. Parse CLI
    // ============================
    util::BenchConfig cfg = util::BenchConfig::from_cli(argc, argv);
    if (cfg.n <= 0) {
        std::cerr << "--n must be positive\n";
        return EXIT_FAILURE;
    }

    util::Registry reg;

    std::cout << "Creating Poisson matrix on a " << cfg.n << "x" << cfg.n << " grid" << std::endl;

    // ============================
    // 2. Build matrix (Poisson2D)
    // ============================
    algebra::MatrixCSR A(algebra::MatrixCOO::Poisson2D(static_cast<std::size_t>(cfg.n)));
    std::printf("Matrix created: %zu x %zu, nnz=%zu\n", A.rows(), A.cols(), A.nnz());

    // RHS pattern: alternating +1/-1
    std::vector<double> b(A.rows(), 0.0);
    for (std::size_t i = 0; i < b.size(); ++i)
        b[i] = (i & 1) ? -1.0 : 1.0;
    std::vector<double> x(A.cols(), 0.0);

    // ============================
    // 3. Select preconditioner
    // ============================
    std::unique_ptr<preconditioner::Preconditioner> M;

    try {
        if (cfg.prec == "none") {
            std::cout << "No preconditioner\n";
        }
        else if (cfg.prec == "identity") {
            std::cout << "Using Identity Preconditioner\n";
            M = std::make_unique<preconditioner::IdentityPreconditioner>();
        }
        else if (cfg.prec == "jacobi") {
            std::cout << "Using Jacobi Preconditioner\n";
            M = std::make_unique<preconditioner::JacobiPreconditioner>();
        }
        else if (cfg.prec == "blockjac") {
            std::cout << "Using BlockJacobi with blocks=" << cfg.block_size << "\n";
            M = std::make_unique<preconditioner::BlockJacobi>(cfg.block_size);
        }
        else {
            std::cerr << "Unknown --prec type: " << cfg.prec << "\n";
            return EXIT_FAILURE;
        }

        if (M) {
            NLA_TIMED_SCOPE(cfg.prec + "_setup", reg, A.rows(), 0, "");
            M->setup(A);
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Preconditioner setup failed: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    // ============================
    // 4. Solve with CG
    // ============================
    solver::ConjugateGradient cg(static_cast<std::size_t>(cfg.max_it), cfg.tol, cfg.check);
    solver::ConvergenceLogger logger(std::cout, cfg.verbose);
    cg.iterationManager().addIterationListener(&logger);

    std::size_t its = 0;
    try {
        util::Timer t;
        t.start();
        its = cg.solveInPlace(A, M.get(), b, x);
        t.stop();

        util::Record rec;
        rec.name = "solve";
        rec.wall_seconds = t.elapsed();
        rec.cpu_seconds = t.cpu_elapsed();
        rec.n = A.rows();
        rec.iters = its;
        rec.note = cfg.prec;
        reg.add(rec);
    }
    catch (const MaxCountExceededException& e) {
        std::cerr << "CG did not converge within " << e.max() << " iterations\n";
        return EXIT_FAILURE;
    }
    catch (const NonPositiveDefiniteOperatorException& e) {
        std::cerr << "CG breakdown: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    reg.print_table();
    reg.to_csv("cg_perf.csv");

    std::cout << "Solver finished in " << its << " iterations.\n";
    return 0;
}
