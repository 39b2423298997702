#pragma once
#include <cstdlib>
#include <iostream>
#include <string>

namespace nla { namespace util {

/// Command-line options shared by the benchmark executables.
struct BenchConfig
{
    int    n           = 64;      // grid points per side (system size n*n)
    double tol         = 1e-8;    // relative residual tolerance (delta)
    int    max_it      = 5000;

    std::string prec   = "none";  // none | jacobi | blockjac

    int  block_size    = 4;       // Block Jacobi
    bool check         = true;    // positive-definiteness checks in CG
    bool verbose       = false;   // per-iteration residuals

    // Unknown options are ignored; --help prints usage and exits.
    static BenchConfig from_cli(int argc, char** argv)
    {
        BenchConfig cfg;

        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);

            if (a == "--n" && i + 1 < argc) {
                cfg.n = std::atoi(argv[++i]);
            }
            else if (a == "--prec" && i + 1 < argc) {
                cfg.prec = argv[++i];
            }
            else if (a == "--tol" && i + 1 < argc) {
                cfg.tol = std::atof(argv[++i]);
            }
            else if (a == "--maxit" && i + 1 < argc) {
                cfg.max_it = std::atoi(argv[++i]);
            }
            else if (a == "--block-size" && i + 1 < argc) {
                cfg.block_size = std::atoi(argv[++i]);
            }
            else if (a == "--no-check") {
                cfg.check = false;
            }
            else if (a == "--verbose") {
                cfg.verbose = true;
            }
            else if (a == "--help") {
                std::cout << "Available parameters:\n"
                          << "  --n N\n"
                          << "  --prec [none|jacobi|blockjac]\n"
                          << "  --tol TOL\n"
                          << "  --maxit MAX_IT\n"
                          << "  --block-size B\n"
                          << "  --no-check\n"
                          << "  --verbose\n";
                std::exit(0);
            }
        }

        return cfg;
    }
};

}} // namespace nla::util
