#pragma once
// nla/util/timing.hpp: wall/CPU timing helpers for the benchmarks.
// Header-only.  Named sections are collected in a Registry and dumped as CSV.
// Example:
//   nla::util::Registry reg;
//   {
//     NLA_TIMED_SCOPE("cholesky", reg, A.rows(), 0, "factor");
//     nla::decomposition::CholeskyDecomposition chol(A);
//   }
//   reg.print_table();
//   reg.to_csv("run.csv");

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace nla { namespace util {

/// Host name for bookkeeping in the CSV output.
inline std::string hostname() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) == 0)
        return buf;
    const char* env = std::getenv("HOSTNAME");
    return env ? env : "unknown";
}

struct Record {
    std::string   name;             // section name
    double        wall_seconds = 0; // elapsed wall-clock seconds
    double        cpu_seconds  = 0; // process CPU seconds
    std::uint64_t n            = 0; // problem size
    std::uint64_t iters        = 0; // iterations, when meaningful
    std::string   note;             // free-form tag (preconditioner, params)
};

// Accumulating stopwatch; start()/stop() pairs add up.
class Timer {
public:
    using clock = std::chrono::steady_clock;

    void start() {
        if (running_) return;
        running_ = true;
        wall0_ = clock::now();
        cpu0_  = std::clock();
    }

    void stop() {
        if (!running_) return;
        running_ = false;
        wall_ += seconds_since_(wall0_);
        const std::clock_t cpu1 = std::clock();
        if (cpu0_ != std::clock_t(-1) && cpu1 != std::clock_t(-1))
            cpu_ += double(cpu1 - cpu0_) / CLOCKS_PER_SEC;
    }

    double elapsed() const { return running_ ? wall_ + seconds_since_(wall0_) : wall_; }

    double cpu_elapsed() const { return cpu_; }

private:
    static double seconds_since_(clock::time_point t) {
        return std::chrono::duration<double>(clock::now() - t).count();
    }

    clock::time_point wall0_{};
    std::clock_t      cpu0_{};
    double            wall_{0.0};
    double            cpu_{0.0};
    bool              running_{false};
};

class Registry {
public:
    void add(Record r) { records_.push_back(std::move(r)); }

    void print_table(std::ostream& os = std::cout) const { write_(os); }

    // Overwrites @p path; throws std::runtime_error if it cannot be opened.
    void to_csv(const std::string& path) const {
        std::ofstream f(path);
        if (!f)
            throw std::runtime_error("Registry::to_csv: cannot open " + path);
        write_(f);
    }

private:
    void write_(std::ostream& os) const {
        const std::string host = hostname();
        os << std::fixed << std::setprecision(6)
           << "name,wall_s,cpu_s,n,iters,host,note\n";
        for (const Record& r : records_) {
            os << r.name << ',' << r.wall_seconds << ',' << r.cpu_seconds << ','
               << r.n << ',' << r.iters << ',' << host << ",\"" << r.note << "\"\n";
        }
    }

    std::vector<Record> records_;
};

// RAII section timer: starts on construction, records on destruction.
class Scoped {
public:
    Scoped(std::string name, Registry& reg,
           std::uint64_t n = 0, std::uint64_t iters = 0, std::string note = "")
        : reg_(reg) {
        rec_.name  = std::move(name);
        rec_.n     = n;
        rec_.iters = iters;
        rec_.note  = std::move(note);
        timer_.start();
    }

    Scoped(const Scoped&) = delete;
    Scoped& operator=(const Scoped&) = delete;

    ~Scoped() {
        timer_.stop();
        rec_.wall_seconds = timer_.elapsed();
        rec_.cpu_seconds  = timer_.cpu_elapsed();
        reg_.add(std::move(rec_));
    }

private:
    Registry& reg_;
    Record    rec_;
    Timer     timer_;
};

}} // namespace nla::util

#define NLA_CONCAT_INNER(a,b) a##b
#define NLA_CONCAT(a,b) NLA_CONCAT_INNER(a,b)

#define NLA_TIMED_SCOPE(NAME, REGISTRY, N, ITERS, NOTE) \
    nla::util::Scoped NLA_CONCAT(_nla_scope_, __LINE__)(NAME, REGISTRY, N, ITERS, NOTE)
