#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

#include "nla/exception.hpp"

namespace nla { namespace algebra {

// Plain std::vector<double> kernels shared by the iterative solvers and
// preconditioners.

inline void checkDimension(const std::vector<double>& v, std::size_t expected)
{
    if (v.size() != expected)
        throw DimensionMismatchException(v.size(), expected);
}

inline double dot(const std::vector<double>& a,
                  const std::vector<double>& b)
{
    checkDimension(b, a.size());
    double s = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) s += a[i] * b[i];
    return s;
}

inline double nrm2(const std::vector<double>& a)
{
    double s = 0.0;
    for (double v : a) s += v * v;
    return std::sqrt(s);
}

/// x = a * x + b * y
inline void combineToSelf(double a, std::vector<double>& x,
                          double b, const std::vector<double>& y)
{
    checkDimension(y, x.size());
    for (std::size_t i = 0; i < x.size(); ++i) x[i] = a * x[i] + b * y[i];
}

}} // namespace nla::algebra
