#include "nla/decomposition/decomposition_solver.hpp"

namespace nla { namespace decomposition {

DecompositionSolver::~DecompositionSolver() = default;

}} // namespace nla::decomposition
