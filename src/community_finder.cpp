#include "community_finder.hpp"

#include <iostream>
#include <string>
#include <utility>

#include "decoder.hpp"
#include "errors.hpp"
#include "model_builder.hpp"

namespace propcomm {

namespace {

struct Solved {
  CommunityModel model;
  SolveResult result;
};

// Maps terminal solver states to exceptions; returns only when an incumbent exists.
void raise_on_failure_(const SolveResult& r, const std::string& what) {
  switch (r.status) {
    case SolveStatus::Optimal:
    case SolveStatus::Feasible:
      if (!r.has_solution())
        throw SolverError(what + ": solver reported a solution but returned no values");
      return;
    case SolveStatus::TimeLimit:
      if (!r.has_solution())
        throw SolverTimeoutError(what + ": time limit reached before any feasible solution was found");
      return;
    case SolveStatus::Infeasible:
      throw InfeasibleModelError("no " + what + " exists");
    case SolveStatus::Error:
      break;
  }
  throw SolverError(what + ": solver stopped without a usable result");
}

std::string status_text_(SolveStatus s) {
  switch (s) {
    case SolveStatus::Optimal:   return "optimal";
    case SolveStatus::Feasible:  return "feasible (not proven optimal)";
    case SolveStatus::TimeLimit: return "time limit reached (best incumbent, not proven optimal)";
    default:                     return to_string(s);
  }
}

} // namespace

CommunityFinder::CommunityFinder(SolverOptions opts, SolverFactory factory)
  : opts_(std::move(opts)), factory_(std::move(factory))
{
  if (!factory_) throw InvalidInputError("solver factory must not be empty");
}

std::string CommunityFinder::describe_(const ProblemSpec& spec) {
  if (spec.family == Family::MaxSubgraph)
    return spec.connected ? "connected maximum community" : "maximum community";
  std::string s = spec.connected ? "connected " : "";
  if (!spec.size_floor) s += "generalized ";
  return s + std::to_string(spec.k) + "-community";
}

void CommunityFinder::check_preconditions_(const Graph& g, const ProblemSpec& spec) const {
  const int n = g.n();
  if (spec.family == Family::MaxSubgraph) {
    if (spec.k != 1) throw InvalidInputError("maximum community selects exactly one subgraph (k must be 1)");
    if (n < 3) throw InfeasibleModelError("no " + describe_(spec) + " exists: graph has fewer than 3 vertices");
    return;
  }
  if (spec.k <= 0 || spec.k > n)
    throw InvalidInputError("k must be in [1, n] (k=" + std::to_string(spec.k) +
                            ", n=" + std::to_string(n) + ")");
  if (spec.size_floor && 2 * spec.k > n)
    throw InfeasibleModelError("no " + describe_(spec) + " exists: " + std::to_string(n) +
                               " vertices cannot form " + std::to_string(spec.k) +
                               " communities of at least 2 vertices");
}

namespace {

Solved build_and_solve_(const Graph& g, const ProblemSpec& spec, const SolverOptions& opts,
                        const SolverFactory& factory, const std::string& what) {
  std::unique_ptr<MilpSolver> solver = factory();
  if (!solver) throw SolverError("solver factory returned no solver");

  Solved out;
  out.model = CommunityModelBuilder(g, spec).build(*solver);
  if (opts.log_level > 0) {
    std::cerr << "[model] " << what << ": n=" << g.n() << " edges=" << g.edges().size()
              << " max_deg=" << g.max_degree()
              << " vars=" << solver->num_vars() << " rows=" << solver->num_constraints() << "\n";
  }
  out.result = solver->solve(opts);
  if (opts.log_level > 0) {
    std::cerr << "[finder] " << what << ": " << to_string(out.result.status) << "\n";
  }
  raise_on_failure_(out.result, what);
  return out;
}

} // namespace

PartitionResult CommunityFinder::solve_partition(const Graph& g, const ProblemSpec& spec) const {
  if (spec.family != Family::Partition)
    throw InvalidInputError("solve_partition requires a partition problem");
  check_preconditions_(g, spec);
  const std::string what = describe_(spec);

  Solved s = build_and_solve_(g, spec, opts_, factory_, what);

  PartitionResult out;
  out.communities = SolutionDecoder(g, opts_.validate).decode_partition(s.model, s.result);
  out.status = s.result.status;
  out.optimal = (s.result.status == SolveStatus::Optimal);
  out.status_text = status_text_(s.result.status);
  if (!out.optimal) {
    std::cerr << "[finder] " << what << ": returning incumbent, " << out.status_text << "\n";
  }
  return out;
}

SubgraphResult CommunityFinder::solve_subgraph(const Graph& g, const ProblemSpec& spec) const {
  if (spec.family != Family::MaxSubgraph)
    throw InvalidInputError("solve_subgraph requires a maximum-community problem");
  check_preconditions_(g, spec);
  const std::string what = describe_(spec);

  Solved s = build_and_solve_(g, spec, opts_, factory_, what);

  SubgraphResult out;
  out.community = SolutionDecoder(g, opts_.validate).decode_selection(s.model, s.result);
  out.size = static_cast<int>(out.community.size());
  out.status = s.result.status;
  out.optimal = (s.result.status == SolveStatus::Optimal);
  out.status_text = status_text_(s.result.status);
  if (!out.optimal) {
    std::cerr << "[finder] " << what << ": returning incumbent of size " << out.size
              << ", " << out.status_text << "\n";
  }
  return out;
}

PartitionResult CommunityFinder::find_k_community(const Graph& g, int k) const {
  return solve_partition(g, ProblemSpec::k_community(k));
}

PartitionResult CommunityFinder::find_connected_k_community(const Graph& g, int k) const {
  return solve_partition(g, ProblemSpec::k_community(k, /*connected=*/true));
}

PartitionResult CommunityFinder::find_generalized_k_community(const Graph& g, int k, bool connected) const {
  return solve_partition(g, ProblemSpec::generalized_k_community(k, connected));
}

SubgraphResult CommunityFinder::find_max_community(const Graph& g) const {
  return solve_subgraph(g, ProblemSpec::max_community());
}

SubgraphResult CommunityFinder::find_connected_max_community(const Graph& g) const {
  return solve_subgraph(g, ProblemSpec::max_community(/*connected=*/true));
}

// ---- free-function wrappers ----

PartitionResult find_k_community(const AdjacencyMatrix& A, int k, const SolverOptions& opts) {
  return CommunityFinder(opts).find_k_community(Graph(A), k);
}

PartitionResult find_connected_k_community(const AdjacencyMatrix& A, int k, const SolverOptions& opts) {
  return CommunityFinder(opts).find_connected_k_community(Graph(A), k);
}

PartitionResult find_generalized_k_community(const AdjacencyMatrix& A, int k, bool connected,
                                             const SolverOptions& opts) {
  return CommunityFinder(opts).find_generalized_k_community(Graph(A), k, connected);
}

SubgraphResult find_max_community(const AdjacencyMatrix& A, const SolverOptions& opts) {
  return CommunityFinder(opts).find_max_community(Graph(A));
}

SubgraphResult find_connected_max_community(const AdjacencyMatrix& A, const SolverOptions& opts) {
  return CommunityFinder(opts).find_connected_max_community(Graph(A));
}

} // namespace propcomm
