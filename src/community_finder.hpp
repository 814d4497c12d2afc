#pragma once
#ifndef PROPCOMM_COMMUNITY_FINDER_HPP
#define PROPCOMM_COMMUNITY_FINDER_HPP

#include "cbc_solver.hpp"
#include "graph.hpp"
#include "milp_solver.hpp"
#include "models.hpp"
#include "options.hpp"

namespace propcomm {

// Builds, solves and decodes one self-contained model per call.
//
// Outcomes:
//   result with optimal=true         solver proved optimality
//   result with optimal=false        time limit or early stop with an incumbent
//   InvalidInputError                bad k (the Graph already validated the matrix)
//   InfeasibleModelError             no such community structure exists
//   SolverTimeoutError               time limit hit without any incumbent
//   SolverError                      solver failed for another reason
//   ModelInconsistencyError          decoded solution breaks the model (bug)
class CommunityFinder {
public:
  explicit CommunityFinder(SolverOptions opts = SolverOptions(),
                           SolverFactory factory = CbcSolver::factory());

  // Partition into k communities of >= 2 vertices each.
  PartitionResult find_k_community(const Graph& g, int k) const;
  // As above, each community also inducing a connected subgraph.
  PartitionResult find_connected_k_community(const Graph& g, int k) const;
  // No size floor: communities may be empty or small.
  PartitionResult find_generalized_k_community(const Graph& g, int k, bool connected = false) const;

  // Largest S with 2 <= |S| <= n-1 whose members have more neighbors inside than outside.
  SubgraphResult find_max_community(const Graph& g) const;
  SubgraphResult find_connected_max_community(const Graph& g) const;

  PartitionResult solve_partition(const Graph& g, const ProblemSpec& spec) const;
  SubgraphResult  solve_subgraph(const Graph& g, const ProblemSpec& spec) const;

  const SolverOptions& options() const { return opts_; }

private:
  void check_preconditions_(const Graph& g, const ProblemSpec& spec) const;
  static std::string describe_(const ProblemSpec& spec);

  SolverOptions opts_;
  SolverFactory factory_;
};

// Convenience wrappers over a raw adjacency matrix (validated here, CBC backend).
PartitionResult find_k_community(const AdjacencyMatrix& A, int k,
                                 const SolverOptions& opts = SolverOptions());
PartitionResult find_connected_k_community(const AdjacencyMatrix& A, int k,
                                           const SolverOptions& opts = SolverOptions());
PartitionResult find_generalized_k_community(const AdjacencyMatrix& A, int k, bool connected = false,
                                             const SolverOptions& opts = SolverOptions());
SubgraphResult find_max_community(const AdjacencyMatrix& A,
                                  const SolverOptions& opts = SolverOptions());
SubgraphResult find_connected_max_community(const AdjacencyMatrix& A,
                                            const SolverOptions& opts = SolverOptions());

} // namespace propcomm

#endif // PROPCOMM_COMMUNITY_FINDER_HPP
