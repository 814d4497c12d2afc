#pragma once
#ifndef PROPCOMM_MODEL_BUILDER_HPP
#define PROPCOMM_MODEL_BUILDER_HPP

#include <vector>

#include "graph.hpp"
#include "milp_solver.hpp"
#include "models.hpp"

namespace propcomm {

// Column indices of everything the builder put into a solver.
struct CommunityModel {
  // directed arc u->v of an edge, one flow column per community
  struct Arc {
    int u{-1}, v{-1};
    std::vector<int> flow;
  };

  ProblemSpec spec;
  int n{0};
  int communities{0};                  // k, or 1 for MaxSubgraph
  std::vector<std::vector<int>> x;     // x[v][c]; MaxSubgraph uses x[v][0] as s[v]
  std::vector<std::vector<int>> root;  // root[v][c], connected variants only
  std::vector<std::vector<int>> supply;
  std::vector<Arc> arcs;
};

// Builds the MILP for every variant from one ProblemSpec.
//
//   membership   sum_c x[v][c] == 1, optional sum_v x[v][c] >= 2,
//                or 2 <= sum_v s[v] <= n-1
//   dominance    in_deg(v,c) - cross_deg(v,c') >= 1 - M_v (1 - x[v][c]),  M_v = deg(v)+1
//   connectivity single-commodity flow from one root per community
//   objective    max sum_v s[v] (MaxSubgraph only)
class CommunityModelBuilder {
public:
  // Throws InvalidInputError for k outside [1, n] (Partition) or k != 1 (MaxSubgraph).
  CommunityModelBuilder(const Graph& g, const ProblemSpec& spec);

  CommunityModel build(MilpSolver& solver) const;

  // Smallest M that deactivates the dominance row of v when x[v][c] = 0.
  static double big_m(const Graph& g, int v) { return g.degree(v) + 1.0; }

private:
  void add_assignment_vars_(MilpSolver& s, CommunityModel& m) const;
  void add_membership_constraints_(MilpSolver& s, const CommunityModel& m) const;
  void add_dominance_constraints_(MilpSolver& s, const CommunityModel& m) const;
  void add_connectivity_constraints_(MilpSolver& s, CommunityModel& m) const;
  void set_objective_(MilpSolver& s, const CommunityModel& m) const;

  const Graph& g_;
  ProblemSpec spec_;
};

} // namespace propcomm

#endif // PROPCOMM_MODEL_BUILDER_HPP
