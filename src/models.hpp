// src/models.hpp
#pragma once
#include <map>
#include <string>
#include <vector>

namespace propcomm {

using AdjacencyMatrix = std::vector<std::vector<int>>;

enum class Family { Partition, MaxSubgraph };

// One value describes all variants; builder, decoder and validator read the same fields.
struct ProblemSpec {
  Family family{Family::Partition};
  int    k{1};              // communities (MaxSubgraph always 1)
  bool   size_floor{true};  // >= 2 members per community
  bool   connected{false};  // induced subgraph of each community is connected

  static ProblemSpec k_community(int k, bool connected = false) {
    return ProblemSpec{Family::Partition, k, true, connected};
  }
  static ProblemSpec generalized_k_community(int k, bool connected = false) {
    return ProblemSpec{Family::Partition, k, false, connected};
  }
  static ProblemSpec max_community(bool connected = false) {
    return ProblemSpec{Family::MaxSubgraph, 1, false, connected};
  }
};

enum class SolveStatus { Optimal, Feasible, Infeasible, TimeLimit, Error };

inline const char* to_string(SolveStatus s) {
  switch (s) {
    case SolveStatus::Optimal:    return "optimal";
    case SolveStatus::Feasible:   return "feasible";
    case SolveStatus::Infeasible: return "infeasible";
    case SolveStatus::TimeLimit:  return "time_limit";
    case SolveStatus::Error:      return "error";
  }
  return "unknown";
}

struct PartitionResult {
  std::map<int /*label 1..k*/, std::vector<int>> communities;
  bool        optimal{false};
  SolveStatus status{SolveStatus::Error};
  std::string status_text;
};

struct SubgraphResult {
  std::vector<int> community;  // ascending vertex ids
  int         size{0};
  bool        optimal{false};
  SolveStatus status{SolveStatus::Error};
  std::string status_text;
};

} // namespace propcomm
