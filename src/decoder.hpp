#pragma once
#ifndef PROPCOMM_DECODER_HPP
#define PROPCOMM_DECODER_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "graph.hpp"
#include "milp_solver.hpp"
#include "model_builder.hpp"
#include "models.hpp"

namespace propcomm {

using Communities = std::map<int /*label 1..k*/, std::vector<int>>;

// Describes the first violated property, or nullopt when 'comms' is a valid
// answer for 'spec': labels 1..k, every vertex exactly once, size floor,
// strict dominance over every rival community, induced connectivity.
std::optional<std::string> check_partition(const Graph& g, const ProblemSpec& spec,
                                           const Communities& comms);

// Same for a subgraph selection: 2 <= |S| <= n-1, in(v) > out(v), connectivity.
std::optional<std::string> check_selection(const Graph& g, const ProblemSpec& spec,
                                           const std::vector<int>& S);

// Rounds solver values (> 0.5 is 1) back into communities / a vertex subset.
// Throws ModelInconsistencyError if the rounded assignment breaks the model.
class SolutionDecoder {
public:
  explicit SolutionDecoder(const Graph& g, bool validate = true) : g_(g), validate_(validate) {}

  Communities decode_partition(const CommunityModel& m, const SolveResult& r) const;
  std::vector<int> decode_selection(const CommunityModel& m, const SolveResult& r) const;

private:
  const Graph& g_;
  bool validate_;
};

} // namespace propcomm

#endif // PROPCOMM_DECODER_HPP
