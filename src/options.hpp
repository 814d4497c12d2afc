#pragma once
#ifndef PROPCOMM_OPTIONS_HPP
#define PROPCOMM_OPTIONS_HPP

#include <nlohmann/json.hpp>

#include "models.hpp"

namespace propcomm {

struct SolverOptions {
  double time_limit_sec{0.0};      // 0 = unlimited
  int    log_level{0};             // 0 = quiet; >0 also forwarded to CBC
  double integer_tolerance{1e-6};
  bool   validate{true};           // re-check decoded solutions

  // Unknown keys are ignored; wrongly typed or negative values throw InvalidInputError.
  static SolverOptions from_json(const nlohmann::json& j);
};

nlohmann::json to_json(const SolverOptions& o);
nlohmann::json to_json(const PartitionResult& r);
nlohmann::json to_json(const SubgraphResult& r);

} // namespace propcomm

#endif // PROPCOMM_OPTIONS_HPP
