#include "options.hpp"

#include <string>
#include <type_traits>

#include "errors.hpp"

namespace propcomm {

namespace {

template <class T>
void read_opt_(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return;
  if (std::is_integral<T>::value && !std::is_same<T, bool>::value && !it->is_number_integer())
    throw InvalidInputError(std::string("option '") + key + "' must be an integer");
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw InvalidInputError(std::string("option '") + key + "': " + e.what());
  }
}

} // namespace

SolverOptions SolverOptions::from_json(const nlohmann::json& j) {
  if (!j.is_object()) throw InvalidInputError("solver options must be a JSON object");
  SolverOptions o;
  read_opt_(j, "time_limit_sec", o.time_limit_sec);
  read_opt_(j, "log_level", o.log_level);
  read_opt_(j, "integer_tolerance", o.integer_tolerance);
  read_opt_(j, "validate", o.validate);
  if (o.time_limit_sec < 0.0) throw InvalidInputError("time_limit_sec must be >= 0");
  if (o.log_level < 0) throw InvalidInputError("log_level must be >= 0");
  if (!(o.integer_tolerance > 0.0 && o.integer_tolerance < 0.5))
    throw InvalidInputError("integer_tolerance must be in (0, 0.5)");
  return o;
}

nlohmann::json to_json(const SolverOptions& o) {
  return nlohmann::json{
    {"time_limit_sec", o.time_limit_sec},
    {"log_level", o.log_level},
    {"integer_tolerance", o.integer_tolerance},
    {"validate", o.validate},
  };
}

nlohmann::json to_json(const PartitionResult& r) {
  nlohmann::json comms = nlohmann::json::object();
  for (const auto& kv : r.communities) comms[std::to_string(kv.first)] = kv.second;
  return nlohmann::json{
    {"communities", comms},
    {"optimal", r.optimal},
    {"status", to_string(r.status)},
    {"status_text", r.status_text},
  };
}

nlohmann::json to_json(const SubgraphResult& r) {
  return nlohmann::json{
    {"community", r.community},
    {"size", r.size},
    {"optimal", r.optimal},
    {"status", to_string(r.status)},
    {"status_text", r.status_text},
  };
}

} // namespace propcomm
