#include "decoder.hpp"

#include <algorithm>
#include <sstream>

#include "errors.hpp"

namespace propcomm {

namespace {

bool on_(double val) { return val > 0.5; }

std::string vertex_list_(const std::vector<int>& vs) {
  std::ostringstream ss;
  ss << "{";
  for (size_t i = 0; i < vs.size(); ++i) ss << (i ? "," : "") << vs[i];
  ss << "}";
  return ss.str();
}

} // namespace

std::optional<std::string> check_partition(const Graph& g, const ProblemSpec& spec,
                                           const Communities& comms) {
  const int n = g.n();
  if (static_cast<int>(comms.size()) != spec.k)
    return "expected " + std::to_string(spec.k) + " communities, got " + std::to_string(comms.size());

  std::vector<int> label(n, -1);
  for (const auto& kv : comms) {
    if (kv.first < 1 || kv.first > spec.k)
      return "community label " + std::to_string(kv.first) + " outside 1.." + std::to_string(spec.k);
    for (int v : kv.second) {
      if (v < 0 || v >= n) return "vertex " + std::to_string(v) + " out of range";
      if (label[v] != -1) return "vertex " + std::to_string(v) + " assigned twice";
      label[v] = kv.first;
    }
    if (spec.size_floor && kv.second.size() < 2)
      return "community " + std::to_string(kv.first) + " has fewer than 2 members";
  }
  for (int v = 0; v < n; ++v)
    if (label[v] == -1) return "vertex " + std::to_string(v) + " unassigned";

  // neighbor counts per (vertex, label)
  for (int v = 0; v < n; ++v) {
    std::map<int, int> cnt;
    for (int u : g.neighbors(v)) cnt[label[u]]++;
    const int own = cnt[label[v]];
    for (const auto& kv : comms) {
      if (kv.first == label[v]) continue;
      const int cross = cnt.count(kv.first) ? cnt.at(kv.first) : 0;
      if (!(own > cross)) {
        return "vertex " + std::to_string(v) + " has " + std::to_string(own) +
               " neighbors in its community " + std::to_string(label[v]) + " but " +
               std::to_string(cross) + " in community " + std::to_string(kv.first);
      }
    }
  }

  if (spec.connected) {
    for (const auto& kv : comms) {
      if (!g.induces_connected(kv.second))
        return "community " + std::to_string(kv.first) + " " + vertex_list_(kv.second) +
               " is not connected";
    }
  }
  return std::nullopt;
}

std::optional<std::string> check_selection(const Graph& g, const ProblemSpec& spec,
                                           const std::vector<int>& S) {
  const int n = g.n();
  std::vector<char> in(n, 0);
  for (int v : S) {
    if (v < 0 || v >= n) return "vertex " + std::to_string(v) + " out of range";
    if (in[v]) return "vertex " + std::to_string(v) + " selected twice";
    in[v] = 1;
  }
  const int size = static_cast<int>(S.size());
  if (size < 2 || size > n - 1)
    return "selection size " + std::to_string(size) + " outside [2, " + std::to_string(n - 1) + "]";

  for (int v : S) {
    const int inside = g.degree_into(v, in);
    const int outside = g.degree(v) - inside;
    if (!(inside > outside))
      return "vertex " + std::to_string(v) + " has " + std::to_string(inside) +
             " neighbors inside and " + std::to_string(outside) + " outside";
  }

  if (spec.connected && !g.induces_connected(S))
    return "selection " + vertex_list_(S) + " is not connected";
  return std::nullopt;
}

Communities SolutionDecoder::decode_partition(const CommunityModel& m, const SolveResult& r) const {
  if (!r.has_solution()) throw ModelInconsistencyError("no solution values to decode");

  Communities comms;
  for (int c = 0; c < m.communities; ++c) comms[c + 1];
  for (int v = 0; v < m.n; ++v) {
    int chosen = -1;
    for (int c = 0; c < m.communities; ++c) {
      if (!on_(r.value(m.x[v][c]))) continue;
      if (chosen != -1)
        throw ModelInconsistencyError("vertex " + std::to_string(v) + " assigned to communities " +
                                      std::to_string(chosen + 1) + " and " + std::to_string(c + 1));
      chosen = c;
    }
    if (chosen == -1)
      throw ModelInconsistencyError("vertex " + std::to_string(v) + " has no community");
    comms[chosen + 1].push_back(v);
  }

  if (validate_) {
    if (auto err = check_partition(g_, m.spec, comms))
      throw ModelInconsistencyError("decoded partition is invalid: " + *err);
  }
  return comms;
}

std::vector<int> SolutionDecoder::decode_selection(const CommunityModel& m, const SolveResult& r) const {
  if (!r.has_solution()) throw ModelInconsistencyError("no solution values to decode");

  std::vector<int> S;
  for (int v = 0; v < m.n; ++v)
    if (on_(r.value(m.x[v][0]))) S.push_back(v);

  if (validate_) {
    if (auto err = check_selection(g_, m.spec, S))
      throw ModelInconsistencyError("decoded selection is invalid: " + *err);
  }
  return S;
}

} // namespace propcomm
