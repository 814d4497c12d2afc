#include "model_builder.hpp"

#include <string>

#include "errors.hpp"

namespace propcomm {

namespace {

std::string idx_(const char* prefix, int a, int b) {
  return std::string(prefix) + "_" + std::to_string(a) + "_" + std::to_string(b);
}

std::string idx_(const char* prefix, int a, int b, int c) {
  return idx_(prefix, a, b) + "_" + std::to_string(c);
}

} // namespace

CommunityModelBuilder::CommunityModelBuilder(const Graph& g, const ProblemSpec& spec)
  : g_(g), spec_(spec)
{
  if (spec_.family == Family::MaxSubgraph) {
    if (spec_.k != 1) throw InvalidInputError("maximum community selects exactly one subgraph (k must be 1)");
    spec_.size_floor = false;
  } else if (spec_.k <= 0 || spec_.k > g_.n()) {
    throw InvalidInputError("k must be in [1, n] (k=" + std::to_string(spec_.k) +
                            ", n=" + std::to_string(g_.n()) + ")");
  }
}

CommunityModel CommunityModelBuilder::build(MilpSolver& solver) const {
  CommunityModel m;
  m.spec = spec_;
  m.n = g_.n();
  m.communities = spec_.k;

  add_assignment_vars_(solver, m);
  add_membership_constraints_(solver, m);
  add_dominance_constraints_(solver, m);
  if (spec_.connected) add_connectivity_constraints_(solver, m);
  if (spec_.family == Family::MaxSubgraph) set_objective_(solver, m);
  return m;
}

void CommunityModelBuilder::add_assignment_vars_(MilpSolver& s, CommunityModel& m) const {
  m.x.assign(m.n, std::vector<int>(m.communities, -1));
  for (int v = 0; v < m.n; ++v) {
    for (int c = 0; c < m.communities; ++c) {
      m.x[v][c] = (spec_.family == Family::MaxSubgraph)
                    ? s.add_binary_var("s_" + std::to_string(v))
                    : s.add_binary_var(idx_("x", v, c));
    }
  }
}

void CommunityModelBuilder::add_membership_constraints_(MilpSolver& s, const CommunityModel& m) const {
  if (spec_.family == Family::MaxSubgraph) {
    LinearExpr size;
    for (int v = 0; v < m.n; ++v) size.add(m.x[v][0], 1.0);
    s.add_constraint(size, Relation::GreaterEqual, 2.0, "min_size_S");
    s.add_constraint(size, Relation::LessEqual, m.n - 1.0, "max_size_S");
    return;
  }

  // each vertex in exactly one community
  for (int v = 0; v < m.n; ++v) {
    LinearExpr row;
    for (int c = 0; c < m.communities; ++c) row.add(m.x[v][c], 1.0);
    s.add_constraint(row, Relation::Equal, 1.0, "one_community_" + std::to_string(v));
  }

  if (!spec_.size_floor) return;
  for (int c = 0; c < m.communities; ++c) {
    LinearExpr row;
    for (int v = 0; v < m.n; ++v) row.add(m.x[v][c], 1.0);
    s.add_constraint(row, Relation::GreaterEqual, 2.0, "min_size_" + std::to_string(c));
  }
}

void CommunityModelBuilder::add_dominance_constraints_(MilpSolver& s, const CommunityModel& m) const {
  for (int v = 0; v < m.n; ++v) {
    const double M = big_m(g_, v);
    const auto& nb = g_.neighbors(v);

    if (spec_.family == Family::MaxSubgraph) {
      // in - out = 2*in - deg(v) >= 1, active when s[v] = 1
      LinearExpr row;
      for (int u : nb) row.add(m.x[u][0], 2.0);
      row.add(m.x[v][0], -M);
      s.add_constraint(row, Relation::GreaterEqual, 1.0 - M + g_.degree(v),
                       "dominance_" + std::to_string(v));
      continue;
    }

    for (int c = 0; c < m.communities; ++c) {
      for (int c2 = 0; c2 < m.communities; ++c2) {
        if (c == c2) continue;
        LinearExpr row;
        for (int u : nb) {
          row.add(m.x[u][c], 1.0);
          row.add(m.x[u][c2], -1.0);
        }
        row.add(m.x[v][c], -M);
        s.add_constraint(row, Relation::GreaterEqual, 1.0 - M, idx_("dominance", v, c, c2));
      }
    }
  }
}

void CommunityModelBuilder::add_connectivity_constraints_(MilpSolver& s, CommunityModel& m) const {
  const int n = m.n;
  const int K = m.communities;
  const double cap = n - 1.0;  // no member receives more than n-1 units

  m.root.assign(n, std::vector<int>(K, -1));
  m.supply.assign(n, std::vector<int>(K, -1));
  for (int v = 0; v < n; ++v) {
    for (int c = 0; c < K; ++c) {
      m.root[v][c]   = s.add_binary_var(idx_("root", v, c));
      m.supply[v][c] = s.add_continuous_var(0.0, n, idx_("supply", v, c));
    }
  }

  m.arcs.clear();
  m.arcs.reserve(2 * g_.edges().size());
  for (const auto& e : g_.edges()) {
    for (int dir = 0; dir < 2; ++dir) {
      CommunityModel::Arc a;
      a.u = dir ? e.second : e.first;
      a.v = dir ? e.first : e.second;
      for (int c = 0; c < K; ++c)
        a.flow.push_back(s.add_continuous_var(0.0, cap, idx_("f", a.u, a.v, c)));
      m.arcs.push_back(std::move(a));
    }
  }

  // per-vertex arc lists into m.arcs
  std::vector<std::vector<int>> out_arcs(n), in_arcs(n);
  for (int i = 0; i < static_cast<int>(m.arcs.size()); ++i) {
    out_arcs[m.arcs[i].u].push_back(i);
    in_arcs[m.arcs[i].v].push_back(i);
  }

  for (int c = 0; c < K; ++c) {
    // at most one root, and only if the community is non-empty
    LinearExpr roots;
    for (int v = 0; v < n; ++v) roots.add(m.root[v][c], 1.0);
    s.add_constraint(roots, Relation::LessEqual, 1.0, "one_root_" + std::to_string(c));

    for (int v = 0; v < n; ++v) {
      LinearExpr member_root;
      member_root.add(m.root[v][c], 1.0).add(m.x[v][c], -1.0);
      s.add_constraint(member_root, Relation::LessEqual, 0.0, idx_("root_member", v, c));

      LinearExpr has_root;
      has_root.add(m.x[v][c], 1.0);
      for (int u = 0; u < n; ++u) has_root.add(m.root[u][c], -1.0);
      s.add_constraint(has_root, Relation::LessEqual, 0.0, idx_("root_exists", v, c));

      LinearExpr supply_gate;
      supply_gate.add(m.supply[v][c], 1.0).add(m.root[v][c], -static_cast<double>(n));
      s.add_constraint(supply_gate, Relation::LessEqual, 0.0, idx_("supply_gate", v, c));

      // inflow - outflow = x[v][c] - supply[v][c]
      LinearExpr balance;
      for (int a : in_arcs[v])  balance.add(m.arcs[a].flow[c], 1.0);
      for (int a : out_arcs[v]) balance.add(m.arcs[a].flow[c], -1.0);
      balance.add(m.x[v][c], -1.0).add(m.supply[v][c], 1.0);
      s.add_constraint(balance, Relation::Equal, 0.0, idx_("flow_balance", v, c));
    }

    // flow only between members of c
    for (const auto& a : m.arcs) {
      LinearExpr tail, head;
      tail.add(a.flow[c], 1.0).add(m.x[a.u][c], -cap);
      head.add(a.flow[c], 1.0).add(m.x[a.v][c], -cap);
      s.add_constraint(tail, Relation::LessEqual, 0.0, idx_("flow_cap_tail", a.u, a.v, c));
      s.add_constraint(head, Relation::LessEqual, 0.0, idx_("flow_cap_head", a.u, a.v, c));
    }
  }
}

void CommunityModelBuilder::set_objective_(MilpSolver& s, const CommunityModel& m) const {
  LinearExpr obj;
  for (int v = 0; v < m.n; ++v) obj.add(m.x[v][0], 1.0);
  s.set_objective(obj, Sense::Maximize);
}

} // namespace propcomm
