#include "graph.hpp"

#include <algorithm>
#include <cstdint>
#include <queue>
#include <string>

#include "errors.hpp"

namespace propcomm {

Graph::Graph(const AdjacencyMatrix& A)
  : n_(static_cast<int>(A.size())), adj_(A), nbrs_(A.size())
{
  for (int u = 0; u < n_; ++u) {
    if (static_cast<int>(A[u].size()) != n_)
      throw InvalidInputError("adjacency matrix must be square (row " + std::to_string(u) +
                              " has " + std::to_string(A[u].size()) + " entries, expected " +
                              std::to_string(n_) + ")");
  }
  for (int u = 0; u < n_; ++u) {
    if (A[u][u] != 0)
      throw InvalidInputError("adjacency matrix must have a zero diagonal (vertex " +
                              std::to_string(u) + ")");
    for (int v = 0; v < n_; ++v) {
      const int a = A[u][v];
      if (a != 0 && a != 1)
        throw InvalidInputError("adjacency entries must be 0 or 1 (at " + std::to_string(u) +
                                "," + std::to_string(v) + ")");
      if (a != A[v][u])
        throw InvalidInputError("adjacency matrix must be symmetric (at " + std::to_string(u) +
                                "," + std::to_string(v) + ")");
      if (a) {
        nbrs_[u].push_back(v);
        if (u < v) edges_.push_back({u, v});
      }
    }
  }
}

Graph Graph::from_json(const nlohmann::json& j) {
  const nlohmann::json& rows = (j.is_object() && j.contains("adjacency")) ? j.at("adjacency") : j;
  if (!rows.is_array())
    throw InvalidInputError("adjacency JSON must be an array of rows");
  AdjacencyMatrix A;
  A.reserve(rows.size());
  for (const auto& row : rows) {
    if (!row.is_array())
      throw InvalidInputError("adjacency JSON row must be an array");
    std::vector<int> r;
    r.reserve(row.size());
    for (const auto& e : row) {
      if (!e.is_number_integer())
        throw InvalidInputError("adjacency JSON entries must be integers");
      const std::int64_t v = e.get<std::int64_t>();
      if (v != 0 && v != 1)
        throw InvalidInputError("adjacency entries must be 0 or 1 (got " + e.dump() + ")");
      r.push_back(static_cast<int>(v));
    }
    A.push_back(std::move(r));
  }
  return Graph(A);
}

int Graph::max_degree() const {
  int d = 0;
  for (const auto& nb : nbrs_) d = std::max(d, static_cast<int>(nb.size()));
  return d;
}

int Graph::degree_into(int v, const std::vector<char>& members) const {
  int cnt = 0;
  for (int u : nbrs_.at(v)) if (members.at(u)) ++cnt;
  return cnt;
}

std::vector<std::vector<int>>
Graph::induced_components(const std::vector<int>& vertices) const {
  std::vector<char> in(n_, 0), seen(n_, 0);
  for (int v : vertices) in.at(v) = 1;

  std::vector<std::vector<int>> comps;
  for (int s : vertices) {
    if (seen[s]) continue;
    std::vector<int> comp;
    std::queue<int> q; q.push(s); seen[s] = 1;
    while (!q.empty()) {
      int u = q.front(); q.pop();
      comp.push_back(u);
      for (int w : nbrs_[u]) {
        if (!in[w] || seen[w]) continue;
        seen[w] = 1;
        q.push(w);
      }
    }
    std::sort(comp.begin(), comp.end());
    comps.push_back(std::move(comp));
  }
  return comps;
}

bool Graph::induces_connected(const std::vector<int>& vertices) const {
  return induced_components(vertices).size() <= 1;
}

} // namespace propcomm
