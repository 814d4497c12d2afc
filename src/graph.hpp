#pragma once
#ifndef PROPCOMM_GRAPH_HPP
#define PROPCOMM_GRAPH_HPP

#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "models.hpp"

namespace propcomm {

// Immutable undirected simple graph built from a validated 0/1 adjacency matrix.
class Graph {
public:
  using Edge = std::pair<int, int>;  // u < v

  // Throws InvalidInputError unless A is square, symmetric, 0/1 with zero diagonal.
  explicit Graph(const AdjacencyMatrix& A);

  // Accepts [[0,1],[1,0]] or {"adjacency": [[...]]}.
  static Graph from_json(const nlohmann::json& j);

  int n() const { return n_; }
  int degree(int v) const { return static_cast<int>(nbrs_.at(v).size()); }
  const std::vector<int>& neighbors(int v) const { return nbrs_.at(v); }
  bool adjacent(int u, int v) const { return adj_.at(u).at(v) != 0; }
  const std::vector<Edge>& edges() const { return edges_; }
  int max_degree() const;

  // Number of neighbors of v that lie in 'members' (membership mask of size n).
  int degree_into(int v, const std::vector<char>& members) const;

  // Connected components of the subgraph induced by 'vertices'. Each component ascending.
  std::vector<std::vector<int>> induced_components(const std::vector<int>& vertices) const;
  bool induces_connected(const std::vector<int>& vertices) const;

private:
  int n_{0};
  AdjacencyMatrix adj_;
  std::vector<std::vector<int>> nbrs_;
  std::vector<Edge> edges_;
};

} // namespace propcomm

#endif // PROPCOMM_GRAPH_HPP
