#include <gtest/gtest.h>

#include "decoder.hpp"
#include "errors.hpp"
#include "fake_solvers.hpp"
#include "model_builder.hpp"

using namespace propcomm;
using propcomm::fakes::RecordingSolver;

namespace {

Graph two_triangles() {
  return Graph(AdjacencyMatrix{
    {0, 1, 1, 0, 0, 0},
    {1, 0, 1, 0, 0, 0},
    {1, 1, 0, 0, 0, 0},
    {0, 0, 0, 0, 1, 1},
    {0, 0, 0, 1, 0, 1},
    {0, 0, 0, 1, 1, 0},
  });
}

// two K4 blocks {0..3} and {4..7} joined by edge 0-4
Graph bridged_k4s() {
  AdjacencyMatrix A(8, std::vector<int>(8, 0));
  for (int b = 0; b < 8; b += 4)
    for (int i = b; i < b + 4; ++i)
      for (int j = b; j < b + 4; ++j)
        if (i != j) A[i][j] = 1;
  A[0][4] = A[4][0] = 1;
  return Graph(A);
}

} // namespace

TEST(CheckPartition, AcceptsTriangles) {
  Graph g = two_triangles();
  Communities c{{1, {0, 1, 2}}, {2, {3, 4, 5}}};
  EXPECT_FALSE(check_partition(g, ProblemSpec::k_community(2), c).has_value());
  EXPECT_FALSE(check_partition(g, ProblemSpec::k_community(2, true), c).has_value());
}

TEST(CheckPartition, BridgeStillDominated) {
  Graph g = bridged_k4s();
  Communities c{{1, {0, 1, 2, 3}}, {2, {4, 5, 6, 7}}};
  EXPECT_FALSE(check_partition(g, ProblemSpec::k_community(2, true), c).has_value());
}

TEST(CheckPartition, ReportsEachViolation) {
  Graph g = two_triangles();
  auto spec = ProblemSpec::k_community(2);

  Communities missing{{1, {0, 1, 2}}, {2, {3, 4}}};
  EXPECT_NE(check_partition(g, spec, missing)->find("unassigned"), std::string::npos);

  Communities twice{{1, {0, 1, 2, 3}}, {2, {3, 4, 5}}};
  EXPECT_NE(check_partition(g, spec, twice)->find("twice"), std::string::npos);

  Communities small{{1, {0, 1, 2, 3, 4}}, {2, {5}}};
  EXPECT_NE(check_partition(g, spec, small)->find("fewer than 2"), std::string::npos);

  Communities mixed{{1, {0, 1, 5}}, {2, {2, 3, 4}}};
  EXPECT_NE(check_partition(g, spec, mixed)->find("neighbors in its community"), std::string::npos);

  Communities wrong_k{{1, {0, 1, 2, 3, 4, 5}}};
  EXPECT_TRUE(check_partition(g, spec, wrong_k).has_value());
}

TEST(CheckPartition, ConnectivityOnlyWhenRequested) {
  // three disjoint edges; {0,1,2,3} is dominant but disconnected
  Graph g(AdjacencyMatrix{
    {0, 1, 0, 0, 0, 0},
    {1, 0, 0, 0, 0, 0},
    {0, 0, 0, 1, 0, 0},
    {0, 0, 1, 0, 0, 0},
    {0, 0, 0, 0, 0, 1},
    {0, 0, 0, 0, 1, 0},
  });
  Communities c{{1, {0, 1, 2, 3}}, {2, {4, 5}}};
  EXPECT_FALSE(check_partition(g, ProblemSpec::k_community(2), c).has_value());
  auto err = check_partition(g, ProblemSpec::k_community(2, true), c);
  ASSERT_TRUE(err.has_value());
  EXPECT_NE(err->find("not connected"), std::string::npos);
}

TEST(CheckSelection, SizeBoundsAndDominance) {
  Graph g = two_triangles();
  auto spec = ProblemSpec::max_community();
  EXPECT_FALSE(check_selection(g, spec, {3, 4, 5}).has_value());
  EXPECT_TRUE(check_selection(g, spec, {3}).has_value());
  EXPECT_TRUE(check_selection(g, spec, {0, 1, 2, 3, 4, 5}).has_value());
  EXPECT_TRUE(check_selection(g, spec, {0, 1}).has_value());
  EXPECT_TRUE(check_selection(g, spec, {0, 0, 1}).has_value());
}

TEST(CheckSelection, ConnectedVariantRejectsTwoBlocks) {
  Graph g = two_triangles();
  // two K4 blocks plus an isolated vertex, so both blocks fit under n-1
  Graph k4s(AdjacencyMatrix{
    {0, 1, 1, 1, 0, 0, 0, 0, 0},
    {1, 0, 1, 1, 0, 0, 0, 0, 0},
    {1, 1, 0, 1, 0, 0, 0, 0, 0},
    {1, 1, 1, 0, 0, 0, 0, 0, 0},
    {0, 0, 0, 0, 0, 1, 1, 1, 0},
    {0, 0, 0, 0, 1, 0, 1, 1, 0},
    {0, 0, 0, 0, 1, 1, 0, 1, 0},
    {0, 0, 0, 0, 1, 1, 1, 0, 0},
    {0, 0, 0, 0, 0, 0, 0, 0, 0},
  });
  std::vector<int> both = {0, 1, 2, 3, 4, 5, 6, 7};
  EXPECT_FALSE(check_selection(k4s, ProblemSpec::max_community(), both).has_value());
  EXPECT_TRUE(check_selection(k4s, ProblemSpec::max_community(true), both).has_value());
  EXPECT_FALSE(check_selection(g, ProblemSpec::max_community(true), {0, 1, 2}).has_value());
}

TEST(SolutionDecoder, DecodesPartitionWithSlack) {
  Graph g = two_triangles();
  RecordingSolver s;
  CommunityModel m = CommunityModelBuilder(g, ProblemSpec::k_community(2)).build(s);

  SolveResult r;
  r.status = SolveStatus::Optimal;
  r.values.assign(s.num_vars(), 0.0);
  for (int v = 0; v < 3; ++v) r.values[m.x[v][1]] = 0.9999997;
  for (int v = 3; v < 6; ++v) r.values[m.x[v][0]] = 1.0000002;
  r.values[m.x[4][1]] = 1e-7;

  Communities c = SolutionDecoder(g).decode_partition(m, r);
  ASSERT_EQ(c.size(), 2u);
  EXPECT_EQ(c.at(1), (std::vector<int>{3, 4, 5}));
  EXPECT_EQ(c.at(2), (std::vector<int>{0, 1, 2}));
}

TEST(SolutionDecoder, DoubleAssignmentIsInconsistent) {
  Graph g = two_triangles();
  RecordingSolver s;
  CommunityModel m = CommunityModelBuilder(g, ProblemSpec::k_community(2)).build(s);
  SolveResult r;
  r.values.assign(s.num_vars(), 0.0);
  for (int v = 0; v < 6; ++v) r.values[m.x[v][v < 3 ? 0 : 1]] = 1.0;
  r.values[m.x[2][1]] = 1.0;
  EXPECT_THROW(SolutionDecoder(g).decode_partition(m, r), ModelInconsistencyError);
}

TEST(SolutionDecoder, InvalidPartitionIsInconsistentUnlessValidationOff) {
  Graph g = two_triangles();
  RecordingSolver s;
  CommunityModel m = CommunityModelBuilder(g, ProblemSpec::k_community(2)).build(s);
  SolveResult r;
  r.values.assign(s.num_vars(), 0.0);
  const std::vector<int> label = {0, 0, 1, 1, 1, 0};
  for (int v = 0; v < 6; ++v) r.values[m.x[v][label[v]]] = 1.0;

  EXPECT_THROW(SolutionDecoder(g).decode_partition(m, r), ModelInconsistencyError);
  Communities c = SolutionDecoder(g, /*validate=*/false).decode_partition(m, r);
  EXPECT_EQ(c.at(1), (std::vector<int>{0, 1, 5}));
}

TEST(SolutionDecoder, DecodesSelection) {
  Graph g = two_triangles();
  RecordingSolver s;
  CommunityModel m = CommunityModelBuilder(g, ProblemSpec::max_community()).build(s);
  SolveResult r;
  r.values.assign(s.num_vars(), 0.0);
  r.values[m.x[3][0]] = r.values[m.x[4][0]] = r.values[m.x[5][0]] = 1.0;
  EXPECT_EQ(SolutionDecoder(g).decode_selection(m, r), (std::vector<int>{3, 4, 5}));

  r.values[m.x[0][0]] = 1.0;
  EXPECT_THROW(SolutionDecoder(g).decode_selection(m, r), ModelInconsistencyError);
}

TEST(SolutionDecoder, EmptyValuesAreInconsistent) {
  Graph g = two_triangles();
  RecordingSolver s;
  CommunityModel m = CommunityModelBuilder(g, ProblemSpec::k_community(2)).build(s);
  EXPECT_THROW(SolutionDecoder(g).decode_partition(m, SolveResult{}), ModelInconsistencyError);
}
