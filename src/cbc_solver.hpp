#pragma once
#ifndef PROPCOMM_CBC_SOLVER_HPP
#define PROPCOMM_CBC_SOLVER_HPP

#include <memory>
#include <string>
#include <vector>

#include <coin/CoinPackedMatrix.hpp>

#include "milp_solver.hpp"

namespace propcomm {

// MilpSolver backed by COIN-OR CBC (branch-and-cut over Clp).
// Columns and rows are collected here and loaded into Osi only inside solve().
class CbcSolver : public MilpSolver {
public:
  CbcSolver();

  int add_binary_var(const std::string& name) override;
  int add_continuous_var(double lb, double ub, const std::string& name) override;
  void add_constraint(const LinearExpr& lhs, Relation rel, double rhs,
                      const std::string& name) override;
  void set_objective(const LinearExpr& obj, Sense sense) override;
  SolveResult solve(const SolverOptions& opts) override;

  int num_vars() const override { return static_cast<int>(col_lower_.size()); }
  int num_constraints() const override { return static_cast<int>(row_lower_.size()); }

  static SolverFactory factory();

private:
  int add_col_(double lb, double ub, bool integer, const std::string& name);

private:
  CoinPackedMatrix mat_;  // row-major
  std::vector<double> col_lower_, col_upper_, obj_;
  std::vector<double> row_lower_, row_upper_;
  std::vector<int> int_idx_;
  std::vector<std::string> col_names_;
  Sense sense_{Sense::Minimize};
};

} // namespace propcomm

#endif // PROPCOMM_CBC_SOLVER_HPP
