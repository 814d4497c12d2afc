#pragma once
#ifndef PROPCOMM_MILP_SOLVER_HPP
#define PROPCOMM_MILP_SOLVER_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "models.hpp"
#include "options.hpp"

namespace propcomm {

// Sparse linear expression sum_i coef_i * var_i. Repeated terms are merged.
class LinearExpr {
public:
  LinearExpr& add(int var, double coef) {
    if (coef != 0.0) terms_[var] += coef;
    return *this;
  }
  const std::map<int, double>& terms() const { return terms_; }
  bool empty() const { return terms_.empty(); }

private:
  std::map<int /*column*/, double> terms_;
};

enum class Relation { LessEqual, GreaterEqual, Equal };
enum class Sense { Minimize, Maximize };

struct SolveResult {
  SolveStatus status{SolveStatus::Error};
  std::vector<double> values;  // one per column; empty when no incumbent exists
  double objective{0.0};

  bool has_solution() const { return !values.empty(); }
  double value(int var) const { return values.at(var); }
};

// Mixed-integer model under construction plus the engine that solves it.
// One instance holds exactly one model.
class MilpSolver {
public:
  virtual ~MilpSolver() = default;

  virtual int add_binary_var(const std::string& name) = 0;
  virtual int add_continuous_var(double lb, double ub, const std::string& name) = 0;
  virtual void add_constraint(const LinearExpr& lhs, Relation rel, double rhs,
                              const std::string& name) = 0;
  virtual void set_objective(const LinearExpr& obj, Sense sense) = 0;
  virtual SolveResult solve(const SolverOptions& opts) = 0;

  virtual int num_vars() const = 0;
  virtual int num_constraints() const = 0;
};

// new_model(): every solve call asks for a fresh solver.
using SolverFactory = std::function<std::unique_ptr<MilpSolver>()>;

} // namespace propcomm

#endif // PROPCOMM_MILP_SOLVER_HPP
