#include "cbc_solver.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <coin/CbcModel.hpp>
#include <coin/CoinPackedVector.hpp>
#include <coin/OsiClpSolverInterface.hpp>

#include "errors.hpp"

namespace propcomm {

CbcSolver::CbcSolver() : mat_(false, 0, 0) {}

SolverFactory CbcSolver::factory() {
  return [] { return std::make_unique<CbcSolver>(); };
}

int CbcSolver::add_col_(double lb, double ub, bool integer, const std::string& name) {
  const int col = num_vars();
  col_lower_.push_back(lb);
  col_upper_.push_back(ub);
  obj_.push_back(0.0);
  col_names_.push_back(name);
  if (integer) int_idx_.push_back(col);
  return col;
}

int CbcSolver::add_binary_var(const std::string& name) {
  return add_col_(0.0, 1.0, true, name);
}

int CbcSolver::add_continuous_var(double lb, double ub, const std::string& name) {
  if (lb > ub) throw SolverError("column " + name + ": lower bound exceeds upper bound");
  return add_col_(lb, ub, false, name);
}

void CbcSolver::add_constraint(const LinearExpr& lhs, Relation rel, double rhs,
                               const std::string& name) {
  CoinPackedVector row;
  for (const auto& t : lhs.terms()) {
    if (t.first < 0 || t.first >= num_vars())
      throw SolverError("row " + name + " references unknown column " + std::to_string(t.first));
    row.insert(t.first, t.second);
  }
  mat_.appendRow(row);
  switch (rel) {
    case Relation::LessEqual:
      row_lower_.push_back(-COIN_DBL_MAX); row_upper_.push_back(rhs); break;
    case Relation::GreaterEqual:
      row_lower_.push_back(rhs); row_upper_.push_back(COIN_DBL_MAX); break;
    case Relation::Equal:
      row_lower_.push_back(rhs); row_upper_.push_back(rhs); break;
  }
}

void CbcSolver::set_objective(const LinearExpr& obj, Sense sense) {
  std::fill(obj_.begin(), obj_.end(), 0.0);
  for (const auto& t : obj.terms()) {
    if (t.first < 0 || t.first >= num_vars())
      throw SolverError("objective references unknown column " + std::to_string(t.first));
    obj_[t.first] = t.second;
  }
  sense_ = sense;
}

SolveResult CbcSolver::solve(const SolverOptions& opts) {
  const int ncols = num_vars();
  const int nrows = num_constraints();
  // trailing columns that no row touches must still exist in the matrix
  mat_.setDimensions(nrows, ncols);

  OsiClpSolverInterface si;
  si.messageHandler()->setLogLevel(opts.log_level > 1 ? 1 : 0);
  si.loadProblem(mat_, col_lower_.data(), col_upper_.data(),
                 obj_.data(), row_lower_.data(), row_upper_.data());
  si.setObjSense(sense_ == Sense::Maximize ? -1.0 : 1.0);
  if (!int_idx_.empty()) si.setInteger(int_idx_.data(), static_cast<int>(int_idx_.size()));

  CbcModel model(si);
  if (opts.time_limit_sec > 0.0) model.setMaximumSeconds(opts.time_limit_sec);
  model.setLogLevel(opts.log_level);
  model.setIntegerTolerance(opts.integer_tolerance);
  model.branchAndBound();

  SolveResult out;
  const double* sol = model.bestSolution();
  if (sol) {
    out.values.assign(sol, sol + ncols);
    // recomputed so the value is in the caller's sense regardless of CBC internals
    out.objective = 0.0;
    for (int c = 0; c < ncols; ++c) out.objective += obj_[c] * sol[c];
  }

  if (model.isProvenOptimal() && sol)      out.status = SolveStatus::Optimal;
  else if (model.isProvenInfeasible())     out.status = SolveStatus::Infeasible;
  else if (model.isSecondsLimitReached())  out.status = SolveStatus::TimeLimit;
  else if (sol)                            out.status = SolveStatus::Feasible;
  else                                     out.status = SolveStatus::Error;

  if (opts.log_level > 0) {
    std::cerr << "[solver] cbc status=" << model.status()
              << " secondary=" << model.secondaryStatus()
              << " -> " << to_string(out.status)
              << " objective=" << out.objective << "\n";
    if (sol && opts.log_level > 1) {
      std::cerr << "[solver] active binaries:";
      for (int c : int_idx_) if (sol[c] > 0.5) std::cerr << " " << col_names_[c];
      std::cerr << "\n";
    }
  }
  if (out.status == SolveStatus::Infeasible) out.values.clear();
  return out;
}

} // namespace propcomm
