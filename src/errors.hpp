#pragma once
#include <stdexcept>
#include <string>

namespace propcomm {

// Root of every error the library raises.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed adjacency matrix, bad k, bad option value. Raised before a model is built.
class InvalidInputError : public Error {
public:
  explicit InvalidInputError(const std::string& what) : Error(what) {}
};

// No community structure exists for this graph / k.
class InfeasibleModelError : public Error {
public:
  explicit InfeasibleModelError(const std::string& what) : Error(what) {}
};

// Time limit hit before the solver found any incumbent.
class SolverTimeoutError : public Error {
public:
  explicit SolverTimeoutError(const std::string& what) : Error(what) {}
};

// Decoded solution violates the model it came from (builder defect).
class ModelInconsistencyError : public Error {
public:
  explicit ModelInconsistencyError(const std::string& what) : Error(what) {}
};

// Solver stopped for any other reason (numerical trouble, abort, ...).
class SolverError : public Error {
public:
  explicit SolverError(const std::string& what) : Error(what) {}
};

} // namespace propcomm
