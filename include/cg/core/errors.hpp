#pragma once
#include <stdexcept>
#include <string>

namespace cg {

// Caller/construction bugs: cycles, evaluation out of dependency order,
// backward without a matching forward, non-scalar gradient seeds.
struct GraphError : public std::logic_error {
  explicit GraphError(const std::string& what) : std::logic_error(what) {}
};

// Operand shapes that do not agree exactly.
struct ShapeError : public std::invalid_argument {
  explicit ShapeError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace cg
