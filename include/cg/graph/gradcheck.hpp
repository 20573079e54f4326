#pragma once
#include <cstddef>
#include <string>

#include "cg/core/config.hpp"
#include "cg/core/node.hpp"
#include "cg/graph/graph_function.hpp"

namespace cg {

// Finite-difference checks of backward(). Central differences with step
// `delta`; errors are relative: |a-b| / max(|a|+|b|, 1e-8).

struct GradCheckResult {
  double max_rel_error = 0.0;
  std::string worst_node;        // leaf/parameter holding the worst entry
  std::size_t worst_index = 0;   // flat index into that tensor
  std::size_t entries_checked = 0;

  bool passed(double tol) const { return max_rel_error <= tol; }
};

double relative_error(double a, double b);
double relative_error(const Tensor& a, const Tensor& b);   // max over entries

// Every predecessor of `node` must be a Leaf; `leaf_values` gives their
// values by name. A random upstream gradient (seeded from
// config::gradcheck_seed()) is backpropagated through `node` and compared
// against numeric derivatives of sum(out * upstream).
GradCheckResult check_node_backward(const NodePtr& node,
                                    const TensorMap& leaf_values,
                                    double delta = config::gradcheck_delta());

// Compares GraphFunction::gradients() against numeric derivatives of
// GraphFunction::objective() for every parameter entry. Parameters are
// restored to `parameters` afterwards.
GradCheckResult check_graph_function(GraphFunction& fn,
                                     const TensorMap& inputs,
                                     const TensorMap& outcomes,
                                     const TensorMap& parameters,
                                     double delta = config::gradcheck_delta());

} // namespace cg
