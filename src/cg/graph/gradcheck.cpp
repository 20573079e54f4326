#include "cg/graph/gradcheck.hpp"
#include "cg/core/errors.hpp"
#include "cg/core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

namespace cg {

double relative_error(double a, double b) {
  return std::fabs(a - b) / std::max(1e-8, std::fabs(a) + std::fabs(b));
}

double relative_error(const Tensor& a, const Tensor& b) {
  if (a.shape() != b.shape())
    throw ShapeError("relative_error: shape mismatch " + detail::shape_str(a.shape()) +
                     " vs " + detail::shape_str(b.shape()));
  double worst = 0.0;
  for (std::size_t i = 0; i < a.numel(); ++i) worst = std::max(worst, relative_error(a[i], b[i]));
  return worst;
}

static void note(GradCheckResult& r, const std::string& name, std::size_t idx, double err) {
  ++r.entries_checked;
  if (std::isnan(err)) err = std::numeric_limits<double>::infinity();
  if (r.worst_node.empty() || err > r.max_rel_error) {
    r.max_rel_error = err;
    r.worst_node = name;
    r.worst_index = idx;
  }
}

GradCheckResult check_node_backward(const NodePtr& node, const TensorMap& leaf_values, double delta) {
  if (!node) throw std::invalid_argument("check_node_backward: null node");
  if (!(delta > 0.0)) throw std::invalid_argument("check_node_backward: delta must be positive");

  // distinct leaf predecessors, in predecessor order
  std::vector<LeafPtr> leaves;
  for (const auto& p : node->predecessors()) {
    auto leaf = std::dynamic_pointer_cast<Leaf>(p);
    if (!leaf)
      throw std::invalid_argument("check_node_backward: predecessor " + p->label() + " of " +
                                  node->label() + " is not a Leaf");
    if (std::find(leaves.begin(), leaves.end(), leaf) == leaves.end()) leaves.push_back(leaf);
  }
  for (const auto& l : leaves) {
    auto it = leaf_values.find(l->name());
    if (it == leaf_values.end())
      throw std::invalid_argument("check_node_backward: no value for leaf '" + l->name() + "'");
    l->set_value(it->second);
  }

  auto run_forward = [&]() -> const Tensor& {
    for (const auto& l : leaves) l->forward();
    return node->forward();
  };

  // analytic: random upstream gradient through one backward()
  const Tensor& out0 = run_forward();
  std::mt19937_64 rng(config::gradcheck_seed());
  std::normal_distribution<double> dist(0.0, 1.0);
  Tensor upstream = Tensor::zeros(out0.shape());
  for (auto& v : upstream) v = dist(rng);
  node->set_d_out(upstream);
  node->backward();

  std::vector<Tensor> analytic;
  for (const auto& l : leaves) analytic.push_back(l->d_out());

  // numeric: central differences of sum(out * upstream)
  GradCheckResult r;
  for (std::size_t k = 0; k < leaves.size(); ++k) {
    const auto& leaf = leaves[k];
    const Tensor base = leaf->value();
    for (std::size_t i = 0; i < base.numel(); ++i) {
      Tensor plus = base, minus = base;
      plus[i] += delta;
      minus[i] -= delta;
      leaf->set_value(plus);
      const double fp = sum(mul(run_forward(), upstream));
      leaf->set_value(minus);
      const double fm = sum(mul(run_forward(), upstream));
      const double numeric = (fp - fm) / (2.0 * delta);
      note(r, leaf->name(), i, relative_error(analytic[k][i], numeric));
    }
    leaf->set_value(base);
  }
  run_forward();

  CG_LOG_DEBUG("check_node_backward {}: {} entries, max relative error {:.3e} at {}[{}]",
               node->label(), r.entries_checked, r.max_rel_error, r.worst_node, r.worst_index);
  return r;
}

GradCheckResult check_graph_function(GraphFunction& fn,
                                     const TensorMap& inputs,
                                     const TensorMap& outcomes,
                                     const TensorMap& parameters,
                                     double delta) {
  if (!(delta > 0.0)) throw std::invalid_argument("check_graph_function: delta must be positive");

  fn.set_parameters(parameters);
  const GradientResult analytic = fn.gradients(inputs, outcomes);

  GradCheckResult r;
  for (const auto& kv : parameters) {
    const std::string& name = kv.first;
    const Tensor& base = kv.second;
    const Tensor& g = analytic.gradients.at(name);
    for (std::size_t i = 0; i < base.numel(); ++i) {
      Tensor plus = base, minus = base;
      plus[i] += delta;
      minus[i] -= delta;
      fn.set_parameters({{name, plus}});
      const double fp = fn.objective(inputs, outcomes);
      fn.set_parameters({{name, minus}});
      const double fm = fn.objective(inputs, outcomes);
      note(r, name, i, relative_error(g[i], (fp - fm) / (2.0 * delta)));
    }
    fn.set_parameters({{name, base}});
  }

  CG_LOG_DEBUG("check_graph_function: {} entries, max relative error {:.3e} at {}[{}]",
               r.entries_checked, r.max_rel_error, r.worst_node, r.worst_index);
  return r;
}

} // namespace cg
