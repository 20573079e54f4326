#include "cg/graph/graph_function.hpp"
#include "cg/core/errors.hpp"
#include "cg/core/logger.hpp"
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace cg {

namespace {

void check_leaves(const std::vector<LeafPtr>& leaves, const char* group,
                  std::unordered_set<std::string>& names) {
  for (const auto& l : leaves) {
    if (!l) throw std::invalid_argument(std::string("GraphFunction: null ") + group + " leaf");
    if (!names.insert(l->name()).second)
      throw GraphError(std::string("GraphFunction: duplicate leaf name '") + l->name() + "'");
  }
}

bool contains(const Graph& g, const Node* n) {
  for (const auto& m : g.nodes()) if (m.get() == n) return true;
  return false;
}

// Every leaf must receive a value and every key must name a leaf.
void assign_all(const std::vector<LeafPtr>& leaves, const TensorMap& values, const char* group) {
  for (const auto& l : leaves) {
    auto it = values.find(l->name());
    if (it == values.end())
      throw std::invalid_argument(std::string("GraphFunction: missing ") + group + " '" + l->name() + "'");
    l->set_value(it->second);
  }
  if (values.size() != leaves.size()) {
    for (const auto& kv : values) {
      bool known = false;
      for (const auto& l : leaves) known = known || (l->name() == kv.first);
      if (!known)
        throw std::invalid_argument(std::string("GraphFunction: unknown ") + group + " '" + kv.first + "'");
    }
  }
}

NodePtr require(NodePtr n, const char* what) {
  if (!n) throw std::invalid_argument(std::string("GraphFunction: null ") + what + " node");
  return n;
}

} // anon

GraphFunction::GraphFunction(std::vector<LeafPtr> inputs,
                             std::vector<LeafPtr> outcomes,
                             std::vector<LeafPtr> parameters,
                             NodePtr prediction,
                             NodePtr objective)
  : inputs_(std::move(inputs)), outcomes_(std::move(outcomes)), parameters_(std::move(parameters)),
    objective_graph_(require(std::move(objective), "objective")),
    prediction_graph_(require(std::move(prediction), "prediction")) {
  std::unordered_set<std::string> names;
  check_leaves(inputs_, "input", names);
  check_leaves(outcomes_, "outcome", names);
  check_leaves(parameters_, "parameter", names);

  for (const auto& p : parameters_) {
    if (!contains(objective_graph_, p.get()))
      throw GraphError("GraphFunction: parameter '" + p->name() + "' does not feed the objective");
  }
  for (const auto& o : outcomes_) {
    if (contains(prediction_graph_, o.get()))
      throw GraphError("GraphFunction: prediction depends on outcome '" + o->name() + "'");
  }
  CG_LOG_DEBUG("GraphFunction: {} inputs, {} outcomes, {} parameters, objective {}, prediction {}",
               inputs_.size(), outcomes_.size(), parameters_.size(),
               objective_graph_.output()->label(), prediction_graph_.output()->label());
}

void GraphFunction::set_parameters(const TensorMap& values) {
  // all names and values are checked before any leaf changes
  std::vector<std::pair<Leaf*, const Tensor*>> updates;
  for (const auto& kv : values) {
    Leaf* target = nullptr;
    for (const auto& p : parameters_)
      if (p->name() == kv.first) { target = p.get(); break; }
    if (!target) throw std::invalid_argument("GraphFunction: unknown parameter '" + kv.first + "'");
    if (!kv.second.defined())
      throw std::invalid_argument("GraphFunction: undefined value for parameter '" + kv.first + "'");
    updates.emplace_back(target, &kv.second);
  }
  for (const auto& u : updates) u.first->set_value(*u.second);
}

TensorMap GraphFunction::parameters() const {
  TensorMap out;
  for (const auto& p : parameters_) out[p->name()] = p->value();
  return out;
}

void GraphFunction::assign_inputs_(const TensorMap& inputs) { assign_all(inputs_, inputs, "input"); }

void GraphFunction::assign_outcomes_(const TensorMap& outcomes) { assign_all(outcomes_, outcomes, "outcome"); }

const Tensor& GraphFunction::forward_objective_() {
  const Tensor& out = objective_graph_.forward();
  if (!out.is_scalar()) {
    const std::string msg = "GraphFunction: objective " + objective_graph_.output()->label() +
                            " must be 0-dim, got shape " + detail::shape_str(out.shape());
    CG_LOG_ERROR("{}", msg);
    throw GraphError(msg);
  }
  return out;
}

double GraphFunction::objective(const TensorMap& inputs, const TensorMap& outcomes) {
  assign_inputs_(inputs);
  assign_outcomes_(outcomes);
  return forward_objective_().item();
}

GradientResult GraphFunction::gradients(const TensorMap& inputs, const TensorMap& outcomes) {
  assign_inputs_(inputs);
  assign_outcomes_(outcomes);
  GradientResult r;
  r.objective = forward_objective_().item();
  objective_graph_.backward();
  for (const auto& p : parameters_) r.gradients[p->name()] = p->d_out();
  return r;
}

Tensor GraphFunction::prediction(const TensorMap& inputs) {
  assign_inputs_(inputs);
  return prediction_graph_.forward();
}

} // namespace cg
