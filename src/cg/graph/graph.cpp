#include "cg/graph/graph.hpp"
#include "cg/core/config.hpp"
#include "cg/core/errors.hpp"
#include "cg/core/logger.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace {
using cg::Node;
using cg::NodePtr;

[[noreturn]] void fail_graph(const std::string& msg) {
  CG_LOG_ERROR("{}", msg);
  throw cg::GraphError(msg);
}

// parents-first DFS; `active` holds the current DFS path for cycle detection
void topo_collect(const NodePtr& node,
                  std::vector<NodePtr>& order,
                  std::unordered_set<const Node*>& seen,
                  std::unordered_set<const Node*>& active) {
  if (seen.count(node.get())) return;
  if (active.count(node.get()))
    fail_graph("cycle detected in computation graph at " + node->label());
  active.insert(node.get());
  for (const auto& p : node->predecessors()) topo_collect(p, order, seen, active);
  active.erase(node.get());
  seen.insert(node.get());
  order.push_back(node);
}

std::string names_of(const std::vector<NodePtr>& nodes) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    if (i) oss << ", ";
    oss << nodes[i]->name();
  }
  return oss.str();
}

// `order` must be a permutation of `ancestors` with predecessors first.
void check_topological(const std::vector<NodePtr>& ancestors,
                       const std::vector<NodePtr>& order,
                       const char* what) {
  std::unordered_map<const Node*, std::size_t> pos;
  for (std::size_t i = 0; i < order.size(); ++i) {
    if (!order[i]) fail_graph(std::string(what) + ": null node at position " + std::to_string(i));
    if (!pos.emplace(order[i].get(), i).second)
      fail_graph(std::string(what) + ": " + order[i]->label() + " listed twice");
  }
  for (const auto& n : ancestors) {
    if (!pos.count(n.get()))
      fail_graph(std::string(what) + ": missing " + n->label());
  }
  if (order.size() != ancestors.size()) {
    std::unordered_set<const Node*> known;
    for (const auto& n : ancestors) known.insert(n.get());
    for (const auto& n : order)
      if (!known.count(n.get()))
        fail_graph(std::string(what) + ": " + n->label() + " is not an ancestor of the output");
  }
  for (std::size_t i = 0; i < order.size(); ++i) {
    for (const auto& p : order[i]->predecessors()) {
      if (pos.at(p.get()) > i)
        fail_graph(std::string(what) + ": " + order[i]->label() + " is ordered before its predecessor " +
                   p->label());
    }
  }
}

} // anon

namespace cg {

std::vector<NodePtr> sort_topological(const std::vector<NodePtr>& sinks) {
  std::vector<NodePtr> order;
  std::unordered_set<const Node*> seen, active;
  for (const auto& s : sinks) {
    if (!s) throw std::invalid_argument("sort_topological: null sink");
    topo_collect(s, order, seen, active);
  }
  return order;
}

Graph::Graph(NodePtr output) : output_(std::move(output)) {
  if (!output_) throw std::invalid_argument("Graph: null output node");
  order_ = sort_topological({output_});

  std::unordered_set<std::string> names;
  for (const auto& n : order_)
    if (!names.insert(n->name()).second)
      CG_LOG_WARN("graph rooted at {}: duplicate node name '{}'", output_->label(), n->name());
  CG_LOG_DEBUG("graph rooted at {}: {} nodes [{}]", output_->label(), order_.size(), names_of(order_));
}

Graph::Graph(NodePtr output, std::vector<NodePtr> order)
  : output_(std::move(output)), order_(std::move(order)) {
  if (!output_) throw std::invalid_argument("Graph: null output node");
  check_topological(sort_topological({output_}), order_, "Graph forward order");
  CG_LOG_DEBUG("graph rooted at {}: explicit order [{}]", output_->label(), names_of(order_));
}

const Tensor& Graph::forward() {
  // a new cycle: nothing counts as forwarded until this sweep reaches it
  for (const auto& n : order_) n->invalidate();
  const bool check = config::check_finite_enabled();
  for (const auto& n : order_) {
    const Tensor& out = n->forward();
    if (check && !all_finite(out))
      CG_LOG_WARN("{}: forward produced non-finite values {}", n->label(), out.str());
  }
  return output_->out();
}

void Graph::seed_output_() {
  if (output_->phase() != Node::Phase::Forwarded)
    fail_graph("Graph::backward: output " + output_->label() + " has no matching forward in this cycle");
  if (!output_->out().is_scalar())
    fail_graph("Graph::backward: output " + output_->label() + " must be 0-dim to seed d_out, got shape " +
               detail::shape_str(output_->out().shape()));
  output_->set_d_out(Tensor::scalar(1.0));
}

void Graph::backward() {
  seed_output_();
  for (auto it = order_.rbegin(); it != order_.rend(); ++it) (*it)->backward();
}

void Graph::backward(const std::vector<NodePtr>& backward_order) {
  std::vector<NodePtr> fwd(backward_order.rbegin(), backward_order.rend());
  check_topological(order_, fwd, "Graph backward order");
  seed_output_();
  for (const auto& n : backward_order) n->backward();
}

double Graph::evaluate() {
  forward();
  backward();
  return output_->out().item();
}

NodePtr Graph::find(const std::string& name) const {
  auto it = std::find_if(order_.begin(), order_.end(),
                         [&](const NodePtr& n){ return n->name() == name; });
  return it == order_.end() ? nullptr : *it;
}

} // namespace cg
