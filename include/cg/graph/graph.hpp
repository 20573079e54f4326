#pragma once
#include <string>
#include <vector>

#include "cg/core/node.hpp"

namespace cg {

// Parents-first DFS from each sink: every node appears once, after all of
// its predecessors. Ties follow predecessor-list order. GraphError on a cycle.
std::vector<NodePtr> sort_topological(const std::vector<NodePtr>& sinks);

// Drives forward/backward cycles over the ancestors of one output node.
// The graph does not own the nodes' state; it holds them and fixes an order.
class Graph {
public:
  explicit Graph(NodePtr output);
  // Explicit forward order; must list exactly the ancestors of output with
  // every predecessor before its successors.
  Graph(NodePtr output, std::vector<NodePtr> order);

  // forward() on every node in order; returns the output's out.
  const Tensor& forward();

  // Seeds output d_out = 1 (output must be 0-dim) and runs backward() in
  // reverse forward order.
  void backward();
  // Same, with a caller-chosen backward order: every successor before its
  // predecessors, same node set.
  void backward(const std::vector<NodePtr>& backward_order);

  // forward() + backward(); returns the scalar output.
  double evaluate();

  const NodePtr& output() const { return output_; }
  const std::vector<NodePtr>& nodes() const { return order_; }
  NodePtr find(const std::string& name) const;   // nullptr if absent

private:
  void seed_output_();

  NodePtr output_;
  std::vector<NodePtr> order_;
};

} // namespace cg
