#pragma once
#include <memory>
#include <string>
#include <vector>
#include <cstddef>

#include "cg/core/tensor.hpp"

namespace cg {

class Node;
using NodePtr = std::shared_ptr<Node>;

// One vertex of the computation graph. Predecessors are fixed at
// construction. A cycle is forward() over every node in topological order,
// then backward() over the same nodes in reverse order.
//
//   out    last forward value (undefined before the first forward)
//   d_out  d(graph output)/d(out); zeroed by forward, accumulated by the
//          backward() calls of this node's successors
class Node {
public:
  enum class Phase { Idle, Forwarded, Backwarded };

  virtual ~Node() = default;
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  // Requires every predecessor to be Forwarded in the current cycle.
  const Tensor& forward();
  // Requires this node to be Forwarded; adds local VJPs into predecessors.
  void backward();

  const std::vector<NodePtr>& predecessors() const { return preds_; }
  const std::string& name() const { return name_; }
  virtual const char* kind() const = 0;
  std::string label() const;   // e.g. "Affine 'hidden'"

  bool has_out() const { return out_.defined(); }
  const Tensor& out()   const { return out_; }
  const Tensor& d_out() const { return d_out_; }
  Phase phase() const { return phase_; }

  // Drops the node back to Idle: successors may not read it until it is
  // forwarded again. out and d_out keep their last values.
  void invalidate() { phase_ = Phase::Idle; }

  // Overwrites d_out (gradient seeding). Node must be Forwarded and g must
  // have out's shape.
  void set_d_out(const Tensor& g);

protected:
  Node(std::string name, std::vector<NodePtr> predecessors);

  virtual Tensor compute_() = 0;
  virtual void backprop_() = 0;

  // pred.d_out += alpha * g. pred must still be Forwarded (its own backward
  // has not run) and g must match its shape.
  void accumulate_into(Node& pred, const Tensor& g, double alpha = 1.0) const;

  // Shape checks that raise ShapeError naming this node.
  void expect_shape(const char* role, const Tensor& t, const Shape& expected) const;
  void expect_rank(const char* role, const Tensor& t, std::size_t rank) const;

private:
  std::string name_;
  std::vector<NodePtr> preds_;
  Tensor out_;
  Tensor d_out_;
  Phase phase_ = Phase::Idle;
};

// Holds externally supplied data (parameters, inputs, targets).
class Leaf : public Node {
public:
  explicit Leaf(std::string name);
  Leaf(std::string name, Tensor value);

  // Also invalidates the leaf; it must be forwarded before use.
  void set_value(Tensor value);
  const Tensor& value() const { return value_; }
  bool has_value() const { return value_.defined(); }

  const char* kind() const override { return "Leaf"; }

protected:
  Tensor compute_() override;
  void backprop_() override {}

private:
  Tensor value_;
};

using LeafPtr = std::shared_ptr<Leaf>;

} // namespace cg
