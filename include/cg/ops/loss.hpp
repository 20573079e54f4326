#pragma once
#include "cg/core/node.hpp"

namespace cg {

// out = sum((a - b)^2), a and b of identical shape -> out []
class SquaredL2Distance : public Node {
public:
  SquaredL2Distance(std::string name, NodePtr a, NodePtr b);
  const char* kind() const override { return "SquaredL2Distance"; }

protected:
  Tensor compute_() override;
  void backprop_() override;

private:
  NodePtr a_, b_;
  Tensor diff_;   // a - b from the last forward
};

// out = l2_reg * sum(w^2) -> out []
// l2_reg is a fixed, finite, non-negative coefficient; it is not a
// predecessor and receives no gradient.
class L2NormPenalty : public Node {
public:
  L2NormPenalty(std::string name, double l2_reg, NodePtr w);
  const char* kind() const override { return "L2NormPenalty"; }
  double l2_reg() const { return l2_reg_; }

protected:
  Tensor compute_() override;
  void backprop_() override;

private:
  double l2_reg_;
  NodePtr w_;
};

} // namespace cg
