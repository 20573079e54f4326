#pragma once
#include "cg/core/node.hpp"

namespace cg {

// out = a + b, identical shapes (no broadcasting)
class ElementwiseSum : public Node {
public:
  ElementwiseSum(std::string name, NodePtr a, NodePtr b);
  const char* kind() const override { return "ElementwiseSum"; }

protected:
  Tensor compute_() override;
  void backprop_() override;

private:
  NodePtr a_, b_;
};

} // namespace cg
