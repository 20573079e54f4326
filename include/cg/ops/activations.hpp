#pragma once
#include "cg/core/node.hpp"

namespace cg {

// Elementwise activations (same shape as input)

// out = tanh(a)
class Tanh : public Node {
public:
  Tanh(std::string name, NodePtr a);
  const char* kind() const override { return "Tanh"; }

protected:
  Tensor compute_() override;
  void backprop_() override;

private:
  NodePtr a_;
};

} // namespace cg
