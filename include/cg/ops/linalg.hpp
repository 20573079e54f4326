#pragma once
#include "cg/core/node.hpp"

namespace cg {

// out = dot(x, w) + b
// Shapes: x [n], w [n], b [] -> out []
class VectorScalarAffine : public Node {
public:
  VectorScalarAffine(std::string name, NodePtr x, NodePtr w, NodePtr b);
  const char* kind() const override { return "VectorScalarAffine"; }

protected:
  Tensor compute_() override;
  void backprop_() override;

private:
  NodePtr x_, w_, b_;
};

// out = W·x + b
// Shapes: W [m,n], x [n], b [m] -> out [m]
class Affine : public Node {
public:
  Affine(std::string name, NodePtr W, NodePtr x, NodePtr b);
  const char* kind() const override { return "Affine"; }

protected:
  Tensor compute_() override;
  void backprop_() override;

private:
  NodePtr W_, x_, b_;
};

} // namespace cg
