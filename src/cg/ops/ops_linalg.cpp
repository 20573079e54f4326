#include "cg/ops/linalg.hpp"
#include <utility>

namespace cg {

// ===== VectorScalarAffine =====

VectorScalarAffine::VectorScalarAffine(std::string name, NodePtr x, NodePtr w, NodePtr b)
  : Node(std::move(name), {x, w, b}), x_(x), w_(w), b_(b) {}

Tensor VectorScalarAffine::compute_() {
  const Tensor& x = x_->out();
  const Tensor& w = w_->out();
  const Tensor& b = b_->out();
  expect_rank("x", x, 1);
  expect_shape("w", w, x.shape());
  expect_shape("b", b, {});
  return Tensor::scalar(dot(x, w) + b.item());
}

void VectorScalarAffine::backprop_() {
  const double g = d_out().item();
  accumulate_into(*x_, w_->out(), g);
  accumulate_into(*w_, x_->out(), g);
  accumulate_into(*b_, d_out());
}

// ===== Affine =====

Affine::Affine(std::string name, NodePtr W, NodePtr x, NodePtr b)
  : Node(std::move(name), {W, x, b}), W_(W), x_(x), b_(b) {}

Tensor Affine::compute_() {
  const Tensor& W = W_->out();
  const Tensor& x = x_->out();
  const Tensor& b = b_->out();
  expect_rank("W", W, 2);
  const std::size_t M = W.shape()[0], N = W.shape()[1];
  expect_shape("x", x, {N});
  expect_shape("b", b, {M});
  return add(matvec(W, x), b);
}

void Affine::backprop_() {
  const Tensor& g = d_out();
  accumulate_into(*W_, outer(g, x_->out()));
  accumulate_into(*x_, matvec_t(W_->out(), g));
  accumulate_into(*b_, g);
}

} // namespace cg
