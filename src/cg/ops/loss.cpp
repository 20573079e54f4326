#include "cg/ops/loss.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace cg {

// ===== SquaredL2Distance =====

SquaredL2Distance::SquaredL2Distance(std::string name, NodePtr a, NodePtr b)
  : Node(std::move(name), {a, b}), a_(a), b_(b) {}

Tensor SquaredL2Distance::compute_() {
  const Tensor& a = a_->out();
  const Tensor& b = b_->out();
  expect_shape("b", b, a.shape());
  diff_ = sub(a, b);
  return Tensor::scalar(sum(mul(diff_, diff_)));
}

void SquaredL2Distance::backprop_() {
  const double g = d_out().item();
  accumulate_into(*a_, diff_,  2.0 * g);
  accumulate_into(*b_, diff_, -2.0 * g);
}

// ===== L2NormPenalty =====

static double checked_l2_reg(const std::string& name, double l2_reg) {
  if (!std::isfinite(l2_reg) || l2_reg < 0.0)
    throw std::invalid_argument("L2NormPenalty '" + name +
                                "': l2_reg must be finite and non-negative, got " +
                                std::to_string(l2_reg));
  return l2_reg;
}

L2NormPenalty::L2NormPenalty(std::string name, double l2_reg, NodePtr w)
  : Node(name, {w}), l2_reg_(checked_l2_reg(name, l2_reg)), w_(w) {}

Tensor L2NormPenalty::compute_() {
  const Tensor& w = w_->out();
  return Tensor::scalar(l2_reg_ * sum(mul(w, w)));
}

void L2NormPenalty::backprop_() {
  const double g = d_out().item();
  accumulate_into(*w_, w_->out(), 2.0 * l2_reg_ * g);
}

} // namespace cg
