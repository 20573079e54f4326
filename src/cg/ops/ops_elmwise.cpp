#include "cg/ops/elementwise.hpp"
#include <utility>

namespace cg {

ElementwiseSum::ElementwiseSum(std::string name, NodePtr a, NodePtr b)
  : Node(std::move(name), {a, b}), a_(a), b_(b) {}

Tensor ElementwiseSum::compute_() {
  const Tensor& a = a_->out();
  const Tensor& b = b_->out();
  expect_shape("b", b, a.shape());
  return add(a, b);
}

void ElementwiseSum::backprop_() {
  accumulate_into(*a_, d_out());
  accumulate_into(*b_, d_out());
}

} // namespace cg
