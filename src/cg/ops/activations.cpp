#include "cg/ops/activations.hpp"
#include <utility>

namespace cg {

Tanh::Tanh(std::string name, NodePtr a)
  : Node(std::move(name), {a}), a_(a) {}

Tensor Tanh::compute_() {
  const Tensor& a = a_->out();
  return tanhv(a);
}

void Tanh::backprop_() {
  // d tanh(a)/da = 1 - tanh(a)^2, with tanh(a) cached in out
  const Tensor& y = out();
  Tensor g = d_out();
  for (std::size_t i = 0; i < g.numel(); ++i) g[i] *= (1.0 - y[i] * y[i]);
  accumulate_into(*a_, g);
}

} // namespace cg
