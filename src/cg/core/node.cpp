#include "cg/core/node.hpp"
#include "cg/core/errors.hpp"
#include "cg/core/logger.hpp"
#include <stdexcept>
#include <utility>

namespace cg {
using detail::shape_str;

namespace {

[[noreturn]] void fail_graph(const std::string& msg) {
  CG_LOG_ERROR("{}", msg);
  throw GraphError(msg);
}

[[noreturn]] void fail_shape(const std::string& msg) {
  CG_LOG_ERROR("{}", msg);
  throw ShapeError(msg);
}

const char* phase_str(Node::Phase p) {
  switch (p) {
    case Node::Phase::Idle:       return "idle";
    case Node::Phase::Forwarded:  return "forwarded";
    case Node::Phase::Backwarded: return "backwarded";
  }
  return "?";
}

} // anon

Node::Node(std::string name, std::vector<NodePtr> predecessors)
  : name_(std::move(name)), preds_(std::move(predecessors)) {
  for (std::size_t i = 0; i < preds_.size(); ++i) {
    if (!preds_[i])
      throw std::invalid_argument("node '" + name_ + "': predecessor #" +
                                  std::to_string(i) + " is null");
  }
}

std::string Node::label() const {
  return std::string(kind()) + " '" + name_ + "'";
}

const Tensor& Node::forward() {
  // a throwing forward leaves the node Idle, never stale-Forwarded
  phase_ = Phase::Idle;
  for (const auto& p : preds_) {
    if (p->phase_ != Phase::Forwarded)
      fail_graph(label() + ": forward called before predecessor " + p->label() +
                 " was forwarded this cycle (predecessor is " + phase_str(p->phase_) + ")");
  }
  Tensor out = compute_();
  if (!out.defined()) fail_graph(label() + ": forward produced no output");
  out_ = std::move(out);
  d_out_ = Tensor::zeros(out_.shape());
  phase_ = Phase::Forwarded;
  CG_LOG_TRACE("forward  {} -> {}", label(), shape_str(out_.shape()));
  return out_;
}

void Node::backward() {
  if (phase_ != Phase::Forwarded)
    fail_graph(label() + ": backward called without a matching forward (node is " +
               phase_str(phase_) + ")");
  backprop_();
  phase_ = Phase::Backwarded;
  CG_LOG_TRACE("backward {}", label());
}

void Node::set_d_out(const Tensor& g) {
  if (phase_ != Phase::Forwarded)
    fail_graph(label() + ": cannot seed d_out, node is " + phase_str(phase_));
  if (!g.defined() || g.shape() != out_.shape())
    fail_shape(label() + ": d_out seed expected shape " + shape_str(out_.shape()) +
               ", got " + (g.defined() ? shape_str(g.shape()) : std::string("undefined")));
  d_out_ = g;
}

void Node::accumulate_into(Node& pred, const Tensor& g, double alpha) const {
  if (pred.phase_ != Phase::Forwarded)
    fail_graph(label() + ": cannot accumulate into " + pred.label() + " (predecessor is " +
               phase_str(pred.phase_) + "; backward must run in reverse topological order)");
  if (g.shape() != pred.d_out_.shape())
    fail_shape(label() + ": gradient for " + pred.label() + " expected shape " +
               shape_str(pred.d_out_.shape()) + ", got " + shape_str(g.shape()));
  axpy(pred.d_out_, alpha, g);
}

void Node::expect_shape(const char* role, const Tensor& t, const Shape& expected) const {
  if (!t.defined())
    fail_graph(label() + ": input '" + role + "' has no value");
  if (t.shape() != expected)
    fail_shape(label() + ": input '" + role + "' expected shape " + shape_str(expected) +
               ", got " + shape_str(t.shape()));
}

void Node::expect_rank(const char* role, const Tensor& t, std::size_t rank) const {
  if (!t.defined())
    fail_graph(label() + ": input '" + role + "' has no value");
  if (t.rank() != rank)
    fail_shape(label() + ": input '" + role + "' expected rank " + std::to_string(rank) +
               ", got shape " + shape_str(t.shape()));
}

// ===== Leaf =====

Leaf::Leaf(std::string name) : Node(std::move(name), {}) {}

Leaf::Leaf(std::string name, Tensor value) : Node(std::move(name), {}) {
  set_value(std::move(value));
}

void Leaf::set_value(Tensor value) {
  if (!value.defined()) throw std::invalid_argument(label() + ": set_value with undefined tensor");
  value_ = std::move(value);
  invalidate();
}

Tensor Leaf::compute_() {
  if (!value_.defined()) fail_graph(label() + ": forward called before a value was assigned");
  return value_;
}

} // namespace cg
