// tests/test_graph.cpp
#include "test_framework.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

#include "cg/core/config.hpp"
#include "cg/core/errors.hpp"
#include "cg/core/node.hpp"
#include "cg/ops/activations.hpp"
#include "cg/ops/elementwise.hpp"
#include "cg/ops/linalg.hpp"
#include "cg/ops/loss.hpp"
#include "cg/graph/graph.hpp"

using cg::Tensor;
using cg::Leaf;
using cg::Graph;
using cg::NodePtr;
using cg::GraphError;

static std::size_t index_of(const std::vector<NodePtr>& order, const NodePtr& n) {
    return static_cast<std::size_t>(std::find(order.begin(), order.end(), n) - order.begin());
}

namespace {

// Small MLP-shaped graph used by several tests:
//   h   = tanh(W·x + b1)
//   p   = dot(h, w2) + b2
//   obj = (p - y)^2 + lam * |W|^2
struct Mlp {
    std::shared_ptr<Leaf> W, x, b1, w2, b2, y;
    NodePtr aff, h, p, loss, pen, obj;

    Mlp() {
        W  = std::make_shared<Leaf>("W",  Tensor::matrix(2, 3, {0.1, -0.2, 0.3, 0.4, 0.5, -0.6}));
        x  = std::make_shared<Leaf>("x",  Tensor::vector({1.0, -1.0, 0.5}));
        b1 = std::make_shared<Leaf>("b1", Tensor::vector({0.05, -0.05}));
        w2 = std::make_shared<Leaf>("w2", Tensor::vector({0.7, -1.3}));
        b2 = std::make_shared<Leaf>("b2", Tensor::scalar(0.2));
        y  = std::make_shared<Leaf>("y",  Tensor::scalar(0.5));
        aff  = std::make_shared<cg::Affine>("aff", W, x, b1);
        h    = std::make_shared<cg::Tanh>("h", aff);
        p    = std::make_shared<cg::VectorScalarAffine>("p", h, w2, b2);
        loss = std::make_shared<cg::SquaredL2Distance>("loss", p, y);
        pen  = std::make_shared<cg::L2NormPenalty>("pen", 0.1, W);
        obj  = std::make_shared<cg::ElementwiseSum>("obj", loss, pen);
    }
};

} // anon

TEST("graph/topological_order_parents_first") {
    Mlp m;
    auto order = cg::sort_topological({m.obj});
    ASSERT_EQ(order.size(), 12u);
    ASSERT_TRUE(order.back() == m.obj);
    for (std::size_t i = 0; i < order.size(); ++i) {
        for (const auto& p : order[i]->predecessors()) ASSERT_TRUE(index_of(order, p) < i);
    }
    // W feeds two consumers but appears once
    ASSERT_EQ(std::count(order.begin(), order.end(), NodePtr(m.W)), 1);
    // parents-first DFS follows predecessor-list order
    ASSERT_TRUE(order[0] == m.W);
    ASSERT_TRUE(order[1] == m.x);
    ASSERT_TRUE(order[2] == m.b1);
}

TEST("graph/sort_multiple_sinks") {
    Mlp m;
    auto order = cg::sort_topological({m.p, m.pen});
    ASSERT_EQ(order.size(), 9u);   // W x b1 aff h w2 b2 p pen
    ASSERT_TRUE(order.back() == m.pen);
    ASSERT_TRUE(index_of(order, m.p) < index_of(order, m.pen));
    ASSERT_THROWS(cg::sort_topological({m.p, NodePtr()}), std::invalid_argument);
}

TEST("graph/diamond_accumulates_both_paths") {
    // x feeds r = |x|^2 and d = |x - t|^2 ; total = r + d
    auto x = std::make_shared<Leaf>("x", Tensor::vector({1.0, -2.0}));
    auto t = std::make_shared<Leaf>("t", Tensor::vector({0.5, 0.5}));
    auto r = std::make_shared<cg::L2NormPenalty>("r", 1.0, x);
    auto d = std::make_shared<cg::SquaredL2Distance>("d", x, t);
    auto total = std::make_shared<cg::ElementwiseSum>("total", r, d);

    // contributions of each consumer on its own
    Graph gr(r);
    gr.evaluate();
    const Tensor via_r = x->d_out();
    Graph gd(d);
    gd.evaluate();
    const Tensor via_d = x->d_out();

    Graph g(total);
    ASSERT_NEAR(g.evaluate(), 5.0 + (0.25 + 6.25), 1e-12);
    ASSERT_TENSOR_NEAR(x->d_out(), std::vector<double>({via_r[0] + via_d[0], via_r[1] + via_d[1]}), 1e-12);
    // 2x + 2(x - t)
    ASSERT_TENSOR_NEAR(x->d_out(), std::vector<double>({3.0, -9.0}), 1e-12);
    ASSERT_NEAR(r->d_out().item(), 1.0, 0.0);
    ASSERT_NEAR(d->d_out().item(), 1.0, 0.0);
}

TEST("graph/d_out_shape_matches_out_every_cycle") {
    Mlp m;
    Graph g(m.obj);
    for (int cycle = 0; cycle < 3; ++cycle) {
        m.x->set_value(Tensor::vector({0.1 * cycle, 1.0, -0.5}));
        g.forward();
        for (const auto& n : g.nodes()) {
            ASSERT_TRUE(n->d_out().shape() == n->out().shape());
            for (double v : n->d_out().value()) ASSERT_NEAR(v, 0.0, 0.0);
        }
        g.backward();
        for (const auto& n : g.nodes()) ASSERT_TRUE(n->d_out().shape() == n->out().shape());
    }
}

TEST("graph/idempotent_rerun") {
    Mlp m;
    Graph g(m.obj);
    const double v1 = g.evaluate();
    std::vector<Tensor> outs1, grads1;
    for (const auto& n : g.nodes()) { outs1.push_back(n->out()); grads1.push_back(n->d_out()); }

    const double v2 = g.evaluate();
    ASSERT_NEAR(v1, v2, 0.0);
    for (std::size_t i = 0; i < g.nodes().size(); ++i) {
        ASSERT_TENSOR_NEAR(g.nodes()[i]->out(), outs1[i].value(), 0.0);
        ASSERT_TENSOR_NEAR(g.nodes()[i]->d_out(), grads1[i].value(), 0.0);
    }
}

TEST("graph/forward_order_invariance") {
    Mlp m;
    Graph g1(m.obj);
    g1.evaluate();
    std::vector<Tensor> outs, grads;
    for (const auto& n : g1.nodes()) { outs.push_back(n->out()); grads.push_back(n->d_out()); }

    // another valid order: all leaves first (reversed), penalty before the loss branch
    std::vector<NodePtr> alt = {m.y, m.b2, m.w2, m.b1, m.x, m.W, m.pen, m.aff, m.h, m.p, m.loss, m.obj};
    Graph g2(m.obj, alt);
    ASSERT_NEAR(g2.evaluate(), m.obj->out().item(), 0.0);
    for (std::size_t i = 0; i < g1.nodes().size(); ++i) {
        ASSERT_TENSOR_NEAR(g1.nodes()[i]->out(), outs[i].value(), 1e-15);
        ASSERT_TENSOR_NEAR(g1.nodes()[i]->d_out(), grads[i].value(), 1e-15);
    }
}

TEST("graph/backward_order_invariance") {
    Mlp m;
    Graph g(m.obj);
    g.evaluate();
    std::vector<Tensor> grads;
    for (const auto& n : g.nodes()) grads.push_back(n->d_out());

    // successors before predecessors, but not the exact reverse of the forward order
    std::vector<NodePtr> rev = {m.obj, m.pen, m.loss, m.y, m.p, m.b2, m.w2, m.h, m.aff, m.W, m.b1, m.x};
    g.forward();
    g.backward(rev);
    for (std::size_t i = 0; i < g.nodes().size(); ++i)
        ASSERT_TENSOR_NEAR(g.nodes()[i]->d_out(), grads[i].value(), 1e-15);
}

TEST("graph/invalid_explicit_orders_rejected") {
    Mlp m;
    // successor before predecessor
    std::vector<NodePtr> bad = {m.W, m.x, m.aff, m.b1, m.h, m.w2, m.b2, m.p, m.y, m.loss, m.pen, m.obj};
    ASSERT_THROWS(Graph(m.obj, bad), GraphError);
    // missing node
    std::vector<NodePtr> missing = {m.W, m.x, m.b1, m.aff, m.h, m.w2, m.b2, m.p, m.y, m.loss, m.obj};
    ASSERT_THROWS(Graph(m.obj, missing), GraphError);
    // duplicate node
    std::vector<NodePtr> dup = {m.W, m.W, m.x, m.b1, m.aff, m.h, m.w2, m.b2, m.p, m.y, m.loss, m.pen, m.obj};
    ASSERT_THROWS(Graph(m.obj, dup), GraphError);
    // node outside the output's ancestry
    auto stray = std::make_shared<Leaf>("stray", Tensor::scalar(0));
    std::vector<NodePtr> extra = {m.W, m.x, m.b1, m.aff, m.h, m.w2, m.b2, m.p, m.y, m.loss, m.pen, m.obj, stray};
    ASSERT_THROWS(Graph(m.obj, extra), GraphError);

    Graph g(m.obj);
    g.forward();
    // a predecessor before its successor in a backward order
    std::vector<NodePtr> bad_rev = {m.obj, m.pen, m.loss, m.y, m.p, m.b2, m.w2, m.aff, m.h, m.W, m.b1, m.x};
    ASSERT_THROWS(g.backward(bad_rev), GraphError);
    // rejected orders leave the cycle intact
    g.backward();
    ASSERT_TRUE(m.W->phase() == cg::Node::Phase::Backwarded);
}

TEST("graph/seeding_requires_scalar_output") {
    Mlp m;
    Graph g(m.h);                   // [2]-shaped output
    ASSERT_EQ(g.forward().numel(), 2u);
    ASSERT_THROWS(g.backward(), GraphError);

    Graph g2(m.obj);
    ASSERT_THROWS(g2.backward(), GraphError);   // not forwarded yet
    g2.forward();
    g2.backward();
    ASSERT_THROWS(g2.backward(), GraphError);   // already differentiated this cycle
}

TEST("graph/evaluate_matches_hand_computation") {
    Mlp m;
    Graph g(m.obj);
    const double v = g.evaluate();

    const double a0 = 0.1 * 1.0 - 0.2 * -1.0 + 0.3 * 0.5 + 0.05;
    const double a1 = 0.4 * 1.0 + 0.5 * -1.0 - 0.6 * 0.5 - 0.05;
    const double h0 = std::tanh(a0), h1 = std::tanh(a1);
    const double p = 0.7 * h0 - 1.3 * h1 + 0.2;
    const double pen = 0.1 * (0.01 + 0.04 + 0.09 + 0.16 + 0.25 + 0.36);
    ASSERT_NEAR(v, (p - 0.5) * (p - 0.5) + pen, 1e-12);

    // d obj / d b1 = 2(p - y) * w2 * (1 - h^2)
    const double dp = 2.0 * (p - 0.5);
    ASSERT_TENSOR_NEAR(m.b1->d_out(), std::vector<double>({dp * 0.7 * (1 - h0 * h0), dp * -1.3 * (1 - h1 * h1)}), 1e-12);
    ASSERT_NEAR(m.b2->d_out().item(), dp, 1e-12);
    ASSERT_NEAR(m.y->d_out().item(), -dp, 1e-12);
}

TEST("graph/find_by_name") {
    Mlp m;
    Graph g(m.obj);
    ASSERT_TRUE(g.find("aff") == m.aff);
    ASSERT_TRUE(g.find("nope") == nullptr);
    ASSERT_TRUE(g.output() == m.obj);
}

TEST("graph/finite_check_only_observes") {
    cg::config::set_check_finite(true);
    auto a = std::make_shared<Leaf>("a", Tensor::vector({std::numeric_limits<double>::infinity(), 1.0}));
    auto b = std::make_shared<Leaf>("b", Tensor::vector({0.0, 0.0}));
    auto d = std::make_shared<cg::SquaredL2Distance>("d", a, b);
    Graph g(d);
    const double v = g.evaluate();
    cg::config::set_check_finite(false);
    ASSERT_TRUE(std::isinf(v));
    ASSERT_TRUE(std::isinf(a->d_out()[0]));
}

TEST("graph/out_of_order_in_later_cycle_detected") {
    auto a = std::make_shared<Leaf>("a", Tensor::vector({1, 2}));
    auto b = std::make_shared<Leaf>("b", Tensor::vector({3, 4}));
    auto d = std::make_shared<cg::SquaredL2Distance>("d", a, b);
    Graph g(d);
    g.evaluate();
    // after a full cycle the leaves are stale until forwarded again
    ASSERT_THROWS(d->forward(), GraphError);
}

TEST("graph/reassigned_leaf_must_be_forwarded_again") {
    auto a = std::make_shared<Leaf>("a", Tensor::vector({1, 2}));
    auto b = std::make_shared<Leaf>("b", Tensor::vector({0, 0}));
    auto d = std::make_shared<cg::SquaredL2Distance>("d", a, b);
    Graph g(d);
    ASSERT_NEAR(g.forward().item(), 5.0, 0.0);

    // a new value makes the leaf stale; d may not read the old out
    a->set_value(Tensor::vector({10, 10}));
    ASSERT_TRUE(a->phase() == cg::Node::Phase::Idle);
    ASSERT_THROWS(d->forward(), GraphError);
    ASSERT_NEAR(g.forward().item(), 200.0, 0.0);
}

TEST("graph/failed_forward_blocks_backward") {
    auto W = std::make_shared<Leaf>("W", Tensor::matrix(1, 2, {1, 2}));
    auto x = std::make_shared<Leaf>("x", Tensor::vector({1, 1}));
    auto b = std::make_shared<Leaf>("b", Tensor::vector({0}));
    auto y = std::make_shared<Leaf>("y", Tensor::vector({0}));
    auto a = std::make_shared<cg::Affine>("a", W, x, b);
    auto d = std::make_shared<cg::SquaredL2Distance>("d", a, y);
    Graph g(d);
    ASSERT_NEAR(g.forward().item(), 9.0, 0.0);      // forward-only cycle

    x->set_value(Tensor::vector({1, 1, 1}));
    ASSERT_THROWS(g.forward(), cg::ShapeError);
    ASSERT_TRUE(a->phase() == cg::Node::Phase::Idle);
    ASSERT_TRUE(d->phase() == cg::Node::Phase::Idle);

    // no partial backprop through the stale downstream nodes
    ASSERT_THROWS(g.backward(), GraphError);
    ASSERT_TENSOR_NEAR(y->d_out(), std::vector<double>({0}), 0.0);
    ASSERT_NEAR(d->d_out().item(), 0.0, 0.0);

    x->set_value(Tensor::vector({1, 1}));
    ASSERT_NEAR(g.evaluate(), 9.0, 0.0);
    ASSERT_TENSOR_NEAR(W->d_out(), std::vector<double>({6, 6}), 0.0);
}
