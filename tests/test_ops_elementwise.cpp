// tests/test_ops_elementwise.cpp
#include "test_framework.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

#include "cg/core/node.hpp"
#include "cg/core/errors.hpp"
#include "cg/ops/activations.hpp"
#include "cg/ops/elementwise.hpp"
#include "cg/ops/loss.hpp"
#include "cg/graph/graph.hpp"

using cg::Tensor;
using cg::Leaf;
using cg::Graph;

TEST("ops/elementwise/sum_forward_backward") {
    auto a = std::make_shared<Leaf>("a", Tensor::vector({1, 2, 3}));
    auto b = std::make_shared<Leaf>("b", Tensor::vector({10, 20, 30}));
    auto s = std::make_shared<cg::ElementwiseSum>("s", a, b);

    a->forward(); b->forward();
    ASSERT_TENSOR_NEAR(s->forward(), std::vector<double>({11, 22, 33}), 0.0);
    s->set_d_out(Tensor::vector({0.5, -1, 2}));
    s->backward();
    ASSERT_TENSOR_NEAR(a->d_out(), std::vector<double>({0.5, -1, 2}), 0.0);
    ASSERT_TENSOR_NEAR(b->d_out(), std::vector<double>({0.5, -1, 2}), 0.0);
}

TEST("ops/elementwise/sum_of_scalars_is_scalar") {
    auto a = std::make_shared<Leaf>("a", Tensor::scalar(1.5));
    auto b = std::make_shared<Leaf>("b", Tensor::scalar(-4.0));
    auto s = std::make_shared<cg::ElementwiseSum>("s", a, b);
    Graph g(s);
    ASSERT_NEAR(g.evaluate(), -2.5, 0.0);
    ASSERT_NEAR(a->d_out().item(), 1.0, 0.0);
    ASSERT_NEAR(b->d_out().item(), 1.0, 0.0);
}

TEST("ops/elementwise/sum_rejects_broadcast") {
    auto a = std::make_shared<Leaf>("a", Tensor::vector({1, 2, 3}));
    auto b = std::make_shared<Leaf>("b", Tensor::scalar(1.0));
    auto s = std::make_shared<cg::ElementwiseSum>("s", a, b);
    Graph g(s);
    ASSERT_THROWS(g.forward(), cg::ShapeError);
}

TEST("ops/activations/tanh_forward_backward") {
    std::vector<double> xv = {-1.2, 0.0, 0.2, 1.1};
    auto a = std::make_shared<Leaf>("a", Tensor::vector(xv));
    auto t = std::make_shared<cg::Tanh>("t", a);

    a->forward();
    const Tensor& y = t->forward();
    for (std::size_t i = 0; i < xv.size(); ++i) ASSERT_NEAR(y[i], std::tanh(xv[i]), 1e-15);

    t->set_d_out(Tensor::vector({1, 1, 1, 1}));
    t->backward();
    for (std::size_t i = 0; i < xv.size(); ++i) {
        const double th = std::tanh(xv[i]);
        ASSERT_NEAR(a->d_out()[i], 1.0 - th * th, 1e-12);
    }
    ASSERT_NEAR(a->d_out()[1], 1.0, 1e-15);
}

TEST("ops/activations/tanh_keeps_matrix_shape") {
    auto a = std::make_shared<Leaf>("a", Tensor::matrix(2, 2, {0.1, -0.2, 0.3, -0.4}));
    auto t = std::make_shared<cg::Tanh>("t", a);
    a->forward();
    ASSERT_TRUE(t->forward().shape() == cg::Shape({2, 2}));
    ASSERT_TRUE(t->d_out().shape() == cg::Shape({2, 2}));
}

TEST("ops/activations/tanh_propagates_nan") {
    // numeric problems are not trapped; NaN flows through both passes
    auto a = std::make_shared<Leaf>("a", Tensor::vector({std::numeric_limits<double>::quiet_NaN(), 0.5}));
    auto z = std::make_shared<Leaf>("z", Tensor::vector({0.0, 0.0}));
    auto t = std::make_shared<cg::Tanh>("t", a);
    auto d = std::make_shared<cg::SquaredL2Distance>("d", t, z);
    Graph g(d);
    const double v = g.evaluate();
    ASSERT_TRUE(std::isnan(v));
    ASSERT_TRUE(std::isnan(a->d_out()[0]));
}
