#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "cg/all.hpp"

namespace py = pybind11;

void bind_nodes(py::module_ &m) {
  // Nodes are always held by shared_ptr; predecessors keep their inputs alive.
  py::class_<cg::Node, std::shared_ptr<cg::Node>> node(m, "Node");
  py::enum_<cg::Node::Phase>(node, "Phase")
    .value("Idle", cg::Node::Phase::Idle)
    .value("Forwarded", cg::Node::Phase::Forwarded)
    .value("Backwarded", cg::Node::Phase::Backwarded);

  node
    .def("forward", &cg::Node::forward, py::return_value_policy::copy)
    .def("backward", &cg::Node::backward)
    .def("invalidate", &cg::Node::invalidate)
    .def_property_readonly("name", &cg::Node::name)
    .def_property_readonly("kind", [](const cg::Node& n){ return std::string(n.kind()); })
    .def_property_readonly("predecessors", &cg::Node::predecessors)
    .def_property_readonly("phase", &cg::Node::phase)
    .def("has_out", &cg::Node::has_out)
    .def_property_readonly("out", [](const cg::Node& n){ return n.out(); })
    .def_property_readonly("d_out", [](const cg::Node& n){ return n.d_out(); })
    .def("set_d_out", &cg::Node::set_d_out, py::arg("g"))
    .def("__repr__", [](const cg::Node& n){ return "<" + n.label() + ">"; });

  py::class_<cg::Leaf, cg::Node, std::shared_ptr<cg::Leaf>>(m, "Leaf")
    .def(py::init<std::string>(), py::arg("name"))
    .def(py::init<std::string, cg::Tensor>(), py::arg("name"), py::arg("value"))
    .def_property("value", [](const cg::Leaf& l){ return l.value(); }, &cg::Leaf::set_value)
    .def("set_value", &cg::Leaf::set_value, py::arg("value"))
    .def("has_value", &cg::Leaf::has_value);

  py::class_<cg::VectorScalarAffine, cg::Node, std::shared_ptr<cg::VectorScalarAffine>>(m, "VectorScalarAffine")
    .def(py::init<std::string, cg::NodePtr, cg::NodePtr, cg::NodePtr>(),
         py::arg("name"), py::arg("x"), py::arg("w"), py::arg("b"));

  py::class_<cg::Affine, cg::Node, std::shared_ptr<cg::Affine>>(m, "Affine")
    .def(py::init<std::string, cg::NodePtr, cg::NodePtr, cg::NodePtr>(),
         py::arg("name"), py::arg("W"), py::arg("x"), py::arg("b"));

  py::class_<cg::SquaredL2Distance, cg::Node, std::shared_ptr<cg::SquaredL2Distance>>(m, "SquaredL2Distance")
    .def(py::init<std::string, cg::NodePtr, cg::NodePtr>(), py::arg("name"), py::arg("a"), py::arg("b"));

  py::class_<cg::L2NormPenalty, cg::Node, std::shared_ptr<cg::L2NormPenalty>>(m, "L2NormPenalty")
    .def(py::init<std::string, double, cg::NodePtr>(), py::arg("name"), py::arg("l2_reg"), py::arg("w"))
    .def_property_readonly("l2_reg", &cg::L2NormPenalty::l2_reg);

  py::class_<cg::ElementwiseSum, cg::Node, std::shared_ptr<cg::ElementwiseSum>>(m, "ElementwiseSum")
    .def(py::init<std::string, cg::NodePtr, cg::NodePtr>(), py::arg("name"), py::arg("a"), py::arg("b"));

  py::class_<cg::Tanh, cg::Node, std::shared_ptr<cg::Tanh>>(m, "Tanh")
    .def(py::init<std::string, cg::NodePtr>(), py::arg("name"), py::arg("a"));

  // --- Graph driver ---
  m.def("sort_topological", &cg::sort_topological, py::arg("sinks"));

  py::class_<cg::Graph>(m, "Graph")
    .def(py::init<cg::NodePtr>(), py::arg("output"))
    .def(py::init<cg::NodePtr, std::vector<cg::NodePtr>>(), py::arg("output"), py::arg("order"))
    .def("forward", &cg::Graph::forward, py::return_value_policy::copy)
    .def("backward", py::overload_cast<>(&cg::Graph::backward))
    .def("backward", py::overload_cast<const std::vector<cg::NodePtr>&>(&cg::Graph::backward),
         py::arg("backward_order"))
    .def("evaluate", &cg::Graph::evaluate)
    .def_property_readonly("output", &cg::Graph::output)
    .def_property_readonly("nodes", &cg::Graph::nodes)
    .def("find", &cg::Graph::find, py::arg("name"));

  py::class_<cg::GradientResult>(m, "GradientResult")
    .def_readonly("objective", &cg::GradientResult::objective)
    .def_readonly("gradients", &cg::GradientResult::gradients);

  py::class_<cg::GraphFunction>(m, "GraphFunction")
    .def(py::init<std::vector<cg::LeafPtr>, std::vector<cg::LeafPtr>, std::vector<cg::LeafPtr>,
                  cg::NodePtr, cg::NodePtr>(),
         py::arg("inputs"), py::arg("outcomes"), py::arg("parameters"),
         py::arg("prediction"), py::arg("objective"))
    .def("set_parameters", &cg::GraphFunction::set_parameters, py::arg("values"))
    .def("parameters", &cg::GraphFunction::parameters)
    .def("objective", &cg::GraphFunction::objective, py::arg("inputs"), py::arg("outcomes"))
    .def("gradients", &cg::GraphFunction::gradients, py::arg("inputs"), py::arg("outcomes"))
    .def("prediction", &cg::GraphFunction::prediction, py::arg("inputs"))
    .def_property_readonly("input_leaves", &cg::GraphFunction::input_leaves)
    .def_property_readonly("outcome_leaves", &cg::GraphFunction::outcome_leaves)
    .def_property_readonly("parameter_leaves", &cg::GraphFunction::parameter_leaves);
}
