// cgraph.cpp: pybind11 module `cgraph` with tensors, config, logging,
// error types and gradient checks. Node and graph classes live in nodes.cpp.
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "cg/all.hpp"

namespace py = pybind11;

// implemented in bindings/nodes.cpp
void bind_nodes(py::module_ &m);

#ifndef CG_BINDINGS_VERSION
#define CG_BINDINGS_VERSION "0.1.0"
#endif

namespace {

using DArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

// Nested lists, NumPy arrays and plain floats all go through NumPy.
cg::Tensor tensor_from_array(DArray arr) {
  py::buffer_info info = arr.request();
  const double* p = static_cast<const double*>(info.ptr);
  std::vector<double> data(p, p + info.size);
  cg::Shape shape(info.shape.begin(), info.shape.end());
  return cg::Tensor(std::move(data), std::move(shape));
}

py::array_t<double> tensor_to_numpy(const cg::Tensor& t) {
  if (!t.defined()) throw std::invalid_argument("tensor is undefined");
  std::vector<py::ssize_t> shape(t.shape().begin(), t.shape().end());
  py::array_t<double> out(shape);
  std::copy(t.value().begin(), t.value().end(), out.mutable_data());
  return out;
}

} // anon

PYBIND11_MODULE(cgraph, m) {
  m.doc() = "Reverse-mode computation graphs over dense double tensors";
  m.attr("__version__") = CG_BINDINGS_VERSION;

  py::register_exception<cg::GraphError>(m, "GraphError");
  py::register_exception<cg::ShapeError>(m, "ShapeError", PyExc_ValueError);

  // --- Tensor ---
  py::class_<cg::Tensor>(m, "Tensor")
    .def(py::init<>())
    .def(py::init(&tensor_from_array), py::arg("data"))
    .def(py::init<std::vector<double>, cg::Shape>(), py::arg("value"), py::arg("shape"))
    .def_static("scalar", &cg::Tensor::scalar, py::arg("v"))
    .def_static("zeros", &cg::Tensor::zeros, py::arg("shape"))
    .def_static("filled", &cg::Tensor::filled, py::arg("shape"), py::arg("v"))
    .def("defined", &cg::Tensor::defined)
    .def("is_scalar", &cg::Tensor::is_scalar)
    .def_property_readonly("shape", [](const cg::Tensor& t){ return t.shape(); })
    .def_property_readonly("rank", &cg::Tensor::rank)
    .def("numel", &cg::Tensor::numel)
    .def("value", [](const cg::Tensor& t){ return t.value(); })
    .def("item", &cg::Tensor::item)
    .def("numpy", &tensor_to_numpy)
    .def("__len__", &cg::Tensor::numel)
    .def("__repr__", &cg::Tensor::str);

  py::implicitly_convertible<py::array, cg::Tensor>();
  py::implicitly_convertible<py::list, cg::Tensor>();
  py::implicitly_convertible<py::float_, cg::Tensor>();

  bind_nodes(m);

  // --- Gradient checks ---
  py::class_<cg::GradCheckResult>(m, "GradCheckResult")
    .def_readonly("max_rel_error", &cg::GradCheckResult::max_rel_error)
    .def_readonly("worst_node", &cg::GradCheckResult::worst_node)
    .def_readonly("worst_index", &cg::GradCheckResult::worst_index)
    .def_readonly("entries_checked", &cg::GradCheckResult::entries_checked)
    .def("passed", &cg::GradCheckResult::passed, py::arg("tol"))
    .def("__repr__", [](const cg::GradCheckResult& r){
      return "<GradCheckResult max_rel_error=" + std::to_string(r.max_rel_error) +
             " at " + r.worst_node + "[" + std::to_string(r.worst_index) + "], " +
             std::to_string(r.entries_checked) + " entries>";
    });

  m.def("relative_error", py::overload_cast<double, double>(&cg::relative_error),
        py::arg("a"), py::arg("b"));
  m.def("check_node_backward",
        [](const cg::NodePtr& node, const cg::TensorMap& values, py::object delta) {
          const double d = delta.is_none() ? cg::config::gradcheck_delta() : delta.cast<double>();
          return cg::check_node_backward(node, values, d);
        },
        py::arg("node"), py::arg("leaf_values"), py::arg("delta") = py::none());
  m.def("check_graph_function",
        [](cg::GraphFunction& fn, const cg::TensorMap& inputs, const cg::TensorMap& outcomes,
           const cg::TensorMap& parameters, py::object delta) {
          const double d = delta.is_none() ? cg::config::gradcheck_delta() : delta.cast<double>();
          return cg::check_graph_function(fn, inputs, outcomes, parameters, d);
        },
        py::arg("fn"), py::arg("inputs"), py::arg("outcomes"), py::arg("parameters"),
        py::arg("delta") = py::none());

  // --- Config / logging ---
  m.def("set_check_finite", &cg::config::set_check_finite, py::arg("on"),
        "Warn about non-finite node outputs after each forward pass");
  m.def("check_finite_enabled", &cg::config::check_finite_enabled);
  m.def("set_gradcheck_delta", &cg::config::set_gradcheck_delta, py::arg("delta"));
  m.def("set_gradcheck_seed", &cg::config::set_gradcheck_seed, py::arg("seed"));
  m.def("set_log_level", [](const std::string& name){ cg::log::set_level(cg::log::parse_level(name)); },
        py::arg("level"), "trace|debug|info|warn|error|critical|off");
  m.def("log_level", [](){
    const auto n = spdlog::level::to_string_view(cg::log::level());
    return std::string(n.data(), n.size());
  });
}
