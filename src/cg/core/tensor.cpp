#include "cg/core/tensor.hpp"
#include "cg/core/errors.hpp"
#include <cmath>
#include <sstream>
#include <utility>

namespace cg {
using detail::shape_str;

namespace detail {

std::size_t numel(const Shape& shp) {
  std::size_t n = 1;
  for (auto d : shp) n *= d;
  return n;
}

std::string shape_str(const Shape& shp) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < shp.size(); ++i) {
    if (i) oss << ", ";
    oss << shp[i];
  }
  oss << "]";
  return oss.str();
}

} // namespace detail

static void require_same(const char* op, const Tensor& a, const Tensor& b) {
  if (!a.defined() || !b.defined())
    throw ShapeError(std::string(op) + ": undefined operand");
  if (a.shape() != b.shape())
    throw ShapeError(std::string(op) + ": shape mismatch " + shape_str(a.shape()) +
                     " vs " + shape_str(b.shape()));
}

static void require_rank(const char* op, const char* role, const Tensor& t, std::size_t r) {
  if (!t.defined() || t.rank() != r) {
    std::ostringstream oss;
    oss << op << ": " << role << " must have rank " << r << ", got "
        << (t.defined() ? shape_str(t.shape()) : std::string("undefined"));
    throw ShapeError(oss.str());
  }
}

Tensor::Tensor(std::vector<double> value, Shape shape)
  : value_(std::move(value)), shape_(std::move(shape)), defined_(true) {
  if (detail::numel(shape_) != value_.size())
    throw ShapeError("Tensor: value size " + std::to_string(value_.size()) +
                     " != numel(" + shape_str(shape_) + ")");
}

Tensor Tensor::scalar(double v) { return Tensor({v}, {}); }

Tensor Tensor::vector(std::vector<double> v) {
  const std::size_t n = v.size();
  return Tensor(std::move(v), {n});
}

Tensor Tensor::matrix(std::size_t rows, std::size_t cols, std::vector<double> v) {
  return Tensor(std::move(v), {rows, cols});
}

Tensor Tensor::zeros(const Shape& shape) { return filled(shape, 0.0); }

Tensor Tensor::filled(const Shape& shape, double v) {
  return Tensor(std::vector<double>(detail::numel(shape), v), shape);
}

double Tensor::item() const {
  if (!is_scalar()) throw ShapeError("item(): expected 0-dim tensor, got " +
                                     (defined_ ? shape_str(shape_) : std::string("undefined")));
  return value_[0];
}

double Tensor::at(std::size_t r, std::size_t c) const {
  require_rank("at()", "tensor", *this, 2);
  if (r >= shape_[0] || c >= shape_[1]) throw std::out_of_range("at(): index out of range");
  return value_[r * shape_[1] + c];
}

std::string Tensor::str() const {
  if (!defined_) return "Tensor(undefined)";
  std::ostringstream oss;
  oss << "Tensor(shape=" << shape_str(shape_) << ", value=[";
  for (std::size_t i = 0; i < value_.size(); ++i) {
    if (i) oss << ", ";
    oss << value_[i];
  }
  oss << "])";
  return oss.str();
}

// ===== elementwise =====

Tensor add(const Tensor& a, const Tensor& b) {
  require_same("add", a, b);
  Tensor out = a;
  for (std::size_t i = 0; i < out.numel(); ++i) out[i] += b[i];
  return out;
}

Tensor sub(const Tensor& a, const Tensor& b) {
  require_same("sub", a, b);
  Tensor out = a;
  for (std::size_t i = 0; i < out.numel(); ++i) out[i] -= b[i];
  return out;
}

Tensor mul(const Tensor& a, const Tensor& b) {
  require_same("mul", a, b);
  Tensor out = a;
  for (std::size_t i = 0; i < out.numel(); ++i) out[i] *= b[i];
  return out;
}

Tensor scale(const Tensor& a, double s) {
  if (!a.defined()) throw ShapeError("scale: undefined operand");
  Tensor out = a;
  for (auto& v : out) v *= s;
  return out;
}

Tensor tanhv(const Tensor& a) {
  if (!a.defined()) throw ShapeError("tanhv: undefined operand");
  Tensor out = a;
  for (auto& v : out) v = std::tanh(v);
  return out;
}

double sum(const Tensor& a) {
  if (!a.defined()) throw ShapeError("sum: undefined operand");
  double acc = 0.0;
  for (double v : a.value()) acc += v;
  return acc;
}

// ===== linear algebra =====

double dot(const Tensor& a, const Tensor& b) {
  require_rank("dot", "lhs", a, 1);
  require_same("dot", a, b);
  double acc = 0.0;
  for (std::size_t i = 0; i < a.numel(); ++i) acc += a[i] * b[i];
  return acc;
}

Tensor matvec(const Tensor& W, const Tensor& x) {
  require_rank("matvec", "matrix", W, 2);
  require_rank("matvec", "vector", x, 1);
  const std::size_t M = W.shape()[0], N = W.shape()[1];
  if (x.shape()[0] != N)
    throw ShapeError("matvec: expected vector " + shape_str({N}) + ", got " + shape_str(x.shape()));
  Tensor out = Tensor::zeros({M});
  const auto& w = W.value();
  for (std::size_t i = 0; i < M; ++i) {
    double acc = 0.0;
    for (std::size_t j = 0; j < N; ++j) acc += w[i*N + j] * x[j];
    out[i] = acc;
  }
  return out;
}

Tensor matvec_t(const Tensor& W, const Tensor& y) {
  require_rank("matvec_t", "matrix", W, 2);
  require_rank("matvec_t", "vector", y, 1);
  const std::size_t M = W.shape()[0], N = W.shape()[1];
  if (y.shape()[0] != M)
    throw ShapeError("matvec_t: expected vector " + shape_str({M}) + ", got " + shape_str(y.shape()));
  Tensor out = Tensor::zeros({N});
  const auto& w = W.value();
  for (std::size_t i = 0; i < M; ++i) {
    const double yi = y[i];
    for (std::size_t j = 0; j < N; ++j) out[j] += w[i*N + j] * yi;
  }
  return out;
}

Tensor outer(const Tensor& u, const Tensor& v) {
  require_rank("outer", "lhs", u, 1);
  require_rank("outer", "rhs", v, 1);
  const std::size_t M = u.numel(), N = v.numel();
  Tensor out = Tensor::zeros({M, N});
  for (std::size_t i = 0; i < M; ++i)
    for (std::size_t j = 0; j < N; ++j) out[i*N + j] = u[i] * v[j];
  return out;
}

void axpy(Tensor& dst, double alpha, const Tensor& src) {
  require_same("axpy", dst, src);
  for (std::size_t i = 0; i < dst.numel(); ++i) dst[i] += alpha * src[i];
}

bool all_finite(const Tensor& a) {
  for (double v : a.value()) if (!std::isfinite(v)) return false;
  return true;
}

} // namespace cg
