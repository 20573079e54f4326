#pragma once
#include <vector>
#include <string>
#include <cstddef>

namespace cg {

using Shape = std::vector<std::size_t>;

namespace detail {

// shape helpers
std::size_t numel(const Shape& shp);
std::string shape_str(const Shape& shp);   // "[2, 3]"; "[]" for 0-dim

} // namespace detail

// Dense row-major tensor of doubles: flattened values + shape.
// A default-constructed Tensor is undefined (nothing computed yet);
// Tensor::scalar() is the 0-dim tensor with a single value.
class Tensor {
public:
  Tensor() = default;
  Tensor(std::vector<double> value, Shape shape);

  static Tensor scalar(double v);
  static Tensor vector(std::vector<double> v);
  static Tensor matrix(std::size_t rows, std::size_t cols, std::vector<double> v);
  static Tensor zeros(const Shape& shape);
  static Tensor filled(const Shape& shape, double v);

  bool defined() const { return defined_; }
  bool is_scalar() const { return defined_ && shape_.empty(); }
  const Shape& shape() const { return shape_; }
  std::size_t rank() const { return shape_.size(); }
  std::size_t numel() const { return value_.size(); }

  // Read-only view of the flat buffer. Entries are written through
  // operator[] or the iterators, so numel() always matches the shape.
  const std::vector<double>& value() const { return value_; }
  double*       data()       { return value_.data(); }
  const double* data() const { return value_.data(); }
  double*       begin()       { return value_.data(); }
  double*       end()         { return value_.data() + value_.size(); }
  const double* begin() const { return value_.data(); }
  const double* end()   const { return value_.data() + value_.size(); }
  double  operator[](std::size_t i) const { return value_[i]; }
  double& operator[](std::size_t i)       { return value_[i]; }

  double item() const;                             // 0-dim only
  double at(std::size_t r, std::size_t c) const;   // rank-2 only

  std::string str() const;

private:
  std::vector<double> value_;
  Shape shape_;
  bool defined_ = false;
};

// ===== Tensor arithmetic =====
// No broadcasting: operands must have identical shapes, else ShapeError.
Tensor add(const Tensor& a, const Tensor& b);
Tensor sub(const Tensor& a, const Tensor& b);
Tensor mul(const Tensor& a, const Tensor& b);
Tensor scale(const Tensor& a, double s);
Tensor tanhv(const Tensor& a);                  // named tanhv to avoid clash with std::tanh
double sum(const Tensor& a);

// Linear algebra
double dot(const Tensor& a, const Tensor& b);         // [n]·[n]
Tensor matvec(const Tensor& W, const Tensor& x);      // [m,n]·[n]  -> [m]
Tensor matvec_t(const Tensor& W, const Tensor& y);    // [m,n]ᵀ·[m] -> [n]
Tensor outer(const Tensor& u, const Tensor& v);       // [m]⊗[n]    -> [m,n]

// dst += alpha * src (in place)
void axpy(Tensor& dst, double alpha, const Tensor& src);

bool all_finite(const Tensor& a);

} // namespace cg
