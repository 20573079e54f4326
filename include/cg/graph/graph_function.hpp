#pragma once
#include <map>
#include <string>
#include <vector>

#include "cg/core/node.hpp"
#include "cg/graph/graph.hpp"

namespace cg {

using TensorMap = std::map<std::string, Tensor>;

struct GradientResult {
  double objective = 0.0;
  TensorMap gradients;   // parameter name -> d(objective)/d(parameter)
};

// A wired graph packaged for repeated evaluation: named input, outcome and
// parameter leaves, a prediction node and a scalar objective node.
// Leaf names must be unique across the three groups.
class GraphFunction {
public:
  GraphFunction(std::vector<LeafPtr> inputs,
                std::vector<LeafPtr> outcomes,
                std::vector<LeafPtr> parameters,
                NodePtr prediction,
                NodePtr objective);

  // Assigns the named parameters; names not given keep their value.
  // All-or-nothing: an unknown name or undefined value changes no leaf.
  void set_parameters(const TensorMap& values);
  TensorMap parameters() const;

  // Forward pass of the objective graph only. The objective must be
  // 0-dim, else GraphError.
  double objective(const TensorMap& inputs, const TensorMap& outcomes);
  // Forward + backward of the objective graph.
  GradientResult gradients(const TensorMap& inputs, const TensorMap& outcomes);
  // Forward pass of the prediction graph; outcomes are not needed.
  Tensor prediction(const TensorMap& inputs);

  const std::vector<LeafPtr>& input_leaves() const     { return inputs_; }
  const std::vector<LeafPtr>& outcome_leaves() const   { return outcomes_; }
  const std::vector<LeafPtr>& parameter_leaves() const { return parameters_; }
  Graph& objective_graph()  { return objective_graph_; }
  Graph& prediction_graph() { return prediction_graph_; }

private:
  const Tensor& forward_objective_();
  void assign_inputs_(const TensorMap& inputs);
  void assign_outcomes_(const TensorMap& outcomes);

  std::vector<LeafPtr> inputs_, outcomes_, parameters_;
  Graph objective_graph_;
  Graph prediction_graph_;
};

} // namespace cg
