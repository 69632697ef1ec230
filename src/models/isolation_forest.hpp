#ifndef ISOLATION_FOREST_HPP
#define ISOLATION_FOREST_HPP

#include "base_model.hpp"
#include "features.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

struct IsolationNode {
  int feature_index = -1;   // Which feature from the vector to check
  double split_value = 0.0; // Values below go left
  std::unique_ptr<IsolationNode> left_child;
  std::unique_ptr<IsolationNode> right_child;

  bool is_leaf = false;
  size_t size = 0; // Training points that reached this node
};

class IsolationTree {
public:
  IsolationTree() = default;

  void build(const FeatureMatrix &data, size_t subsample_size,
             size_t max_depth, std::mt19937_64 &rng);

  // Depth at which the point is isolated, plus the expected remaining depth
  // of the leaf it lands in
  double path_length(const std::array<double, FEATURE_DIMENSIONS> &point) const;

private:
  std::unique_ptr<IsolationNode> build_node(const FeatureMatrix &data,
                                            std::vector<size_t> &indices,
                                            size_t depth, size_t max_depth,
                                            std::mt19937_64 &rng);

  std::unique_ptr<IsolationNode> root_;
};

struct IsolationForestParams {
  size_t num_trees = 100;
  size_t max_samples = 256;
  size_t build_threads = 1;
};

// Ensemble of randomized partitioning trees. The forest is a pure function
// of (data, seed): every tree draws from its own generator seeded up front,
// so the thread count never changes the result.
class IsolationForest : public IAnomalyModel {
public:
  IsolationForest(IsolationForestParams params, uint64_t seed);

  void fit(const FeatureMatrix &matrix) override;

  // 2^(-E[h(x)] / c(subsample_size))
  std::vector<double>
  anomaly_scores(const FeatureMatrix &matrix) const override;

  double average_path_length(
      const std::array<double, FEATURE_DIMENSIONS> &point) const;

  size_t subsample_size() const { return subsample_size_; }
  size_t tree_count() const { return trees_.size(); }

  // Expected path length of an unsuccessful BST search over n points
  static double expected_path_length(size_t n);

private:
  IsolationForestParams params_;
  uint64_t seed_;
  size_t subsample_size_ = 0;
  std::vector<IsolationTree> trees_;
};

#endif // ISOLATION_FOREST_HPP
