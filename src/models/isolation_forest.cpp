#include "isolation_forest.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <numeric>
#include <thread>
#include <utility>

namespace {
constexpr double EULER_MASCHERONI = 0.5772156649;
// Feature ranges narrower than this cannot be split
constexpr double MIN_SPLIT_RANGE = 1e-12;
} // namespace

void IsolationTree::build(const FeatureMatrix &data, size_t subsample_size,
                          size_t max_depth, std::mt19937_64 &rng) {
  std::vector<size_t> indices(data.size());
  std::iota(indices.begin(), indices.end(), 0);

  // Partial Fisher-Yates: the first subsample_size entries are drawn
  // without replacement
  subsample_size = std::min(subsample_size, indices.size());
  for (size_t i = 0; i < subsample_size; i++) {
    std::uniform_int_distribution<size_t> pick(i, indices.size() - 1);
    std::swap(indices[i], indices[pick(rng)]);
  }
  indices.resize(subsample_size);

  root_ = build_node(data, indices, 0, max_depth, rng);
}

std::unique_ptr<IsolationNode>
IsolationTree::build_node(const FeatureMatrix &data,
                          std::vector<size_t> &indices, size_t depth,
                          size_t max_depth, std::mt19937_64 &rng) {
  auto node = std::make_unique<IsolationNode>();
  node->size = indices.size();

  if (depth >= max_depth || indices.size() <= 1) {
    node->is_leaf = true;
    return node;
  }

  // Draw features without replacement until one is not constant here
  std::array<int, FEATURE_DIMENSIONS> candidates{};
  std::iota(candidates.begin(), candidates.end(), 0);
  for (size_t k = 0; k < candidates.size(); k++) {
    std::uniform_int_distribution<size_t> pick(k, candidates.size() - 1);
    std::swap(candidates[k], candidates[pick(rng)]);
    int feature = candidates[k];

    double min_val = data[indices.front()][feature];
    double max_val = min_val;
    for (size_t idx : indices) {
      min_val = std::min(min_val, data[idx][feature]);
      max_val = std::max(max_val, data[idx][feature]);
    }
    if (max_val - min_val < MIN_SPLIT_RANGE)
      continue;

    std::uniform_real_distribution<double> threshold(min_val, max_val);
    double split = threshold(rng);
    if (split <= min_val)
      split = min_val + (max_val - min_val) / 2.0;

    std::vector<size_t> left, right;
    for (size_t idx : indices) {
      if (data[idx][feature] < split)
        left.push_back(idx);
      else
        right.push_back(idx);
    }

    node->feature_index = feature;
    node->split_value = split;
    node->left_child = build_node(data, left, depth + 1, max_depth, rng);
    node->right_child = build_node(data, right, depth + 1, max_depth, rng);
    return node;
  }

  // Every point in this node is identical
  node->is_leaf = true;
  return node;
}

double IsolationTree::path_length(
    const std::array<double, FEATURE_DIMENSIONS> &point) const {
  const IsolationNode *node = root_.get();
  size_t depth = 0;
  while (node && !node->is_leaf) {
    node = point[node->feature_index] < node->split_value
               ? node->left_child.get()
               : node->right_child.get();
    depth++;
  }
  if (!node)
    return static_cast<double>(depth);
  return static_cast<double>(depth) +
         IsolationForest::expected_path_length(node->size);
}

IsolationForest::IsolationForest(IsolationForestParams params, uint64_t seed)
    : params_(params), seed_(seed) {}

double IsolationForest::expected_path_length(size_t n) {
  if (n <= 1)
    return 0.0;
  if (n == 2)
    return 1.0;
  double nd = static_cast<double>(n);
  double harmonic = std::log(nd - 1.0) + EULER_MASCHERONI;
  return 2.0 * harmonic - 2.0 * (nd - 1.0) / nd;
}

void IsolationForest::fit(const FeatureMatrix &matrix) {
  trees_.clear();
  subsample_size_ = std::min(params_.max_samples, matrix.size());
  if (matrix.empty() || params_.num_trees == 0)
    return;

  size_t max_depth = static_cast<size_t>(
      std::ceil(std::log2(static_cast<double>(std::max<size_t>(
          subsample_size_, 2)))));

  // Seeds are fixed before any tree is built
  std::mt19937_64 master(seed_);
  std::vector<uint64_t> tree_seeds(params_.num_trees);
  for (auto &tree_seed : tree_seeds)
    tree_seed = master();

  trees_.resize(params_.num_trees);
  auto build_range = [&](size_t begin, size_t end) {
    for (size_t i = begin; i < end; i++) {
      std::mt19937_64 rng(tree_seeds[i]);
      trees_[i].build(matrix, subsample_size_, max_depth, rng);
    }
  };

  size_t thread_count =
      std::max<size_t>(1, std::min(params_.build_threads, params_.num_trees));
  if (thread_count == 1) {
    build_range(0, trees_.size());
  } else {
    std::vector<std::thread> workers;
    std::vector<std::exception_ptr> errors(thread_count);
    size_t chunk = (trees_.size() + thread_count - 1) / thread_count;
    workers.reserve(thread_count);
    try {
      for (size_t t = 0; t < thread_count; t++) {
        size_t begin = t * chunk;
        size_t end = std::min(trees_.size(), begin + chunk);
        workers.emplace_back([&, t, begin, end]() {
          try {
            build_range(begin, end);
          } catch (...) {
            errors[t] = std::current_exception();
          }
        });
      }
    } catch (...) {
      // Workers already started still reference this frame
      for (auto &worker : workers)
        worker.join();
      throw;
    }
    for (auto &worker : workers)
      worker.join();
    for (const auto &error : errors)
      if (error)
        std::rethrow_exception(error);
  }

  LOG(LogLevel::DEBUG, LogComponent::ML_FOREST,
      "Built " << trees_.size() << " trees on subsamples of "
               << subsample_size_ << " (depth limit " << max_depth << ", "
               << thread_count << " threads)");
}

double IsolationForest::average_path_length(
    const std::array<double, FEATURE_DIMENSIONS> &point) const {
  if (trees_.empty())
    return 0.0;
  double total = 0.0;
  for (const auto &tree : trees_)
    total += tree.path_length(point);
  return total / static_cast<double>(trees_.size());
}

std::vector<double>
IsolationForest::anomaly_scores(const FeatureMatrix &matrix) const {
  std::vector<double> scores;
  scores.reserve(matrix.size());

  double normalizer = expected_path_length(subsample_size_);
  for (const auto &row : matrix) {
    // A one-point batch has nothing to isolate against
    if (normalizer <= 0.0 || trees_.empty()) {
      scores.push_back(0.5);
      continue;
    }
    scores.push_back(std::pow(2.0, -average_path_length(row) / normalizer));
  }
  return scores;
}
