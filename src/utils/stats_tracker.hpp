#ifndef STATS_TRACKER_HPP
#define STATS_TRACKER_HPP

#include <array>
#include <cmath>
#include <cstddef>

// Welford accumulator over every column of a fixed-width row at once
template <size_t Width> class StatsTracker {
public:
  using Row = std::array<double, Width>;

  void update(const Row &row) {
    count_++;
    for (size_t i = 0; i < Width; i++) {
      double delta = row[i] - mean_[i];
      mean_[i] += delta / static_cast<double>(count_);
      // M2 accumulates squared distance from the running mean
      m2_[i] += delta * (row[i] - mean_[i]);
    }
  }

  size_t get_count() const { return count_; }

  Row get_mean() const { return mean_; }

  // M2 / n
  Row get_population_stddev() const {
    Row out{};
    if (count_ < 1)
      return out;
    for (size_t i = 0; i < Width; i++)
      out[i] = std::sqrt(m2_[i] / static_cast<double>(count_));
    return out;
  }

  // M2 / (n - 1); needs at least two rows to mean anything
  Row get_sample_stddev() const {
    Row out{};
    if (count_ < 2)
      return out;
    for (size_t i = 0; i < Width; i++)
      out[i] = std::sqrt(m2_[i] / static_cast<double>(count_ - 1));
    return out;
  }

private:
  size_t count_ = 0;
  Row mean_{};
  Row m2_{};
};

#endif // STATS_TRACKER_HPP
