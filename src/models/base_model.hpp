#ifndef BASE_MODEL_HPP
#define BASE_MODEL_HPP

#include "features.hpp"

#include <vector>

// Abstract base class for unsupervised batch anomaly models. A model is
// fitted on one batch and only ever scores that same batch.
class IAnomalyModel {
public:
  virtual ~IAnomalyModel() = default;

  virtual void fit(const FeatureMatrix &matrix) = 0;

  // One score per row in (0, 1]; higher means more anomalous
  virtual std::vector<double>
  anomaly_scores(const FeatureMatrix &matrix) const = 0;

  // Helper method for the fit-then-score case
  virtual std::vector<double> fit_score(const FeatureMatrix &matrix) {
    fit(matrix);
    return anomaly_scores(matrix);
  }
};

#endif // BASE_MODEL_HPP
