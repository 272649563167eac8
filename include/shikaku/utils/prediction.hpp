#ifndef SHIKAKU_PREDICTION_HPP
#define SHIKAKU_PREDICTION_HPP

#include "shikaku/utils/label_set.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <cstddef>

namespace shikaku {

using ProbabilityVector = std::vector<float>;

struct PredictionResult {
    std::string breed;
    double confidence;  // percent, 2 decimals
};

struct TopKResult {
    std::vector<PredictionResult> predictions;
    int top_class_index = -1;

    bool empty() const { return predictions.empty(); }
    const PredictionResult& primary() const { return predictions.front(); }
};

// Percentage rounded to 2 decimals.
double to_confidence(float probability);

// The k highest probabilities, descending, ties by ascending index.
// Returns min(k, labels.size()) entries.
TopKResult top_k(const ProbabilityVector& probabilities, const LabelSet& labels, size_t k = 5);

nlohmann::json to_json(const TopKResult& result, const std::string& filename);

void print_prediction(const TopKResult& result, size_t top_k = 5);

} // namespace shikaku

#endif // SHIKAKU_PREDICTION_HPP
