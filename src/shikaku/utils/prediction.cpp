// MIT License

// Copyright (c) 2026 ICHIRO ITS

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:

// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "shikaku/utils/prediction.hpp"
#include "shikaku/utils/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace shikaku {

// Percent rounded to two decimals on the exact binary value, ties to even.
double to_confidence(float probability) {
    std::ostringstream percent;
    percent << std::fixed << std::setprecision(2) << static_cast<double>(probability) * 100.0;
    return std::stod(percent.str());
}

TopKResult top_k(const ProbabilityVector& probabilities, const LabelSet& labels, size_t k) {
    if (probabilities.size() != labels.size()) {
        throw InferenceError("Model produced " + std::to_string(probabilities.size()) +
                             " scores for " + std::to_string(labels.size()) + " classes");
    }

    for (size_t i = 0; i < probabilities.size(); ++i) {
        if (!std::isfinite(probabilities[i])) {
            throw InferenceError("Model produced a non-finite score for class " + labels[i]);
        }
    }

    TopKResult result;
    size_t count = std::min(k, probabilities.size());
    if (count == 0) {
        return result;
    }

    std::vector<std::pair<float, size_t>> scored_indices;
    scored_indices.reserve(probabilities.size());
    for (size_t i = 0; i < probabilities.size(); ++i) {
        scored_indices.push_back({probabilities[i], i});
    }

    std::partial_sort(scored_indices.begin(),
                      scored_indices.begin() + count,
                      scored_indices.end(),
                      [](const std::pair<float, size_t>& a, const std::pair<float, size_t>& b) {
                          if (a.first != b.first) return a.first > b.first;
                          return a.second < b.second;
                      });

    for (size_t i = 0; i < count; ++i) {
        size_t idx = scored_indices[i].second;
        result.predictions.push_back({labels[idx], to_confidence(scored_indices[i].first)});
    }
    result.top_class_index = static_cast<int>(scored_indices[0].second);

    return result;
}

nlohmann::json to_json(const TopKResult& result, const std::string& filename) {
    nlohmann::json ranked = nlohmann::json::array();
    for (const auto& p : result.predictions) {
        ranked.push_back({{"breed", p.breed}, {"confidence", p.confidence}});
    }

    nlohmann::json body;
    if (!result.empty()) {
        body["predicted_breed"] = result.primary().breed;
        body["confidence"] = result.primary().confidence;
    }
    body["top_5_predictions"] = ranked;
    body["filename"] = filename;
    return body;
}

void print_prediction(const TopKResult& result, size_t top_k) {
    if (result.empty()) {
        std::cout << "Failed to classify image.\n";
        return;
    }

    std::cout << "Predicted breed: " << result.primary().breed << " ("
              << std::fixed << std::setprecision(2) << result.primary().confidence << "%)\n";

    size_t num_to_print = std::min(top_k, result.predictions.size());
    for (size_t i = 0; i < num_to_print; ++i) {
        std::cout << "  " << (i + 1) << ". "
                  << result.predictions[i].breed << ": "
                  << std::fixed << std::setprecision(2)
                  << result.predictions[i].confidence << "%\n";
    }
}

} // namespace shikaku
