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

#include "shikaku/utils/label_set.hpp"
#include "shikaku/utils/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace shikaku {

LabelSet build_label_set(const std::string& dataset_root) {
    std::error_code ec;
    if (!fs::is_directory(dataset_root, ec)) {
        throw DatasetNotFound("Dataset directory not found: " + dataset_root);
    }

    LabelSet labels;
    fs::directory_iterator it(dataset_root, ec);
    if (ec) {
        throw DatasetNotFound("Cannot read dataset directory " + dataset_root + ": " + ec.message());
    }

    for (const auto& entry : it) {
        // is_directory follows symlinks
        if (entry.is_directory(ec)) {
            labels.push_back(entry.path().filename().string());
        }
    }

    if (labels.empty()) {
        throw LabelSetEmpty("No class directories found in " + dataset_root);
    }

    // std::string compares bytes, same as the ordering used at training time
    std::sort(labels.begin(), labels.end());

    spdlog::debug("Built label set with {} classes from {}", labels.size(), dataset_root);
    return labels;
}

} // namespace shikaku
