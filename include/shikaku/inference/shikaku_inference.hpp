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

#ifndef SHIKAKU_INFERENCE_HPP
#define SHIKAKU_INFERENCE_HPP

#include <openvino/openvino.hpp>
#include "shikaku/inference/model_loader.hpp"
#include "shikaku/utils/image_processing.hpp"
#include "shikaku/utils/prediction.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace shikaku {

/**
 * Runs forward passes over a loaded model.
 *
 * ov::InferRequest is not reentrant, so the engine keeps a fixed pool of
 * requests. Each execute() call borrows one for the duration of the pass
 * and waits up to slot_timeout when all of them are busy, then throws
 * ServiceBusy.
 */
class Inference {
public:
    // Holds one infer request until destroyed.
    class SlotGuard;

    Inference(std::shared_ptr<const ModelHandle> model, size_t num_slots = 1,
              bool apply_softmax = false,
              std::chrono::milliseconds slot_timeout = std::chrono::seconds(30));

    Inference(const Inference&) = delete;
    Inference& operator=(const Inference&) = delete;
    Inference(Inference&&) = delete;
    Inference& operator=(Inference&&) = delete;

    ProbabilityVector execute(const ImageTensor& tensor) const;

    size_t get_num_classes() const;
    size_t get_num_slots() const { return requests_.size(); }
    const ModelHandle& model() const;

    void print_model_info() const;

private:
    std::shared_ptr<const ModelHandle> model_;
    bool apply_softmax_;
    std::chrono::milliseconds slot_timeout_;

    mutable std::vector<ov::InferRequest> requests_;
    mutable std::vector<size_t> idle_slots_;
    mutable std::mutex slots_mutex_;
    mutable std::condition_variable slot_available_;
};

class Inference::SlotGuard {
public:
    explicit SlotGuard(const Inference& engine);
    ~SlotGuard();

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

    ov::InferRequest& request() { return engine_.requests_[slot_]; }

private:
    const Inference& engine_;
    size_t slot_ = 0;
};

// Numerically stable softmax, in place.
void softmax(ProbabilityVector& values);

} // namespace shikaku

#endif // SHIKAKU_INFERENCE_HPP
