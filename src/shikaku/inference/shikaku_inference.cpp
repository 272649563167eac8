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

#include "shikaku/inference/shikaku_inference.hpp"
#include "shikaku/utils/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace shikaku {

namespace {

std::string shape_string(const ov::Shape& shape) {
    std::ostringstream out;
    out << shape;
    return out.str();
}

} // namespace

Inference::SlotGuard::SlotGuard(const Inference& engine) : engine_(engine) {
    if (engine_.requests_.empty()) {
        throw ModelNotLoaded();
    }
    std::unique_lock<std::mutex> lock(engine_.slots_mutex_);
    bool acquired = engine_.slot_available_.wait_for(
        lock, engine_.slot_timeout_, [this] { return !engine_.idle_slots_.empty(); });
    if (!acquired) {
        throw ServiceBusy("All " + std::to_string(engine_.requests_.size()) +
                          " infer request slot(s) busy for " +
                          std::to_string(engine_.slot_timeout_.count()) + " ms");
    }
    slot_ = engine_.idle_slots_.back();
    engine_.idle_slots_.pop_back();
}

Inference::SlotGuard::~SlotGuard() {
    {
        std::lock_guard<std::mutex> lock(engine_.slots_mutex_);
        engine_.idle_slots_.push_back(slot_);
    }
    engine_.slot_available_.notify_one();
}

void softmax(ProbabilityVector& values) {
    if (values.empty()) return;
    float max_value = *std::max_element(values.begin(), values.end());
    double sum = 0.0;
    for (auto& v : values) {
        v = std::exp(v - max_value);
        sum += v;
    }
    for (auto& v : values) {
        v = static_cast<float>(v / sum);
    }
}

Inference::Inference(std::shared_ptr<const ModelHandle> model, size_t num_slots,
                     bool apply_softmax, std::chrono::milliseconds slot_timeout)
    : model_(std::move(model)), apply_softmax_(apply_softmax), slot_timeout_(slot_timeout) {
    if (!model_) {
        return;
    }

    num_slots = std::max<size_t>(1, num_slots);
    ov::CompiledModel compiled = model_->compiled_model();
    for (size_t i = 0; i < num_slots; ++i) {
        requests_.push_back(compiled.create_infer_request());
        idle_slots_.push_back(i);
    }

    spdlog::debug("Inference engine ready with {} infer request slot(s)", num_slots);
}

ProbabilityVector Inference::execute(const ImageTensor& tensor) const {
    if (!model_) {
        throw ModelNotLoaded();
    }

    const ov::Shape& expected = model_->input_shape();
    ov::Shape actual(tensor.shape.begin(), tensor.shape.end());
    if (actual != expected) {
        throw InferenceError("Input tensor shape " + shape_string(actual) +
                             " does not match model input " + shape_string(expected));
    }
    if (model_->input_type() != ov::element::f32) {
        throw InferenceError("Model input type " + model_->input_type().get_type_name() +
                             " is not f32");
    }
    if (tensor.data.size() != ov::shape_size(actual)) {
        throw InferenceError("Input tensor holds " + std::to_string(tensor.data.size()) +
                             " values for shape " + shape_string(actual));
    }

    ProbabilityVector probabilities;
    try {
        SlotGuard slot(*this);
        ov::InferRequest& infer_request = slot.request();

        ov::Tensor input_tensor(ov::element::f32, expected,
                                const_cast<float*>(tensor.data.data()));
        infer_request.set_input_tensor(input_tensor);
        infer_request.infer();

        ov::Tensor output_tensor = infer_request.get_output_tensor();
        const float* predictions = output_tensor.data<const float>();
        probabilities.assign(predictions, predictions + output_tensor.get_size());
    } catch (const ov::Exception& e) {
        throw InferenceError(std::string("Error during OpenVINO inference: ") + e.what());
    }

    if (apply_softmax_) {
        softmax(probabilities);
    }
    return probabilities;
}

size_t Inference::get_num_classes() const {
    return model_ ? model_->num_classes() : 0;
}

const ModelHandle& Inference::model() const {
    if (!model_) {
        throw ModelNotLoaded();
    }
    return *model_;
}

void Inference::print_model_info() const {
    if (!model_) {
        std::cout << "No model loaded\n";
        return;
    }

    std::cout << "\n=== OpenVINO Model Information ===\n";
    std::cout << "Input name: " << model_->input_name() << "\n";
    std::cout << "Input shape: " << model_->input_shape() << "\n";
    std::cout << "Output name: " << model_->output_name() << "\n";
    std::cout << "Output shape: " << model_->output_shape() << "\n";
    std::cout << "Number of classes: " << model_->num_classes() << "\n";
    std::cout << "Number of operations: " << model_->num_operations() << "\n";
    std::cout << "Infer request slots: " << requests_.size() << "\n";
    std::cout << std::string(40, '=') << "\n";
}

} // namespace shikaku
