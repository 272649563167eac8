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

#include "shikaku/service/lifecycle.hpp"
#include "shikaku/utils/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <sstream>
#include <utility>

namespace shikaku {

const char* to_string(ServiceState state) {
    switch (state) {
    case ServiceState::Uninitialized: return "uninitialized";
    case ServiceState::Ready: return "ready";
    case ServiceState::Failed: return "failed";
    case ServiceState::ShuttingDown: return "shutting_down";
    }
    return "unknown";
}

LifecycleManager::LifecycleManager(ShikakuConfig config)
    : config_(std::move(config)) {}

LifecycleManager::~LifecycleManager() {
    stop();
}

std::shared_ptr<const ServiceContext> LifecycleManager::load_context() const {
    auto context = std::make_shared<ServiceContext>();
    context->preprocess.image_size = config_.image_size;
    try {
        context->preprocess.interpolation = interpolation_from_name(config_.resize_interpolation);
    } catch (const std::invalid_argument& e) {
        throw StartupError(e.what());
    }

    ModelLoaderOptions options;
    options.device = config_.device;
    options.image_size = config_.image_size;
    options.weights_path = config_.model_bin.empty() ? std::string() : config_.model_bin_path();

    ModelLoader loader(SchemaAdapter::default_adapter(config_.ignored_layer_attributes), options);
    context->model = loader.load(config_.model_xml_path());

    // A model the preprocessor cannot feed must not reach Ready
    const auto size = static_cast<size_t>(config_.image_size);
    const ov::Shape expected_input{1, size, size, 3};
    if (context->model->input_shape() != expected_input) {
        std::ostringstream message;
        message << "Model input shape " << context->model->input_shape()
                << " does not match preprocessed images " << expected_input;
        throw StartupError(message.str());
    }
    if (context->model->input_type() != ov::element::f32) {
        throw StartupError("Model input type " + context->model->input_type().get_type_name() +
                           " is not f32");
    }

    context->labels = build_label_set(config_.dataset_dir);

    if (context->model->num_classes() != context->labels.size()) {
        throw StartupError("Model outputs " + std::to_string(context->model->num_classes()) +
                           " classes but " + config_.dataset_dir + " has " +
                           std::to_string(context->labels.size()) + " class directories");
    }

    context->engine = std::make_unique<Inference>(
        context->model, static_cast<size_t>(config_.inference_slots), config_.apply_softmax,
        std::chrono::milliseconds(config_.inference_timeout_ms));

    return context;
}

bool LifecycleManager::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state() != ServiceState::Uninitialized) {
        return is_ready();
    }

    spdlog::info("Loading model...");
    try {
        auto context = load_context();
        num_classes_.store(context->labels.size(), std::memory_order_release);
        std::atomic_store(&context_, std::move(context));
        state_.store(ServiceState::Ready, std::memory_order_release);

        spdlog::info("Model loaded successfully");
        spdlog::info("Total Classes: {}", num_classes());
        return true;

    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> reason_lock(reason_mutex_);
            failure_reason_ = e.what();
        }
        state_.store(ServiceState::Failed, std::memory_order_release);
        spdlog::error("Startup failed: {}", e.what());
        return false;
    }
}

void LifecycleManager::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    ServiceState current = state();
    if (current == ServiceState::ShuttingDown || current == ServiceState::Uninitialized) {
        return;
    }

    state_.store(ServiceState::ShuttingDown, std::memory_order_release);
    spdlog::info("Shutting down service...");

    // Requests still holding a context copy finish before it is freed
    std::atomic_store(&context_, std::shared_ptr<const ServiceContext>());
}

std::shared_ptr<const ServiceContext> LifecycleManager::context() const {
    return std::atomic_load(&context_);
}

LabelSet LifecycleManager::class_names() const {
    auto ctx = context();
    return ctx ? ctx->labels : LabelSet{};
}

std::string LifecycleManager::failure_reason() const {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    return failure_reason_;
}

TopKResult LifecycleManager::predict(const std::string& image_bytes, size_t k) const {
    if (!is_ready()) {
        throw ModelNotLoaded();
    }
    auto ctx = context();
    if (!ctx || !ctx->engine) {
        throw ModelNotLoaded();
    }

    ImageTensor tensor = preprocess_image(image_bytes, ctx->preprocess);
    ProbabilityVector probabilities = ctx->engine->execute(tensor);
    return top_k(probabilities, ctx->labels, k);
}

TopKResult LifecycleManager::predict(const std::string& image_bytes) const {
    return predict(image_bytes, static_cast<size_t>(config_.top_k));
}

} // namespace shikaku
