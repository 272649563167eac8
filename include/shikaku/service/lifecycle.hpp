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

#ifndef SHIKAKU_LIFECYCLE_HPP
#define SHIKAKU_LIFECYCLE_HPP

#include "shikaku/inference/shikaku_inference.hpp"
#include "shikaku/utils/config.hpp"
#include "shikaku/utils/image_processing.hpp"
#include "shikaku/utils/label_set.hpp"
#include "shikaku/utils/prediction.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace shikaku {

enum class ServiceState {
    Uninitialized,
    Ready,
    Failed,
    ShuttingDown
};

const char* to_string(ServiceState state);

// Everything a request needs. Built once at startup, read-only afterwards.
struct ServiceContext {
    std::shared_ptr<const ModelHandle> model;
    std::unique_ptr<Inference> engine;
    LabelSet labels;
    PreprocessOptions preprocess;
};

/**
 * Owns the process-wide service state.
 *
 *   Uninitialized -> Ready         start() loaded the model and labels
 *   Uninitialized -> Failed        start() hit a startup error
 *   Ready/Failed  -> ShuttingDown  stop()
 *
 * Only start() and stop() write. Readers see either no context or a
 * complete one.
 */
class LifecycleManager {
public:
    explicit LifecycleManager(ShikakuConfig config);
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    bool start();
    void stop();

    ServiceState state() const { return state_.load(std::memory_order_acquire); }
    bool is_ready() const { return state() == ServiceState::Ready; }

    std::shared_ptr<const ServiceContext> context() const;

    size_t num_classes() const { return num_classes_.load(std::memory_order_acquire); }
    LabelSet class_names() const;
    std::string failure_reason() const;

    const ShikakuConfig& config() const { return config_; }

    // Full per-request pipeline: decode, normalize, forward pass, top-k.
    // Throws ModelNotLoaded unless Ready.
    TopKResult predict(const std::string& image_bytes, size_t k) const;
    TopKResult predict(const std::string& image_bytes) const;

private:
    ShikakuConfig config_;

    std::atomic<ServiceState> state_{ServiceState::Uninitialized};
    std::shared_ptr<const ServiceContext> context_;
    std::atomic<size_t> num_classes_{0};

    std::mutex lifecycle_mutex_;
    mutable std::mutex reason_mutex_;
    std::string failure_reason_;

    std::shared_ptr<const ServiceContext> load_context() const;
};

} // namespace shikaku

#endif // SHIKAKU_LIFECYCLE_HPP
