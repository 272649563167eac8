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

#include "shikaku/service/http_server.hpp"
#include "shikaku/utils/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace shikaku {

namespace {

using Clock = std::chrono::steady_clock;

class InFlightCounter {
public:
    explicit InFlightCounter(std::atomic<int>& counter)
        : counter_(counter), value_(counter.fetch_add(1) + 1) {}
    ~InFlightCounter() { counter_.fetch_sub(1); }

    InFlightCounter(const InFlightCounter&) = delete;
    InFlightCounter& operator=(const InFlightCounter&) = delete;

    int value() const { return value_; }

private:
    std::atomic<int>& counter_;
    int value_;
};

double elapsed_ms(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

} // namespace

void set_json_response(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void set_error_response(httplib::Response& res, int status, const std::string& detail) {
    set_json_response(res, status, nlohmann::json{{"detail", detail}});
}

HttpServer::HttpServer(LifecycleManager& lifecycle)
    : lifecycle_(lifecycle),
      predict_limit_(lifecycle.config().predict_limit()) {
    const auto& config = lifecycle_.config();

    server_.new_task_queue = [threads = std::max(1, config.server_threads)] {
        return new httplib::ThreadPool(static_cast<size_t>(threads));
    };
    server_.set_payload_max_length(config.max_upload_bytes);

    register_routes();
}

void HttpServer::register_routes() {
    server_.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_root(req, res);
    });
    server_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    server_.Post("/predict", [this](const httplib::Request& req, httplib::Response& res) {
        handle_predict(req, res);
    });

    // CORS preflight
    server_.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    // Fills in a JSON body for errors raised by the server itself (404, 413, ...)
    server_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            set_error_response(res, res.status, httplib::status_message(res.status));
        }
    });

    server_.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        apply_cors(req, res);
    });
}

void HttpServer::apply_cors(const httplib::Request& req, httplib::Response& res) const {
    if (!req.has_header("Origin")) {
        return;
    }
    const std::string origin = req.get_header_value("Origin");
    const auto& allowed = lifecycle_.config().cors_origins;
    if (std::find(allowed.begin(), allowed.end(), origin) == allowed.end()) {
        return;
    }

    res.set_header("Access-Control-Allow-Origin", origin);
    res.set_header("Access-Control-Allow-Credentials", "true");
    res.set_header("Vary", "Origin");
    if (req.method == "OPTIONS") {
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        const std::string requested = req.get_header_value("Access-Control-Request-Headers");
        res.set_header("Access-Control-Allow-Headers", requested.empty() ? "*" : requested);
    }
}

void HttpServer::handle_root(const httplib::Request&, httplib::Response& res) const {
    LabelSet labels = lifecycle_.class_names();
    set_json_response(res, 200, {
        {"message", "Cattle Breed Classifier API"},
        {"total_classes", labels.size()},
        {"class_names", labels},
    });
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) const {
    ServiceState state = lifecycle_.state();
    nlohmann::json body = {
        {"status", "ok"},
        {"model_loaded", state == ServiceState::Ready},
        {"num_classes", lifecycle_.num_classes()},
        {"state", to_string(state)},
    };
    if (state == ServiceState::Failed) {
        body["error"] = lifecycle_.failure_reason();
    }
    set_json_response(res, 200, body);
}

void HttpServer::handle_predict(const httplib::Request& req, httplib::Response& res) const {
    const auto started = Clock::now();

    if (!lifecycle_.is_ready()) {
        spdlog::error("/predict rejected: service state is {}", to_string(lifecycle_.state()));
        set_error_response(res, 500, "Model not loaded");
        return;
    }

    InFlightCounter in_flight(predicts_in_flight_);
    if (in_flight.value() > predict_limit_) {
        spdlog::warn("/predict rejected: {} requests already in flight", predict_limit_);
        set_error_response(res, 503, "Server busy, retry later");
        return;
    }

    std::string filename;
    try {
        if (!req.form.has_file("file")) {
            throw InputError("No file provided (use multipart field 'file')");
        }
        const auto file = req.form.get_file("file");
        filename = file.filename;

        TopKResult result = lifecycle_.predict(file.content);
        set_json_response(res, 200, to_json(result, filename));

        spdlog::debug("/predict {} -> {} ({:.2f}%) in {:.1f} ms", filename,
                      result.primary().breed, result.primary().confidence, elapsed_ms(started));

    } catch (const ModelNotLoaded& e) {
        spdlog::error("/predict {}: {}", filename, e.what());
        set_error_response(res, 500, e.what());
    } catch (const InputError& e) {
        spdlog::warn("/predict {}: {}", filename, e.what());
        set_error_response(res, 400, e.what());
    } catch (const ServiceBusy& e) {
        spdlog::warn("/predict {}: {}", filename, e.what());
        set_error_response(res, 503, e.what());
    } catch (const ServiceError& e) {
        spdlog::error("/predict {}: {}", filename, e.what());
        set_error_response(res, 500, e.what());
    } catch (const std::exception& e) {
        spdlog::error("/predict {}: unexpected error: {}", filename, e.what());
        set_error_response(res, 500, std::string("Internal server error: ") + e.what());
    }
}

bool HttpServer::listen() {
    const auto& config = lifecycle_.config();
    return listen(config.host, config.port);
}

bool HttpServer::listen(const std::string& host, int port) {
    spdlog::info("Server starting on http://{}:{}", host, port);
    return server_.listen(host, port);
}

int HttpServer::bind_to_any_port(const std::string& host) {
    return server_.bind_to_any_port(host);
}

bool HttpServer::listen_after_bind() {
    return server_.listen_after_bind();
}

void HttpServer::stop() {
    server_.stop();
}

void HttpServer::wait_until_ready() const {
    server_.wait_until_ready();
}

bool HttpServer::is_running() const {
    return server_.is_running();
}

} // namespace shikaku
