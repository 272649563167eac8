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

#ifndef SHIKAKU_HTTP_SERVER_HPP
#define SHIKAKU_HTTP_SERVER_HPP

#include "shikaku/service/lifecycle.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <string>

namespace shikaku {

class HttpServer {
public:
    explicit HttpServer(LifecycleManager& lifecycle);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until stop() is called. Returns false if the socket could not be bound.
    bool listen();
    bool listen(const std::string& host, int port);

    // Binds an ephemeral port and returns it; serve with listen_after_bind().
    int bind_to_any_port(const std::string& host);
    bool listen_after_bind();

    void stop();
    void wait_until_ready() const;
    bool is_running() const;

    int predicts_in_flight() const { return predicts_in_flight_.load(); }

private:
    LifecycleManager& lifecycle_;
    httplib::Server server_;

    // Bounds concurrent /predict handlers so / and /health keep a worker
    const int predict_limit_;
    mutable std::atomic<int> predicts_in_flight_{0};

    void register_routes();
    void apply_cors(const httplib::Request& req, httplib::Response& res) const;

    void handle_root(const httplib::Request& req, httplib::Response& res) const;
    void handle_health(const httplib::Request& req, httplib::Response& res) const;
    void handle_predict(const httplib::Request& req, httplib::Response& res) const;
};

void set_json_response(httplib::Response& res, int status, const nlohmann::json& body);
void set_error_response(httplib::Response& res, int status, const std::string& detail);

} // namespace shikaku

#endif // SHIKAKU_HTTP_SERVER_HPP
