#include "shikaku/shikaku.hpp"
#include <spdlog/spdlog.h>
#include <pthread.h>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --config <path>      Path to JSON config (default: config/shikaku_config.json)\n"
              << "  --image <path>       Classify one image file and exit\n"
              << "  --top-k <n>          Number of ranked predictions (default: from config)\n"
              << "  --info               Show model information and exit\n"
              << "  -h, --help           Show this help message\n";
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.good()) {
        throw std::runtime_error("Cannot open image file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/shikaku_config.json";
    std::string image_path;
    int top_k = 0;
    bool show_info = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--image") == 0 && i + 1 < argc) {
            image_path = argv[++i];
        } else if (std::strcmp(argv[i], "--top-k") == 0 && i + 1 < argc) {
            top_k = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--info") == 0) {
            show_info = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    shikaku::ShikakuConfig config;
    try {
        config = shikaku::ShikakuConfig::load_from_json(config_path);
        config.apply_env_overrides();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    if (top_k > 0) {
        config.top_k = top_k;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    shikaku::LifecycleManager lifecycle(config);
    if (!lifecycle.start()) {
        std::cerr << "Error: " << lifecycle.failure_reason() << "\n";
        return 1;
    }

    try {
        if (show_info) {
            lifecycle.context()->engine->print_model_info();
            return 0;
        }

        if (!image_path.empty()) {
            auto result = lifecycle.predict(read_file(image_path));
            shikaku::print_prediction(result, static_cast<size_t>(config.top_k));
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Blocked only for serving, so Ctrl+C still ends model load and --image runs.
    // A dedicated thread picks them up with sigwait.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    shikaku::HttpServer server(lifecycle);

    std::thread signal_thread([&server, stop_signals] {
        int sig = 0;
        sigwait(&stop_signals, &sig);
        spdlog::info("Received signal {}, stopping server", sig);
        server.stop();
    });

    bool served = server.listen();
    if (!served) {
        spdlog::error("Failed to listen on {}:{}", config.host, config.port);
        // Unblock the signal thread so it can be joined
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();

    lifecycle.stop();
    return served ? 0 : 1;
}
