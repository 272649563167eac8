#include "shikaku/utils/config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace shikaku {

namespace {

std::string trim(const std::string& s, const char* chars = " \t\n\r") {
    auto begin = s.find_first_not_of(chars);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(chars);
    return s.substr(begin, end - begin + 1);
}

bool parse_bool(const std::string& value) {
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    throw std::invalid_argument("expected true or false, got '" + value + "'");
}

std::string join_path(std::string dir, const std::string& file) {
    if (dir.empty()) return file;
    if (!file.empty() && file.front() == '/') return file;
    if (dir.back() == '/') {
        dir.pop_back();
    }
    return dir + "/" + file;
}

} // namespace

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string item = trim(value.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

std::string ShikakuConfig::model_xml_path() const {
    return join_path(model_dir, model_xml);
}

std::string ShikakuConfig::model_bin_path() const {
    if (!model_bin.empty()) {
        return join_path(model_dir, model_bin);
    }
    std::string xml = model_xml_path();
    auto dot = xml.find_last_of('.');
    auto slash = xml.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return xml + ".bin";
    }
    return xml.substr(0, dot) + ".bin";
}

ShikakuConfig ShikakuConfig::load_from_json(const std::string& config_path) {
    ShikakuConfig config;

    std::ifstream file(config_path);
    if (!file.is_open()) {
        spdlog::warn("Could not open config file: {}, using defaults.", config_path);
        return config;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '{' || line[0] == '}' || line[0] == ',') {
            continue;
        }

        // Parse key-value pairs
        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, colon_pos), " \t\"");
        std::string value = trim(line.substr(colon_pos + 1), " \t,");

        if (!value.empty() && value.front() == '"') {
            value.erase(0, 1);
        }
        if (!value.empty() && value.back() == '"') {
            value.pop_back();
        }

        try {
            if (key == "model_dir") {
                config.model_dir = value;
            } else if (key == "model_xml") {
                config.model_xml = value;
            } else if (key == "model_bin") {
                config.model_bin = value;
            } else if (key == "device") {
                config.device = value;
            } else if (key == "ignored_layer_attributes") {
                config.ignored_layer_attributes = split_list(value);
            } else if (key == "dataset_dir") {
                config.dataset_dir = value;
            } else if (key == "image_size") {
                config.image_size = std::stoi(value);
            } else if (key == "resize_interpolation") {
                config.resize_interpolation = value;
            } else if (key == "top_k") {
                config.top_k = std::stoi(value);
            } else if (key == "inference_slots") {
                config.inference_slots = std::stoi(value);
            } else if (key == "inference_timeout_ms") {
                config.inference_timeout_ms = std::stoi(value);
            } else if (key == "apply_softmax") {
                config.apply_softmax = parse_bool(value);
            } else if (key == "host") {
                config.host = value;
            } else if (key == "port") {
                config.port = std::stoi(value);
            } else if (key == "server_threads") {
                config.server_threads = std::stoi(value);
            } else if (key == "max_concurrent_predicts") {
                config.max_concurrent_predicts = std::stoi(value);
            } else if (key == "max_upload_bytes") {
                config.max_upload_bytes = static_cast<size_t>(std::stoull(value));
            } else if (key == "cors_origins") {
                config.cors_origins = split_list(value);
            } else if (key == "log_level") {
                config.log_level = value;
            } else {
                spdlog::warn("Ignoring unknown config key: {}", key);
            }
        } catch (const std::logic_error& e) {
            throw std::runtime_error("Invalid value for config key '" + key + "' in " +
                                     config_path + ": " + e.what());
        }
    }

    if (config.image_size <= 0) {
        throw std::runtime_error("image_size must be positive");
    }
    if (config.top_k <= 0) {
        throw std::runtime_error("top_k must be positive");
    }
    if (config.inference_slots < 1) {
        spdlog::warn("inference_slots must be at least 1, was {}. Using 1.", config.inference_slots);
        config.inference_slots = 1;
    }
    if (config.inference_timeout_ms <= 0) {
        throw std::runtime_error("inference_timeout_ms must be positive");
    }

    return config;
}

int ShikakuConfig::predict_limit() const {
    int threads = std::max(1, server_threads);
    int limit = max_concurrent_predicts > 0 ? max_concurrent_predicts : threads - 1;
    return std::max(1, std::min(limit, threads > 1 ? threads - 1 : 1));
}

void ShikakuConfig::apply_env_overrides() {
    if (const char* model_dir_env = std::getenv("SHIKAKU_MODEL_DIR")) {
        model_dir = model_dir_env;
    }
    if (const char* dataset_env = std::getenv("SHIKAKU_DATASET_DIR")) {
        dataset_dir = dataset_env;
    }
    if (const char* port_env = std::getenv("SHIKAKU_PORT")) {
        int parsed = static_cast<int>(std::strtol(port_env, nullptr, 10));
        if (parsed <= 0 || parsed > 65535) {
            throw std::runtime_error(std::string("Invalid SHIKAKU_PORT: ") + port_env);
        }
        port = parsed;
    }
}

} // namespace shikaku
