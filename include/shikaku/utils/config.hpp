#ifndef SHIKAKU_CONFIG_HPP
#define SHIKAKU_CONFIG_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace shikaku {

struct ShikakuConfig {
    // Model
    std::string model_dir = "./model";
    std::string model_xml = "cattle_classifier.xml";
    std::string model_bin = "";  // empty: same stem as model_xml
    std::string device = "CPU";
    std::vector<std::string> ignored_layer_attributes;

    // Labels
    std::string dataset_dir = "./dataset/train";

    // Preprocessing and ranking
    int image_size = 224;
    std::string resize_interpolation = "bilinear";
    int top_k = 5;
    int inference_slots = 1;
    int inference_timeout_ms = 30000;  // wait for a free infer request
    bool apply_softmax = false;

    // HTTP
    std::string host = "0.0.0.0";
    int port = 8000;
    int server_threads = 8;
    int max_concurrent_predicts = 0;  // 0: server_threads - 1
    size_t max_upload_bytes = 10 * 1024 * 1024;
    std::vector<std::string> cors_origins = {"http://localhost:3000",
                                             "http://localhost:5173"};

    std::string log_level = "info";

    std::string model_xml_path() const;
    std::string model_bin_path() const;
    // Predict requests allowed at once. Always leaves a worker for other routes
    // when server_threads > 1.
    int predict_limit() const;

    static ShikakuConfig load_from_json(const std::string& config_path);
    void apply_env_overrides();
};

std::vector<std::string> split_list(const std::string& value);

} // namespace shikaku

#endif // SHIKAKU_CONFIG_HPP
