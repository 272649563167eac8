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

#include "shikaku/inference/model_loader.hpp"
#include "shikaku/utils/errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <utility>

namespace shikaku {

namespace {

std::string shape_string(const ov::Shape& shape) {
    std::ostringstream out;
    out << shape;
    return out.str();
}

std::string port_name(const ov::Output<const ov::Node>& port) {
    return port.get_names().empty() ? std::string() : port.get_any_name();
}

} // namespace

ModelHandle::ModelHandle(std::shared_ptr<ov::Model> model, ov::CompiledModel compiled_model)
    : model_(std::move(model)), compiled_model_(std::move(compiled_model)) {
    auto input = compiled_model_.input();
    auto output = compiled_model_.output();

    input_name_ = port_name(input);
    output_name_ = port_name(output);
    input_shape_ = input.get_shape();
    output_shape_ = output.get_shape();
    input_type_ = input.get_element_type();

    num_classes_ = 1;
    for (auto dim : output_shape_) num_classes_ *= dim;
}

size_t ModelHandle::num_operations() const {
    return model_ ? model_->get_ops().size() : 0;
}

ModelLoader::ModelLoader(SchemaAdapter adapter, ModelLoaderOptions options)
    : adapter_(std::move(adapter)), options_(std::move(options)) {}

std::string ModelLoader::weights_path_for(const std::string& xml_path) {
    auto dot = xml_path.find_last_of('.');
    auto slash = xml_path.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return xml_path + ".bin";
    }
    return xml_path.substr(0, dot) + ".bin";
}

std::string ModelLoader::read_topology(const std::string& xml_path) const {
    std::ifstream xml_file(xml_path, std::ios::binary);
    if (!xml_file.good()) {
        throw ModelNotFound("Model not found at " + xml_path);
    }
    std::ostringstream contents;
    contents << xml_file.rdbuf();
    return contents.str();
}

ov::Tensor ModelLoader::read_weights(const std::string& bin_path) const {
    std::ifstream bin_file(bin_path, std::ios::binary | std::ios::ate);
    if (!bin_file.good()) {
        throw ModelNotFound("Binary weights file not found: " + bin_path +
                            "\nThe .bin file must reside in the same directory as the .xml file.");
    }

    auto size = static_cast<size_t>(bin_file.tellg());
    bin_file.seekg(0);

    ov::Tensor weights(ov::element::u8, ov::Shape{size});
    if (size > 0 && !bin_file.read(reinterpret_cast<char*>(weights.data<uint8_t>()),
                                   static_cast<std::streamsize>(size))) {
        throw ModelLoadError("Failed to read weights file: " + bin_path);
    }
    return weights;
}

std::shared_ptr<const ModelHandle> ModelLoader::load(const std::string& xml_path) {
    const std::string bin_path =
        options_.weights_path.empty() ? weights_path_for(xml_path) : options_.weights_path;

    spdlog::info("Loading model files:");
    spdlog::info("XML: {}", xml_path);
    spdlog::info("BIN: {}", bin_path);

    std::string topology = read_topology(xml_path);
    ov::Tensor weights = read_weights(bin_path);

    AdaptResult adapted = adapter_.adapt(topology);
    if (adapted.dropped > 0 || adapted.renamed > 0) {
        spdlog::info("Schema adapter v{}: dropped {} and renamed {} layer attributes",
                     adapter_.version(), adapted.dropped, adapted.renamed);
    }

    try {
        auto model = core_.read_model(adapted.xml, weights);

        if (model->inputs().size() != 1 || model->outputs().empty()) {
            throw ModelLoadError("Expected a single-input classifier, model has " +
                                 std::to_string(model->inputs().size()) + " inputs and " +
                                 std::to_string(model->outputs().size()) + " outputs");
        }

        // Fix the input to one NHWC image
        if (model->input().get_partial_shape().is_dynamic()) {
            const auto side = static_cast<int64_t>(options_.image_size);
            model->reshape(ov::PartialShape{1, side, side, 3});
        }

        ov::CompiledModel compiled = core_.compile_model(model, options_.device);
        auto handle = std::make_shared<const ModelHandle>(std::move(model), std::move(compiled));

        spdlog::info("Model compiled for {}: input {} {}, {} output classes",
                     options_.device, handle->input_name(),
                     shape_string(handle->input_shape()), handle->num_classes());
        return handle;

    } catch (const ModelLoadError&) {
        throw;
    } catch (const std::exception& e) {
        throw ModelLoadError("Error loading OpenVINO model " + xml_path + ": " + e.what());
    }
}

} // namespace shikaku
