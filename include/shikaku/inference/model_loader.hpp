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

#ifndef SHIKAKU_MODEL_LOADER_HPP
#define SHIKAKU_MODEL_LOADER_HPP

#include <openvino/openvino.hpp>
#include "shikaku/inference/schema_adapter.hpp"
#include <memory>
#include <string>

namespace shikaku {

// Compiled model plus the metadata the engine needs. Immutable once built.
class ModelHandle {
public:
    ModelHandle(std::shared_ptr<ov::Model> model, ov::CompiledModel compiled_model);

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    // ov::CompiledModel is a shared handle; copies refer to the same compiled network.
    ov::CompiledModel compiled_model() const { return compiled_model_; }

    const std::string& input_name() const { return input_name_; }
    const std::string& output_name() const { return output_name_; }
    const ov::Shape& input_shape() const { return input_shape_; }
    const ov::Shape& output_shape() const { return output_shape_; }
    ov::element::Type input_type() const { return input_type_; }
    size_t num_classes() const { return num_classes_; }
    size_t num_operations() const;

private:
    std::shared_ptr<ov::Model> model_;
    ov::CompiledModel compiled_model_;

    std::string input_name_;
    std::string output_name_;
    ov::Shape input_shape_;
    ov::Shape output_shape_;
    ov::element::Type input_type_;
    size_t num_classes_ = 0;
};

struct ModelLoaderOptions {
    std::string device = "CPU";
    int image_size = 224;
    std::string weights_path;  // empty: <xml stem>.bin
};

class ModelLoader {
public:
    explicit ModelLoader(SchemaAdapter adapter = SchemaAdapter::default_adapter(),
                         ModelLoaderOptions options = {});

    ModelLoader(const ModelLoader&) = delete;
    ModelLoader& operator=(const ModelLoader&) = delete;

    // Throws ModelNotFound if a file is missing and ModelLoadError otherwise.
    std::shared_ptr<const ModelHandle> load(const std::string& xml_path);

    const SchemaAdapter& adapter() const { return adapter_; }

    static std::string weights_path_for(const std::string& xml_path);

private:
    SchemaAdapter adapter_;
    ModelLoaderOptions options_;
    ov::Core core_;

    std::string read_topology(const std::string& xml_path) const;
    ov::Tensor read_weights(const std::string& bin_path) const;
};

} // namespace shikaku

#endif // SHIKAKU_MODEL_LOADER_HPP
