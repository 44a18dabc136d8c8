#include "model_module.hpp"
#include "errors.hpp"
#include "frame_codec.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace {

template <typename T>
void copy_values(const Ort::Value& value, size_t count, std::vector<float>& out) {
    const T* data = value.GetTensorData<T>();
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out.push_back(static_cast<float>(data[i]));
    }
}

OutputTensor to_output_tensor(const std::string& name, const Ort::Value& value) {
    OutputTensor out;
    out.name = name;
    if (!value.IsTensor()) {
        spdlog::debug("Output '{}' is not a tensor, skipped", name);
        return out;
    }

    auto info = value.GetTensorTypeAndShapeInfo();
    out.shape = info.GetShape();
    const size_t count = info.GetElementCount();

    switch (info.GetElementType()) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT: {
            const float* data = value.GetTensorData<float>();
            out.values.assign(data, data + count);
            break;
        }
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE: copy_values<double>(value, count, out.values); break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:  copy_values<int64_t>(value, count, out.values); break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:  copy_values<int32_t>(value, count, out.values); break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8:  copy_values<uint8_t>(value, count, out.values); break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_BOOL:   copy_values<bool>(value, count, out.values); break;
        default:
            spdlog::debug("Output '{}' has unsupported element type {}, values skipped",
                          name, static_cast<int>(info.GetElementType()));
            break;
    }
    return out;
}

}  // namespace

Ort::Env& OnnxModel::env() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "InferenceEnvironment");
    return env;
}

OnnxModel::OnnxModel(const std::string& model_path, const std::vector<int64_t>& expected_shape,
                     int intra_op_threads) {
    if (!std::filesystem::is_regular_file(model_path)) {
        throw ModelError("model file not found: " + model_path);
    }
    try {
        load(model_path, intra_op_threads);
    } catch (const Ort::Exception& e) {
        throw ModelError("failed to load model from " + model_path + ": " + e.what());
    }
    validate(model_path, expected_shape);

    spdlog::info("Model loaded: {} input {} {} -> {} output(s)", model_path, model_.input_names_str.front(),
                 shape_to_string(model_.input_shape), model_.output_names_str.size());
}

void OnnxModel::load(const std::string& model_path, int intra_op_threads) {
    Ort::SessionOptions session_options;
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_BASIC);
    session_options.SetIntraOpNumThreads(intra_op_threads);

    model_.session = Ort::Session(env(), model_path.c_str(), session_options);

    Ort::AllocatorWithDefaultOptions allocator;

    // 1. names first, the pointer arrays are built once the strings stop moving
    const size_t num_inputs = model_.session.GetInputCount();
    for (size_t i = 0; i < num_inputs; i++) {
        auto name = model_.session.GetInputNameAllocated(i, allocator);
        model_.input_names_str.emplace_back(name.get());
    }
    const size_t num_outputs = model_.session.GetOutputCount();
    for (size_t i = 0; i < num_outputs; i++) {
        auto name = model_.session.GetOutputNameAllocated(i, allocator);
        model_.output_names_str.emplace_back(name.get());
    }
    for (const auto& name : model_.input_names_str) model_.input_names.push_back(name.c_str());
    for (const auto& name : model_.output_names_str) model_.output_names.push_back(name.c_str());

    // 2. declared input shape
    if (num_inputs > 0) {
        model_.input_shape = model_.session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    }
}

void OnnxModel::validate(const std::string& model_path, const std::vector<int64_t>& expected_shape) {
    if (model_.input_names.empty() || model_.output_names.empty()) {
        throw ModelError(model_path + " must have at least one input and one output");
    }

    auto type_info = model_.session.GetInputTypeInfo(0);
    if (type_info.GetONNXType() != ONNX_TYPE_TENSOR ||
        type_info.GetTensorTypeAndShapeInfo().GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        throw ModelError(model_path + ": input '" + model_.input_names_str.front() + "' is not a float tensor");
    }

    const auto& declared = model_.input_shape;
    bool compatible = declared.size() == expected_shape.size();
    for (size_t i = 0; compatible && i < declared.size(); ++i) {
        // dynamic dimensions (-1 or symbolic) accept anything
        if (declared[i] > 0 && declared[i] != expected_shape[i]) compatible = false;
    }
    if (!compatible) {
        throw ModelError(model_path + ": input shape " + shape_to_string(declared) +
                         " does not accept configured shape " + shape_to_string(expected_shape));
    }
}

InferenceResult OnnxModel::run(const InputTensor& input) {
    InferenceResult result;
    try {
        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeDefault);
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
                memory_info, const_cast<float*>(input.data.data()), input.data.size(),
                input.shape.data(), input.shape.size());

        Ort::RunOptions run_options;
        run_options.SetRunLogVerbosityLevel(ORT_LOGGING_LEVEL_WARNING);

        auto outputs = model_.session.Run(run_options,
                model_.input_names.data(), &input_tensor, 1,
                model_.output_names.data(), model_.output_names.size());

        result.outputs.reserve(outputs.size());
        for (size_t i = 0; i < outputs.size(); ++i) {
            result.outputs.push_back(to_output_tensor(model_.output_names_str[i], outputs[i]));
        }
    } catch (const Ort::Exception& e) {
        throw InferenceError(std::string("inference failed: ") + e.what());
    }
    return result;
}

std::unique_ptr<InferenceEngine> load_onnx_model(const InferenceConfig& config) {
    return std::make_unique<OnnxModel>(config.model_path, config.input_shape, config.intra_op_threads);
}
