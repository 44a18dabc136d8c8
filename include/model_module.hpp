#pragma once
#include "data_types.hpp"

#include <onnxruntime_cxx_api.h>

#include <memory>
#include <string>
#include <vector>

// A loaded, validated model. Durable: a failed run() leaves it usable.
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    // Throws InferenceError if the runtime rejects the call.
    virtual InferenceResult run(const InputTensor& input) = 0;
};

// Session plus the names ONNX Runtime needs on every Run()
struct ModelSession {
    Ort::Session session{nullptr};
    std::vector<int64_t> input_shape;            // as declared by the model, -1 for dynamic
    std::vector<std::string> input_names_str;
    std::vector<std::string> output_names_str;
    std::vector<const char*> input_names;        // point into *_names_str
    std::vector<const char*> output_names;
};

class OnnxModel : public InferenceEngine {
public:
    /*
     * Loads model_path with basic graph optimization on the CPU provider and checks
     * that its first input is a float tensor compatible with expected_shape.
     * Throws ModelError on load or validation failure.
     */
    OnnxModel(const std::string& model_path, const std::vector<int64_t>& expected_shape, int intra_op_threads);

    InferenceResult run(const InputTensor& input) override;

private:
    // One ONNX environment for the whole process
    static Ort::Env& env();

    void load(const std::string& model_path, int intra_op_threads);
    void validate(const std::string& model_path, const std::vector<int64_t>& expected_shape);

    ModelSession model_;
};

std::unique_ptr<InferenceEngine> load_onnx_model(const InferenceConfig& config);
