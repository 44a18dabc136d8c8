#pragma once
#include "data_types.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

// Writes one text line per inference result
class ResultSink {
public:
    ResultSink(std::shared_ptr<spdlog::logger> logger, size_t preview);

    void emit(const InferenceResult& result) const;

    // seq=<n> latency_ms=<x> | <name> <shape> = [v0, v1, ...] (<count> values) | ...
    static std::string format(const InferenceResult& result, size_t preview, TimestampNS now_ns);

private:
    std::shared_ptr<spdlog::logger> logger_;
    size_t preview_;
};
