#include "result_sink.hpp"
#include "frame_codec.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

ResultSink::ResultSink(std::shared_ptr<spdlog::logger> logger, size_t preview)
        : logger_(std::move(logger)), preview_(preview) {}

void ResultSink::emit(const InferenceResult& result) const {
    logger_->info("{}", format(result, preview_, wall_clock_ns()));
}

std::string ResultSink::format(const InferenceResult& result, size_t preview, TimestampNS now_ns) {
    std::ostringstream ss;
    if (result.has_sequence) {
        // clocks are not synchronized across nodes, negative latency just means skew
        const double latency_ms = (static_cast<double>(now_ns) - static_cast<double>(result.capture_ts_ns)) / 1e6;
        ss << "seq=" << result.sequence << " latency_ms=" << std::fixed << std::setprecision(1) << latency_ms;
    } else {
        ss << "seq=-";
    }

    ss << std::defaultfloat << std::setprecision(6);
    for (const auto& output : result.outputs) {
        ss << " | " << output.name << " " << shape_to_string(output.shape) << " = [";
        const size_t shown = std::min(preview, output.values.size());
        for (size_t i = 0; i < shown; ++i) {
            if (i) ss << ", ";
            ss << output.values[i];
        }
        if (shown < output.values.size()) ss << ", ...";
        ss << "] (" << output.values.size() << " values)";
    }
    return ss.str();
}
