#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace dag {

/**
 * Status of a node attempt during execution
 */
enum class ExecutionStatus {
    Started,    // Attempt began
    Retrying,   // Attempt failed, node resubmitted
    Completed,  // Node succeeded
    Failed      // Node failed for good (budget exhausted or run stopping)
};

/**
 * Event emitted during a run for real-time feedback
 */
struct ExecutionEvent {
    std::string nodeId;
    std::string kind;                // Wire name of the operation
    ExecutionStatus status;
    int attempt = 0;                 // 1-based attempt number
    int64_t durationMs = 0;          // Attempt duration (not for Started)
    std::string errorMessage;        // Only for Retrying/Failed

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["node_id"] = nodeId;
        j["kind"] = kind;
        j["attempt"] = attempt;

        switch (status) {
            case ExecutionStatus::Started:
                j["status"] = "started";
                break;
            case ExecutionStatus::Retrying:
                j["status"] = "retrying";
                j["duration_ms"] = durationMs;
                j["error_message"] = errorMessage;
                break;
            case ExecutionStatus::Completed:
                j["status"] = "completed";
                j["duration_ms"] = durationMs;
                break;
            case ExecutionStatus::Failed:
                j["status"] = "failed";
                j["duration_ms"] = durationMs;
                j["error_message"] = errorMessage;
                break;
        }

        return j;
    }
};

/**
 * Callback type for execution events
 * Invoked from worker threads; must be thread-safe
 */
using ExecutionCallback = std::function<void(const ExecutionEvent&)>;

} // namespace dag
