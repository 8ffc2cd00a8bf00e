#include "dag/Errors.hpp"
#include "dag/Executor.hpp"
#include <sstream>

namespace dag {

namespace {

std::string joinNames(const std::vector<std::string>& names, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += sep;
        out += names[i];
    }
    return out;
}

} // anonymous namespace

GraphError::GraphError(std::string code, const std::string& message)
    : std::runtime_error(message)
    , m_code(std::move(code))
{}

DuplicateNodeError::DuplicateNodeError(std::string nodeId)
    : GraphError("DuplicateNodeError", "Node with id '" + nodeId + "' already exists")
    , m_nodeId(std::move(nodeId))
{}

NodeNotFoundError::NodeNotFoundError(std::string nodeId)
    : GraphError("NodeNotFoundError", "Node not found: '" + nodeId + "'")
    , m_nodeId(std::move(nodeId))
{}

UnknownKindError::UnknownKindError(std::string kind)
    : GraphError("UnknownKindError", "Unsupported node type: '" + kind + "'")
    , m_kind(std::move(kind))
{}

MissingParameterError::MissingParameterError(std::string kind,
                                             std::vector<std::string> missing,
                                             std::vector<std::string> required,
                                             std::string supplied)
    : GraphError("MissingParameterError",
                 "Missing required parameters for node type " + kind + ": [" +
                 joinNames(missing, ", ") + "] (required: [" + joinNames(required, ", ") +
                 "], supplied: " + supplied + ")")
    , m_kind(std::move(kind))
    , m_missing(std::move(missing))
    , m_required(std::move(required))
    , m_supplied(std::move(supplied))
{}

InvalidParameterError::InvalidParameterError(const std::string& detail)
    : GraphError("InvalidParameterError", "Invalid parameters: " + detail)
{}

CycleError::CycleError(std::string source, std::string target, std::vector<std::string> path)
    : GraphError("CycleError",
                 "Adding edge " + source + " -> " + target + " would create a cycle (" +
                 joinNames(path, " -> ") + " -> " + target + ")")
    , m_source(std::move(source))
    , m_target(std::move(target))
    , m_path(std::move(path))
{}

ConsistencyError::ConsistencyError(const std::string& detail)
    : GraphError("ConsistencyError", "Graph consistency violated: " + detail)
{}

DocumentError::DocumentError(const std::string& detail)
    : GraphError("DocumentError", "Invalid graph document: " + detail)
{}

ExecutionError::ExecutionError(std::string nodeId, std::string cause)
    : ExecutionError("ExecutionError", nodeId, cause,
                     "Execution of node '" + nodeId + "' failed: " + cause)
{}

ExecutionError::ExecutionError(std::string code, std::string nodeId, std::string cause,
                               const std::string& message)
    : GraphError(std::move(code), message)
    , m_nodeId(std::move(nodeId))
    , m_cause(std::move(cause))
{}

FatalError::FatalError(std::string nodeId, std::string cause, int attempts,
                       std::shared_ptr<const ExecutionSummary> summary)
    : ExecutionError("FatalError", nodeId, cause,
                     "Execution aborted: node '" + nodeId + "' failed after " +
                     std::to_string(attempts) + " attempt(s): " + cause)
    , m_attempts(attempts)
    , m_summary(summary ? std::move(summary) : std::make_shared<const ExecutionSummary>())
{}

const ExecutionSummary& FatalError::summary() const {
    return *m_summary;
}

} // namespace dag
