#pragma once

#include "dag/Types.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dag {

struct ExecutionSummary;

/**
 * Base class of every graph error
 *
 * code() is a stable machine-readable name (e.g. "CycleError") used by
 * the HTTP layer; what() is the human readable message.
 */
class GraphError : public std::runtime_error {
public:
    GraphError(std::string code, const std::string& message);

    const std::string& code() const { return m_code; }

private:
    std::string m_code;
};

class DuplicateNodeError : public GraphError {
public:
    explicit DuplicateNodeError(std::string nodeId);
    const std::string& nodeId() const { return m_nodeId; }

private:
    std::string m_nodeId;
};

class NodeNotFoundError : public GraphError {
public:
    explicit NodeNotFoundError(std::string nodeId);
    const std::string& nodeId() const { return m_nodeId; }

private:
    std::string m_nodeId;
};

class UnknownKindError : public GraphError {
public:
    explicit UnknownKindError(std::string kind);
    const std::string& kind() const { return m_kind; }

private:
    std::string m_kind;
};

/**
 * Required parameters are absent
 *
 * missing() is in the registry's required-parameter order.
 */
class MissingParameterError : public GraphError {
public:
    MissingParameterError(std::string kind,
                          std::vector<std::string> missing,
                          std::vector<std::string> required,
                          std::string supplied);

    const std::string& kind() const { return m_kind; }
    const std::vector<std::string>& missing() const { return m_missing; }
    const std::vector<std::string>& required() const { return m_required; }
    const std::string& supplied() const { return m_supplied; }

private:
    std::string m_kind;
    std::vector<std::string> m_missing;
    std::vector<std::string> m_required;
    std::string m_supplied;
};

/**
 * Malformed parameter list or node id
 */
class InvalidParameterError : public GraphError {
public:
    explicit InvalidParameterError(const std::string& detail);
};

/**
 * Adding source -> target would close a cycle
 *
 * path() is the existing route target -> ... -> source.
 */
class CycleError : public GraphError {
public:
    CycleError(std::string source, std::string target, std::vector<std::string> path);

    const std::string& source() const { return m_source; }
    const std::string& target() const { return m_target; }
    const std::vector<std::string>& path() const { return m_path; }

private:
    std::string m_source;
    std::string m_target;
    std::vector<std::string> m_path;
};

/**
 * Internal invariant broken (e.g. a cycle reached the resolver)
 */
class ConsistencyError : public GraphError {
public:
    explicit ConsistencyError(const std::string& detail);
};

/**
 * Malformed graph document
 */
class DocumentError : public GraphError {
public:
    explicit DocumentError(const std::string& detail);
};

/**
 * A unit failed while executing a node
 */
class ExecutionError : public GraphError {
public:
    ExecutionError(std::string nodeId, std::string cause);

    const std::string& nodeId() const { return m_nodeId; }
    const std::string& cause() const { return m_cause; }

protected:
    ExecutionError(std::string code, std::string nodeId, std::string cause, const std::string& message);

private:
    std::string m_nodeId;
    std::string m_cause;
};

/**
 * Run aborted: a node exhausted its retry budget
 *
 * Carries the outcomes recorded up to the abort.
 */
class FatalError : public ExecutionError {
public:
    FatalError(std::string nodeId, std::string cause, int attempts,
               std::shared_ptr<const ExecutionSummary> summary);

    int attempts() const { return m_attempts; }

    /**
     * Outcomes recorded at the time of abort (never null)
     */
    const ExecutionSummary& summary() const;

private:
    int m_attempts;
    std::shared_ptr<const ExecutionSummary> m_summary;
};

} // namespace dag
