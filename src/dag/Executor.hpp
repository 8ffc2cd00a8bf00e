#pragma once

#include "dag/Types.hpp"
#include "dag/OperationRegistry.hpp"
#include "dag/DependencyResolver.hpp"
#include "dag/ExecutionEvent.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dag {

/**
 * Per-attempt node state
 *
 * Pending -> Running -> {Succeeded | Failed}; a failed attempt with
 * budget left goes back to Pending.
 */
enum class NodeState {
    Pending,
    Running,
    Succeeded,
    Failed
};

std::string nodeStateToString(NodeState state);

/**
 * Retry bookkeeping for one node, owned by the executor for one run
 */
struct RetryState {
    int attemptsRemaining = 0;
    NodeState state = NodeState::Pending;
};

/**
 * What happened to a node during a run
 */
struct NodeOutcome {
    std::string nodeId;
    NodeState state = NodeState::Pending;  // Pending: never ran
    int attempts = 0;
    std::string lastError;                 // Error of the last failed attempt
    ColumnData output;                     // Set when Succeeded
    int64_t durationMs = 0;                // Summed over attempts
};

/**
 * Result of a run
 */
struct ExecutionSummary {
    std::map<std::string, NodeOutcome> outcomes;
    size_t stageCount = 0;
    size_t stagesCompleted = 0;
    int64_t durationMs = 0;
    bool cancelled = false;

    const NodeOutcome* find(const std::string& nodeId) const;

    /**
     * Ids of succeeded nodes (sorted)
     */
    std::vector<std::string> completedNodes() const;
};

/**
 * Shared cancellation flag
 *
 * Copies share the same flag. Once cancelled, a run submits no new
 * stage or retry; attempts already running finish.
 */
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

struct ExecutorOptions {
    size_t concurrency = 4;   // Worker pool size
    int retryBudget = 3;      // Total attempts per node
};

/**
 * Runs a StagedPlan
 *
 * Stages run strictly in order with a barrier between them: stage i+1
 * starts only when every node of stage i has a terminal outcome,
 * retries included. Inside a stage, nodes run concurrently on a fixed
 * size worker pool acquired for the duration of run().
 *
 * Each node's output column is published into the data table under
 * the node id once its stage completes, so later stages can read it.
 */
class Executor {
public:
    /**
     * Throws std::invalid_argument if concurrency or retryBudget < 1
     */
    explicit Executor(const OperationRegistry& registry, ExecutorOptions options = {});

    /**
     * Set callback for per-attempt events
     *
     * Invoked from worker threads. An exception thrown by the callback
     * is logged and does not affect the run.
     */
    void setExecutionCallback(ExecutionCallback callback);

    const ExecutorOptions& options() const { return m_options; }

    /**
     * Execute the plan against the input table
     *
     * Returns the summary (cancelled = true if the token was raised).
     * Throws FatalError when a node exhausts its retry budget; the
     * error carries the outcomes recorded so far.
     */
    ExecutionSummary run(const StagedPlan& plan,
                         const DataTable& inputs = {},
                         const CancellationToken& cancel = {});

private:
    struct StageRun;

    void runStage(StageRun& stage, const Stage& nodeIds);
    void submit(StageRun& stage, const std::string& nodeId);
    void runAttempt(StageRun& stage, const std::string& nodeId);
    void emit(const ExecutionEvent& event) const;

    const OperationRegistry& m_registry;
    ExecutorOptions m_options;
    ExecutionCallback m_callback;
};

} // namespace dag
