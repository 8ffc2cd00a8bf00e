#include "dag/Executor.hpp"
#include "dag/Errors.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>

namespace dag {

std::string nodeStateToString(NodeState state) {
    switch (state) {
        case NodeState::Pending: return "pending";
        case NodeState::Running: return "running";
        case NodeState::Succeeded: return "succeeded";
        case NodeState::Failed: return "failed";
    }
    return "unknown";
}

const NodeOutcome* ExecutionSummary::find(const std::string& nodeId) const {
    auto it = outcomes.find(nodeId);
    return it != outcomes.end() ? &it->second : nullptr;
}

std::vector<std::string> ExecutionSummary::completedNodes() const {
    std::vector<std::string> ids;
    for (const auto& [id, outcome] : outcomes) {
        if (outcome.state == NodeState::Succeeded) {
            ids.push_back(id);
        }
    }
    return ids;
}

// =============================================================================
// Stage bookkeeping
// =============================================================================

/**
 * State shared between the coordinating thread and the workers while
 * one stage runs. Everything below the mutex is guarded by it.
 */
struct Executor::StageRun {
    StageRun(boost::asio::thread_pool& p, const StagedPlan& pl, const DataTable& t,
             const CancellationToken& c, ExecutionSummary& s)
        : pool(p), plan(pl), table(t), cancel(c), summary(s) {}

    boost::asio::thread_pool& pool;
    const StagedPlan& plan;
    const DataTable& table;
    const CancellationToken& cancel;

    std::mutex mutex;
    std::condition_variable done;
    ExecutionSummary& summary;
    std::unordered_map<std::string, RetryState> retry;
    size_t unfinished = 0;             // Nodes without a terminal outcome
    bool aborted = false;
    std::optional<ExecutionError> failure;

    bool stopping() const { return aborted || cancel.isCancelled(); }
};

/**
 * Joins the pool on every exit path of run()
 */
class PoolGuard {
public:
    explicit PoolGuard(boost::asio::thread_pool& pool) : m_pool(pool) {}
    ~PoolGuard() { m_pool.join(); }

    PoolGuard(const PoolGuard&) = delete;
    PoolGuard& operator=(const PoolGuard&) = delete;

private:
    boost::asio::thread_pool& m_pool;
};

// =============================================================================
// Executor
// =============================================================================

Executor::Executor(const OperationRegistry& registry, ExecutorOptions options)
    : m_registry(registry)
    , m_options(options)
{
    if (m_options.concurrency < 1) {
        throw std::invalid_argument("concurrency must be at least 1");
    }
    if (m_options.retryBudget < 1) {
        throw std::invalid_argument("retry budget must be at least 1");
    }
}

void Executor::setExecutionCallback(ExecutionCallback callback) {
    m_callback = std::move(callback);
}

void Executor::emit(const ExecutionEvent& event) const {
    if (!m_callback) {
        return;
    }
    // Called from pool workers: an exception escaping here would terminate
    try {
        m_callback(event);
    } catch (const std::exception& e) {
        LOG_ERROR("Execution callback failed for node " + event.nodeId + ": " + e.what());
    }
}

ExecutionSummary Executor::run(const StagedPlan& plan, const DataTable& inputs,
                               const CancellationToken& cancel) {
    PROFILE_SCOPE("execute");
    auto startTime = std::chrono::steady_clock::now();

    auto summary = std::make_shared<ExecutionSummary>();
    summary->stageCount = plan.stages.size();
    for (const auto& [id, node] : plan.nodes) {
        summary->outcomes[id].nodeId = id;
    }

    LOG_INFO("Executing " + std::to_string(plan.nodeCount()) + " node(s) in " +
             std::to_string(plan.stages.size()) + " stage(s), concurrency=" +
             std::to_string(m_options.concurrency) + ", retry budget=" +
             std::to_string(m_options.retryBudget));

    // Working copy: stage outputs are published here between stages
    DataTable table = inputs;
    std::optional<ExecutionError> failure;

    {
        boost::asio::thread_pool pool(m_options.concurrency);
        PoolGuard guard(pool);

        for (size_t i = 0; i < plan.stages.size(); ++i) {
            if (cancel.isCancelled()) {
                summary->cancelled = true;
                break;
            }

            StageRun stage(pool, plan, table, cancel, *summary);
            for (const auto& id : plan.stages[i]) {
                stage.retry[id] = RetryState{m_options.retryBudget, NodeState::Pending};
            }
            runStage(stage, plan.stages[i]);

            if (stage.failure) {
                failure = std::move(stage.failure);
                break;
            }
            if (cancel.isCancelled()) {
                summary->cancelled = true;
                break;
            }

            // Barrier passed: publish outputs for the next stage
            for (const auto& id : plan.stages[i]) {
                const auto& outcome = summary->outcomes.at(id);
                if (outcome.state == NodeState::Succeeded) {
                    table.setColumn(id, outcome.output);
                }
            }
            summary->stagesCompleted++;
            LOG_DEBUG("Stage " + std::to_string(i) + " completed (" +
                      std::to_string(plan.stages[i].size()) + " node(s))");
        }
    }

    summary->durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();

    if (failure) {
        int attempts = summary->outcomes.at(failure->nodeId()).attempts;
        LOG_ERROR("Execution aborted: node " + failure->nodeId() + " failed after " +
                  std::to_string(attempts) + " attempt(s): " + failure->cause());
        throw FatalError(failure->nodeId(), failure->cause(), attempts, summary);
    }

    if (summary->cancelled) {
        LOG_WARN("Execution cancelled after " + std::to_string(summary->stagesCompleted) +
                 " of " + std::to_string(summary->stageCount) + " stage(s)");
    } else {
        LOG_INFO("Execution finished in " + std::to_string(summary->durationMs) + "ms");
    }
    return *summary;
}

void Executor::runStage(StageRun& stage, const Stage& nodeIds) {
    {
        std::lock_guard lock(stage.mutex);
        stage.unfinished = nodeIds.size();
    }

    for (const auto& id : nodeIds) {
        submit(stage, id);
    }

    std::unique_lock lock(stage.mutex);
    stage.done.wait(lock, [&stage] { return stage.unfinished == 0; });
}

void Executor::submit(StageRun& stage, const std::string& nodeId) {
    boost::asio::post(stage.pool, [this, &stage, nodeId] {
        runAttempt(stage, nodeId);
    });
}

void Executor::runAttempt(StageRun& stage, const std::string& nodeId) {
    const Node& node = stage.plan.nodes.at(nodeId);
    const std::string kind = kindToString(node.kind);
    int attempt = 0;

    {
        std::lock_guard lock(stage.mutex);
        auto& retry = stage.retry.at(nodeId);
        auto& outcome = stage.summary.outcomes.at(nodeId);

        // Queued work is dropped once the run is stopping
        if (stage.stopping()) {
            if (outcome.attempts > 0) {
                retry.state = NodeState::Failed;
                outcome.state = NodeState::Failed;
            }
            stage.unfinished--;
            stage.done.notify_all();
            return;
        }

        retry.state = NodeState::Running;
        retry.attemptsRemaining--;
        outcome.state = NodeState::Running;
        attempt = ++outcome.attempts;
    }

    emit(ExecutionEvent{nodeId, kind, ExecutionStatus::Started, attempt, 0, ""});

    auto t0 = std::chrono::steady_clock::now();
    ColumnData output;
    std::optional<std::string> error;
    try {
        const auto& capability = m_registry.lookup(node.kind);
        m_registry.validate(node.kind, node.parameters);
        capability.unit->validate(node.parameters);
        output = capability.unit->execute(node.parameters, stage.table);
    } catch (const std::exception& e) {
        error = e.what();
    } catch (...) {
        error = "unknown exception";
    }
    double elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    opgraph::server::Profiler::instance().record("unit:" + kind, elapsed);
    auto elapsedMs = static_cast<int64_t>(elapsed);

    ExecutionEvent event{nodeId, kind, ExecutionStatus::Completed, attempt, elapsedMs, ""};
    bool resubmit = false;
    {
        std::lock_guard lock(stage.mutex);
        auto& retry = stage.retry.at(nodeId);
        auto& outcome = stage.summary.outcomes.at(nodeId);
        outcome.durationMs += elapsedMs;

        if (!error) {
            retry.state = NodeState::Succeeded;
            outcome.state = NodeState::Succeeded;
            outcome.output = std::move(output);
            outcome.lastError.clear();
        } else {
            outcome.lastError = *error;
            event.errorMessage = *error;

            if (retry.attemptsRemaining > 0 && !stage.stopping()) {
                retry.state = NodeState::Pending;
                outcome.state = NodeState::Pending;
                event.status = ExecutionStatus::Retrying;
                resubmit = true;
            } else {
                retry.state = NodeState::Failed;
                outcome.state = NodeState::Failed;
                event.status = ExecutionStatus::Failed;
                if (retry.attemptsRemaining == 0 && !stage.failure) {
                    stage.failure.emplace(nodeId, *error);
                    stage.aborted = true;
                }
            }
        }
    }

    if (resubmit) {
        LOG_WARN("Node " + nodeId + " attempt " + std::to_string(attempt) + " failed (" +
                 *error + "), retrying");
    } else if (error) {
        LOG_ERROR("Node " + nodeId + " failed on attempt " + std::to_string(attempt) + ": " + *error);
    } else {
        LOG_DEBUG("Node " + nodeId + " succeeded on attempt " + std::to_string(attempt) +
                  " (" + std::to_string(elapsedMs) + "ms)");
    }

    emit(event);

    if (resubmit) {
        submit(stage, nodeId);
        return;
    }

    std::lock_guard lock(stage.mutex);
    stage.unfinished--;
    stage.done.notify_all();
}

} // namespace dag
