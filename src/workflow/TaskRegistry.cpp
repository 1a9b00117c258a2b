#include "workflow/TaskRegistry.hpp"
#include "core/Logger.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace drflow {
namespace workflow {

/**
 * Shared between the handler thread and the timeout timer; whichever
 * finishes first settles the promise, the other is a no-op.
 */
struct TaskRegistry::PendingCall {
    explicit PendingCall(boost::asio::io_context& ctx) : timer(ctx) {}

    bool settle(TaskOutcome outcome) {
        if (settled.exchange(true)) {
            return false;
        }
        promise.set_value(std::move(outcome));
        return true;
    }

    std::promise<TaskOutcome> promise;
    std::atomic<bool> settled{false};
    std::atomic<bool> slotReleased{false};
    boost::asio::steady_timer timer;
};

TaskRegistry::TaskRegistry(size_t maxConcurrent)
    : m_maxConcurrent(maxConcurrent == 0 ? 1 : maxConcurrent)
    , m_timerWork(boost::asio::make_work_guard(m_timerContext))
{
    m_timerThread = std::thread([this]() { m_timerContext.run(); });
}

TaskRegistry::~TaskRegistry() {
    shutdown();
}

void TaskRegistry::shutdown() {
    std::deque<Job> queued;
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped) return;
        m_stopped = true;
        queued.swap(m_queue);
        workers.swap(m_workers);
    }

    for (auto& job : queued) {
        job.call->settle(TaskOutcome::failure({errors::RUNTIME, "Task registry is shut down"}));
    }
    if (!workers.empty()) {
        LOG_DEBUG("Waiting for " + std::to_string(workers.size()) + " task handler(s)");
    }
    for (auto& worker : workers) {
        worker.thread.join();
    }

    m_timerWork.reset();
    m_timerContext.stop();
    if (m_timerThread.joinable()) {
        m_timerThread.join();
    }
}

void TaskRegistry::registerTask(const TaskRef& ref, TaskHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers[ref] = std::move(handler);
}

bool TaskRegistry::hasTask(const TaskRef& ref) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handlers.count(ref) > 0;
}

std::vector<TaskRef> TaskRegistry::getTaskRefs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TaskRef> refs;
    refs.reserve(m_handlers.size());
    for (const auto& [ref, _] : m_handlers) {
        refs.push_back(ref);
    }
    return refs;
}

size_t TaskRegistry::runningCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

std::future<TaskOutcome> TaskRegistry::invoke(const TaskRef& ref,
                                              const json& payload,
                                              std::chrono::milliseconds timeout) {
    auto call = std::make_shared<PendingCall>(m_timerContext);
    auto future = call->promise.get_future();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped) {
        call->settle(TaskOutcome::failure({errors::RUNTIME, "Task registry is shut down"}));
        return future;
    }
    auto it = m_handlers.find(ref);
    if (it == m_handlers.end()) {
        call->settle(TaskOutcome::failure(
            {errors::RUNTIME, "No handler registered for task '" + ref + "'"}));
        return future;
    }

    m_queue.push_back(Job{
        .call = call,
        .handler = it->second,
        .ref = ref,
        .payload = payload,
        .timeout = timeout,
        .logScope = Logger::currentScope()
    });
    dispatchLocked();
    return future;
}

// Caller holds m_mutex
void TaskRegistry::dispatchLocked() {
    if (m_stopped) return;

    for (auto it = m_workers.begin(); it != m_workers.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }

    while (m_running < m_maxConcurrent && !m_queue.empty()) {
        Job job = std::move(m_queue.front());
        m_queue.pop_front();
        ++m_running;

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([this, job = std::move(job), done]() mutable {
            runJob(std::move(job));
            done->store(true);
        });
        m_workers.push_back(Worker{std::move(thread), done});
    }
}

void TaskRegistry::runJob(Job job) {
    LogScope scope(job.logScope.empty() ? job.ref : job.logScope + "/" + job.ref, false);
    auto call = job.call;
    const TaskRef ref = job.ref;
    const auto timeout = job.timeout;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    boost::asio::post(m_timerContext, [this, call, ref, timeout, deadline]() {
        call->timer.expires_at(deadline);
        call->timer.async_wait([this, call, ref, timeout](const boost::system::error_code& ec) {
            if (ec) return;  // cancelled: the handler finished first
            if (call->settle(TaskOutcome::failure(
                    {errors::TIMEOUT, "Task '" + ref + "' did not complete within " +
                                      std::to_string(timeout.count()) + " ms"}))) {
                LOG_WARN("Task '" + ref + "' timed out after " + std::to_string(timeout.count()) +
                         " ms; abandoning its handler");
                releaseSlot(*call);
            }
        });
    });

    TaskOutcome outcome;
    try {
        outcome = TaskOutcome::ok(job.handler(job.payload));
    } catch (const WorkflowException& e) {
        outcome = TaskOutcome::failure(e.info());
    } catch (const std::exception& e) {
        outcome = TaskOutcome::failure({errors::TASK_FAILED, e.what()});
    } catch (...) {
        outcome = TaskOutcome::failure(
            {errors::TASK_FAILED, "Task '" + ref + "' threw a non-standard exception"});
    }

    if (!call->settle(std::move(outcome))) {
        LOG_DEBUG("Discarding late result of task '" + ref + "'");
    }
    boost::asio::post(m_timerContext, [call]() { call->timer.cancel(); });
    releaseSlot(*call);
}

void TaskRegistry::releaseSlot(PendingCall& call) {
    if (call.slotReleased.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    --m_running;
    dispatchLocked();
}

} // namespace workflow
} // namespace drflow
