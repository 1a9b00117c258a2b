#pragma once

#include "workflow/TaskInvoker.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace drflow {
namespace workflow {

/**
 * Task handler: input payload -> output payload.
 *
 * Throw TaskInvocationError to pick the error identifier seen by Retry/Catch
 * matchers; any other exception is reported as States.TaskFailed.
 */
using TaskHandler = std::function<json(const json&)>;

/**
 * Explicit TaskRef -> handler table, used as the engine's TaskInvoker
 *
 * Each invocation runs its handler on a thread of its own, at most
 * `maxConcurrent` at a time; further invocations wait in a FIFO queue.
 * The timeout starts when the handler starts. A handler that times out is
 * abandoned: its result is discarded and it stops counting against the
 * limit, so a hung collaborator never starves queued work.
 *
 * Usage:
 *   TaskRegistry tasks(4);
 *   tasks.registerTask("AssessEmergency", [](const json& in) { return json{{"severity", 3}}; });
 *   auto future = tasks.invoke("AssessEmergency", payload, std::chrono::seconds(30));
 */
class TaskRegistry : public TaskInvoker {
public:
    explicit TaskRegistry(size_t maxConcurrent = 4);
    ~TaskRegistry() override;

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * Register (or replace) the handler for a task reference
     */
    void registerTask(const TaskRef& ref, TaskHandler handler);

    bool hasTask(const TaskRef& ref) const;
    std::vector<TaskRef> getTaskRefs() const;

    std::future<TaskOutcome> invoke(const TaskRef& ref,
                                    const json& payload,
                                    std::chrono::milliseconds timeout) override;

    /**
     * Handlers currently holding a concurrency slot
     */
    size_t runningCount() const;

    /**
     * Fail queued invocations with States.Runtime, wait for running (and
     * abandoned) handlers and stop the timer thread. Called by the destructor.
     */
    void shutdown();

private:
    struct PendingCall;

    struct Job {
        std::shared_ptr<PendingCall> call;
        TaskHandler handler;
        TaskRef ref;
        json payload;
        std::chrono::milliseconds timeout;
        std::string logScope;  // tag of the invoking thread
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void dispatchLocked();
    void runJob(Job job);
    void releaseSlot(PendingCall& call);

    mutable std::mutex m_mutex;
    std::map<TaskRef, TaskHandler> m_handlers;
    std::deque<Job> m_queue;
    std::list<Worker> m_workers;
    size_t m_maxConcurrent;
    size_t m_running = 0;
    bool m_stopped = false;

    boost::asio::io_context m_timerContext;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_timerWork;
    std::thread m_timerThread;
};

} // namespace workflow
} // namespace drflow
