#include "server/Config.hpp"
#include "server/HttpServer.hpp"
#include "server/HttpTaskClient.hpp"
#include "server/RequestHandler.hpp"
#include "storage/ExecutionStore.hpp"
#include "workflow/ExecutionService.hpp"
#include "workflow/TaskRegistry.hpp"
#include "workflow/WorkflowRegistry.hpp"
#include "core/Logger.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>

using namespace drflow;

namespace {

void loadStoredWorkflows(storage::ExecutionStore& store, workflow::WorkflowRegistry& workflows) {
    for (const auto& record : store.loadWorkflows()) {
        try {
            workflows.registerWorkflow(record.name, nlohmann::json::parse(record.definitionJson));
            LOG_INFO("Loaded stored workflow '" + record.name + "'");
        } catch (const workflow::ValidationError& e) {
            LOG_ERROR("Stored workflow '" + record.name + "' is invalid: " + e.what());
        } catch (const nlohmann::json::parse_error& e) {
            LOG_ERROR("Stored workflow '" + record.name + "' is not valid JSON: " + e.what());
        }
    }
}

void warnMissingResources(const workflow::WorkflowRegistry& workflows,
                          const workflow::TaskRegistry& tasks) {
    for (const auto& name : workflows.getWorkflowNames()) {
        auto definition = workflows.getWorkflow(name);
        if (!definition) continue;
        for (const auto& ref : workflow::WorkflowRegistry::missingResources(*definition, tasks)) {
            LOG_WARN("Workflow '" + name + "' uses task '" + ref +
                     "' which has no endpoint; it will fail with States.Runtime");
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    server::AppConfig config;
    try {
        config = server::parseArgs(argc, argv);
    } catch (const server::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << server::usage(argv[0]);
        return 2;
    }
    if (config.showHelp) {
        std::cout << server::usage(argv[0]);
        return 0;
    }

    try {
        Logger::instance().setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            Logger::instance().enableFileLogging(config.logFile);
        }

        std::cout << "=== drflow ===" << std::endl;

        storage::ExecutionStore store(config.database);
        LOG_INFO("Execution store: " + store.getDbPath());

        // Task collaborators
        workflow::TaskRegistry tasks(config.taskThreads);
        server::HttpTaskClient client(config.taskTimeout());
        for (const auto& [ref, url] : config.taskEndpoints) {
            server::HttpTaskClient::parseUrl(url);
            tasks.registerTask(ref, client.handlerFor(url));
            LOG_INFO("Task '" + ref + "' -> " + url);
        }

        // Workflow definitions: directory first, then those registered through the API
        workflow::WorkflowRegistry workflows;
        if (!config.workflowsDir.empty()) {
            workflows.loadDirectory(config.workflowsDir);
        }
        loadStoredWorkflows(store, workflows);
        warnMissingResources(workflows, tasks);

        workflow::ExecutionService service(workflows, tasks, store, config.serviceOptions());
        size_t resumed = service.recoverInterrupted();
        if (resumed > 0) {
            LOG_INFO("Resumed " + std::to_string(resumed) + " interrupted execution(s)");
        }

        server::RequestHandler handler(workflows, service, store);

        boost::asio::io_context ioc{1};
        server::HttpServer httpServer(ioc, handler, config.address, config.port);
        httpServer.run();

        // Stop on SIGINT / SIGTERM
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            LOG_INFO("Shutting down...");
            httpServer.stop();
            ioc.stop();
        });

        std::cout << std::endl;
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  GET  /api/health                       - Health check" << std::endl;
        std::cout << "  GET  /api/workflows                    - List workflows" << std::endl;
        std::cout << "  GET  /api/workflows/:name              - Get a workflow definition" << std::endl;
        std::cout << "  POST /api/workflows/:name              - Register a workflow definition" << std::endl;
        std::cout << "  POST /api/workflows/validate           - Validate a definition" << std::endl;
        std::cout << "  POST /api/workflows/:name/executions   - Start an execution" << std::endl;
        std::cout << "  GET  /api/workflows/:name/executions   - List executions" << std::endl;
        std::cout << "  GET  /api/executions/:id               - Execution status" << std::endl;
        std::cout << "  GET  /api/executions/:id/history       - Execution history" << std::endl;
        std::cout << "  GET  /api/executions/:id/report        - Situation report" << std::endl;
        std::cout << "  POST /api/executions/:id/cancel        - Cancel an execution" << std::endl;
        std::cout << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        ioc.run();

        service.shutdown();
        tasks.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
