#include "server/HttpServer.hpp"
#include "server/RequestHandler.hpp"
#include "server/ServerConfig.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "dag/GraphSession.hpp"
#include "storage/GraphStorage.hpp"
#include <iostream>
#include <csignal>
#include <functional>
#include <memory>

using namespace opgraph::server;

namespace {
    std::function<void()> shutdown_handler;
    void signal_handler(int) {
        if (shutdown_handler) shutdown_handler();
    }
}

int main(int argc, char* argv[]) {
    try {
        ServerConfig config = ServerConfig::fromArgs(argc, argv);
        if (config.showHelp) {
            std::cout << ServerConfig::usage(argv[0]);
            return 0;
        }

        // Configure Logger
        Logger::instance().setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            Logger::instance().enableFileLogging(config.logFile);
        }

        // Configure Profiler
        Profiler::instance().setEnabled(config.enableProfiler);

        std::cout << "=== OpGraphServer ===" << std::endl;
        std::cout << std::endl;

        dag::ExecutorOptions options;
        options.concurrency = config.workers;
        options.retryBudget = config.retries;
        dag::GraphSession session(dag::OperationRegistry::defaults(), options);

        // Load the dataset (optional)
        if (!config.datasetPath.empty()) {
            auto table = dag::DataTable::readCsv(config.datasetPath);
            LOG_INFO("Dataset loaded: " + std::to_string(table.columnCount()) + " column(s), " +
                     std::to_string(table.rowCount()) + " row(s)");
            session.setDataset(std::move(table));
        }

        // Open graph storage
        auto graphStorage = std::make_unique<storage::GraphStorage>(config.graphsDbPath);

        RequestHandler handler(session, graphStorage.get());

        // IO context, single-threaded
        net::io_context ioc{1};

        // Create and start the server
        HttpServer server(ioc, config.address, config.port, handler);
        server.run();

        // Shutdown on SIGINT/SIGTERM
        shutdown_handler = [&]() {
            LOG_INFO("Shutting down...");

            // Print profiler stats
            if (Profiler::instance().isEnabled()) {
                std::cout << Profiler::instance().formatStats() << std::endl;
            }

            server.stop();
            ioc.stop();
        };
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::cout << std::endl;
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  GET    /api/health           - Health check" << std::endl;
        std::cout << "  POST   /add_node             - Add a node {id, type, parameters}" << std::endl;
        std::cout << "  DELETE /remove_node/:id      - Remove a node" << std::endl;
        std::cout << "  POST   /add_edge             - Add an edge {source, target}" << std::endl;
        std::cout << "  POST   /remove_edge          - Remove an edge {source, target}" << std::endl;
        std::cout << "  GET    /execute              - Run the graph" << std::endl;
        std::cout << "  GET    /dag                  - Export the graph" << std::endl;
        std::cout << "  PUT    /dag                  - Replace the graph" << std::endl;
        std::cout << std::endl;
        std::cout << "  GET    /api/graphs           - List saved graphs" << std::endl;
        std::cout << "  POST   /api/graphs/:slug     - Save the graph as a new version" << std::endl;
        std::cout << "  GET    /api/graphs/:slug     - Load the latest version" << std::endl;
        std::cout << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << std::endl;

        // Run the event loop
        ioc.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
