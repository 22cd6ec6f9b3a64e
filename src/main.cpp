#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <Poco/Exception.h>

#include "chunkyard/core/config.h"
#include "chunkyard/core/logger.h"
#include "chunkyard/http/http_server.h"
#include "chunkyard/http/route_registration.h"
#include "chunkyard/http/router.h"
#include "chunkyard/upload/upload_service.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");

    chunkyard::core::Config config;
    try {
        config = chunkyard::core::LoadConfig(config_path);
    } catch (const Poco::Exception& ex) {
        std::cerr << "failed to load " << config_path << ": " << ex.displayText() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "invalid configuration in " << config_path << ": " << ex.what()
                  << std::endl;
        return 1;
    }
    chunkyard::core::InitLogging(config.observability.log_level);

    chunkyard::upload::UploadHooks hooks;
    hooks.on_finished = [](const std::string& upload_id, int parts) {
        chunkyard::core::LogInfo("completed upload " + upload_id + " from " +
                                 std::to_string(parts) + " parts");
    };
    auto uploads = std::make_shared<chunkyard::upload::UploadService>(config.uploads, hooks);
    auto root = uploads->store().EnsureRoot();
    if (!root.ok()) {
        chunkyard::core::LogError(root.error().message);
        return 1;
    }
    chunkyard::core::LogInfo("staging uploads under " + config.uploads.staging_root);

    chunkyard::http::Router router;
    chunkyard::http::RegisterDefaultRoutes(router, uploads);

    boost::asio::io_context ioc(config.server.threads);
    chunkyard::http::HttpServer server(ioc, config, std::move(router));
    try {
        server.Run();
    } catch (const std::exception& ex) {
        chunkyard::core::LogError(std::string("failed to start server: ") + ex.what());
        return 1;
    }

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
