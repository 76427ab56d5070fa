#include "api/httpserver.hpp"
#include "api/router.hpp"
#include "auth/jwtidentity.hpp"
#include "config/serviceconfig.hpp"
#include "core/logging.hpp"
#include "lockbox/dataroomservice.hpp"
#include "storage/s3presigner.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>

using namespace lockbox;

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 2;
    }

    try {
        auto config = config::ServiceConfig::load(argv[1]);
        config.applyEnvironment();
        config.validate();
        core::Log::setLevel(*core::Log::parseLevel(config.logLevel));

        auto clock = std::make_shared<core::SystemClock>();
        auto objectStore = std::make_shared<storage::S3Presigner>(config.s3, clock);

        ServiceOptions options;
        options.databasePath = config.databasePath;
        options.database = config.database;
        options.inviteSecret = config::ServiceConfig::secretBytes(config.inviteSecret);
        options.auditKey = config::ServiceConfig::secretBytes(config.auditKey);
        DataRoomService service(options, objectStore, clock);

        auto identity = std::make_shared<auth::JwtIdentityProvider>(
            config::ServiceConfig::secretBytes(config.jwtSecret), clock, config.jwtIssuer);
        api::Router router(service, identity);

        boost::asio::io_context ioc;
        api::HttpServer server(ioc, config.server, router);

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&server](const boost::system::error_code& ec, int signal) {
            if (!ec) {
                core::Log::info("lockboxd", "Caught signal " + std::to_string(signal) + ", shutting down");
                server.stop();
            }
        });

        server.run();
        ioc.run();
    } catch (const std::exception& e) {
        core::Log::error("lockboxd", e.what());
        return 1;
    }

    core::Log::info("lockboxd", "Stopped");
    return 0;
}
