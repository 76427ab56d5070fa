#pragma once

#include "api/api_export.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace lockbox::api {

class Router;

struct ServerSettings {
    std::string address = "127.0.0.1";
    unsigned short port = 8080;              // 0 picks a free port
    size_t workerThreads = 4;                // Threads running request handlers
    size_t maxBodyBytes = 1024 * 1024;       // Larger bodies get 413
    std::chrono::seconds readTimeout{30};
};

/**
 * @brief HTTP/1.1 front end for the router
 *
 * Socket I/O runs on the io_context passed in; each parsed request is
 * handed to a worker pool because handlers block on SQLite. The response
 * is written back on the connection's executor.
 */
class LOCKBOX_API_EXPORT HttpServer {
public:
    /**
     * @brief Bind and listen
     * @throws boost::system::system_error if the address cannot be bound
     */
    HttpServer(boost::asio::io_context& ioc, const ServerSettings& settings, const Router& router);
    ~HttpServer();

    /**
     * @brief Start accepting connections; returns immediately
     */
    void run();

    /**
     * @brief Stop accepting and stop the io_context
     */
    void stop();

    /**
     * @brief Port actually bound
     */
    unsigned short port() const;

private:
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    ServerSettings settings_;
    const Router& router_;
    boost::asio::thread_pool workers_;

    void doAccept();

    // Prevent copying
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
};

} // namespace lockbox::api
