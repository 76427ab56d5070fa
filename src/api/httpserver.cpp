#include "api/httpserver.hpp"
#include "api/router.hpp"
#include "core/encoding.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <optional>

namespace lockbox::api {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

using BeastRequest = http::request<http::string_body>;
using BeastResponse = http::response<http::string_body>;

std::string toString(beast::string_view view) {
    return std::string(view.data(), view.size());
}

void parseQuery(std::string_view query, Request& request) {
    size_t start = 0;
    while (start < query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string_view::npos) {
            end = query.size();
        }
        std::string_view pair = query.substr(start, end - start);
        size_t eq = pair.find('=');
        auto name = core::percentDecode(pair.substr(0, eq));
        auto value = core::percentDecode(eq == std::string_view::npos ? std::string_view()
                                                                      : pair.substr(eq + 1));
        if (name && value && !name->empty()) {
            request.query.emplace(std::move(*name), std::move(*value));
        }
        start = end + 1;
    }
}

Request toRequest(const BeastRequest& req, const std::string& remoteAddress) {
    Request request;
    request.method = toString(req.method_string());
    request.remoteAddress = remoteAddress;

    std::string target = toString(req.target());
    size_t q = target.find('?');
    request.path = target.substr(0, q);
    if (q != std::string::npos) {
        parseQuery(std::string_view(target).substr(q + 1), request);
    }

    for (const auto& field : req) {
        request.headers[core::toLowerAscii(toString(field.name_string()))] = toString(field.value());
    }
    request.body = req.body();
    return request;
}

BeastResponse toBeast(const Response& response, unsigned version, bool keepAlive) {
    BeastResponse res{static_cast<http::status>(response.status), version};
    res.set(http::field::server, "lockboxd");
    if (!response.contentType.empty()) {
        res.set(http::field::content_type, response.contentType);
    }
    for (const auto& [name, value] : response.headers) {
        res.set(name, value);
    }
    res.keep_alive(keepAlive);
    res.body() = response.body;
    res.prepare_payload();
    return res;
}

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, const Router& router, net::thread_pool& workers,
            const ServerSettings& settings)
        : stream_(std::move(socket)), router_(router), workers_(workers), settings_(settings) {
        beast::error_code ec;
        auto peer = stream_.socket().remote_endpoint(ec);
        if (!ec) {
            remoteAddress_ = peer.address().to_string();
        }
    }

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::doRead, shared_from_this()));
    }

private:
    beast::tcp_stream stream_;
    std::string remoteAddress_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<BeastResponse> response_;
    const Router& router_;
    net::thread_pool& workers_;
    const ServerSettings& settings_;

    void doRead() {
        parser_.emplace();
        parser_->body_limit(settings_.maxBodyBytes);
        stream_.expires_after(settings_.readTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return doClose();
        }
        if (ec == http::error::body_limit) {
            Response tooLarge = Router::errorResponse(
                413, core::errorKindName(core::ErrorKind::Validation), "Request body too large");
            return doWrite(toBeast(tooLarge, 11, false));
        }
        if (ec) {
            if (ec != beast::error::timeout) {
                core::Log::debug("http", "Read failed: " + ec.message());
            }
            return;
        }

        BeastRequest req = parser_->release();
        net::post(workers_, [self = shared_from_this(), req = std::move(req)]() {
            Response response = self->router_.handle(toRequest(req, self->remoteAddress_));
            core::Log::debug("http", toString(req.method_string()) + " " +
                             toString(req.target()) + " -> " + std::to_string(response.status));
            auto res = std::make_shared<BeastResponse>(
                toBeast(response, req.version(), req.keep_alive()));
            net::post(self->stream_.get_executor(), [self, res]() {
                self->doWrite(std::move(*res));
            });
        });
    }

    void doWrite(BeastResponse res) {
        response_ = std::make_shared<BeastResponse>(std::move(res));
        stream_.expires_after(settings_.readTimeout);
        http::async_write(stream_, *response_,
                          beast::bind_front_handler(&Session::onWrite, shared_from_this(),
                                                    response_->keep_alive()));
    }

    void onWrite(bool keepAlive, beast::error_code ec, std::size_t) {
        if (ec) {
            core::Log::debug("http", "Write failed: " + ec.message());
            return;
        }
        response_.reset();
        if (!keepAlive) {
            return doClose();
        }
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

} // namespace

HttpServer::HttpServer(net::io_context& ioc, const ServerSettings& settings, const Router& router)
    : ioc_(ioc),
      acceptor_(ioc),
      settings_(settings),
      router_(router),
      workers_(settings.workerThreads == 0 ? 1 : settings.workerThreads) {
    tcp::endpoint endpoint(net::ip::make_address(settings_.address), settings_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
}

HttpServer::~HttpServer() {
    beast::error_code ec;
    acceptor_.close(ec);
    workers_.join();
}

void HttpServer::run() {
    core::Log::info("http", "Listening on " + settings_.address + ":" + std::to_string(port()));
    doAccept();
}

void HttpServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    ioc_.stop();
}

unsigned short HttpServer::port() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::doAccept() {
    acceptor_.async_accept(net::make_strand(ioc_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    core::Log::warning("http", "Accept failed: " + ec.message());
                }
            } else {
                std::make_shared<Session>(std::move(socket), router_, workers_, settings_)->run();
            }
            if (acceptor_.is_open()) {
                doAccept();
            }
        });
}

} // namespace lockbox::api
