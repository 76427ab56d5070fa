#include "storage/s3presigner.hpp"
#include "core/digest.hpp"
#include "core/encoding.hpp"
#include "core/errors.hpp"
#include "core/identifiers.hpp"
#include "core/logging.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <vector>

namespace lockbox::storage {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr char ALGORITHM[] = "AWS4-HMAC-SHA256";
constexpr char SERVICE[] = "s3";
constexpr char UNSIGNED_PAYLOAD[] = "UNSIGNED-PAYLOAD";
constexpr std::chrono::seconds MAX_EXPIRY{7 * 24 * 60 * 60};

std::vector<uint8_t> toBytes(std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// {"20130524T000000Z", "20130524"}
std::pair<std::string, std::string> signingDates(core::TimePoint at) {
    std::time_t t = std::chrono::system_clock::to_time_t(at);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char amzDate[32];
    std::snprintf(amzDate, sizeof(amzDate), "%04d%02d%02dT%02d%02d%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return {std::string(amzDate), std::string(amzDate, 8)};
}

// "host:port" or "[v6]:port" into a name the resolver accepts and a port
std::pair<std::string, std::string> splitHostPort(const std::string& host,
                                                  const std::string& scheme) {
    std::string name = host;
    std::string port = scheme == "https" ? "443" : "80";
    size_t colon = host.rfind(':');
    size_t bracket = host.rfind(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        name = host.substr(0, colon);
        port = host.substr(colon + 1);
    }
    if (name.size() > 2 && name.front() == '[' && name.back() == ']') {
        name = name.substr(1, name.size() - 2);
    }
    return {name, port};
}

// Run one asynchronous step to completion; the stream's deadline bounds it
template <typename Start>
beast::error_code runStep(net::io_context& ioc, Start&& start) {
    beast::error_code result;
    start([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

template <typename Stream>
beast::error_code exchange(net::io_context& ioc,
                           Stream& stream,
                           http::request<http::empty_body>& request,
                           http::response<http::string_body>& response) {
    beast::error_code ec = runStep(ioc, [&](auto handler) {
        http::async_write(stream, request, std::move(handler));
    });
    if (ec) {
        return ec;
    }
    beast::flat_buffer buffer;
    return runStep(ioc, [&](auto handler) {
        http::async_read(stream, buffer, response, std::move(handler));
    });
}

} // namespace

S3Presigner::S3Presigner(S3Settings settings, std::shared_ptr<const core::Clock> clock)
    : settings_(std::move(settings)), clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("S3Presigner requires a clock");
    }
    if (settings_.bucket.empty() || settings_.region.empty()) {
        throw std::invalid_argument("S3 bucket and region are required");
    }
    if (settings_.accessKeyId.empty() || settings_.secretAccessKey.empty()) {
        throw std::invalid_argument("S3 credentials are required");
    }

    const std::string separator = "://";
    size_t pos = settings_.endpoint.find(separator);
    if (pos == std::string::npos) {
        throw std::invalid_argument("S3 endpoint must include a scheme: " + settings_.endpoint);
    }
    scheme_ = core::toLowerAscii(settings_.endpoint.substr(0, pos));
    endpointHost_ = settings_.endpoint.substr(pos + separator.size());
    while (!endpointHost_.empty() && endpointHost_.back() == '/') {
        endpointHost_.pop_back();
    }
    if ((scheme_ != "http" && scheme_ != "https") || endpointHost_.empty() ||
        endpointHost_.find('/') != std::string::npos) {
        throw std::invalid_argument("Invalid S3 endpoint: " + settings_.endpoint);
    }
}

UploadTicket S3Presigner::presignUpload(const std::string& roomId) {
    UploadTicket ticket;
    ticket.storageKey = documentStorageKey(roomId, core::generateUuid());
    ticket.expiresIn = settings_.uploadExpiry;
    ticket.uploadUrl = presignUrl("PUT", ticket.storageKey, settings_.uploadExpiry, clock_->now());
    return ticket;
}

DownloadTicket S3Presigner::presignDownload(const std::string& roomId,
                                            const std::string& documentId) {
    DownloadTicket ticket;
    ticket.expiresIn = settings_.downloadExpiry;
    ticket.downloadUrl = presignUrl("GET", documentStorageKey(roomId, documentId),
                                    settings_.downloadExpiry, clock_->now());
    return ticket;
}

void S3Presigner::deleteObject(const std::string& roomId, const std::string& documentId) {
    const std::string key = documentStorageKey(roomId, documentId);
    unsigned status = send("DELETE", signedTarget("DELETE", key, settings_.downloadExpiry,
                                                  clock_->now()));

    // S3 answers 204 whether or not the key existed; other stores may say 404
    if (status == 200 || status == 204 || status == 404) {
        core::Log::debug("s3", "Deleted object " + key);
        return;
    }
    const std::string message = "S3 DELETE of " + key + " returned " + std::to_string(status);
    if (status >= 500 || status == 429) {
        throw core::TransientStorageError(message);
    }
    throw core::StorageError(message);
}

unsigned S3Presigner::send(std::string_view method, const std::string& target) const {
    const std::string hostHeader = host();
    const auto address = splitHostPort(hostHeader, scheme_);
    const std::string& hostName = address.first;

    http::request<http::empty_body> request;
    request.method(http::string_to_verb(beast::string_view(method.data(), method.size())));
    request.target(target);
    request.version(11);
    request.set(http::field::host, hostHeader);
    request.set(http::field::user_agent, "lockboxd");
    request.keep_alive(false);
    http::response<http::string_body> response;

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto endpoints = resolver.resolve(hostName, address.second, ec);
    if (ec) {
        throw core::TransientStorageError("Cannot resolve " + hostName + ": " + ec.message());
    }

    auto connect = [&](beast::tcp_stream& lowest) {
        lowest.expires_after(settings_.requestTimeout);
        return runStep(ioc, [&](auto handler) {
            lowest.async_connect(endpoints, std::move(handler));
        });
    };

    if (scheme_ == "https") {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        stream.set_verify_mode(ssl::verify_peer);
        stream.set_verify_callback(ssl::host_name_verification(hostName));
        if (!SSL_set_tlsext_host_name(stream.native_handle(), hostName.c_str())) {
            throw core::StorageError("Failed to set TLS server name for " + hostName);
        }

        ec = connect(beast::get_lowest_layer(stream));
        if (!ec) {
            ec = runStep(ioc, [&](auto handler) {
                stream.async_handshake(ssl::stream_base::client, std::move(handler));
            });
        }
        if (!ec) {
            ec = exchange(ioc, stream, request, response);
        }
    } else {
        beast::tcp_stream stream(ioc);
        ec = connect(stream);
        if (!ec) {
            ec = exchange(ioc, stream, request, response);
        }
    }

    if (ec) {
        throw core::TransientStorageError("S3 " + std::string(method) + " to " + hostName +
                                          " failed: " + ec.message());
    }
    return response.result_int();
}

std::string S3Presigner::host() const {
    return settings_.pathStyle ? endpointHost_ : settings_.bucket + "." + endpointHost_;
}

std::string S3Presigner::canonicalUri(const std::string& key) const {
    std::string encodedKey = core::percentEncode(key, true);
    if (settings_.pathStyle) {
        return "/" + core::percentEncode(settings_.bucket) + "/" + encodedKey;
    }
    return "/" + encodedKey;
}

std::string S3Presigner::presignUrl(std::string_view method,
                                    const std::string& key,
                                    std::chrono::seconds expires,
                                    core::TimePoint at) const {
    return scheme_ + "://" + host() + signedTarget(method, key, expires, at);
}

std::string S3Presigner::signedTarget(std::string_view method,
                                      const std::string& key,
                                      std::chrono::seconds expires,
                                      core::TimePoint at) const {
    if (expires.count() <= 0 || expires > MAX_EXPIRY) {
        throw std::invalid_argument("Presigned URL expiry must be between 1 second and 7 days");
    }

    auto [amzDate, dateStamp] = signingDates(at);
    const std::string scope = dateStamp + "/" + settings_.region + "/" + SERVICE + "/aws4_request";
    const std::string credential = settings_.accessKeyId + "/" + scope;
    const std::string uri = canonicalUri(key);
    const std::string hostName = host();

    // Parameters in byte order of their names
    std::string query;
    query += "X-Amz-Algorithm=" + std::string(ALGORITHM);
    query += "&X-Amz-Credential=" + core::percentEncode(credential);
    query += "&X-Amz-Date=" + amzDate;
    query += "&X-Amz-Expires=" + std::to_string(expires.count());
    query += "&X-Amz-SignedHeaders=host";

    std::string canonicalRequest;
    canonicalRequest += std::string(method) + "\n";
    canonicalRequest += uri + "\n";
    canonicalRequest += query + "\n";
    canonicalRequest += "host:" + hostName + "\n";
    canonicalRequest += "\n";
    canonicalRequest += "host\n";
    canonicalRequest += UNSIGNED_PAYLOAD;

    std::string stringToSign;
    stringToSign += std::string(ALGORITHM) + "\n";
    stringToSign += amzDate + "\n";
    stringToSign += scope + "\n";
    stringToSign += core::hexEncode(core::sha256(canonicalRequest));

    auto signingKey = toBytes("AWS4" + settings_.secretAccessKey);
    signingKey = core::hmacSha256(signingKey, dateStamp);
    signingKey = core::hmacSha256(signingKey, settings_.region);
    signingKey = core::hmacSha256(signingKey, SERVICE);
    signingKey = core::hmacSha256(signingKey, "aws4_request");
    std::string signature = core::hexEncode(core::hmacSha256(signingKey, stringToSign));
    core::cleanse(signingKey.data(), signingKey.size());

    return uri + "?" + query + "&X-Amz-Signature=" + signature;
}

} // namespace lockbox::storage
