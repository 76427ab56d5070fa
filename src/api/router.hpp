#pragma once

#include "api/api_export.hpp"
#include "api/request.hpp"
#include "auth/identity.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lockbox {
class DataRoomService;
}

namespace lockbox::core {
class Error;
}

namespace lockbox::api {

using PathParams = std::map<std::string, std::string>;

/**
 * @brief Maps REST requests onto the data room service
 *
 * Every route requires an authenticated caller. Errors are rendered as
 * {"error": {"kind": ..., "message": ...}} with a status derived from the
 * error kind.
 */
class LOCKBOX_API_EXPORT Router {
public:
    Router(DataRoomService& service, std::shared_ptr<const auth::IdentityProvider> identity);
    ~Router();

    /**
     * @brief Handle one request; never throws
     */
    Response handle(const Request& request) const;

    /**
     * @brief HTTP status for an error kind
     */
    static int statusFor(const core::Error& error);

    static Response errorResponse(int status, const std::string& kind, const std::string& message);

private:
    using Handler = std::function<Response(const Request&, const auth::Identity&, const PathParams&)>;

    struct Route {
        std::string method;
        std::vector<std::string> segments;  // "{name}" captures one segment
        Handler handler;
    };

    DataRoomService& service_;
    std::shared_ptr<const auth::IdentityProvider> identity_;
    std::vector<Route> routes_;

    void add(const std::string& method, const std::string& pattern, Handler handler);
    Response dispatch(const Request& request) const;

    Response createRoom(const Request& request, const auth::Identity& caller) const;
    Response listRooms(const auth::Identity& caller) const;
    Response createInvite(const Request& request, const auth::Identity& caller) const;
    Response listInvites(const auth::Identity& caller, const PathParams& params) const;
    Response acceptInvite(const Request& request, const auth::Identity& caller) const;
    Response revokeInvite(const Request& request, const auth::Identity& caller,
                          const PathParams& params) const;
    Response listShares(const auth::Identity& caller, const PathParams& params) const;
    Response revokeShare(const Request& request, const auth::Identity& caller,
                         const PathParams& params) const;
    Response listDownloads(const auth::Identity& caller, const PathParams& params) const;
    Response exportDownloads(const Request& request, const auth::Identity& caller,
                             const PathParams& params) const;
    Response presignUpload(const Request& request, const auth::Identity& caller,
                           const PathParams& params) const;
    Response confirmUpload(const Request& request, const auth::Identity& caller,
                           const PathParams& params) const;
    Response listDocuments(const auth::Identity& caller, const PathParams& params) const;
    Response downloadLink(const Request& request, const auth::Identity& caller,
                          const PathParams& params) const;
    Response deleteDocument(const Request& request, const auth::Identity& caller,
                            const PathParams& params) const;

    // Prevent copying
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
};

} // namespace lockbox::api
