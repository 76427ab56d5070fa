#include "api/router.hpp"
#include "core/encoding.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "lockbox/dataroomservice.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lockbox::api {

using nlohmann::json;

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

bool matchSegments(const std::vector<std::string>& pattern,
                   const std::vector<std::string>& path,
                   PathParams& params) {
    if (pattern.size() != path.size()) {
        return false;
    }
    PathParams captured;
    for (size_t i = 0; i < pattern.size(); ++i) {
        const std::string& part = pattern[i];
        if (part.size() > 2 && part.front() == '{' && part.back() == '}') {
            auto decoded = core::percentDecode(path[i], false);
            if (!decoded || decoded->empty()) {
                return false;
            }
            captured[part.substr(1, part.size() - 2)] = *decoded;
        } else if (part != path[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

// Body helpers: absent and null fields read as "not given"

json parseBody(const Request& request) {
    if (core::trim(request.body).empty()) {
        return json::object();
    }
    json body = json::parse(request.body, nullptr, false);
    if (body.is_discarded()) {
        throw core::ValidationError("Request body is not valid JSON");
    }
    if (!body.is_object()) {
        throw core::ValidationError("Request body must be a JSON object");
    }
    return body;
}

bool isGiven(const json& body, const char* key) {
    auto it = body.find(key);
    return it != body.end() && !it->is_null();
}

std::optional<std::string> optionalString(const json& body, const char* key) {
    if (!isGiven(body, key)) {
        return std::nullopt;
    }
    const json& value = body.at(key);
    if (!value.is_string()) {
        throw core::ValidationError(std::string(key) + " must be a string");
    }
    return value.get<std::string>();
}

std::string requiredString(const json& body, const char* key) {
    auto value = optionalString(body, key);
    if (!value || value->empty()) {
        throw core::ValidationError(std::string(key) + " is required");
    }
    return *value;
}

std::optional<int64_t> optionalInteger(const json& body, const char* key) {
    if (!isGiven(body, key)) {
        return std::nullopt;
    }
    const json& value = body.at(key);
    if (!value.is_number_integer()) {
        throw core::ValidationError(std::string(key) + " must be an integer");
    }
    return value.get<int64_t>();
}

bool optionalBool(const json& body, const char* key) {
    if (!isGiven(body, key)) {
        return false;
    }
    const json& value = body.at(key);
    if (!value.is_boolean()) {
        throw core::ValidationError(std::string(key) + " must be a boolean");
    }
    return value.get<bool>();
}

// Audit origin of a request; empty values are left unset
audit::RequestContext originOf(const Request& request) {
    audit::RequestContext origin;
    if (!request.remoteAddress.empty()) {
        origin.ipAddress = request.remoteAddress;
    }
    auto userAgent = request.header("user-agent");
    if (userAgent && !userAgent->empty()) {
        origin.userAgent = *userAgent;
    }
    return origin;
}

json optionalTime(const std::optional<core::TimePoint>& tp) {
    return tp ? json(core::formatIso8601(*tp)) : json(nullptr);
}

json optionalText(const std::optional<std::string>& text) {
    return text ? json(*text) : json(nullptr);
}

// Wire representations

json toJson(const rooms::Room& room) {
    return {
        {"id", room.id},
        {"owner_id", room.ownerId},
        {"name", room.name},
        {"description", optionalText(room.description)},
        {"created_at", core::formatIso8601(room.createdAt)}
    };
}

json toJson(const sharing::Share& share) {
    return {
        {"id", share.id},
        {"room_id", share.roomId},
        {"user_id", share.userId},
        {"invite_id", optionalText(share.inviteId)},
        {"role", sharing::roleName(share.role)},
        {"expires_at", optionalTime(share.expiresAt)},
        {"revoked", share.revoked},
        {"created_at", core::formatIso8601(share.createdAt)}
    };
}

json toJson(const invites::InviteSummary& summary) {
    const invites::Invite& invite = summary.invite;
    return {
        {"id", invite.id},
        {"room_id", invite.roomId},
        {"creator_id", invite.creatorId},
        {"allowed_email", optionalText(invite.allowedEmail)},
        {"max_uses", invite.maxUses ? json(*invite.maxUses) : json(nullptr)},
        {"single_use", invite.singleUse},
        {"uses_count", invite.usesCount},
        {"grant_hours", invite.grantHours ? json(*invite.grantHours) : json(nullptr)},
        {"expires_at", optionalTime(invite.expiresAt)},
        {"revoked", invite.revoked},
        {"status", invites::statusName(summary.status)},
        {"created_at", core::formatIso8601(invite.createdAt)}
    };
}

json toJson(const documents::Document& doc) {
    return {
        {"id", doc.id},
        {"room_id", doc.roomId},
        {"uploaded_by", doc.uploadedBy},
        {"filename", doc.filename},
        {"content_type", doc.contentType},
        {"size_bytes", doc.sizeBytes},
        {"sha256", optionalText(doc.sha256)},
        {"storage_key", doc.storageKey},
        {"uploaded_at", core::formatIso8601(doc.uploadedAt)}
    };
}

json toJson(const audit::Download& download) {
    return {
        {"id", download.id},
        {"room_id", download.roomId},
        {"document_id", download.documentId},
        {"user_id", download.userId},
        {"filename", download.filename},
        {"timestamp", core::formatIso8601(download.timestamp)}
    };
}

template <typename T>
json toJsonArray(const std::vector<T>& items) {
    json array = json::array();
    for (const auto& item : items) {
        array.push_back(toJson(item));
    }
    return array;
}

Response jsonResponse(int status, const json& body) {
    Response response;
    response.status = status;
    response.body = body.dump();
    return response;
}

Response noContent() {
    Response response;
    response.status = 204;
    response.contentType.clear();
    return response;
}

} // namespace

Router::Router(DataRoomService& service, std::shared_ptr<const auth::IdentityProvider> identity)
    : service_(service), identity_(std::move(identity)) {
    if (!identity_) {
        throw std::invalid_argument("Router requires an identity provider");
    }

    add("POST", "/rooms", [this](const Request& r, const auth::Identity& c, const PathParams&) {
        return createRoom(r, c);
    });
    add("GET", "/rooms", [this](const Request&, const auth::Identity& c, const PathParams&) {
        return listRooms(c);
    });
    add("POST", "/invites", [this](const Request& r, const auth::Identity& c, const PathParams&) {
        return createInvite(r, c);
    });
    add("POST", "/invites/accept", [this](const Request& r, const auth::Identity& c, const PathParams&) {
        return acceptInvite(r, c);
    });
    add("GET", "/invites/room/{room_id}", [this](const Request&, const auth::Identity& c, const PathParams& p) {
        return listInvites(c, p);
    });
    add("POST", "/invites/{invite_id}/revoke", [this](const Request& r, const auth::Identity& c, const PathParams& p) {
        return revokeInvite(r, c, p);
    });
    add("GET", "/rooms/{room_id}/shares", [this](const Request&, const auth::Identity& c, const PathParams& p) {
        return listShares(c, p);
    });
    add("POST", "/rooms/{room_id}/shares/{user_id}/revoke", [this](const Request& r, const auth::Identity& c, const PathParams& p) {
        return revokeShare(r, c, p);
    });
    add("GET", "/rooms/{room_id}/downloads", [this](const Request&, const auth::Identity& c, const PathParams& p) {
        return listDownloads(c, p);
    });
    add("GET", "/rooms/{room_id}/downloads/export", [this](const Request& r, const auth::Identity& c, const PathParams& p) {
        return exportDownloads(r, c, p);
    });
    add("POST", "/rooms/{room_id}/documents/presign", [this](const Request& r, const auth::Identity& c, const PathParams& p) {
        return presignUpload(r, c, p);
    });
    add("POST", "/rooms/{room_id}/documents/confirm", [this](const Request& r, const auth::Identity& c, const PathParams& p) {
        return confirmUpload(r, c, p);
    });
    add("GET", "/rooms/{room_id}/documents", [this](const Request&, const auth::Identity& c, const PathParams& p) {
        return listDocuments(c, p);
    });
    add("GET", "/rooms/{room_id}/documents/{document_id}/download", [this](const Request& r, const auth::Identity& c, const PathParams& p) {
        return downloadLink(r, c, p);
    });
    add("DELETE", "/rooms/{room_id}/documents/{document_id}", [this](const Request& r, const auth::Identity& c, const PathParams& p) {
        return deleteDocument(r, c, p);
    });
}

Router::~Router() = default;

void Router::add(const std::string& method, const std::string& pattern, Handler handler) {
    routes_.push_back({method, splitPath(pattern), std::move(handler)});
}

int Router::statusFor(const core::Error& error) {
    switch (error.kind()) {
        case core::ErrorKind::Validation: return 400;
        case core::ErrorKind::Authorization: return 403;
        case core::ErrorKind::NotFound: return 404;
        case core::ErrorKind::InviteRevoked:
        case core::ErrorKind::InviteExpired:
        case core::ErrorKind::InviteExhausted:
        case core::ErrorKind::EmailMismatch:
        case core::ErrorKind::Conflict:
            return 409;
        case core::ErrorKind::Transient: return 503;
        case core::ErrorKind::Storage: return 500;
    }
    return 500;
}

Response Router::errorResponse(int status, const std::string& kind, const std::string& message) {
    json body = {{"error", {{"kind", kind}, {"message", message}}}};
    return jsonResponse(status, body);
}

Response Router::handle(const Request& request) const {
    try {
        return dispatch(request);
    } catch (const core::Error& e) {
        int status = statusFor(e);
        Response response = errorResponse(status, core::errorKindName(e.kind()), e.what());
        if (e.isRetryable()) {
            response.headers["Retry-After"] = "1";
        }
        if (status >= 500) {
            core::Log::error("api", request.method + " " + request.path + ": " + e.what());
        }
        return response;
    } catch (const json::exception& e) {
        return errorResponse(400, core::errorKindName(core::ErrorKind::Validation), e.what());
    } catch (const std::exception& e) {
        core::Log::error("api", request.method + " " + request.path + " failed: " + e.what());
        return errorResponse(500, "internal_error", "Internal server error");
    }
}

Response Router::dispatch(const Request& request) const {
    const auto segments = splitPath(request.path);

    const Route* matched = nullptr;
    PathParams params;
    std::string allowed;
    for (const auto& route : routes_) {
        PathParams candidate;
        if (!matchSegments(route.segments, segments, candidate)) {
            continue;
        }
        if (route.method == request.method) {
            matched = &route;
            params = std::move(candidate);
            break;
        }
        allowed += allowed.empty() ? route.method : ", " + route.method;
    }

    if (!matched) {
        if (!allowed.empty()) {
            Response response = errorResponse(405, "method_not_allowed",
                                              "Method " + request.method + " not allowed");
            response.headers["Allow"] = allowed;
            return response;
        }
        return errorResponse(404, core::errorKindName(core::ErrorKind::NotFound),
                             "No route for " + request.path);
    }

    auto caller = identity_->authenticate(request);
    if (!caller) {
        Response response = errorResponse(401, "unauthenticated", "Authentication required");
        response.headers["WWW-Authenticate"] = "Bearer";
        return response;
    }
    return matched->handler(request, *caller, params);
}

Response Router::createRoom(const Request& request, const auth::Identity& caller) const {
    json body = parseBody(request);
    auto room = service_.rooms().createRoom(caller.userId, requiredString(body, "name"),
                                            optionalString(body, "description"),
                                            originOf(request));
    return jsonResponse(201, toJson(room));
}

Response Router::listRooms(const auth::Identity& caller) const {
    return jsonResponse(200, toJsonArray(service_.rooms().listRoomsForUser(caller.userId)));
}

Response Router::createInvite(const Request& request, const auth::Identity& caller) const {
    json body = parseBody(request);
    const std::string roomId = requiredString(body, "data_room_id");

    invites::InviteOptions options;
    options.singleUse = optionalBool(body, "single_use");
    if (!options.singleUse) {
        options.maxUses = optionalInteger(body, "max_uses");
    }
    options.allowedEmail = optionalString(body, "allowed_email");
    options.expiresHours = optionalInteger(body, "expires_hours");
    options.grantHours = optionalInteger(body, "grant_hours");

    auto issued = service_.createInvite(roomId, caller.userId, options, originOf(request));
    json response = {
        {"invite_id", issued.inviteId},
        {"raw_token", issued.rawToken},
        {"invite_link_path", issued.linkPath}
    };
    return jsonResponse(201, response);
}

Response Router::listInvites(const auth::Identity& caller, const PathParams& params) const {
    auto invites = service_.invites().listInvites(params.at("room_id"), caller.userId);
    return jsonResponse(200, toJsonArray(invites));
}

Response Router::acceptInvite(const Request& request, const auth::Identity& caller) const {
    auto token = request.queryParam("token");
    if (!token || token->empty()) {
        throw core::ValidationError("token query parameter is required");
    }
    auto share = service_.acceptInvite(*token, caller.userId, caller.email, originOf(request));
    return jsonResponse(200, toJson(share));
}

Response Router::revokeInvite(const Request& request, const auth::Identity& caller,
                              const PathParams& params) const {
    service_.revokeInvite(params.at("invite_id"), caller.userId, originOf(request));
    return noContent();
}

Response Router::listShares(const auth::Identity& caller, const PathParams& params) const {
    auto shares = service_.shares().listShares(params.at("room_id"), caller.userId);
    return jsonResponse(200, toJsonArray(shares));
}

Response Router::revokeShare(const Request& request, const auth::Identity& caller,
                             const PathParams& params) const {
    service_.revokeShare(params.at("room_id"), params.at("user_id"), caller.userId,
                         originOf(request));
    return noContent();
}

Response Router::listDownloads(const auth::Identity& caller, const PathParams& params) const {
    auto downloads = service_.listDownloads(params.at("room_id"), caller.userId);
    return jsonResponse(200, toJsonArray(downloads));
}

Response Router::exportDownloads(const Request& request, const auth::Identity& caller,
                                 const PathParams& params) const {
    const std::string format = core::toLowerAscii(request.queryParam("format").value_or("json"));
    audit::Format exportFormat;
    if (format == "json") {
        exportFormat = audit::Format::JSON;
    } else if (format == "csv") {
        exportFormat = audit::Format::CSV;
    } else {
        throw core::ValidationError("format must be json or csv");
    }

    Response response;
    response.body = service_.auditLog().exportDownloads(params.at("room_id"), caller.userId,
                                                        exportFormat);
    if (exportFormat == audit::Format::CSV) {
        response.contentType = "text/csv";
    }
    return response;
}

Response Router::presignUpload(const Request& request, const auth::Identity& caller,
                               const PathParams& params) const {
    auto ticket = service_.documents().presignUpload(params.at("room_id"), caller.userId,
                                                     originOf(request));
    json response = {
        {"upload_url", ticket.uploadUrl},
        {"storage_key", ticket.storageKey},
        {"expires_in", ticket.expiresIn.count()}
    };
    return jsonResponse(200, response);
}

Response Router::confirmUpload(const Request& request, const auth::Identity& caller,
                               const PathParams& params) const {
    json body = parseBody(request);

    documents::UploadConfirmation upload;
    upload.filename = requiredString(body, "filename");
    upload.contentType = optionalString(body, "content_type").value_or("");
    auto size = optionalInteger(body, "size_bytes");
    if (!size) {
        throw core::ValidationError("size_bytes is required");
    }
    upload.sizeBytes = *size;
    upload.storageKey = requiredString(body, "storage_key");
    upload.sha256 = optionalString(body, "sha256");

    auto doc = service_.documents().confirmUpload(params.at("room_id"), caller.userId, upload,
                                                  originOf(request));
    return jsonResponse(201, toJson(doc));
}

Response Router::listDocuments(const auth::Identity& caller, const PathParams& params) const {
    auto docs = service_.documents().listDocuments(params.at("room_id"), caller.userId);
    return jsonResponse(200, toJsonArray(docs));
}

Response Router::downloadLink(const Request& request, const auth::Identity& caller,
                              const PathParams& params) const {
    auto ticket = service_.documents().issueDownloadLink(params.at("room_id"),
                                                         params.at("document_id"),
                                                         caller.userId,
                                                         originOf(request));
    json response = {
        {"download_url", ticket.downloadUrl},
        {"expires_in", ticket.expiresIn.count()}
    };
    return jsonResponse(200, response);
}

Response Router::deleteDocument(const Request& request, const auth::Identity& caller,
                                const PathParams& params) const {
    service_.documents().deleteDocument(params.at("room_id"), params.at("document_id"),
                                        caller.userId, originOf(request));
    return noContent();
}

} // namespace lockbox::api
