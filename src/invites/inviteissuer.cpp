#include "invites/inviteissuer.hpp"
#include "audit/auditlog.hpp"
#include "core/encoding.hpp"
#include "core/errors.hpp"
#include "core/identifiers.hpp"
#include "core/logging.hpp"
#include "core/tokencodec.hpp"
#include "rooms/roomregistry.hpp"
#include "storage/database.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lockbox::invites {

namespace sql {
    const char* INSERT_INVITE = R"(
        INSERT INTO invites (id, room_id, creator_id, allowed_email, token_hash, max_uses,
                             single_use, uses_count, grant_hours, expires_at, revoked, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, 0, ?, ?, 0, ?)
    )";

    const char* LIST_INVITES = R"(
        SELECT id FROM invites WHERE room_id = ? ORDER BY created_at, id
    )";
}

namespace {

void requireHours(const std::optional<int64_t>& hours, const char* field) {
    if (!hours) {
        return;
    }
    if (*hours <= 0) {
        throw core::ValidationError(std::string(field) + " must be a positive integer");
    }
    if (*hours > MAX_POLICY_HOURS) {
        throw core::ValidationError(std::string(field) + " must not exceed " +
                                    std::to_string(MAX_POLICY_HOURS));
    }
}

std::optional<int64_t> toMillis(const std::optional<core::TimePoint>& tp) {
    if (!tp) {
        return std::nullopt;
    }
    return core::toEpochMillis(*tp);
}

} // namespace

InviteIssuer::InviteIssuer(std::shared_ptr<storage::Database> db,
                           std::shared_ptr<const core::Clock> clock,
                           std::shared_ptr<const core::TokenCodec> codec,
                           std::shared_ptr<audit::AuditLog> auditLog)
    : db_(std::move(db)),
      clock_(std::move(clock)),
      codec_(std::move(codec)),
      auditLog_(std::move(auditLog)) {
    if (!db_ || !clock_ || !codec_ || !auditLog_) {
        throw std::invalid_argument("InviteIssuer is missing a dependency");
    }
}

InviteOptions InviteIssuer::normalize(const InviteOptions& options) {
    InviteOptions normalized = options;

    if (options.singleUse) {
        normalized.maxUses = 1;
    } else if (options.maxUses && *options.maxUses <= 0) {
        throw core::ValidationError("max_uses must be a positive integer");
    }

    requireHours(options.expiresHours, "expires_hours");
    requireHours(options.grantHours, "grant_hours");

    if (options.allowedEmail) {
        std::string email = core::trim(*options.allowedEmail);
        if (!core::looksLikeEmail(email)) {
            throw core::ValidationError("allowed_email is not a valid email address");
        }
        normalized.allowedEmail = email;
    }
    return normalized;
}

IssuedInvite InviteIssuer::createInvite(const std::string& roomId,
                                        const std::string& creatorId,
                                        const InviteOptions& options,
                                        const audit::RequestContext& origin) {
    InviteOptions policy = normalize(options);
    const core::TimePoint now = clock_->now();

    Invite invite;
    invite.id = core::generateUuid();
    invite.roomId = roomId;
    invite.creatorId = creatorId;
    invite.allowedEmail = policy.allowedEmail;
    invite.maxUses = policy.maxUses;
    invite.singleUse = policy.singleUse;
    invite.grantHours = policy.grantHours;
    if (policy.expiresHours) {
        invite.expiresAt = now + std::chrono::hours(*policy.expiresHours);
    }
    invite.createdAt = now;

    core::IssuedToken token = codec_->generate();
    invite.tokenHash = token.hash;

    auto conn = db_->acquire();
    storage::Transaction tx(*conn);
    rooms::RoomRegistry::ensureOwner(*conn, roomId, creatorId);

    auto stmt = conn->prepare(sql::INSERT_INVITE);
    stmt.bindText(1, invite.id)
        .bindText(2, invite.roomId)
        .bindText(3, invite.creatorId)
        .bindOptionalText(4, invite.allowedEmail)
        .bindText(5, invite.tokenHash)
        .bindOptionalInt64(6, invite.maxUses)
        .bindBool(7, invite.singleUse)
        .bindOptionalInt64(8, invite.grantHours)
        .bindOptionalInt64(9, toMillis(invite.expiresAt))
        .bindInt64(10, core::toEpochMillis(invite.createdAt));
    stmt.run();

    nlohmann::json details = {
        {"room_id", roomId},
        {"single_use", invite.singleUse},
        {"restricted", invite.allowedEmail.has_value()}
    };
    if (invite.maxUses) {
        details["max_uses"] = *invite.maxUses;
    }
    if (invite.expiresAt) {
        details["expires_at"] = core::formatIso8601(*invite.expiresAt);
    }
    auditLog_->recordEvent(*conn, {creatorId, audit::action::CREATE_INVITE,
                                   std::string("invite"), invite.id, details.dump()}, origin);
    tx.commit();

    core::Log::info("invites", "Created invite " + invite.id + " for room " + roomId);

    IssuedInvite issued;
    issued.inviteId = invite.id;
    issued.rawToken = std::move(token.raw);
    issued.linkPath = "/invites/accept?token=" + issued.rawToken;
    return issued;
}

std::vector<InviteSummary> InviteIssuer::listInvites(const std::string& roomId,
                                                     const std::string& callerId) const {
    auto conn = db_->acquire();
    storage::Transaction tx(*conn, storage::Transaction::Mode::Deferred);
    rooms::RoomRegistry::ensureOwner(*conn, roomId, callerId);

    std::vector<std::string> ids;
    {
        auto stmt = conn->prepare(sql::LIST_INVITES);
        stmt.bindText(1, roomId);
        while (stmt.step()) {
            ids.push_back(stmt.text(0));
        }
    }

    const core::TimePoint now = clock_->now();
    std::vector<InviteSummary> summaries;
    summaries.reserve(ids.size());
    for (const auto& id : ids) {
        auto invite = fetchInviteById(*conn, id);
        if (!invite) {
            continue;
        }
        InviteSummary summary;
        summary.status = deriveStatus(*invite, now);
        summary.invite = std::move(*invite);
        summaries.push_back(std::move(summary));
    }
    tx.commit();
    return summaries;
}

} // namespace lockbox::invites
