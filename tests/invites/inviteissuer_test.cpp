#include "core/errors.hpp"
#include "core/tokencodec.hpp"
#include "support/servicefixture.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <string>

using namespace lockbox;
using namespace lockbox::test;
using invites::InviteOptions;
using invites::InviteStatus;

class InviteIssuerTest : public ServiceTest {};

TEST_F(InviteIssuerTest, StoresOnlyTheTokenHash) {
    auto room = createRoom();
    auto issued = createInvite(room.id);

    EXPECT_TRUE(core::isUuid(issued.inviteId));
    EXPECT_EQ(issued.rawToken.size(), 43u);
    EXPECT_EQ(issued.linkPath, "/invites/accept?token=" + issued.rawToken);

    auto invite = storedInvite(issued.inviteId);
    EXPECT_EQ(invite.roomId, room.id);
    EXPECT_EQ(invite.creatorId, OWNER);
    EXPECT_EQ(invite.tokenHash.size(), 64u);
    EXPECT_NE(invite.tokenHash, issued.rawToken);
    EXPECT_EQ(invite.tokenHash, core::TokenCodec(options().inviteSecret).hash(issued.rawToken));
    EXPECT_EQ(invite.usesCount, 0);
    EXPECT_FALSE(invite.revoked);
    EXPECT_FALSE(invite.maxUses.has_value());
    EXPECT_FALSE(invite.expiresAt.has_value());
}

TEST_F(InviteIssuerTest, SingleUseOverridesMaxUses) {
    auto room = createRoom();
    InviteOptions opts;
    opts.singleUse = true;
    opts.maxUses = 5;
    auto invite = storedInvite(createInvite(room.id, opts).inviteId);

    EXPECT_TRUE(invite.singleUse);
    EXPECT_EQ(invite.maxUses, 1);
}

TEST_F(InviteIssuerTest, ExpiryIsRelativeToCreation) {
    auto room = createRoom();
    InviteOptions opts;
    opts.expiresHours = 24;
    opts.grantHours = 72;
    auto invite = storedInvite(createInvite(room.id, opts).inviteId);

    ASSERT_TRUE(invite.expiresAt.has_value());
    EXPECT_EQ(*invite.expiresAt, clock_->now() + std::chrono::hours(24));
    EXPECT_EQ(invite.grantHours, 72);
    EXPECT_EQ(invite.createdAt, clock_->now());
}

TEST_F(InviteIssuerTest, RejectsMalformedConstraints) {
    auto room = createRoom();

    InviteOptions zeroUses;
    zeroUses.maxUses = 0;
    EXPECT_THROW(createInvite(room.id, zeroUses), core::ValidationError);

    InviteOptions negativeExpiry;
    negativeExpiry.expiresHours = -1;
    EXPECT_THROW(createInvite(room.id, negativeExpiry), core::ValidationError);

    InviteOptions zeroGrant;
    zeroGrant.grantHours = 0;
    EXPECT_THROW(createInvite(room.id, zeroGrant), core::ValidationError);

    InviteOptions hugeExpiry;
    hugeExpiry.expiresHours = invites::MAX_POLICY_HOURS + 1;
    EXPECT_THROW(createInvite(room.id, hugeExpiry), core::ValidationError);

    InviteOptions badEmail;
    badEmail.allowedEmail = "not an email";
    EXPECT_THROW(createInvite(room.id, badEmail), core::ValidationError);

    auto invites = service_->invites().listInvites(room.id, OWNER);
    EXPECT_TRUE(invites.empty());
}

TEST_F(InviteIssuerTest, TrimsAllowedEmail) {
    auto room = createRoom();
    InviteOptions opts;
    opts.allowedEmail = "  Guest@Example.com ";
    auto invite = storedInvite(createInvite(room.id, opts).inviteId);
    EXPECT_EQ(invite.allowedEmail, std::string("Guest@Example.com"));
}

TEST_F(InviteIssuerTest, OnlyOwnerCanInvite) {
    auto room = createRoom();
    EXPECT_THROW(service_->createInvite(room.id, "stranger", {}), core::AuthorizationError);
    EXPECT_THROW(service_->createInvite(core::generateUuid(), OWNER, {}), core::NotFoundError);
}

TEST_F(InviteIssuerTest, ListsInvitesWithDerivedStatus) {
    auto room = createRoom();

    InviteOptions single;
    single.singleUse = true;
    auto exhausted = createInvite(room.id, single);
    clock_->advance(std::chrono::minutes(1));

    InviteOptions shortLived;
    shortLived.expiresHours = 1;
    auto expired = createInvite(room.id, shortLived);
    clock_->advance(std::chrono::minutes(1));

    auto revoked = createInvite(room.id);
    clock_->advance(std::chrono::minutes(1));

    auto active = createInvite(room.id);

    service_->acceptInvite(exhausted.rawToken, "guest-1", "guest1@example.com");
    service_->revokeInvite(revoked.inviteId, OWNER);
    clock_->advance(std::chrono::hours(2));

    auto summaries = service_->invites().listInvites(room.id, OWNER);
    ASSERT_EQ(summaries.size(), 4u);
    EXPECT_EQ(summaries[0].invite.id, exhausted.inviteId);
    EXPECT_EQ(summaries[0].status, InviteStatus::Exhausted);
    EXPECT_EQ(summaries[1].invite.id, expired.inviteId);
    EXPECT_EQ(summaries[1].status, InviteStatus::Expired);
    EXPECT_EQ(summaries[2].invite.id, revoked.inviteId);
    EXPECT_EQ(summaries[2].status, InviteStatus::Revoked);
    EXPECT_EQ(summaries[3].invite.id, active.inviteId);
    EXPECT_EQ(summaries[3].status, InviteStatus::Active);

    EXPECT_THROW(service_->invites().listInvites(room.id, "guest-1"), core::AuthorizationError);
}

TEST_F(InviteIssuerTest, RecordsCreateEvent) {
    auto room = createRoom();
    auto issued = createInvite(room.id);

    audit::Query query;
    query.action = std::string(audit::action::CREATE_INVITE);
    auto events = service_->auditLog().queryEvents(query);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data.objectId, issued.inviteId);
    EXPECT_EQ(events[0].data.userId, std::string(OWNER));
    ASSERT_TRUE(events[0].data.details.has_value());
    EXPECT_EQ(events[0].data.details->find(issued.rawToken), std::string::npos);
}

TEST(InviteStatusTest, DerivationOrder) {
    invites::Invite invite;
    const auto now = core::fromEpochMillis(1000000);
    EXPECT_EQ(invites::deriveStatus(invite, now), InviteStatus::Active);

    invite.maxUses = 2;
    invite.usesCount = 2;
    EXPECT_EQ(invites::deriveStatus(invite, now), InviteStatus::Exhausted);

    invite.expiresAt = now;
    EXPECT_EQ(invites::deriveStatus(invite, now), InviteStatus::Expired);

    invite.revoked = true;
    EXPECT_EQ(invites::deriveStatus(invite, now), InviteStatus::Revoked);
    EXPECT_STREQ(invites::statusName(InviteStatus::Revoked), "revoked");
}
