#include "core/errors.hpp"
#include "support/servicefixture.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace lockbox;
using namespace lockbox::test;
using invites::InviteOptions;

class RevocationTest : public ServiceTest {
protected:
    void SetUp() override {
        ServiceTest::SetUp();
        room_ = createRoom();
    }

    rooms::Room room_;
};

TEST_F(RevocationTest, RevokedInviteStopsRedemptionButKeepsShares) {
    InviteOptions opts;
    opts.maxUses = 5;
    auto issued = createInvite(room_.id, opts);
    service_->acceptInvite(issued.rawToken, "guest-1", "g1@example.com");
    service_->acceptInvite(issued.rawToken, "guest-2", "g2@example.com");

    service_->revokeInvite(issued.inviteId, OWNER);

    try {
        service_->acceptInvite(issued.rawToken, "guest-3", "g3@example.com");
        FAIL() << "Expected a revoked invite";
    } catch (const core::InviteStateError& e) {
        EXPECT_EQ(e.reason(), core::InviteStateError::Reason::Revoked);
    }

    auto invite = storedInvite(issued.inviteId);
    EXPECT_TRUE(invite.revoked);
    EXPECT_EQ(invite.usesCount, 2);
    EXPECT_TRUE(service_->shares().hasAccess(room_.id, "guest-1"));
    EXPECT_TRUE(service_->shares().hasAccess(room_.id, "guest-2"));
}

TEST_F(RevocationTest, RevokeInviteIsIdempotent) {
    auto issued = createInvite(room_.id);
    service_->revokeInvite(issued.inviteId, OWNER);
    EXPECT_NO_THROW(service_->revokeInvite(issued.inviteId, OWNER));

    audit::Query query;
    query.action = std::string(audit::action::REVOKE_INVITE);
    EXPECT_EQ(service_->auditLog().queryEvents(query).size(), 1u);
}

TEST_F(RevocationTest, RevokeInviteRequiresOwner) {
    auto issued = createInvite(room_.id);
    EXPECT_THROW(service_->revokeInvite(issued.inviteId, "guest-1"), core::AuthorizationError);
    EXPECT_THROW(service_->revokeInvite(core::generateUuid(), OWNER), core::NotFoundError);
    EXPECT_FALSE(storedInvite(issued.inviteId).revoked);
}

TEST_F(RevocationTest, RevokeShareRemovesAccess) {
    auto issued = createInvite(room_.id);
    service_->acceptInvite(issued.rawToken, "guest-1", "g1@example.com");
    ASSERT_TRUE(service_->shares().hasAccess(room_.id, "guest-1"));

    service_->revokeShare(room_.id, "guest-1", OWNER);
    EXPECT_FALSE(service_->shares().hasAccess(room_.id, "guest-1"));
    EXPECT_THROW(service_->shares().requireAccess(room_.id, "guest-1"), core::AuthorizationError);

    // Again is a no-op
    EXPECT_NO_THROW(service_->revokeShare(room_.id, "guest-1", OWNER));

    audit::Query query;
    query.action = std::string(audit::action::REVOKE_ACCESS);
    EXPECT_EQ(service_->auditLog().queryEvents(query).size(), 1u);
}

TEST_F(RevocationTest, RevokeShareChecks) {
    auto issued = createInvite(room_.id);
    service_->acceptInvite(issued.rawToken, "guest-1", "g1@example.com");

    EXPECT_THROW(service_->revokeShare(room_.id, "guest-1", "guest-1"), core::AuthorizationError);
    EXPECT_THROW(service_->revokeShare(room_.id, OWNER, OWNER), core::ValidationError);
    EXPECT_THROW(service_->revokeShare(room_.id, "nobody", OWNER), core::NotFoundError);
    EXPECT_THROW(service_->revokeShare(core::generateUuid(), "guest-1", OWNER),
                 core::NotFoundError);
    EXPECT_TRUE(service_->shares().hasAccess(room_.id, "guest-1"));
}

TEST_F(RevocationTest, RevokedInviteDoesNotAffectOtherInvites) {
    auto revoked = createInvite(room_.id);
    auto other = createInvite(room_.id);
    service_->revokeInvite(revoked.inviteId, OWNER);

    auto share = service_->acceptInvite(other.rawToken, "guest-1", "g1@example.com");
    EXPECT_EQ(share.inviteId, other.inviteId);
}
