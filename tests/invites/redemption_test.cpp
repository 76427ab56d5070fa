#include "core/errors.hpp"
#include "support/servicefixture.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <string>

using namespace lockbox;
using namespace lockbox::test;
using core::InviteStateError;
using invites::InviteOptions;
using Reason = core::InviteStateError::Reason;

class RedemptionTest : public ServiceTest {
protected:
    void SetUp() override {
        ServiceTest::SetUp();
        room_ = createRoom();
    }

    sharing::Share accept(const invites::IssuedInvite& issued,
                          const std::string& userId,
                          const std::string& email) {
        return service_->acceptInvite(issued.rawToken, userId, email);
    }

    void expectRejected(const std::function<void()>& action, Reason expected) {
        try {
            action();
            FAIL() << "Expected the redemption to be rejected";
        } catch (const InviteStateError& e) {
            EXPECT_EQ(e.reason(), expected) << e.what();
        }
    }

    rooms::Room room_;
};

TEST_F(RedemptionTest, CreatesGuestShare) {
    auto issued = createInvite(room_.id);
    auto share = accept(issued, "guest-1", "guest@example.com");

    EXPECT_EQ(share.roomId, room_.id);
    EXPECT_EQ(share.userId, "guest-1");
    EXPECT_EQ(share.role, sharing::Role::Guest);
    EXPECT_EQ(share.inviteId, issued.inviteId);
    EXPECT_FALSE(share.revoked);
    EXPECT_FALSE(share.expiresAt.has_value());

    EXPECT_TRUE(service_->shares().hasAccess(room_.id, "guest-1"));
    EXPECT_EQ(storedInvite(issued.inviteId).usesCount, 1);
}

TEST_F(RedemptionTest, UnknownTokenIsNotFound) {
    createInvite(room_.id);
    EXPECT_THROW(service_->acceptInvite("not-a-real-token", "guest-1", "g@example.com"),
                 core::NotFoundError);
    EXPECT_THROW(service_->acceptInvite("", "guest-1", "g@example.com"), core::NotFoundError);
}

TEST_F(RedemptionTest, RequiresUserId) {
    auto issued = createInvite(room_.id);
    EXPECT_THROW(accept(issued, "", "g@example.com"), core::ValidationError);
    EXPECT_EQ(storedInvite(issued.inviteId).usesCount, 0);
}

TEST_F(RedemptionTest, MaxUsesIsEnforced) {
    InviteOptions opts;
    opts.maxUses = 3;
    auto issued = createInvite(room_.id, opts);

    accept(issued, "guest-1", "g1@example.com");
    accept(issued, "guest-2", "g2@example.com");
    accept(issued, "guest-3", "g3@example.com");
    expectRejected([&] { accept(issued, "guest-4", "g4@example.com"); }, Reason::Exhausted);

    EXPECT_EQ(storedInvite(issued.inviteId).usesCount, 3);
    EXPECT_FALSE(service_->shares().getShare(room_.id, "guest-4").has_value());
}

TEST_F(RedemptionTest, UnlimitedInviteKeepsCounting) {
    auto issued = createInvite(room_.id);
    for (int i = 0; i < 10; ++i) {
        accept(issued, "guest-" + std::to_string(i), "g@example.com");
    }
    EXPECT_EQ(storedInvite(issued.inviteId).usesCount, 10);
}

TEST_F(RedemptionTest, SingleUseAdmitsOnce) {
    InviteOptions opts;
    opts.singleUse = true;
    auto issued = createInvite(room_.id, opts);

    accept(issued, "guest-1", "g1@example.com");
    expectRejected([&] { accept(issued, "guest-1", "g1@example.com"); }, Reason::Exhausted);
    expectRejected([&] { accept(issued, "guest-2", "g2@example.com"); }, Reason::Exhausted);
}

TEST_F(RedemptionTest, RepeatRedemptionConsumesUse) {
    InviteOptions opts;
    opts.maxUses = 2;
    auto issued = createInvite(room_.id, opts);

    auto first = accept(issued, "guest-1", "g1@example.com");
    auto second = accept(issued, "guest-1", "g1@example.com");

    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(storedInvite(issued.inviteId).usesCount, 2);
    EXPECT_EQ(service_->shares().listShares(room_.id, OWNER).size(), 2u);
}

TEST_F(RedemptionTest, ExpiryIsInclusive) {
    InviteOptions opts;
    opts.expiresHours = 1;
    auto issued = createInvite(room_.id, opts);

    clock_->advance(std::chrono::minutes(59));
    accept(issued, "guest-1", "g1@example.com");

    clock_->advance(std::chrono::minutes(1));
    expectRejected([&] { accept(issued, "guest-2", "g2@example.com"); }, Reason::Expired);
    EXPECT_EQ(storedInvite(issued.inviteId).usesCount, 1);
}

TEST_F(RedemptionTest, EmailMatchIgnoresCaseAndWhitespace) {
    InviteOptions opts;
    opts.allowedEmail = "guest@example.com";
    auto issued = createInvite(room_.id, opts);

    expectRejected([&] { accept(issued, "other", "other@example.com"); }, Reason::EmailMismatch);
    auto share = accept(issued, "guest-1", "  GUEST@Example.COM ");
    EXPECT_EQ(share.userId, "guest-1");
}

TEST_F(RedemptionTest, GatesRunInOrder) {
    InviteOptions opts;
    opts.expiresHours = 1;
    opts.allowedEmail = "guest@example.com";
    opts.singleUse = true;
    auto issued = createInvite(room_.id, opts);
    accept(issued, "guest-1", "guest@example.com");

    // Exhausted, wrong email
    expectRejected([&] { accept(issued, "other", "other@example.com"); }, Reason::EmailMismatch);

    // Exhausted, wrong email, expired
    clock_->advance(std::chrono::hours(2));
    expectRejected([&] { accept(issued, "other", "other@example.com"); }, Reason::Expired);

    // Everything, including revoked
    service_->revokeInvite(issued.inviteId, OWNER);
    expectRejected([&] { accept(issued, "other", "other@example.com"); }, Reason::Revoked);
}

TEST_F(RedemptionTest, RevokedShareIsNotRestored) {
    auto first = createInvite(room_.id);
    auto second = createInvite(room_.id);

    accept(first, "guest-1", "g1@example.com");
    service_->revokeShare(room_.id, "guest-1", OWNER);

    EXPECT_THROW(accept(second, "guest-1", "g1@example.com"), core::AuthorizationError);
    EXPECT_EQ(storedInvite(second.inviteId).usesCount, 0);

    auto share = service_->shares().getShare(room_.id, "guest-1");
    ASSERT_TRUE(share.has_value());
    EXPECT_TRUE(share->revoked);
    EXPECT_FALSE(service_->shares().hasAccess(room_.id, "guest-1"));
}

TEST_F(RedemptionTest, GrantHoursLimitShareLifetime) {
    InviteOptions opts;
    opts.grantHours = 24;
    auto issued = createInvite(room_.id, opts);
    auto share = accept(issued, "guest-1", "g1@example.com");

    ASSERT_TRUE(share.expiresAt.has_value());
    EXPECT_EQ(*share.expiresAt, clock_->now() + std::chrono::hours(24));
    EXPECT_TRUE(service_->shares().hasAccess(room_.id, "guest-1"));

    clock_->advance(std::chrono::hours(24));
    EXPECT_FALSE(service_->shares().hasAccess(room_.id, "guest-1"));
    EXPECT_THROW(service_->documents().listDocuments(room_.id, "guest-1"),
                 core::AuthorizationError);
}

TEST_F(RedemptionTest, RefreshKeepsTheLaterExpiry) {
    InviteOptions longGrant;
    longGrant.grantHours = 48;
    InviteOptions shortGrant;
    shortGrant.grantHours = 1;
    auto longInvite = createInvite(room_.id, longGrant);
    auto shortInvite = createInvite(room_.id, shortGrant);
    auto unlimitedInvite = createInvite(room_.id);

    const auto start = clock_->now();
    accept(longInvite, "guest-1", "g1@example.com");
    auto refreshed = accept(shortInvite, "guest-1", "g1@example.com");
    ASSERT_TRUE(refreshed.expiresAt.has_value());
    EXPECT_EQ(*refreshed.expiresAt, start + std::chrono::hours(48));

    auto unlimited = accept(unlimitedInvite, "guest-1", "g1@example.com");
    EXPECT_FALSE(unlimited.expiresAt.has_value());
}

TEST_F(RedemptionTest, ExpiredShareIsRenewedByNewInvite) {
    InviteOptions opts;
    opts.grantHours = 1;
    auto first = createInvite(room_.id, opts);
    auto second = createInvite(room_.id, opts);

    accept(first, "guest-1", "g1@example.com");
    clock_->advance(std::chrono::hours(2));
    EXPECT_FALSE(service_->shares().hasAccess(room_.id, "guest-1"));

    auto renewed = accept(second, "guest-1", "g1@example.com");
    EXPECT_EQ(*renewed.expiresAt, clock_->now() + std::chrono::hours(1));
    EXPECT_TRUE(service_->shares().hasAccess(room_.id, "guest-1"));
}

TEST_F(RedemptionTest, OwnerKeepsOwnerRole) {
    auto issued = createInvite(room_.id);
    auto share = accept(issued, OWNER, OWNER_EMAIL);
    EXPECT_EQ(share.role, sharing::Role::Owner);
    EXPECT_FALSE(share.expiresAt.has_value());
}

TEST_F(RedemptionTest, RecordsAcceptEvent) {
    auto issued = createInvite(room_.id);
    accept(issued, "guest-1", "g1@example.com");

    audit::Query query;
    query.action = std::string(audit::action::ACCEPT_INVITE);
    auto events = service_->auditLog().queryEvents(query);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data.userId, std::string("guest-1"));
    EXPECT_EQ(events[0].data.objectId, issued.inviteId);
}
