#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "fake_connection.hpp"
#include "relay/dispatcher.hpp"

namespace {

using relay::ClientRegistry;
using relay::CloseReason;
using relay::ConflictPolicy;
using relay::Dispatcher;
using relay::DispatchStatus;
using relay::SendFailurePolicy;
using relay::SessionIdentity;
using relay::testing::FakeConnection;

struct Peer {
  std::shared_ptr<FakeConnection> connection;
  SessionIdentity identity;
};

class DispatcherTest : public ::testing::Test {
 protected:
  void Configure(ConflictPolicy conflict, SendFailurePolicy send_failure) {
    registry_ = std::make_shared<ClientRegistry>(conflict);
    dispatcher_ = std::make_shared<Dispatcher>(registry_, send_failure);
  }

  void SetUp() override { Configure(ConflictPolicy::kTakeover, SendFailurePolicy::kFailSender); }

  Peer MakePeer(const std::string& connection_id) {
    return Peer{std::make_shared<FakeConnection>(connection_id), SessionIdentity{}};
  }

  relay::DispatchResult Feed(Peer& peer, const std::string& frame) {
    return dispatcher_->Dispatch(peer.identity, peer.connection, frame);
  }

  std::shared_ptr<ClientRegistry> registry_;
  std::shared_ptr<Dispatcher> dispatcher_;
};

TEST_F(DispatcherTest, RegisterIdentifiesSessionWithoutReply) {
  auto a = MakePeer("conn-a");
  auto result = Feed(a, R"({"type":"register","id":"alice"})");

  EXPECT_EQ(result.status, DispatchStatus::kRegistered);
  EXPECT_FALSE(result.IsFatal());
  EXPECT_TRUE(a.identity.IsIdentified());
  EXPECT_EQ(a.identity.ClientId(), "alice");
  EXPECT_EQ(registry_->Lookup("alice"), a.connection);
  EXPECT_TRUE(a.connection->Frames().empty());
}

TEST_F(DispatcherTest, RelayForwardsRawFrameVerbatim) {
  auto a = MakePeer("conn-a");
  auto b = MakePeer("conn-b");
  Feed(a, R"({"type":"register","id":"alice"})");
  Feed(b, R"({"type":"register","id":"bob"})");

  const std::string frame = R"({"type":"chat", "to":"alice","text":"hi",  "n":1.50})";
  auto result = Feed(b, frame);

  EXPECT_EQ(result.status, DispatchStatus::kRelayed);
  ASSERT_EQ(a.connection->Frames().size(), 1u);
  EXPECT_EQ(a.connection->Frames()[0], frame);
  EXPECT_TRUE(b.connection->Frames().empty());
}

TEST_F(DispatcherTest, RelayIgnoresMessageTypeOnceIdentified) {
  auto a = MakePeer("conn-a");
  auto b = MakePeer("conn-b");
  Feed(a, R"({"type":"register","id":"alice"})");
  Feed(b, R"({"type":"register","id":"bob"})");

  auto result = Feed(b, R"({"type":"offer","to":"alice","sdp":{"v":0}})");
  EXPECT_EQ(result.status, DispatchStatus::kRelayed);
  EXPECT_EQ(a.connection->Frames().size(), 1u);
}

TEST_F(DispatcherTest, UnknownRecipientIsDroppedWithoutError) {
  auto b = MakePeer("conn-b");
  Feed(b, R"({"type":"register","id":"bob"})");

  auto result = Feed(b, R"({"type":"chat","to":"carol","text":"hi"})");
  EXPECT_EQ(result.status, DispatchStatus::kUnknownRecipient);
  EXPECT_FALSE(result.IsFatal());
  EXPECT_EQ(result.target, "carol");
}

TEST_F(DispatcherTest, UnidentifiedSenderIsIgnored) {
  auto a = MakePeer("conn-a");
  auto c = MakePeer("conn-c");
  Feed(a, R"({"type":"register","id":"alice"})");

  auto result = Feed(c, R"({"type":"chat","to":"alice","text":"hi"})");
  EXPECT_EQ(result.status, DispatchStatus::kIgnored);
  EXPECT_FALSE(result.IsFatal());
  EXPECT_TRUE(a.connection->Frames().empty());
}

TEST_F(DispatcherTest, FrameWithoutTargetIsIgnored) {
  auto a = MakePeer("conn-a");
  Feed(a, R"({"type":"register","id":"alice"})");

  auto result = Feed(a, R"({"type":"ping"})");
  EXPECT_EQ(result.status, DispatchStatus::kIgnored);
}

TEST_F(DispatcherTest, SelfAddressedFrameIsNotEchoed) {
  auto a = MakePeer("conn-a");
  Feed(a, R"({"type":"register","id":"alice"})");

  auto result = Feed(a, R"({"type":"chat","to":"alice"})");
  EXPECT_EQ(result.status, DispatchStatus::kIgnored);
  EXPECT_TRUE(a.connection->Frames().empty());
}

TEST_F(DispatcherTest, MalformedJsonIsProtocolViolation) {
  auto d = MakePeer("conn-d");
  auto result = Feed(d, "not-json");
  EXPECT_EQ(result.status, DispatchStatus::kProtocolViolation);
  EXPECT_TRUE(result.IsFatal());
}

TEST_F(DispatcherTest, NonObjectJsonIsProtocolViolation) {
  auto d = MakePeer("conn-d");
  EXPECT_EQ(Feed(d, "[1,2,3]").status, DispatchStatus::kProtocolViolation);
  EXPECT_EQ(Feed(d, "42").status, DispatchStatus::kProtocolViolation);
}

TEST_F(DispatcherTest, MissingTypeIsProtocolViolation) {
  auto a = MakePeer("conn-a");
  Feed(a, R"({"type":"register","id":"alice"})");
  auto result = Feed(a, R"({"to":"bob","text":"hi"})");
  EXPECT_EQ(result.status, DispatchStatus::kProtocolViolation);
}

TEST_F(DispatcherTest, RegisterWithoutIdIsProtocolViolation) {
  auto a = MakePeer("conn-a");
  auto result = Feed(a, R"({"type":"register"})");
  EXPECT_EQ(result.status, DispatchStatus::kProtocolViolation);
  EXPECT_FALSE(a.identity.IsIdentified());
  EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(DispatcherTest, NonStringIdOrTargetIsProtocolViolation) {
  auto a = MakePeer("conn-a");
  EXPECT_EQ(Feed(a, R"({"type":"register","id":7})").status, DispatchStatus::kProtocolViolation);
  Feed(a, R"({"type":"register","id":"alice"})");
  EXPECT_EQ(Feed(a, R"({"type":"chat","to":["bob"]})").status, DispatchStatus::kProtocolViolation);
}

TEST_F(DispatcherTest, TakeoverRoutesToNewestRegistrantOnly) {
  auto old_alice = MakePeer("conn-old");
  auto new_alice = MakePeer("conn-new");
  auto b = MakePeer("conn-b");
  Feed(old_alice, R"({"type":"register","id":"alice"})");
  Feed(new_alice, R"({"type":"register","id":"alice"})");
  Feed(b, R"({"type":"register","id":"bob"})");

  Feed(b, R"({"type":"chat","to":"alice","text":"hi"})");
  EXPECT_TRUE(old_alice.connection->Frames().empty());
  EXPECT_FALSE(old_alice.connection->Closed());
  EXPECT_EQ(new_alice.connection->Frames().size(), 1u);

  // 밀려난 세션이 종료되어도 새 보유자의 항목은 남는다.
  EXPECT_FALSE(dispatcher_->Release(old_alice.identity, old_alice.connection.get()));
  EXPECT_EQ(registry_->Lookup("alice"), new_alice.connection);
}

TEST_F(DispatcherTest, RejectPolicyKeepsSessionUnidentified) {
  Configure(ConflictPolicy::kReject, SendFailurePolicy::kFailSender);
  auto first = MakePeer("conn-1");
  auto second = MakePeer("conn-2");
  Feed(first, R"({"type":"register","id":"alice"})");

  auto result = Feed(second, R"({"type":"register","id":"alice"})");
  EXPECT_EQ(result.status, DispatchStatus::kRegistrationRejected);
  EXPECT_FALSE(result.IsFatal());
  EXPECT_FALSE(second.identity.IsIdentified());
  EXPECT_EQ(registry_->Lookup("alice"), first.connection);
}

TEST_F(DispatcherTest, EvictPolicyClosesPreviousHolder) {
  Configure(ConflictPolicy::kEvict, SendFailurePolicy::kFailSender);
  auto first = MakePeer("conn-1");
  auto second = MakePeer("conn-2");
  Feed(first, R"({"type":"register","id":"alice"})");

  auto result = Feed(second, R"({"type":"register","id":"alice"})");
  EXPECT_EQ(result.status, DispatchStatus::kRegistered);
  EXPECT_TRUE(first.connection->Closed());
  EXPECT_EQ(first.connection->LastCloseReason(), CloseReason::kSuperseded);
  EXPECT_EQ(registry_->Lookup("alice"), second.connection);
}

TEST_F(DispatcherTest, ReregisterUnderNewIdReleasesPreviousId) {
  auto a = MakePeer("conn-a");
  Feed(a, R"({"type":"register","id":"alice"})");
  Feed(a, R"({"type":"register","id":"alicia"})");

  EXPECT_EQ(a.identity.ClientId(), "alicia");
  EXPECT_FALSE(registry_->Contains("alice"));
  EXPECT_EQ(registry_->Lookup("alicia"), a.connection);
  EXPECT_EQ(registry_->Size(), 1u);
}

TEST_F(DispatcherTest, StaleRecipientIsFatalToSenderByDefault) {
  auto a = MakePeer("conn-a");
  auto b = MakePeer("conn-b");
  Feed(a, R"({"type":"register","id":"alice"})");
  Feed(b, R"({"type":"register","id":"bob"})");
  a.connection->Kill();

  auto result = Feed(b, R"({"type":"chat","to":"alice"})");
  EXPECT_EQ(result.status, DispatchStatus::kStaleRecipient);
  EXPECT_TRUE(result.IsFatal());
  EXPECT_TRUE(registry_->Contains("alice"));
}

TEST_F(DispatcherTest, StaleRecipientIsEvictedWhenConfigured) {
  Configure(ConflictPolicy::kTakeover, SendFailurePolicy::kEvictRecipient);
  auto a = MakePeer("conn-a");
  auto b = MakePeer("conn-b");
  Feed(a, R"({"type":"register","id":"alice"})");
  Feed(b, R"({"type":"register","id":"bob"})");
  a.connection->Kill();

  auto result = Feed(b, R"({"type":"chat","to":"alice"})");
  EXPECT_EQ(result.status, DispatchStatus::kRecipientEvicted);
  EXPECT_FALSE(result.IsFatal());
  EXPECT_FALSE(registry_->Contains("alice"));
  EXPECT_EQ(Feed(b, R"({"type":"chat","to":"alice"})").status, DispatchStatus::kUnknownRecipient);
}

TEST_F(DispatcherTest, ReleaseRemovesEntryOnlyWhenIdentified) {
  auto a = MakePeer("conn-a");
  EXPECT_FALSE(dispatcher_->Release(a.identity, a.connection.get()));

  Feed(a, R"({"type":"register","id":"alice"})");
  EXPECT_TRUE(dispatcher_->Release(a.identity, a.connection.get()));
  EXPECT_FALSE(registry_->Contains("alice"));
}

TEST(SessionIdentityTest, StartsUnidentified) {
  SessionIdentity identity;
  EXPECT_EQ(identity.GetState(), SessionIdentity::State::kUnidentified);
  EXPECT_TRUE(identity.ClientId().empty());
  identity.Identify("alice");
  EXPECT_EQ(identity.GetState(), SessionIdentity::State::kIdentified);
}

}  // namespace
