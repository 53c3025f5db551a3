#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "federation/federation_engine.hpp"
#include "federation/federation_error.hpp"
#include "federation/selection_policy.hpp"
#include "mock_http_client.hpp"

using namespace magenc;
using namespace magenc::federation;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::Invoke;
using ::testing::Key;
using ::testing::Not;
using ::testing::NiceMock;
using ::testing::Pair;
using ::testing::Return;

namespace {

std::vector<Peer> make_peers(std::size_t count, const std::string& prefix = "http://peer") {
  std::vector<Peer> peers;
  for (std::size_t i = 0; i < count; ++i) {
    peers.push_back(*Peer::parse(prefix + std::to_string(i) + ".example:3000"));
  }
  return peers;
}

} // namespace

//==============================================
// SELECTION POLICY
//==============================================

TEST(SelectionPolicyTest, AllPeersKeepsOrder) {
  std::mt19937 rng(1);
  const auto peers = make_peers(4);
  EXPECT_EQ(select_peers(peers, AllPeers{}, rng), peers);
  EXPECT_EQ(describe(AllPeers{}), "all peers");
}

TEST(SelectionPolicyTest, RandomSubsetPicksExactlyNDistinctPeers) {
  std::mt19937 rng(7);
  const auto peers = make_peers(5);
  for (int trial = 0; trial < 100; ++trial) {
    const auto selected = select_peers(peers, RandomSubset{2}, rng);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_NE(selected[0], selected[1]);
  }
}

TEST(SelectionPolicyTest, RandomSubsetIsRoughlyUniform) {
  std::mt19937 rng(12345);
  const auto peers = make_peers(5);
  const int trials = 10000;
  std::map<std::string, int> counts;
  for (int trial = 0; trial < trials; ++trial) {
    for (const auto& peer : select_peers(peers, RandomSubset{2}, rng)) {
      counts[peer.base()]++;
    }
  }

  // Each peer is expected in 2/5 of the events
  ASSERT_EQ(counts.size(), 5u);
  for (const auto& [base, count] : counts) {
    EXPECT_GT(count, 3600) << base;
    EXPECT_LT(count, 4400) << base;
  }
}

TEST(SelectionPolicyTest, RandomSubsetLargerThanSetReturnsAll) {
  std::mt19937 rng(3);
  const auto peers = make_peers(2);
  EXPECT_EQ(select_peers(peers, RandomSubset{5}, rng).size(), 2u);
  EXPECT_TRUE(select_peers({}, RandomSubset{5}, rng).empty());
}

TEST(GossipModeTest, ParsesKnownModes) {
  EXPECT_EQ(gossip_mode_from_string("push"), GossipMode::PUSH);
  EXPECT_EQ(gossip_mode_from_string("announce"), GossipMode::ANNOUNCE);
  EXPECT_THROW(gossip_mode_from_string("flood"), FederationError);
}

//==============================================
// FEDERATION ENGINE
//==============================================

class FederationEngineTest : public ::testing::Test {
protected:
  NiceMock<MockHttpClient> client;
  const std::string content = "federated bytes";
  const cid::Cid cid = cid::Cid::compute(content);
  const std::shared_ptr<const std::string> bytes = std::make_shared<const std::string>(content);

  std::unique_ptr<PeerManager> peers;
  std::unique_ptr<FederationEngine> engine;

  std::mutex calls_mutex;
  std::vector<std::string> posted_urls;

  void SetUp() override {
    ON_CALL(client, post(_, _, _))
        .WillByDefault(Invoke([this](const std::string& url, const std::string&, const network::Headers&) {
          std::lock_guard<std::mutex> lock(calls_mutex);
          posted_urls.push_back(url);
          return http_status(201);
        }));
  }

  void TearDown() override {
    engine.reset();
    peers.reset();
  }

  void start(FederationOptions options, PeerPolicy policy = PeerPolicy()) {
    peers = std::make_unique<PeerManager>(std::move(policy));
    engine = std::make_unique<FederationEngine>(client, *peers, std::move(options));
  }

  static FederationOptions options_with(GossipMode mode, std::size_t fanout = 3) {
    FederationOptions options;
    options.self_url = "http://self.example:3000";
    options.fanout = fanout;
    options.gossip_mode = mode;
    return options;
  }
};

TEST_F(FederationEngineTest, PushesToEveryPushTargetWithHeaders) {
  start(options_with(GossipMode::PUSH));
  for (const auto& peer : make_peers(3)) {
    peers->add_push_peer(peer);
  }

  const auto expected_headers = AllOf(
      Contains(Pair(FederationEngine::CID_HEADER, cid.encode())),
      Contains(Pair(FederationEngine::PEER_HEADER, "http://self.example:3000")));
  for (int i = 0; i < 3; ++i) {
    EXPECT_CALL(client, post("http://peer" + std::to_string(i) + ".example:3000/", content,
                             expected_headers))
        .WillOnce(Return(http_status(201)));
  }

  engine->federate(cid, bytes);
  engine->wait_idle();
}

TEST_F(FederationEngineTest, GossipPushReachesExactlyFanoutPeers) {
  start(options_with(GossipMode::PUSH, 2));
  for (const auto& peer : make_peers(5)) {
    peers->add_gossip_peer(peer);
  }

  engine->federate(cid, bytes);
  engine->wait_idle();

  std::lock_guard<std::mutex> lock(calls_mutex);
  ASSERT_EQ(posted_urls.size(), 2u);
  EXPECT_NE(posted_urls[0], posted_urls[1]);
}

TEST_F(FederationEngineTest, AnnounceModePostsCidToNotify) {
  start(options_with(GossipMode::ANNOUNCE, 1));
  peers->add_gossip_peer(*Peer::parse("http://gossip.example:3000/"));

  EXPECT_CALL(client, post("http://gossip.example:3000/notify", cid.encode(),
                           AllOf(Contains(Pair(FederationEngine::PEER_HEADER, "http://self.example:3000")),
                                 Not(Contains(Key(FederationEngine::CID_HEADER))))))
      .WillOnce(Return(http_status(202)));

  engine->federate(cid, bytes);
  engine->wait_idle();
}

TEST_F(FederationEngineTest, AnnounceWithoutSelfUrlSendsNothing) {
  FederationOptions options = options_with(GossipMode::ANNOUNCE);
  options.self_url.clear();
  start(options);
  peers->add_gossip_peer(*Peer::parse("http://gossip.example:3000"));

  EXPECT_CALL(client, post(_, _, _)).Times(0);
  engine->federate(cid, bytes);
  engine->wait_idle();
}

TEST_F(FederationEngineTest, DeniedPeersAreNeverContacted) {
  PeerPolicy policy;
  policy.deny(*Peer::parse("http://peer1.example:3000"));
  start(options_with(GossipMode::PUSH, 10), policy);
  for (const auto& peer : make_peers(3)) {
    peers->add_push_peer(peer);
    peers->add_gossip_peer(peer);
  }

  engine->federate(cid, bytes);
  engine->wait_idle();

  std::lock_guard<std::mutex> lock(calls_mutex);
  EXPECT_EQ(posted_urls.size(), 4u);
  for (const auto& url : posted_urls) {
    EXPECT_EQ(url.find("peer1"), std::string::npos) << url;
  }
}

TEST_F(FederationEngineTest, DeliveryFailuresAreAbsorbed) {
  start(options_with(GossipMode::PUSH));
  for (const auto& peer : make_peers(2)) {
    peers->add_push_peer(peer);
  }

  EXPECT_CALL(client, post(_, _, _))
      .Times(2)
      .WillRepeatedly(Return(http_failure(network::NetworkError::CONNECTION_FAILED)));
  EXPECT_NO_THROW(engine->federate(cid, bytes));
  engine->wait_idle();
}

TEST_F(FederationEngineTest, NotifyPeerSetReturnsSelection) {
  start(options_with(GossipMode::PUSH));
  const auto candidates = make_peers(4);

  const auto selected = engine->notify_peer_set(candidates, RandomSubset{3}, Notification::announce(cid));
  engine->wait_idle();
  EXPECT_EQ(selected.size(), 3u);

  std::lock_guard<std::mutex> lock(calls_mutex);
  EXPECT_EQ(posted_urls.size(), 3u);
}

TEST_F(FederationEngineTest, BackgroundTasksRunAndExceptionsAreLogged) {
  start(options_with(GossipMode::PUSH));
  std::atomic<int> ran{0};
  engine->run_in_background([&ran]() { ran++; });
  engine->run_in_background([&ran]() {
    ran++;
    throw std::runtime_error("task failure");
  });
  engine->wait_idle();
  EXPECT_EQ(ran.load(), 2);

  engine->shutdown();
  engine->run_in_background([&ran]() { ran++; });
  EXPECT_EQ(ran.load(), 2);
}
