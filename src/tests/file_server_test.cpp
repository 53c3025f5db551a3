#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include "federation/federation_engine.hpp"
#include "federation/peer_manager.hpp"
#include "fetch/fetcher.hpp"
#include "file_server/file_server.hpp"
#include "crypto/signature.hpp"
#include "magnet/magnet_link.hpp"
#include "magnet/rasl_link.hpp"
#include "mock_http_client.hpp"
#include "network/url.hpp"
#include "store/store.hpp"
#include "test_utils.hpp"

using namespace magenc;
using namespace magenc::file_server;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class FileServerTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  NiceMock<MockHttpClient> client;
  std::unique_ptr<store::Store> store;
  std::unique_ptr<federation::PeerManager> peers;
  std::unique_ptr<federation::FederationEngine> federation;
  std::unique_ptr<fetch::Fetcher> fetcher;
  std::unique_ptr<FileServer> server;

  const std::string hello = "hello";
  const cid::Cid hello_cid = cid::Cid::compute(hello);

  void SetUp() override {
    test_dir = make_temp_dir("file_server_test");
    start(true);
  }

  void TearDown() override {
    server.reset();
    federation.reset();
    fetcher.reset();
    peers.reset();
    store.reset();
    std::filesystem::remove_all(test_dir);
  }

  void start(bool allow_post) {
    server.reset();
    federation.reset();

    federation::PeerPolicy policy;
    policy.deny(*federation::Peer::parse("http://evil.example:3000"));
    policy.deny(*federation::Peer::parse("http://10.6.6.6"));

    store = std::make_unique<store::Store>(test_dir.string());
    peers = std::make_unique<federation::PeerManager>(policy);
    federation::FederationOptions options;
    options.self_url = "http://self.example:3000";
    federation = std::make_unique<federation::FederationEngine>(client, *peers, options);
    fetcher = std::make_unique<fetch::Fetcher>(client);

    FileServerOptions server_options;
    server_options.allow_post = allow_post;
    server = std::make_unique<FileServer>(*store, *peers, *federation, *fetcher, server_options);
  }

  static Request request(const std::string& method, const std::string& target,
                         const std::string& body = "") {
    Request req;
    req.method = method;
    req.target = target;
    req.body = body;
    req.remote_host = "127.0.0.1";
    return req;
  }

  Response get(const std::string& target) { return server->handle(request("GET", target)); }

  Response post(const std::string& body, const network::Headers& headers = {}) {
    Request req = request("POST", "/", body);
    req.headers = headers;
    return server->handle(req);
  }

  Response notify(const std::string& body, const network::Headers& headers) {
    Request req = request("POST", "/notify", body);
    req.headers = headers;
    return server->handle(req);
  }

  std::string gateway_target(const magnet::MagnetLink& link) const {
    return "/?magnet=" + network::escape_component(link.serialize());
  }
};

//==============================================
// GET AND POST
//==============================================

TEST_F(FileServerTest, HelloBeforeAndAfterPost) {
  EXPECT_EQ(get("/" + hello_cid.encode()).status, 404u);

  Response created = post(hello);
  EXPECT_EQ(created.status, 201u);
  EXPECT_EQ(created.body, hello_cid.encode());
  EXPECT_EQ(created.headers["Location"], "/" + hello_cid.encode());

  Response fetched = get("/" + hello_cid.encode());
  EXPECT_EQ(fetched.status, 200u);
  EXPECT_EQ(fetched.body, hello);
  EXPECT_EQ(fetched.headers["Content-CID"], hello_cid.encode());
  EXPECT_EQ(fetched.headers["ETag"], "\"" + hello_cid.encode() + "\"");
  EXPECT_EQ(fetched.headers["Content-Type"], "application/octet-stream");
}

TEST_F(FileServerTest, HeadCarriesLengthWithoutBody) {
  post(hello);
  Response head = server->handle(request("HEAD", "/" + hello_cid.encode()));
  EXPECT_EQ(head.status, 200u);
  EXPECT_TRUE(head.body.empty());
  ASSERT_TRUE(head.content_length.has_value());
  EXPECT_EQ(*head.content_length, hello.size());
  EXPECT_EQ(head.headers["Content-CID"], hello_cid.encode());

  EXPECT_EQ(server->handle(request("HEAD", "/" + cid::Cid::compute("x").encode())).status, 404u);
}

TEST_F(FileServerTest, IndexServesUsage) {
  Response index = get("/");
  EXPECT_EQ(index.status, 200u);
  EXPECT_NE(index.body.find("POST /"), std::string::npos);
}

TEST_F(FileServerTest, EmptyBodyIsStored) {
  Response created = post("");
  EXPECT_EQ(created.status, 201u);
  EXPECT_EQ(get("/" + created.body).status, 200u);
}

TEST_F(FileServerTest, MalformedCidPathIs400) {
  EXPECT_EQ(get("/not-a-cid").status, 400u);
  EXPECT_EQ(get("/B" + hello_cid.encode().substr(1)).status, 400u);
}

TEST_F(FileServerTest, RoutingErrors) {
  EXPECT_EQ(server->handle(request("PUT", "/", hello)).status, 405u);
  EXPECT_EQ(server->handle(request("DELETE", "/" + hello_cid.encode())).status, 405u);
  EXPECT_EQ(get("/notify").status, 405u);
  EXPECT_EQ(get("/a/b").status, 404u);
}

TEST_F(FileServerTest, CorruptObjectIs500) {
  post(hello);
  {
    std::ofstream file(store->object_path(hello_cid), std::ios::binary | std::ios::trunc);
    file << "jello";
  }
  EXPECT_EQ(get("/" + hello_cid.encode()).status, 500u);
}

TEST_F(FileServerTest, PostDisabledIs403) {
  start(false);
  EXPECT_EQ(post(hello).status, 403u);
  EXPECT_EQ(notify(hello_cid.encode(), {{"x-magenc-peer", "http://peer.example"}}).status, 403u);
  EXPECT_FALSE(store->has(hello_cid));
  // Reads still work
  EXPECT_EQ(get("/" + hello_cid.encode()).status, 404u);
}

//==============================================
// PEER PUSHES
//==============================================

TEST_F(FileServerTest, DeniedPeerPushStoresNothingAndFederatesNothing) {
  peers->add_push_peer(*federation::Peer::parse("http://downstream.example:3000"));
  EXPECT_CALL(client, post(_, _, _)).Times(0);

  Response declared = post(hello, {{"x-magenc-peer", "http://evil.example:3000"},
                                   {"content-cid", hello_cid.encode()}});
  EXPECT_EQ(declared.status, 403u);

  Request by_host = request("POST", "/", hello);
  by_host.remote_host = "10.6.6.6";
  EXPECT_EQ(server->handle(by_host).status, 403u);

  federation->wait_idle();
  EXPECT_FALSE(store->has(hello_cid));
}

TEST_F(FileServerTest, MalformedPeerHeaderIs400) {
  EXPECT_EQ(post(hello, {{"x-magenc-peer", "evil.example"}}).status, 400u);
  EXPECT_FALSE(store->has(hello_cid));
}

TEST_F(FileServerTest, AssertedCidMustMatchBody) {
  const std::string other = cid::Cid::compute("other").encode();
  Response mismatch = post(hello, {{"content-cid", other}});
  EXPECT_EQ(mismatch.status, 400u);
  EXPECT_NE(mismatch.body.find("Integrity violation"), std::string::npos);
  EXPECT_FALSE(store->has(hello_cid));

  EXPECT_EQ(post(hello, {{"content-cid", "garbage"}}).status, 400u);
  EXPECT_EQ(post(hello, {{"content-cid", hello_cid.encode()}}).status, 201u);
}

TEST_F(FileServerTest, NewObjectIsForwardedOnce) {
  peers->add_push_peer(*federation::Peer::parse("http://downstream.example:3000"));
  EXPECT_CALL(client, post("http://downstream.example:3000/", hello, _))
      .WillOnce(Return(http_status(201)));

  EXPECT_EQ(post(hello).status, 201u);
  // Already stored, nothing new to federate
  EXPECT_EQ(post(hello).status, 201u);
  federation->wait_idle();
}

TEST_F(FileServerTest, StoreFileFederatesLocalAdds) {
  peers->add_push_peer(*federation::Peer::parse("http://downstream.example:3000"));
  EXPECT_CALL(client, post("http://downstream.example:3000/", hello, _))
      .WillOnce(Return(http_status(201)));

  std::istringstream input(hello);
  EXPECT_EQ(server->store_file(input), hello_cid);
  EXPECT_EQ(server->get_file(hello_cid), hello);
  federation->wait_idle();
}

//==============================================
// ANNOUNCEMENTS
//==============================================

TEST_F(FileServerTest, NotifyPullsFromAnnouncer) {
  EXPECT_CALL(client, get("http://announcer.example:3000/" + hello_cid.encode()))
      .WillOnce(Return(http_ok(hello)));

  Response accepted = notify(hello_cid.encode() + "\n", {{"x-magenc-peer", "http://announcer.example:3000/"}});
  EXPECT_EQ(accepted.status, 202u);
  EXPECT_EQ(accepted.body, hello_cid.encode());

  federation->wait_idle();
  EXPECT_TRUE(store->has(hello_cid));
}

TEST_F(FileServerTest, NotifyOfForgedContentStoresNothing) {
  EXPECT_CALL(client, get("http://announcer.example:3000/" + hello_cid.encode()))
      .WillOnce(Return(http_ok("forged")));

  EXPECT_EQ(notify(hello_cid.encode(), {{"x-magenc-peer", "http://announcer.example:3000"}}).status, 202u);
  federation->wait_idle();
  EXPECT_FALSE(store->has(hello_cid));
  EXPECT_FALSE(store->has(cid::Cid::compute("forged")));
}

TEST_F(FileServerTest, NotifyOfKnownObjectDoesNotFetch) {
  post(hello);
  EXPECT_CALL(client, get(_)).Times(0);
  EXPECT_EQ(notify(hello_cid.encode(), {{"x-magenc-peer", "http://announcer.example:3000"}}).status, 202u);
  federation->wait_idle();
}

TEST_F(FileServerTest, NotifyValidation) {
  EXPECT_CALL(client, get(_)).Times(0);
  EXPECT_EQ(notify(hello_cid.encode(), {}).status, 400u);
  EXPECT_EQ(notify("not a cid", {{"x-magenc-peer", "http://announcer.example:3000"}}).status, 400u);
  EXPECT_EQ(notify(hello_cid.encode(), {{"x-magenc-peer", "http://evil.example:3000"}}).status, 403u);
  federation->wait_idle();
}

//==============================================
// GATEWAY
//==============================================

TEST_F(FileServerTest, GatewayFetchesVerifiesAndCaches) {
  auto link = magnet::MagnetLink::create(hello, {"https://bad.example", "https://good.example"}, {});
  EXPECT_CALL(client, get("https://bad.example/" + hello_cid.encode()))
      .WillOnce(Return(http_ok("corrupted")));
  EXPECT_CALL(client, get("https://good.example/" + hello_cid.encode()))
      .WillOnce(Return(http_ok(hello)));

  Response response = get(gateway_target(link));
  EXPECT_EQ(response.status, 200u);
  EXPECT_EQ(response.body, hello);
  EXPECT_TRUE(store->has(hello_cid));

  // Served from the store the second time
  EXPECT_EQ(get(gateway_target(link)).status, 200u);
}

TEST_F(FileServerTest, GatewayChecksSignatureOfCachedObject) {
  post(hello);
  EXPECT_CALL(client, get(_)).Times(0);

  const crypto::Ed25519Signer signer = crypto::Ed25519Signer::generate();
  const crypto::Ed25519Signer other = crypto::Ed25519Signer::generate();
  auto forged = magnet::MagnetLink::create(hello, {"https://a.example"}, {});
  forged.set_signature(other.sign("not hello"), signer.did_key());

  Response response = get(gateway_target(forged));
  EXPECT_EQ(response.status, 502u);
  EXPECT_NE(response.body, hello);

  auto genuine = magnet::MagnetLink::create(hello, {"https://a.example"}, {});
  genuine.sign(signer, hello);
  response = get(gateway_target(genuine));
  EXPECT_EQ(response.status, 200u);
  EXPECT_EQ(response.body, hello);
}

TEST_F(FileServerTest, GatewayAcceptsRaslLinks) {
  EXPECT_CALL(client, get("https://seed.example/.well-known/rasl/" + hello_cid.encode()))
      .WillOnce(Return(http_ok(hello)));

  magnet::RaslLink link(hello_cid);
  link.add_seed("seed.example");
  Response response = get("/?magnet=" + network::escape_component(link.serialize()));
  EXPECT_EQ(response.status, 200u);
  EXPECT_EQ(response.body, hello);
  EXPECT_TRUE(store->has(hello_cid));
}

TEST_F(FileServerTest, GatewayExhaustionIs502) {
  auto link = magnet::MagnetLink::create(hello, {"https://a.example", "https://b.example"}, {});
  EXPECT_CALL(client, get(_))
      .WillOnce(Return(http_failure(network::NetworkError::TIMEOUT)))
      .WillOnce(Return(http_status(404)));

  Response response = get(gateway_target(link));
  EXPECT_EQ(response.status, 502u);
  EXPECT_NE(response.body.find("https://a.example/"), std::string::npos);
  EXPECT_FALSE(store->has(hello_cid));
}

TEST_F(FileServerTest, GatewayAllTimeoutsIs504) {
  auto link = magnet::MagnetLink::create(hello, {"https://a.example", "https://b.example"}, {});
  EXPECT_CALL(client, get(_))
      .Times(2)
      .WillRepeatedly(Return(http_failure(network::NetworkError::TIMEOUT)));

  EXPECT_EQ(get(gateway_target(link)).status, 504u);
}

TEST_F(FileServerTest, GatewayRejectsBadLinks) {
  EXPECT_CALL(client, get(_)).Times(0);
  EXPECT_EQ(get("/?magnet=" + network::escape_component("magnet:?cdn=https://a.example")).status, 400u);
  EXPECT_EQ(get("/?magnet=%zz").status, 400u);
}
