#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "crypto/signature.hpp"
#include "fetch/fetcher.hpp"
#include "mock_http_client.hpp"

using namespace magenc;
using namespace magenc::fetch;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StrictMock;

class FetcherTest : public ::testing::Test {
protected:
  StrictMock<MockHttpClient> client;
  Fetcher fetcher{client};

  const std::string content = "hello";
  const cid::Cid cid = cid::Cid::compute(content);

  magnet::MagnetLink link_with(const std::vector<std::string>& cdns) const {
    return magnet::MagnetLink::create(content, cdns, {});
  }

  std::string url_for(const std::string& base) const {
    return base + "/" + cid.encode();
  }
};

TEST_F(FetcherTest, FirstSourceCorruptedSecondCorrect) {
  const auto link = link_with({"https://bad.example", "https://good.example"});
  {
    ::testing::InSequence seq;
    EXPECT_CALL(client, get(url_for("https://bad.example"))).WillOnce(Return(http_ok("hellO")));
    EXPECT_CALL(client, get(url_for("https://good.example"))).WillOnce(Return(http_ok(content)));
  }

  EXPECT_EQ(fetcher.fetch(link), content);
}

TEST_F(FetcherTest, StopsAtFirstVerifiedSource) {
  const auto link = link_with({"https://one.example", "https://two.example"});
  EXPECT_CALL(client, get(url_for("https://one.example"))).WillOnce(Return(http_ok(content)));
  EXPECT_CALL(client, get(url_for("https://two.example"))).Times(0);

  EXPECT_EQ(fetcher.fetch(link), content);
}

TEST_F(FetcherTest, EverySourceFailingRecordsOneCausePerSource) {
  auto link = link_with({"https://a.example", "https://b.example", "https://c.example"});
  link.add_source(magnet::ExactSource{"https://d.example/file"});

  EXPECT_CALL(client, get(url_for("https://a.example")))
      .WillOnce(Return(http_failure(network::NetworkError::CONNECTION_FAILED)));
  EXPECT_CALL(client, get(url_for("https://b.example")))
      .WillOnce(Return(http_failure(network::NetworkError::TIMEOUT)));
  EXPECT_CALL(client, get(url_for("https://c.example"))).WillOnce(Return(http_status(404)));
  EXPECT_CALL(client, get("https://d.example/file")).WillOnce(Return(http_ok("wrong")));

  try {
    fetcher.fetch(link);
    FAIL() << "fetch should exhaust every source";
  } catch (const AllSourcesExhausted& e) {
    const auto& failures = e.failures();
    ASSERT_EQ(failures.size(), 4u);
    EXPECT_EQ(failures[0].url, url_for("https://a.example"));
    EXPECT_EQ(failures[0].kind, FailureKind::TRANSPORT);
    EXPECT_EQ(failures[1].kind, FailureKind::TIMEOUT);
    EXPECT_EQ(failures[2].kind, FailureKind::HTTP_STATUS);
    EXPECT_EQ(failures[3].url, "https://d.example/file");
    EXPECT_EQ(failures[3].kind, FailureKind::INTEGRITY_MISMATCH);
    EXPECT_FALSE(e.all_timeouts());
  }
}

TEST_F(FetcherTest, AllTimeouts) {
  const auto link = link_with({"https://slow1.example", "https://slow2.example"});
  EXPECT_CALL(client, get(_)).Times(2)
      .WillRepeatedly(Return(http_failure(network::NetworkError::TIMEOUT)));

  try {
    fetcher.fetch(link);
    FAIL() << "fetch should exhaust every source";
  } catch (const AllSourcesExhausted& e) {
    EXPECT_EQ(e.failures().size(), 2u);
    EXPECT_TRUE(e.all_timeouts());
  }
}

TEST_F(FetcherTest, ZeroCandidatesExhaustImmediately) {
  const magnet::MagnetLink link(cid);
  try {
    fetcher.fetch(link);
    FAIL() << "fetch without candidates should throw";
  } catch (const AllSourcesExhausted& e) {
    EXPECT_TRUE(e.failures().empty());
    EXPECT_FALSE(e.all_timeouts());
  }
}

TEST_F(FetcherTest, SignedLinkRejectsSourceWhenSignatureFails) {
  auto signer = crypto::Ed25519Signer::generate();
  auto impostor = crypto::Ed25519Signer::generate();

  // Valid shape, but made by a key other than the declared signer
  auto link = link_with({"https://cdn.example"});
  link.set_signature(impostor.sign(content), signer.did_key());

  EXPECT_CALL(client, get(url_for("https://cdn.example"))).WillOnce(Return(http_ok(content)));
  try {
    fetcher.fetch(link);
    FAIL() << "signature mismatch should fail the source";
  } catch (const AllSourcesExhausted& e) {
    ASSERT_EQ(e.failures().size(), 1u);
    EXPECT_EQ(e.failures()[0].kind, FailureKind::SIGNATURE_INVALID);
  }
}

TEST_F(FetcherTest, SignedLinkAcceptsValidSignature) {
  auto signer = crypto::Ed25519Signer::generate();
  auto link = link_with({"https://cdn.example"});
  link.sign(signer, content);

  EXPECT_CALL(client, get(url_for("https://cdn.example"))).WillOnce(Return(http_ok(content)));
  EXPECT_EQ(fetcher.fetch(link), content);
}

TEST_F(FetcherTest, CancellationStopsBeforeNextCandidate) {
  const auto link = link_with({"https://a.example", "https://b.example"});
  CancellationToken token;

  EXPECT_CALL(client, get(url_for("https://a.example")))
      .WillOnce(Invoke([&token](const std::string&) {
        token.cancel();
        return http_status(503);
      }));
  EXPECT_CALL(client, get(url_for("https://b.example"))).Times(0);

  EXPECT_THROW(fetcher.fetch(link, token), FetchCancelled);
}

TEST_F(FetcherTest, CancelledTokenSharedAcrossCopies) {
  CancellationToken token;
  CancellationToken copy = token;
  copy.cancel();
  EXPECT_TRUE(token.is_cancelled());

  const auto link = link_with({"https://a.example"});
  EXPECT_THROW(fetcher.fetch(link, token), FetchCancelled);
}

TEST_F(FetcherTest, FetchFromVerifiesContent) {
  EXPECT_CALL(client, get(url_for("http://peer.example:3000")))
      .WillOnce(Return(http_ok(content)))
      .WillOnce(Return(http_ok("forged")));

  EXPECT_EQ(fetcher.fetch_from("http://peer.example:3000/", cid), content);
  try {
    fetcher.fetch_from("http://peer.example:3000", cid);
    FAIL() << "forged content should be rejected";
  } catch (const AllSourcesExhausted& e) {
    ASSERT_EQ(e.failures().size(), 1u);
    EXPECT_EQ(e.failures()[0].kind, FailureKind::INTEGRITY_MISMATCH);
  }
}

TEST_F(FetcherTest, HasObjectUsesHead) {
  EXPECT_CALL(client, head(url_for("https://cdn.example")))
      .WillOnce(Return(http_status(200)))
      .WillOnce(Return(http_status(404)));
  EXPECT_CALL(client, head(url_for("https://down.example")))
      .WillOnce(Return(http_failure(network::NetworkError::RESOLVE_FAILED)));

  EXPECT_TRUE(fetcher.has_object("https://cdn.example", cid));
  EXPECT_FALSE(fetcher.has_object("https://cdn.example", cid));
  EXPECT_FALSE(fetcher.has_object("https://down.example", cid));
}
