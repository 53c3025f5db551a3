#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "magnet/rasl_link.hpp"

using namespace magenc;
using namespace magenc::magnet;

class RaslLinkTest : public ::testing::Test {
protected:
  const std::string cid_text = "bafkreiayssqzzbn2cu5mx52dvrheh7aajsermbfsn6ggtypih2rk7r6er4";
  const cid::Cid cid = cid::Cid::decode(cid_text);
};

//==============================================
// PARSING
//==============================================

TEST_F(RaslLinkTest, ParsesIdentifierAndSeeds) {
  RaslLink link = RaslLink::parse("web+rasl://" + cid_text + ";example.com,test.org/");

  EXPECT_EQ(link.cid(), cid);
  const std::vector<std::string> expected{"example.com", "test.org"};
  EXPECT_EQ(link.seeds(), expected);
}

TEST_F(RaslLinkTest, AcceptsEscapedSeparatorAndPorts) {
  RaslLink link = RaslLink::parse("web+rasl://" + cid_text + "%3Bexample.com,127.0.0.1:8080/");

  EXPECT_EQ(link.cid(), cid);
  const std::vector<std::string> expected{"example.com", "127.0.0.1:8080"};
  EXPECT_EQ(link.seeds(), expected);
}

TEST_F(RaslLinkTest, SkipsInvalidAndDuplicateSeeds) {
  RaslLink link = RaslLink::parse("web+rasl://" + cid_text + ";example.com,,bad host,example.com:99999,example.com/");

  const std::vector<std::string> expected{"example.com"};
  EXPECT_EQ(link.seeds(), expected);
}

TEST_F(RaslLinkTest, EmptySeedListIsAllowed) {
  RaslLink link = RaslLink::parse("web+rasl://" + cid_text + ";/");
  EXPECT_EQ(link.cid(), cid);
  EXPECT_TRUE(link.seeds().empty());
}

TEST_F(RaslLinkTest, RejectsMalformedLinks) {
  EXPECT_THROW(RaslLink::parse("https://" + cid_text + ";example.com/"), InvalidParameter);
  EXPECT_THROW(RaslLink::parse("web+rasl://" + cid_text + "/"), InvalidParameter);
  EXPECT_THROW(RaslLink::parse("web+rasl://notacid;example.com/"), InvalidParameter);
  EXPECT_THROW(RaslLink::parse("web+rasl://"), InvalidParameter);
}


//==============================================
// SERIALIZATION
//==============================================

TEST_F(RaslLinkTest, SerializesAuthoritiesOfSeedUrls) {
  RaslLink link(cid);
  EXPECT_TRUE(link.add_seed("https://example.com"));
  EXPECT_TRUE(link.add_seed("https://user@test.org/extra/junk"));
  EXPECT_FALSE(link.add_seed("example.com"));

  EXPECT_EQ(link.serialize(), "web+rasl://" + cid_text + ";example.com,test.org/");
  EXPECT_EQ(RaslLink::parse(link.serialize()).seeds(), link.seeds());
}

TEST_F(RaslLinkTest, AddSeedRejectsNonHosts) {
  RaslLink link(cid);
  EXPECT_THROW(link.add_seed(""), InvalidParameter);
  EXPECT_THROW(link.add_seed("ftp://example.com"), InvalidParameter);
  EXPECT_THROW(link.add_seed("example.com/path"), InvalidParameter);
  EXPECT_TRUE(link.seeds().empty());
}


//==============================================
// CONVERSION
//==============================================

TEST_F(RaslLinkTest, SeedsBecomeWellKnownCdnBases) {
  MagnetLink magnet = RaslLink::parse("web+rasl://" + cid_text + ";example.com,test.org:8443/").to_magnet();

  EXPECT_EQ(magnet.cid(), cid);
  const std::vector<std::string> expected{
      "https://example.com/.well-known/rasl/" + cid_text,
      "https://test.org:8443/.well-known/rasl/" + cid_text};
  EXPECT_EQ(magnet.candidate_urls(), expected);
  EXPECT_FALSE(magnet.is_signed());
}

TEST_F(RaslLinkTest, RetrievalLinkAcceptsBothForms) {
  const MagnetLink from_rasl = parse_retrieval_link("web+rasl://" + cid_text + ";example.com/");
  EXPECT_EQ(from_rasl.cid(), cid);
  ASSERT_EQ(from_rasl.sources().size(), 1u);

  const MagnetLink from_magnet = parse_retrieval_link(
      "magnet:?xt=urn:cid:" + cid_text + "&cdn=https://cdn.example");
  EXPECT_EQ(from_magnet.cid(), cid);
  ASSERT_EQ(from_magnet.sources().size(), 1u);

  EXPECT_THROW(parse_retrieval_link("http://example.com/" + cid_text), MagnetError);
}
