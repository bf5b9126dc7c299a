#include "httplike/known-protocol.hpp"

#include <gtest/gtest.h>

#include <set>

#include "httplike/features.hpp"

namespace httplike::uri {

TEST(KnownProtocolTest, NumberFollowsEnabledFamilies) {
  EXPECT_EQ(kNbKnownProtocols, (httpEnabled() ? 2U : 0U) + (rtspEnabled() ? 2U : 0U));
}

TEST(KnownProtocolTest, TableIndexedByEnum) {
  for (const KnownProtocol &known : kKnownProtocols) {
    EXPECT_EQ(&GetKnownProtocol(known.protocol), &known);
    EXPECT_EQ(ProtocolName(known.protocol), known.name);
    EXPECT_EQ(ProtocolNameLength(known.protocol), known.name.size());
  }
}

TEST(KnownProtocolTest, HashTagsAreDistinct) {
  std::set<int> tags;
  for (const KnownProtocol &known : kKnownProtocols) {
    EXPECT_TRUE(tags.insert(known.hashTag).second);
  }
}

TEST(KnownProtocolTest, FindIsCaseSensitive) {
  EXPECT_FALSE(FindProtocol("ftp").has_value());
  EXPECT_FALSE(FindProtocol("").has_value());
#ifdef HTTPLIKE_ENABLE_HTTP
  EXPECT_EQ(FindProtocol("http"), Protocol::http);
  EXPECT_EQ(FindProtocol("https"), Protocol::https);
  EXPECT_FALSE(FindProtocol("HTTP").has_value());
  EXPECT_FALSE(FindProtocol("http:").has_value());
#endif
#ifdef HTTPLIKE_ENABLE_RTSP
  EXPECT_EQ(FindProtocol("rtsp"), Protocol::rtsp);
  EXPECT_EQ(FindProtocol("rtsps"), Protocol::rtsps);
#endif
}

TEST(KnownProtocolTest, FindIgnoreCase) {
  EXPECT_FALSE(FindProtocolIgnoreCase("ftp").has_value());
#ifdef HTTPLIKE_ENABLE_HTTP
  EXPECT_EQ(FindProtocolIgnoreCase("HTTP"), Protocol::http);
  EXPECT_EQ(FindProtocolIgnoreCase("hTtPs"), Protocol::https);
  EXPECT_EQ(ProtocolHashTag(Protocol::http), 1);
  EXPECT_EQ(ProtocolHashTag(Protocol::https), 2);
#endif
#ifdef HTTPLIKE_ENABLE_RTSP
  EXPECT_EQ(FindProtocolIgnoreCase("RTSPS"), Protocol::rtsps);
  EXPECT_EQ(ProtocolHashTag(Protocol::rtsp), 3);
  EXPECT_EQ(ProtocolHashTag(Protocol::rtsps), 4);
#endif
}

}  // namespace httplike::uri
