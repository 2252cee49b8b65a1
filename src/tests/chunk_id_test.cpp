#include <gtest/gtest.h>
#include "rawx/chunk/chunk_error.hpp"
#include "rawx/chunk/chunk_id.hpp"
#include "test_utils.hpp"

using namespace rawx::chunk;

namespace {

void expect_invalid(const std::string& path) {
  try {
    ChunkId::parse(path);
    ADD_FAILURE() << "Should reject: " << path;
  } catch (const ChunkError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::INVALID_CHUNK_ID) << path;
    EXPECT_EQ(e.status(), 400u);
  }
}

} // namespace

TEST(ChunkIdTest, CanonicalizesToUppercase) {
  std::string lower = "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";
  ChunkId id = ChunkId::parse("/" + lower);

  EXPECT_EQ(id.str(), rawx::test::CHUNK_A);
  EXPECT_EQ(id.str().size(), ChunkId::LENGTH);
  EXPECT_EQ(id, ChunkId::from_string(rawx::test::CHUNK_A));
}

TEST(ChunkIdTest, UsesLastPathSegment) {
  EXPECT_EQ(ChunkId::parse(std::string("/rawx/") + rawx::test::CHUNK_A).str(), rawx::test::CHUNK_A);
  EXPECT_EQ(ChunkId::parse(std::string("/") + rawx::test::CHUNK_A + "/").str(), rawx::test::CHUNK_A);
  EXPECT_EQ(ChunkId::parse(std::string("/") + rawx::test::CHUNK_A + "?x=1").str(), rawx::test::CHUNK_A);
}

TEST(ChunkIdTest, RejectsMalformedIdentifiers) {
  const std::string valid = rawx::test::CHUNK_A;

  expect_invalid("/");
  expect_invalid("");
  expect_invalid("/" + valid.substr(1));           // 63 characters
  expect_invalid("/" + valid + "0");               // 65 characters
  expect_invalid("/" + valid.substr(1) + "G");     // not hex
  expect_invalid("/" + valid.substr(2) + "-1");
  expect_invalid("/stat");
}

TEST(ChunkIdTest, HexStringHelper) {
  EXPECT_TRUE(is_hex_string("00ff"));
  EXPECT_TRUE(is_hex_string("00FF", 4));
  EXPECT_FALSE(is_hex_string("00FF", 3));
  EXPECT_FALSE(is_hex_string(""));
  EXPECT_FALSE(is_hex_string("0x12"));
}

TEST(ChunkIdTest, PathBasename) {
  EXPECT_EQ(path_basename("/a/b/c"), "c");
  EXPECT_EQ(path_basename("/a/b/c/"), "c");
  EXPECT_EQ(path_basename("c"), "c");
  EXPECT_EQ(path_basename("/a?b/c"), "a");
  EXPECT_EQ(path_basename("/"), "");
}
