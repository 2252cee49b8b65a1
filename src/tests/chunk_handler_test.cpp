#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <cctype>
#include "rawx/chunk/chunk_handler.hpp"
#include "test_utils.hpp"

using namespace rawx::chunk;
using rawx::http::Request;
using rawx::stats::Verb;
using rawx::store::StoreError;
using rawx::test::MockNotifier;
using rawx::test::MockRepository;
using rawx::test::MockStatsSink;
using ::testing::HasSubstr;
using ::testing::StrictMock;
using ::testing::Throw;

class ChunkHandlerTest : public ::testing::Test {
protected:
  StrictMock<MockRepository> repository;
  StrictMock<MockNotifier> notifier;
  StrictMock<MockStatsSink> stats;
  rawx::logger::RequestLogger logger;
  std::unique_ptr<ChunkHandler> handler;

  void SetUp() override {
    rawx::test::init_logging();
    handler = std::make_unique<ChunkHandler>(
      Services{repository, notifier, stats, logger, ServerSettings{}});
  }
};

TEST_F(ChunkHandlerTest, InvalidIdShortCircuits) {
  for (const std::string method : {"PUT", "GET", "HEAD", "DELETE", "COPY", "PATCH"}) {
    Request request = rawx::test::make_request(method, "/0123");
    auto reply = handler->serve(request);
    EXPECT_EQ(reply.status, 400u) << method;
    EXPECT_THAT(reply.headers["X-Error"], HasSubstr("Invalid chunk ID"));
    EXPECT_FALSE(reply.body);
  }
}

TEST_F(ChunkHandlerTest, UnknownMethodNotAllowed) {
  Request request = rawx::test::make_request("PATCH", std::string("/") + rawx::test::CHUNK_A);
  EXPECT_EQ(handler->serve(request).status, 405u);

  request.method = "get";
  EXPECT_EQ(handler->serve(request).status, 405u);
}

TEST_F(ChunkHandlerTest, CanonicalIdReachesPipeline) {
  std::string lower = rawx::test::CHUNK_A;
  std::transform(lower.begin(), lower.end(), lower.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  EXPECT_CALL(repository, del(ChunkId::from_string(rawx::test::CHUNK_A))).Times(1);

  Request request = rawx::test::make_request("DELETE", "/" + lower);
  EXPECT_EQ(handler->serve(request).status, 204u);
}

TEST_F(ChunkHandlerTest, ChunkErrorsBecomeReplies) {
  EXPECT_CALL(repository, del(ChunkId::from_string(rawx::test::CHUNK_A)))
    .WillOnce(Throw(StoreError(ErrorKind::CHUNK_NOT_FOUND, rawx::test::CHUNK_A)));

  Request request = rawx::test::make_request("DELETE", std::string("/") + rawx::test::CHUNK_A);
  auto reply = handler->serve(request);
  EXPECT_EQ(reply.status, 404u);
  EXPECT_THAT(reply.headers["X-Error"], HasSubstr("Chunk not found"));
}

TEST_F(ChunkHandlerTest, UnexpectedErrorsAreStorageErrors) {
  EXPECT_CALL(repository, del(ChunkId::from_string(rawx::test::CHUNK_A)))
    .WillOnce(Throw(std::runtime_error("disk on fire")));

  Request request = rawx::test::make_request("DELETE", std::string("/") + rawx::test::CHUNK_A);
  auto reply = handler->serve(request);
  EXPECT_EQ(reply.status, 500u);
  EXPECT_THAT(reply.headers["X-Error"], HasSubstr("disk on fire"));
}

TEST_F(ChunkHandlerTest, RouteTable) {
  EXPECT_EQ(ChunkHandler::verb_for("PUT"), Verb::PUT);
  EXPECT_EQ(ChunkHandler::verb_for("COPY"), Verb::COPY);
  EXPECT_EQ(ChunkHandler::verb_for("HEAD"), Verb::HEAD);
  EXPECT_EQ(ChunkHandler::verb_for("GET"), Verb::GET);
  EXPECT_EQ(ChunkHandler::verb_for("DELETE"), Verb::DELETE);
  EXPECT_EQ(ChunkHandler::verb_for("OPTIONS"), Verb::OTHER);
  EXPECT_EQ(chunk_routes().size(), 5u);
}

TEST(ErrorReplyTest, StatusPerKind) {
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::INVALID_HEADER, "x")).status, 400u);
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::MISSING_HEADER, "x")).status, 400u);
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::INVALID_RANGE, "x")).status, 400u);
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::CHUNK_NOT_FOUND, "x")).status, 404u);
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::CHUNK_EXISTS, "x")).status, 409u);
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::RANGE_NOT_SATISFIABLE, "x")).status, 416u);
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::COMPRESSION_NOT_MANAGED, "x")).status, 500u);
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::CHECKSUM_MISMATCH, "x")).status, 500u);
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::NOT_IMPLEMENTED)).status, 501u);
  EXPECT_EQ(error_reply(ChunkError(ErrorKind::STORAGE)).headers.at("X-Error"), "Storage error");
}
