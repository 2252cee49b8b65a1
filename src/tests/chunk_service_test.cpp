#include <gtest/gtest.h>
#include <filesystem>
#include "rawx/chunk/chunk_handler.hpp"
#include "rawx/store/file_repository.hpp"
#include "test_utils.hpp"

using namespace rawx::chunk;
using rawx::http::HeaderMap;
using rawx::http::Reply;
using rawx::http::Request;

// Chunk handler over a real repository
class ChunkServiceTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<rawx::store::FileRepository> repository;
  rawx::notify::NullNotifier notifier;
  rawx::stats::ServiceStats stats;
  rawx::logger::RequestLogger logger;
  std::unique_ptr<ChunkHandler> handler;

  const std::string path_a = std::string("/") + rawx::test::CHUNK_A;
  const std::string path_b = std::string("/") + rawx::test::CHUNK_B;

  void SetUp() override {
    rawx::test::init_logging();
    test_dir = rawx::test::make_temp_dir("rawx_service_test_");
    if (!rawx::test::supports_user_xattrs(test_dir)) {
      GTEST_SKIP() << "Filesystem does not support user extended attributes";
    }
    repository = std::make_unique<rawx::store::FileRepository>(test_dir.string());

    ServerSettings settings;
    settings.service_url = "127.0.0.1:6200";
    handler = std::make_unique<ChunkHandler>(Services{*repository, notifier, stats, logger, settings});
  }

  void TearDown() override {
    handler.reset();
    repository.reset();
    std::filesystem::remove_all(test_dir);
  }

  Reply put(const std::string& path, const std::string& data, HeaderMap trailers = {}) {
    rawx::test::StringBody body(data);
    body.trailers_ = std::move(trailers);
    Request request = rawx::test::make_request("PUT", path, rawx::test::upload_headers(), &body);
    return handler->serve(request);
  }

  Reply get(const std::string& path, const std::string& range = "") {
    HeaderMap headers;
    if (!range.empty()) {
      headers["Range"] = range;
    }
    Request request = rawx::test::make_request("GET", path, headers);
    return handler->serve(request);
  }

  Reply simple(const std::string& method, const std::string& path, HeaderMap headers = {}) {
    Request request = rawx::test::make_request(method, path, std::move(headers));
    return handler->serve(request);
  }

  static std::string body_of(Reply& reply) {
    return reply.body ? rawx::test::read_all(*reply.body) : std::string();
  }
};

TEST_F(ChunkServiceTest, PutThenGet) {
  Reply created = put(path_a, "abc");
  EXPECT_EQ(created.status, 201u);
  EXPECT_EQ(created.headers[header::REPLY_CHUNK_HASH], rawx::test::ABC_MD5);

  Reply fetched = get(path_a);
  EXPECT_EQ(fetched.status, 200u);
  EXPECT_EQ(fetched.headers["Content-Length"], "3");
  EXPECT_EQ(fetched.headers[header::CHUNK_HASH], rawx::test::ABC_MD5);
  EXPECT_EQ(fetched.headers[header::CHUNK_SIZE], "3");
  EXPECT_EQ(fetched.headers[header::CONTENT_PATH], "photos/cat.jpg");
  EXPECT_EQ(body_of(fetched), "abc");
}

TEST_F(ChunkServiceTest, SecondPutConflicts) {
  ASSERT_EQ(put(path_a, "abc").status, 201u);
  EXPECT_EQ(put(path_a, "xyz").status, 409u);

  Reply fetched = get(path_a);
  EXPECT_EQ(body_of(fetched), "abc");
}

TEST_F(ChunkServiceTest, RangedGet) {
  ASSERT_EQ(put(path_a, "abc").status, 201u);

  Reply ranged = get(path_a, "bytes=1-2");
  EXPECT_EQ(ranged.status, 206u);
  EXPECT_EQ(ranged.headers["Content-Range"], "bytes 1-3/2");
  EXPECT_EQ(ranged.headers["Content-Length"], "2");
  EXPECT_EQ(body_of(ranged), "bc");

  Reply invalid = get(path_a, "bytes=5-2");
  EXPECT_EQ(invalid.status, 400u);
  EXPECT_FALSE(invalid.body);
  Reply whole = get(path_a);
  EXPECT_EQ(body_of(whole), "abc");

  EXPECT_EQ(get(path_a, "bytes=3-4").status, 416u);
}

TEST_F(ChunkServiceTest, HashMismatchLeavesNothing) {
  Reply rejected = put(path_a, "abc", {{header::CHUNK_HASH, "00000000000000000000000000000000"}});
  EXPECT_GE(rejected.status, 400u);
  EXPECT_EQ(get(path_a).status, 404u);
  EXPECT_FALSE(std::filesystem::exists(repository->path_for(ChunkId::from_string(rawx::test::CHUNK_A)).string()
                                       + rawx::store::PENDING_SUFFIX));

  // The identifier stays usable
  EXPECT_EQ(put(path_a, "abc", {{header::CHUNK_HASH, rawx::test::ABC_MD5}}).status, 201u);
}

TEST_F(ChunkServiceTest, CopySharesContent) {
  ASSERT_EQ(put(path_a, "abc").status, 201u);

  Reply copied = simple("COPY", path_a, {
    {header::DESTINATION, "http://127.0.0.1:6200" + path_b},
    {header::FULL_PATH, "acct/ct/copy/1/C1"},
  });
  EXPECT_EQ(copied.status, 201u);

  Reply fetched = get(path_b);
  EXPECT_EQ(fetched.status, 200u);
  EXPECT_EQ(body_of(fetched), "abc");
  EXPECT_EQ(fetched.headers[header::FULL_PATH], "acct/ct/copy/1/C1");
  EXPECT_EQ(fetched.headers[header::CHUNK_ID], rawx::test::CHUNK_B);

  // The source keeps its own provenance
  Reply source = get(path_a);
  EXPECT_EQ(source.headers.count(header::FULL_PATH), 0u);
}

TEST_F(ChunkServiceTest, CopyErrors) {
  EXPECT_EQ(simple("COPY", path_a, {{header::DESTINATION, path_b}}).status, 400u);
  EXPECT_EQ(simple("COPY", path_a, {{header::DESTINATION, path_b},
                                    {header::FULL_PATH, "acct/ct/obj/1/C"}}).status, 404u);
}

TEST_F(ChunkServiceTest, DeleteMissingChunk) {
  Reply reply = simple("DELETE", path_a);
  EXPECT_EQ(reply.status, 404u);

  ASSERT_EQ(put(path_a, "abc").status, 201u);
  EXPECT_EQ(simple("DELETE", path_a).status, 204u);
  EXPECT_EQ(simple("HEAD", path_a).status, 404u);
}

TEST_F(ChunkServiceTest, HeadSizeMatchesGet) {
  const std::string data(2 * rawx::io::BLOCK_SIZE + 123, 'q');
  ASSERT_EQ(put(path_a, data).status, 201u);

  Reply head = simple("HEAD", path_a);
  EXPECT_EQ(head.status, 204u);
  EXPECT_EQ(head.headers["Content-Length"], std::to_string(data.size()));

  Reply fetched = get(path_a);
  EXPECT_EQ(body_of(fetched).size(), data.size());
}

TEST_F(ChunkServiceTest, CompressedChunkIsNotServed) {
  ServerSettings settings;
  settings.compress = true;
  ChunkHandler compressing(Services{*repository, notifier, stats, logger, settings});

  rawx::test::StringBody body("abcabcabcabc");
  Request request = rawx::test::make_request("PUT", path_a, rawx::test::upload_headers(), &body);
  ASSERT_EQ(compressing.serve(request).status, 201u);

  EXPECT_EQ(get(path_a).status, 500u);
  EXPECT_EQ(simple("HEAD", path_a).status, 204u);
}
