#include "test_support.hpp"
#include "loopback_server.hpp"
#include <managers/artifact_fetcher.hpp>
#include <core/errors.hpp>

class FetcherTest : public ScratchTest {
protected:
    HttpFetcher fetcher{30};

    std::string file_url(const fs::path& p) { return "file://" + p.string(); }
};

TEST_F(FetcherTest, CopiesLocalFileUrl) {
    std::string payload(100000, 'v');
    auto src = write_file("remote/clip.mp4", payload);
    auto dest = test_dir / "scene" / "input.mp4";

    auto stats = fetcher.fetch(file_url(src), dest);
    EXPECT_EQ(stats.bytes, payload.size());
    EXPECT_EQ(read_file(dest), payload);
}

TEST_F(FetcherTest, CreatesMissingParentDirectories) {
    auto src = write_file("remote/clip.mp4", "abc");
    auto dest = test_dir / "a" / "b" / "c" / "input.mp4";
    fetcher.fetch(file_url(src), dest);
    EXPECT_TRUE(fs::exists(dest));
}

TEST_F(FetcherTest, OverwritesExistingDestination) {
    auto src = write_file("remote/clip.mp4", "new");
    auto dest = write_file("scene/input.mp4", "old contents that are longer");
    fetcher.fetch(file_url(src), dest);
    EXPECT_EQ(read_file(dest), "new");
}

TEST_F(FetcherTest, MissingSourceFailsWithoutLeavingFile) {
    auto dest = test_dir / "scene" / "input.mp4";
    try {
        fetcher.fetch(file_url(test_dir / "remote" / "absent.mp4"), dest);
        FAIL() << "expected FetchFailure";
    } catch (const FetchFailure& e) {
        EXPECT_NE(std::string(e.what()).find("absent.mp4"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(FetcherTest, UnsupportedSchemeFails) {
    EXPECT_THROW(fetcher.fetch("nosuchscheme://host/x.mp4", test_dir / "x.mp4"), FetchFailure);
}

// ── Over HTTP ──────────────────────────────────────────────

class HttpFetchTest : public FetcherTest {
protected:
    LoopbackHttpServer server;
};

TEST_F(HttpFetchTest, SuccessfulGetWritesExactBytes) {
    std::string payload;
    for (int i = 0; i < 50000; i++) payload += static_cast<char>(i % 251);
    server.route("/videos/clip.mp4", 200, payload);
    auto dest = test_dir / "scene" / "input.mp4";

    auto stats = fetcher.fetch(server.url("/videos/clip.mp4"), dest);
    EXPECT_EQ(stats.http_status, 200);
    EXPECT_EQ(stats.bytes, payload.size());
    EXPECT_EQ(read_file(dest), payload);

    auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "GET");
}

TEST_F(HttpFetchTest, NotFoundFailsWithoutLeavingFile) {
    server.route("/videos/gone.mp4", 404, "<html>no such object</html>");
    auto dest = test_dir / "scene" / "input.mp4";
    try {
        fetcher.fetch(server.url("/videos/gone.mp4"), dest);
        FAIL() << "expected FetchFailure";
    } catch (const FetchFailure& e) {
        EXPECT_NE(std::string(e.what()).find("HTTP 404"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("/videos/gone.mp4"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(HttpFetchTest, ErrorStatusWithEmptyBodyStillFails) {
    server.route("/videos/clip.mp4", 500);
    auto dest = test_dir / "scene" / "input.mp4";
    EXPECT_THROW(fetcher.fetch(server.url("/videos/clip.mp4"), dest), FetchFailure);
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(HttpFetchTest, RejectedRefetchRemovesPreviousDownload) {
    auto dest = write_file("scene/input.mp4", "stale bytes from an earlier attempt");
    EXPECT_THROW(fetcher.fetch(server.url("/videos/unrouted.mp4"), dest), FetchFailure);
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(HttpFetchTest, EmptySuccessfulBodyCreatesEmptyFile) {
    server.route("/videos/empty.mp4", 200);
    auto dest = test_dir / "scene" / "input.mp4";
    auto stats = fetcher.fetch(server.url("/videos/empty.mp4"), dest);
    EXPECT_EQ(stats.bytes, 0u);
    EXPECT_TRUE(fs::exists(dest));
    EXPECT_EQ(fs::file_size(dest), 0u);
}
