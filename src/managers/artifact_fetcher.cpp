#include "artifact_fetcher.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/http.hpp>
#include <fmt/format.h>

HttpFetcher::HttpFetcher(int timeout_secs) : timeout_secs_(timeout_secs) {}

FetchStats HttpFetcher::fetch(const std::string& url, const fs::path& dest) {
    log_info(fmt::format("Downloading {} -> {}", url, dest.string()));

    std::error_code ec;
    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            throw FetchFailure(fmt::format("cannot create {}: {}",
                                           dest.parent_path().string(), ec.message()));
        }
    }

    auto dl = platform::http_download(url, dest, timeout_secs_, CONNECT_TIMEOUT_SECS,
                                      FETCH_CHUNK_SIZE);
    if (!dl.ok) {
        throw FetchFailure(fmt::format("{} fetching {}", dl.error, url));
    }

    log_info(fmt::format("Downloaded {} bytes to {}", dl.bytes, dest.string()));
    return FetchStats{dl.bytes, dl.status};
}
