#pragma once

#include <cstdint>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

struct FetchStats {
    std::uint64_t bytes = 0;
    long http_status = 0;
};

// Retrieves a remote input into local storage.
class ArtifactFetcher {
public:
    virtual ~ArtifactFetcher() = default;

    // Creates missing parent directories and overwrites `dest`.
    // Throws FetchFailure on non-2xx status or transport error.
    virtual FetchStats fetch(const std::string& url, const fs::path& dest) = 0;
};

// Streaming GET over libcurl. Safe to share between jobs.
class HttpFetcher : public ArtifactFetcher {
public:
    explicit HttpFetcher(int timeout_secs);

    FetchStats fetch(const std::string& url, const fs::path& dest) override;

private:
    int timeout_secs_;
};
