#pragma once

#include <memory>
#include <optional>
#include <string>
#include <filesystem>
#include <core/config.hpp>

namespace fs = std::filesystem;

// Destination for the final archive. Implementations must tolerate
// concurrent deliver() calls from different jobs.
class Sink {
public:
    virtual ~Sink() = default;

    // Uploads `archive` under `name`; returns the public locator.
    // Throws PublishFailure.
    virtual std::string deliver(const fs::path& archive, const std::string& name) = 0;

    virtual std::string describe() const = 0;
};

// Generic HTTP endpoint: raw PUT to <base>/<name>, or multipart POST to an
// upload server route.
class HttpSink : public Sink {
public:
    enum class Mode { Put, Multipart };

    HttpSink(Mode mode, std::string base_url, std::string route,
             std::string token, int timeout_secs);

    static std::unique_ptr<HttpSink> bucket_put(const HttpSinkConfig& cfg, int timeout_secs);
    static std::unique_ptr<HttpSink> upload_server(const HttpSinkConfig& cfg, int timeout_secs);

    std::string deliver(const fs::path& archive, const std::string& name) override;
    std::string describe() const override;

    // URL the locator falls back to when the response carries none.
    std::string default_locator(const std::string& name) const;

private:
    Mode mode_;
    std::string base_url_;
    std::string route_;
    std::string token_;
    int timeout_secs_;
};

// S3-compatible object store, path-style addressing, public-read ACL.
// Delegates to `fallback` when libcurl cannot sign SigV4 requests.
class ObjectStoreSink : public Sink {
public:
    ObjectStoreSink(S3Config cfg, int timeout_secs, std::shared_ptr<Sink> fallback = nullptr);

    std::string deliver(const fs::path& archive, const std::string& name) override;
    std::string describe() const override;

    std::string object_key(const std::string& name) const;
    std::string upload_url(const std::string& key) const;
    std::string public_url(const std::string& key) const;

private:
    S3Config cfg_;
    int timeout_secs_;
    std::shared_ptr<Sink> fallback_;
};

// Chooses the sink once from configuration. nullptr when none is configured.
std::shared_ptr<Sink> make_sink(const Config& config);

// URL field from a JSON response body, if any accepted key holds one.
std::optional<std::string> extract_locator(const std::string& body);
