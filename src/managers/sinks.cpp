#include "sinks.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/http.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

static const char* LOCATOR_KEYS[] = {
    "url", "plt_url", "public_url", "download_url", "location", "Location",
};

std::optional<std::string> extract_locator(const std::string& body) {
    std::string trimmed = body;
    trim(trimmed);
    if (trimmed.empty() || trimmed.front() != '{') return std::nullopt;

    YAML::Node root;
    try {
        // JSON is a YAML subset
        root = YAML::Load(trimmed);
    } catch (const YAML::Exception& e) {
        log_debug(fmt::format("Upload response is not JSON: {}", e.what()));
        return std::nullopt;
    }
    if (!root.IsMap()) return std::nullopt;

    for (const char* key : LOCATOR_KEYS) {
        const YAML::Node v = root[key];
        if (v && v.IsScalar()) {
            std::string s = v.as<std::string>("");
            trim(s);
            if (!s.empty()) return s;
        }
    }
    return std::nullopt;
}

static std::string rejection(const std::string& who, const platform::HttpResponse& resp) {
    return fmt::format("{} rejected upload: HTTP {}{}", who, resp.status,
                       resp.body.empty() ? "" : ": " + tail_excerpt(resp.body, 500));
}

// ── HttpSink ───────────────────────────────────────────────

HttpSink::HttpSink(Mode mode, std::string base_url, std::string route,
                   std::string token, int timeout_secs)
    : mode_(mode), base_url_(std::move(base_url)), route_(std::move(route)),
      token_(std::move(token)), timeout_secs_(timeout_secs) {}

std::unique_ptr<HttpSink> HttpSink::bucket_put(const HttpSinkConfig& cfg, int timeout_secs) {
    return std::make_unique<HttpSink>(Mode::Put, cfg.bucket_url, "", cfg.bucket_key, timeout_secs);
}

std::unique_ptr<HttpSink> HttpSink::upload_server(const HttpSinkConfig& cfg, int timeout_secs) {
    return std::make_unique<HttpSink>(Mode::Multipart, cfg.server_url, cfg.server_route,
                                      cfg.server_token, timeout_secs);
}

std::string HttpSink::default_locator(const std::string& name) const {
    if (mode_ == Mode::Put) return url_join(base_url_, name);
    return url_join(base_url_, std::string(SERVER_FILES_ROUTE) + name);
}

std::string HttpSink::describe() const {
    if (mode_ == Mode::Put) return fmt::format("http PUT {}", base_url_);
    return fmt::format("http POST {}", url_join(base_url_, route_));
}

std::string HttpSink::deliver(const fs::path& archive, const std::string& name) {
    platform::RequestOptions opts;
    opts.timeout_secs = timeout_secs_;
    opts.connect_timeout_secs = CONNECT_TIMEOUT_SECS;
    opts.bearer_token = token_;

    platform::HttpResponse resp;
    try {
        if (mode_ == Mode::Put) {
            std::string url = url_join(base_url_, name);
            log_info(fmt::format("Uploading to {}", url));
            opts.headers.push_back("Content-Type: application/zip");
            resp = platform::http_put_file(url, archive, opts);
        } else {
            std::string url = url_join(base_url_, route_);
            log_info(fmt::format("Uploading to {}", url));
            std::string scene_id = fs::path(name).stem().string();
            resp = platform::http_post_file(url, "file", archive, {{"scene_id", scene_id}}, opts);
        }
    } catch (const std::runtime_error& e) {
        throw PublishFailure(e.what());
    }

    if (!resp.ok()) throw PublishFailure(rejection("upload endpoint", resp));

    std::string locator = extract_locator(resp.body).value_or(default_locator(name));
    log_info(fmt::format("Uploaded to: {}", locator));
    return locator;
}

// ── ObjectStoreSink ────────────────────────────────────────

ObjectStoreSink::ObjectStoreSink(S3Config cfg, int timeout_secs, std::shared_ptr<Sink> fallback)
    : cfg_(std::move(cfg)), timeout_secs_(timeout_secs), fallback_(std::move(fallback)) {}

std::string ObjectStoreSink::object_key(const std::string& name) const {
    return std::string(S3_KEY_PREFIX) + name;
}

std::string ObjectStoreSink::upload_url(const std::string& key) const {
    if (!cfg_.endpoint.empty()) return url_join(cfg_.endpoint, cfg_.bucket + "/" + key);
    return fmt::format("https://s3.{}.amazonaws.com/{}/{}", cfg_.region, cfg_.bucket, key);
}

std::string ObjectStoreSink::public_url(const std::string& key) const {
    if (!cfg_.endpoint.empty()) return url_join(cfg_.endpoint, cfg_.bucket + "/" + key);
    return fmt::format("https://{}.s3.amazonaws.com/{}", cfg_.bucket, key);
}

std::string ObjectStoreSink::describe() const {
    return fmt::format("s3 {}/{}", cfg_.endpoint.empty() ? "aws" : cfg_.endpoint, cfg_.bucket);
}

std::string ObjectStoreSink::deliver(const fs::path& archive, const std::string& name) {
    if (!platform::curl_supports_sigv4()) {
        if (fallback_) {
            log_warn(fmt::format("libcurl cannot sign S3 requests, falling back to {}",
                                 fallback_->describe()));
            return fallback_->deliver(archive, name);
        }
        throw PublishFailure("libcurl lacks AWS SigV4 support and no HTTP upload endpoint is configured");
    }

    std::string key = object_key(name);
    std::string url = upload_url(key);
    log_info(fmt::format("Uploading to S3: {}/{}", cfg_.bucket, key));

    platform::RequestOptions opts;
    opts.timeout_secs = timeout_secs_;
    opts.connect_timeout_secs = CONNECT_TIMEOUT_SECS;
    opts.aws_sigv4 = fmt::format("aws:amz:{}:s3", cfg_.region);
    opts.userpwd = cfg_.access_key + ":" + cfg_.secret_key;
    opts.headers = {
        "Content-Type: application/zip",
        "x-amz-acl: public-read",
        "x-amz-content-sha256: UNSIGNED-PAYLOAD",
    };

    platform::HttpResponse resp;
    try {
        resp = platform::http_put_file(url, archive, opts);
    } catch (const std::runtime_error& e) {
        throw PublishFailure(std::string("S3 upload failed: ") + e.what());
    }
    if (!resp.ok()) throw PublishFailure(rejection("object store", resp));

    std::string locator = extract_locator(resp.body).value_or(public_url(key));
    log_info(fmt::format("Uploaded to: {}", locator));
    return locator;
}

// ── Selection ──────────────────────────────────────────────

static std::shared_ptr<Sink> make_http_sink(const Config& config) {
    int timeout = config.timeouts().upload_secs;
    if (!config.http().server_url.empty()) return HttpSink::upload_server(config.http(), timeout);
    if (!config.http().bucket_url.empty()) return HttpSink::bucket_put(config.http(), timeout);
    return nullptr;
}

std::shared_ptr<Sink> make_sink(const Config& config) {
    switch (config.sink_kind()) {
        case SinkKind::ObjectStore:
            return std::make_shared<ObjectStoreSink>(config.s3(), config.timeouts().upload_secs,
                                                     make_http_sink(config));
        case SinkKind::UploadServer:
        case SinkKind::BucketPut:
            return make_http_sink(config);
        case SinkKind::None:
            break;
    }
    return nullptr;
}
