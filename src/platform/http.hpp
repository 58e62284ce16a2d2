#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <filesystem>

namespace platform {

// Process-wide libcurl setup. Construct once in main() before any thread
// starts a transfer; every transfer then uses its own easy handle.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

struct DownloadResult {
    bool ok = false;
    long status = 0;          // 0 for non-HTTP schemes
    std::uint64_t bytes = 0;
    std::string error;
};

struct RequestOptions {
    std::vector<std::string> headers;    // "Name: value"
    int timeout_secs = 600;
    int connect_timeout_secs = 30;
    std::string bearer_token;            // adds "Authorization: Bearer <token>"
    std::string aws_sigv4;               // "aws:amz:<region>:s3" enables SigV4 signing
    std::string userpwd;                 // "<access>:<secret>" for SigV4
};

// Streaming GET into `dest`. For http(s) the status is checked before the
// first body byte is written; non-2xx leaves no file behind. Never throws.
DownloadResult http_download(const std::string& url,
                             const std::filesystem::path& dest,
                             int timeout_secs,
                             int connect_timeout_secs,
                             std::size_t chunk_size);

// PUT the file body. Throws std::runtime_error on transport errors only;
// the caller judges the status.
HttpResponse http_put_file(const std::string& url,
                           const std::filesystem::path& file,
                           const RequestOptions& opts);

// multipart/form-data POST with the file under `file_field` plus text fields.
HttpResponse http_post_file(const std::string& url,
                            const std::string& file_field,
                            const std::filesystem::path& file,
                            const std::map<std::string, std::string>& fields,
                            const RequestOptions& opts);

// True if the libcurl loaded at runtime can sign requests with AWS SigV4.
bool curl_supports_sigv4();

} // namespace platform
