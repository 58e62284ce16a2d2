#include "http.hpp"
#include <curl/curl.h>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace platform {

namespace {

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
struct MimeDeleter {
    void operator()(curl_mime* m) const { curl_mime_free(m); }
};
struct FileDeleter {
    void operator()(std::FILE* f) const { std::fclose(f); }
};

using EasyPtr = std::unique_ptr<CURL, EasyDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

EasyPtr new_easy() {
    EasyPtr h(curl_easy_init());
    if (!h) throw std::runtime_error("curl_easy_init failed");
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h.get(), CURLOPT_USERAGENT, "gsworker/0.1");
    return h;
}

bool is_http_scheme(CURL* h) {
    char* scheme = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_SCHEME, &scheme) != CURLE_OK || !scheme) return true;
    std::string s(scheme);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s == "http" || s == "https";
}

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

// ── Streaming download state ─────────────────────────────────

struct DownloadSink {
    CURL* handle = nullptr;
    fs::path dest;
    std::ofstream out;
    bool opened = false;
    bool rejected = false;
    bool write_failed = false;
    long status = 0;
    std::uint64_t bytes = 0;
};

// Status has to be judged before anything touches the disk.
bool admit_response(DownloadSink& sink) {
    curl_easy_getinfo(sink.handle, CURLINFO_RESPONSE_CODE, &sink.status);
    if (is_http_scheme(sink.handle) && (sink.status < 200 || sink.status >= 300)) {
        sink.rejected = true;
        return false;
    }
    sink.out.open(sink.dest, std::ios::binary | std::ios::trunc);
    if (!sink.out) {
        sink.write_failed = true;
        return false;
    }
    sink.opened = true;
    return true;
}

size_t write_chunk(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    size_t n = size * nmemb;
    if (!sink->opened && !admit_response(*sink)) return 0;
    sink->out.write(ptr, static_cast<std::streamsize>(n));
    if (!sink->out) {
        sink->write_failed = true;
        return 0;
    }
    sink->bytes += n;
    return n;
}

SlistPtr build_headers(const RequestOptions& opts) {
    curl_slist* list = nullptr;
    for (const auto& h : opts.headers) {
        list = curl_slist_append(list, h.c_str());
    }
    if (!opts.bearer_token.empty()) {
        list = curl_slist_append(list, ("Authorization: Bearer " + opts.bearer_token).c_str());
    }
    return SlistPtr(list);
}

void apply_common(CURL* h, const RequestOptions& opts, curl_slist* headers, std::string& body) {
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(opts.timeout_secs));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opts.connect_timeout_secs));
    if (headers) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    if (!opts.aws_sigv4.empty()) {
        if (curl_easy_setopt(h, CURLOPT_AWS_SIGV4, opts.aws_sigv4.c_str()) != CURLE_OK) {
            throw std::runtime_error("libcurl does not support AWS SigV4 signing");
        }
        curl_easy_setopt(h, CURLOPT_USERPWD, opts.userpwd.c_str());
    }
}

HttpResponse perform(CURL* h, std::string& body, const std::string& url) {
    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        throw std::runtime_error("request to " + url + " failed: " + curl_easy_strerror(rc));
    }
    HttpResponse resp;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(body);
    return resp;
}

} // namespace

// ── CurlGlobal ───────────────────────────────────────────────

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

bool curl_supports_sigv4() {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    // CURLOPT_AWS_SIGV4 arrived in 7.75.0
    return info && info->version_num >= 0x074b00;
}

// ── Download ─────────────────────────────────────────────────

DownloadResult http_download(const std::string& url, const fs::path& dest,
                             int timeout_secs, int connect_timeout_secs,
                             std::size_t chunk_size) {
    DownloadResult result;

    EasyPtr h;
    try {
        h = new_easy();
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }

    DownloadSink sink;
    sink.handle = h.get();
    sink.dest = dest;

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_secs));
    curl_easy_setopt(h.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_secs));
    curl_easy_setopt(h.get(), CURLOPT_BUFFERSIZE, static_cast<long>(chunk_size));
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, write_chunk);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &sink);

    CURLcode rc = curl_easy_perform(h.get());
    if (!sink.rejected && rc == CURLE_OK) {
        curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &sink.status);
        // Empty bodies never reach write_chunk
        if (!sink.opened && !admit_response(sink)) {
            rc = CURLE_WRITE_ERROR;
        }
    }
    if (sink.opened) {
        sink.out.close();
        if (!sink.out) sink.write_failed = true;
    }

    result.status = sink.status;
    result.bytes = sink.bytes;

    if (sink.rejected) {
        result.error = "HTTP " + std::to_string(sink.status);
    } else if (sink.write_failed) {
        result.error = "cannot write " + dest.string();
    } else if (rc != CURLE_OK) {
        result.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
    } else {
        result.ok = true;
        return result;
    }

    std::error_code ec;
    fs::remove(dest, ec);
    return result;
}

// ── Upload ───────────────────────────────────────────────────

HttpResponse http_put_file(const std::string& url, const fs::path& file,
                           const RequestOptions& opts) {
    std::unique_ptr<std::FILE, FileDeleter> in(std::fopen(file.c_str(), "rb"));
    if (!in) throw std::runtime_error("cannot open " + file.string());
    auto size = static_cast<curl_off_t>(fs::file_size(file));

    EasyPtr h = new_easy();
    SlistPtr headers = build_headers(opts);
    std::string body;

    curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h.get(), CURLOPT_READDATA, in.get());
    curl_easy_setopt(h.get(), CURLOPT_INFILESIZE_LARGE, size);
    apply_common(h.get(), opts, headers.get(), body);

    return perform(h.get(), body, url);
}

HttpResponse http_post_file(const std::string& url, const std::string& file_field,
                            const fs::path& file,
                            const std::map<std::string, std::string>& fields,
                            const RequestOptions& opts) {
    if (!fs::is_regular_file(file)) throw std::runtime_error("cannot open " + file.string());

    EasyPtr h = new_easy();
    SlistPtr headers = build_headers(opts);
    std::string body;

    std::unique_ptr<curl_mime, MimeDeleter> mime(curl_mime_init(h.get()));
    curl_mimepart* part = curl_mime_addpart(mime.get());
    curl_mime_name(part, file_field.c_str());
    if (curl_mime_filedata(part, file.c_str()) != CURLE_OK) {
        throw std::runtime_error("cannot attach " + file.string());
    }
    curl_mime_type(part, "application/zip");
    for (const auto& [name, value] : fields) {
        curl_mimepart* f = curl_mime_addpart(mime.get());
        curl_mime_name(f, name.c_str());
        curl_mime_data(f, value.c_str(), CURL_ZERO_TERMINATED);
    }

    curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_MIMEPOST, mime.get());
    apply_common(h.get(), opts, headers.get(), body);

    return perform(h.get(), body, url);
}

} // namespace platform
