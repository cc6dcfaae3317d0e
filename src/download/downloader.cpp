#include "exampack/downloader.hpp"
#include "exampack/platform.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <fstream>

namespace exampack {

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

struct WriteContext {
    std::ofstream* out = nullptr;
    uint64_t written = 0;
};

struct ProgressContext {
    const DownloadRequest* request = nullptr;
    const CancelFlag* cancel = nullptr;
    const ProgressCallback* on_progress = nullptr;
    curl_off_t last_reported = -1;
};

// Callback for libcurl to write received data
size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    size_t total = size * nmemb;
    ctx->out->write(ptr, static_cast<std::streamsize>(total));
    if (!*ctx->out) {
        return 0;  // CURLE_WRITE_ERROR
    }
    ctx->written += total;
    return total;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int curl_progress_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                           curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* ctx = static_cast<ProgressContext*>(userdata);

    if (*ctx->cancel && (*ctx->cancel)->load()) {
        return 1;
    }

    if (dltotal > 0 && dlnow != ctx->last_reported && *ctx->on_progress) {
        ctx->last_reported = dlnow;

        DownloadProgress progress;
        progress.pack_id = ctx->request->pack_id;
        progress.downloaded = static_cast<uint64_t>(dlnow);
        progress.total = static_cast<uint64_t>(dltotal);
        progress.percentage = static_cast<int>((dlnow * 100 + dltotal / 2) / dltotal);
        progress.status = DownloadStatus::Downloading;
        (*ctx->on_progress)(progress);
    }
    return 0;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

bool is_canceled(const CancelFlag& cancel) {
    return cancel && cancel->load();
}

} // namespace

std::string check_download_url(const std::string& url, bool allow_insecure_http) {
    if (starts_with(url, "https://") || starts_with(url, "file://")) {
        return "";
    }
    if (starts_with(url, "http://")) {
        return allow_insecure_http ? "" : "plain http downloads are disabled: " + url;
    }
    return "unsupported URL scheme, expected https:// or file://: " + url;
}

DownloadResult download_to_file(const DownloadRequest& request,
                                const CancelFlag& cancel,
                                const ProgressCallback& on_progress) {
    DownloadResult result;

    std::string url_error = check_download_url(request.url, request.allow_insecure_http);
    if (!url_error.empty()) {
        result.kind = PackError::Network;
        result.error = url_error;
        return result;
    }

    std::string dest_dir = get_parent_directory(request.dest_path);
    if (!dest_dir.empty() && !create_directories(dest_dir)) {
        result.kind = PackError::Filesystem;
        result.error = "failed to create download directory: " + dest_dir;
        return result;
    }

    std::string part_path = request.dest_path + "." + generate_uuid() + ".part";
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        result.kind = PackError::Filesystem;
        result.error = "failed to create temp file: " + part_path;
        return result;
    }

    // Ensure global initialization
    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.kind = PackError::Network;
        result.error = "failed to initialize CURL";
        return result;
    }

    WriteContext write_ctx;
    write_ctx.out = &out;

    ProgressContext progress_ctx;
    progress_ctx.request = &request;
    progress_ctx.cancel = &cancel;
    progress_ctx.on_progress = &on_progress;

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &write_ctx);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, curl_progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &progress_ctx);

    // Follow redirects
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    // TLS verification
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, request.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "exampack/" EXAMPACK_VERSION);

    spdlog::info("downloading pack {} from {}", request.pack_id, request.url);
    CURLcode res = curl_easy_perform(curl.get());

    out.close();
    result.bytes = write_ctx.written;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    if (res == CURLE_ABORTED_BY_CALLBACK || (res == CURLE_OK && is_canceled(cancel))) {
        result.kind = PackError::Canceled;
        result.error = "Download canceled";
        spdlog::info("download of {} canceled", request.pack_id);
        return result;
    }

    if (res == CURLE_OPERATION_TIMEDOUT) {
        result.kind = PackError::Timeout;
        result.error = "Download timed out";
        spdlog::warn("download of {} timed out", request.pack_id);
        return result;
    }

    if (res == CURLE_WRITE_ERROR) {
        result.kind = PackError::Filesystem;
        result.error = "failed to write downloaded data: " + part_path;
        return result;
    }

    if (res != CURLE_OK) {
        result.kind = PackError::Network;
        result.error = std::string("Download failed: ") +
                       (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        spdlog::warn("download of {} failed: {}", request.pack_id, result.error);
        return result;
    }

    // file:// transfers have no status code
    bool is_http = starts_with(request.url, "http");
    if (is_http && (result.http_status < 200 || result.http_status >= 300)) {
        result.kind = PackError::Network;
        result.error = "Download failed with status " + std::to_string(result.http_status);
        spdlog::warn("download of {} failed: HTTP {}", request.pack_id, result.http_status);
        return result;
    }

    if (path_exists(request.dest_path) && !remove_file(request.dest_path)) {
        result.kind = PackError::Filesystem;
        result.error = "failed to replace previous download: " + request.dest_path;
        return result;
    }

    auto renamed = atomic_rename(part_path, request.dest_path);
    if (!renamed.ok) {
        result.kind = PackError::Filesystem;
        result.error = "failed to save downloaded pack: " + renamed.error;
        return result;
    }

    spdlog::debug("downloaded {} bytes for {}", result.bytes, request.pack_id);
    result.temp_path = request.dest_path;
    result.ok = true;
    return result;
}

} // namespace exampack
