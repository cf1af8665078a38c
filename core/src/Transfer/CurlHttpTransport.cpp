#include "localsync/Transfer/HttpTransport.h"
#include "localsync/Errors.h"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>

namespace LocalSync {

namespace {

constexpr size_t MAX_ERROR_BODY_LENGTH = 512;

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) curl_easy_cleanup(curl);
    }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) curl_slist_free_all(list);
    }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct ReadContext {
    ProgressReader* reader = nullptr;
    std::exception_ptr error;     // Исключение из reader, пробрасывается после perform
};

std::once_flag g_curlInitFlag;

void ensureCurlInitialized() {
    std::call_once(g_curlInitFlag, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("CurlHttpTransport: curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<ReadContext*>(userdata);
    try {
        return ctx->reader->read(reinterpret_cast<uint8_t*>(buffer), size * nitems);
    } catch (...) {
        // Исключения не должны проходить через C-код libcurl
        ctx->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

/// Тело нельзя перемотать: разрешена только перемотка в начало до первого байта
int seekCallback(void* userdata, curl_off_t offset, int origin) {
    auto* ctx = static_cast<ReadContext*>(userdata);
    if (origin == SEEK_SET && offset == 0 && ctx->reader->sent() == 0) {
        return CURL_SEEKFUNC_OK;
    }
    return CURL_SEEKFUNC_CANTSEEK;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    size_t n = size * nmemb;
    out->append(ptr, n);
    return n;
}

HeaderList appendHeader(HeaderList list, const std::string& header) {
    curl_slist* raw = curl_slist_append(list.get(), header.c_str());
    if (!raw) {
        throw TransferFailed("Failed to build request headers");
    }
    list.release();
    return HeaderList(raw);
}

} // namespace

CurlHttpTransport::CurlHttpTransport(UploadOptions options)
    : m_options(std::move(options)) {
    ensureCurlInitialized();
}

CurlHttpTransport::~CurlHttpTransport() = default;

std::string CurlHttpTransport::post(
    const std::string& url,
    const std::string& contentType,
    uint64_t contentLength,
    ProgressReader& reader)
{
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw TransferFailed("Failed to initialize HTTP client");
    }

    HeaderList headers;
    headers = appendHeader(std::move(headers), "Content-Type: " + contentType);
    // Без "Expect: 100-continue" тело уходит сразу
    headers = appendHeader(std::move(headers), "Expect:");

    ReadContext ctx;
    ctx.reader = &reader;
    std::string responseBody;
    char errorBuffer[CURL_ERROR_SIZE] = {0};

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(contentLength));
    curl_easy_setopt(h, CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &responseBody);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_SEEKFUNCTION, seekCallback);
    curl_easy_setopt(h, CURLOPT_SEEKDATA, &ctx);
    // 301/302/303: ответ забирается GET-запросом без повторной отправки тела.
    // 307/308 требуют повтора тела и завершаются TransferFailed.
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, m_options.userAgent.c_str());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, m_options.connectTimeoutSec);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, m_options.timeoutSec);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errorBuffer);

    spdlog::debug("CurlHttpTransport: POST {} ({} bytes)", url, contentLength);
    CURLcode res = curl_easy_perform(h);

    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }

    if (res != CURLE_OK) {
        std::string detail = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(res);
        spdlog::warn("CurlHttpTransport: POST {} failed: {}", url, detail);
        throw TransferFailed("Upload failed: " + detail);
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::string snippet = responseBody.substr(0, MAX_ERROR_BODY_LENGTH);
        spdlog::warn("CurlHttpTransport: POST {} returned HTTP {}", url, status);
        throw TransferFailed("Upload failed with HTTP " + std::to_string(status) +
                             (snippet.empty() ? std::string() : ": " + snippet));
    }

    return responseBody;
}

} // namespace LocalSync
