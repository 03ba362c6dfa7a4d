#include "CurlHttpClient.h"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace {
struct WriteContext {
    CURL* handle;
    std::int64_t requestStart;
    const HttpClient::DataCallback* onData;

    std::int64_t contentRangeStart = -1;
    bool checked = false;
    bool rejected = false;
    bool aborted = false;
    long status = 0;
};

bool startsWithNoCase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
}

// Nothing reaches onData until the final response is known to hold the requested range
size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    std::size_t total = size * nmemb;

    if (!ctx->checked) {
        ctx->checked = true;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &ctx->status);

        bool accepted = rangeResponseAccepted(ctx->status, ctx->requestStart);
        if (accepted && ctx->status == 206 && ctx->contentRangeStart >= 0)
            accepted = ctx->contentRangeStart == ctx->requestStart;

        if (!accepted) {
            ctx->rejected = true;
            return 0;
        }
    }

    if (!(*ctx->onData)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

size_t rangeHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<WriteContext*>(userdata);

    std::string header(buffer, total);

    if (startsWithNoCase(header, "HTTP/")) {
        ctx->contentRangeStart = -1;
    }
    else if (startsWithNoCase(header, "Content-Range:")) {
        // Content-Range: bytes <first>-<last>/<total>
        auto unit = header.find("bytes");
        if (unit != std::string::npos) {
            const char* first = header.c_str() + unit + 5;
            char* end = nullptr;
            long long value = std::strtoll(first, &end, 10);
            if (end != first && *end == '-')
                ctx->contentRangeStart = static_cast<std::int64_t>(value);
        }
    }

    return total;
}

size_t headHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* result = static_cast<HttpHeadResult*>(userdata);

    std::string header(buffer, total);

    // A redirect starts a new header block
    if (startsWithNoCase(header, "HTTP/")) {
        *result = HttpHeadResult{};
    }
    else if (startsWithNoCase(header, "Accept-Ranges:")) {
        if (header.find("bytes") != std::string::npos)
            result->acceptRanges = true;
    }

    return total;
}
}

CurlHttpClient::CurlHttpClient(const std::string& u,
    std::optional<std::string> proxyUrl,
    std::vector<std::string> extraHeaders)
    : url(u),
    proxy(std::move(proxyUrl)),
    headers(std::move(extraHeaders)) {
    curl = curl_easy_init();

    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        curl_slist* next = curl_slist_append(list, h.c_str());
        if (!next)
            break;
        list = next;
    }
    headerList = list;
}

CurlHttpClient::~CurlHttpClient() {
    if (headerList)
        curl_slist_free_all(static_cast<curl_slist*>(headerList));
    if (curl)
        curl_easy_cleanup(static_cast<CURL*>(curl));
}

std::unique_ptr<HttpClient> CurlHttpClient::fromJob(const DownloadJob& job) {
    return std::make_unique<CurlHttpClient>(job.url, job.proxy, job.headers);
}

bool CurlHttpClient::prepare() {
    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        error = "curl_easy_init failed";
        return false;
    }

    curl_easy_reset(c);
    error.clear();

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);

    if (proxy)
        curl_easy_setopt(c, CURLOPT_PROXY, proxy->c_str());
    if (headerList)
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, static_cast<curl_slist*>(headerList));

    return true;
}

bool CurlHttpClient::perform(long& status) {
    CURL* c = static_cast<CURL*>(curl);

    CURLcode res = curl_easy_perform(c);
    if (res != CURLE_OK) {
        error = curl_easy_strerror(res);
        return false;
    }

    status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        error = "HTTP status " + std::to_string(status);
        return false;
    }

    return true;
}

bool CurlHttpClient::head(HttpHeadResult& out) {
    if (!prepare())
        return false;

    CURL* c = static_cast<CURL*>(curl);
    curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headHeaderCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &out);

    long status = 0;
    if (!perform(status))
        return false;

    curl_off_t length = -1;
    if (curl_easy_getinfo(c, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK)
        out.contentLength = static_cast<std::int64_t>(length);
    else
        out.contentLength = -1;

    return true;
}

bool CurlHttpClient::getRange(std::int64_t start,
    std::int64_t end,
    const DataCallback& onData) {
    if (!prepare())
        return false;

    CURL* c = static_cast<CURL*>(curl);

    std::ostringstream range;
    range << start << "-" << end;
    const std::string rangeStr = range.str();

    WriteContext ctx{ c, start, &onData };

    curl_easy_setopt(c, CURLOPT_RANGE, rangeStr.c_str());
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, rangeHeaderCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, static_cast<void*>(&ctx));
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, static_cast<void*>(&ctx));
    curl_easy_setopt(c, CURLOPT_FAILONERROR, 1L);

    long status = 0;
    const bool ok = perform(status);

    if (ctx.rejected) {
        error = "HTTP status " + std::to_string(ctx.status) + " does not match range " + rangeStr;
        return false;
    }
    if (!ok) {
        if (ctx.aborted)
            error = "transfer aborted by receiver";
        return false;
    }

    // Empty bodies never reach writeCallback
    if (!rangeResponseAccepted(status, start)) {
        error = "HTTP status " + std::to_string(status) + " does not match range " + rangeStr;
        return false;
    }

    return true;
}
