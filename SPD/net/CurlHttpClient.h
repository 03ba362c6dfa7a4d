#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>

#include "HttpClient.h"
#include "../core/utils.h"

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient(const std::string& url,
        std::optional<std::string> proxy = std::nullopt,
        std::vector<std::string> headers = {});
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    static std::unique_ptr<HttpClient> fromJob(const DownloadJob& job);

    bool head(HttpHeadResult& out) override;
    bool getRange(std::int64_t start,
        std::int64_t end,
        const DataCallback& onData) override;

    std::string lastError() const override { return error; }

private:
    bool prepare();
    bool perform(long& status);

private:
    void* curl;
    void* headerList{ nullptr };
    std::string url;
    std::optional<std::string> proxy;
    std::vector<std::string> headers;
    std::string error;
};
