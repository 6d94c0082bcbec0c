#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <curl/curl.h>
#include <string>

class HttpAsrBackend : public AsrBackend {
public:
    explicit HttpAsrBackend(Config::Asr options);
    ~HttpAsrBackend() override;

    HttpAsrBackend(const HttpAsrBackend&) = delete;
    HttpAsrBackend& operator=(const HttpAsrBackend&) = delete;

    std::expected<std::string, Error>
        transcribe(const Segment& segment, const std::string& prompt) override;

    std::string endpoint() const;

    static ErrorKind classify_curl_error(CURLcode code);
    static ErrorKind classify_http_status(long status);

    // Extracts the transcript from a response body, or the server's error.
    static std::expected<std::string, Error> parse_response(long status, const std::string& body);

private:
    Config::Asr options_;
};
