#include "http_backend.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

static std::string trim(const std::string& text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

HttpAsrBackend::HttpAsrBackend(Config::Asr options)
    : options_(std::move(options)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpAsrBackend::~HttpAsrBackend() {
    curl_global_cleanup();
}

std::string HttpAsrBackend::endpoint() const {
    std::string base = options_.url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (options_.api_format == "openai") return base + "/audio/transcriptions";
    return base + "/inference";
}

std::expected<std::string, Error>
HttpAsrBackend::transcribe(const Segment& segment, const std::string& prompt) {
    bool openai = options_.api_format == "openai";
    if (openai && options_.api_key.empty()) {
        return std::unexpected(Error{ErrorKind::TranscriptionPermanent, "no API key configured"});
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Error{ErrorKind::TranscriptionTransient, "curl_easy_init failed"});
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    if (curl_mime_filedata(part, segment.path.c_str()) != CURLE_OK) {
        curl_mime_free(mime);
        curl_easy_cleanup(curl);
        return std::unexpected(Error{ErrorKind::TranscriptionPermanent,
                                     "cannot read " + segment.path.string()});
    }

    if (openai) {
        add_field(mime, "model", options_.model);
    }
    add_field(mime, "temperature", "0");
    add_field(mime, "response_format", "json");
    if (!options_.language.empty()) add_field(mime, "language", options_.language);
    if (!prompt.empty()) add_field(mime, "prompt", prompt);

    curl_slist* headers = nullptr;
    if (!options_.api_key.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + options_.api_key).c_str());
    }

    std::string url = endpoint();
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.request_timeout_s));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout_s));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(Error{classify_curl_error(res),
                                     std::string("curl error: ") + curl_easy_strerror(res)});
    }

    return parse_response(http_status, response_body);
}

ErrorKind HttpAsrBackend::classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return ErrorKind::TranscriptionTransient;
        default:
            return ErrorKind::TranscriptionPermanent;
    }
}

ErrorKind HttpAsrBackend::classify_http_status(long status) {
    if (status == 408 || status == 409 || status == 425 || status == 429) {
        return ErrorKind::TranscriptionTransient;
    }
    if (status >= 500) return ErrorKind::TranscriptionTransient;
    return ErrorKind::TranscriptionPermanent;
}

std::expected<std::string, Error> HttpAsrBackend::parse_response(long status, const std::string& body) {
    bool success = status >= 200 && status < 300;

    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        if (!success) {
            return std::unexpected(Error{classify_http_status(status),
                std::format("HTTP {}: {}", status, trim(body))});
        }
        return std::unexpected(Error{ErrorKind::TranscriptionPermanent,
            std::string("JSON parse error: ") + e.what()});
    }

    if (!success) {
        std::string message = "HTTP " + std::to_string(status);
        if (j.is_object() && j.contains("error")) {
            auto& err = j["error"];
            if (err.is_string()) {
                message += ": " + err.get<std::string>();
            } else if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                message += ": " + err["message"].get<std::string>();
            }
        }
        return std::unexpected(Error{classify_http_status(status), std::move(message)});
    }

    if (j.is_object() && j.contains("text") && j["text"].is_string()) {
        return trim(j["text"].get<std::string>());
    }
    if (j.is_object() && j.contains("error")) {
        auto& err = j["error"];
        std::string message = err.is_string() ? err.get<std::string>() : err.dump();
        return std::unexpected(Error{ErrorKind::TranscriptionPermanent, "server error: " + message});
    }
    return std::unexpected(Error{ErrorKind::TranscriptionPermanent, "unexpected response: " + body});
}
