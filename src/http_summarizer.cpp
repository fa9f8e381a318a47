#include "summarizer.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "logger.hpp"

namespace {

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string first_line_trimmed(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    const char* ws = " \t\r";
    auto b = line.find_first_not_of(ws);
    if (b == std::string::npos)
        return "";
    auto e = line.find_last_not_of(ws);
    return line.substr(b, e - b + 1);
}

} // namespace

HttpSummarizer::HttpSummarizer(HttpSummarizerOptions opts, Summarizer& fallback)
    : opts_(std::move(opts)), fallback_(fallback) {}

std::optional<std::string> HttpSummarizer::request(const std::string& diff,
                                                   std::string& error) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "curl_easy_init failed";
        return std::nullopt;
    }
    std::string text = diff.size() > opts_.max_bytes ? diff.substr(0, opts_.max_bytes) : diff;
    // Cutting may split a UTF-8 sequence; replace rather than throw on dump.
    std::string payload = nlohmann::json{{"diff", text}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::string body;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (opts_.token && !opts_.token->empty()) {
        std::string hdr = "Authorization: Bearer " + *opts_.token;
        headers = curl_slist_append(headers, hdr.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_URL, opts_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(opts_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    if (rc == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        error = curl_easy_strerror(rc);
        return std::nullopt;
    }
    if (status < 200 || status >= 300) {
        error = "HTTP status " + std::to_string(status);
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        error = "response is not a JSON object";
        return std::nullopt;
    }
    auto it = j.find("message");
    if (it == j.end() || !it->is_string()) {
        error = "response has no string \"message\"";
        return std::nullopt;
    }
    std::string msg = first_line_trimmed(it->get<std::string>());
    if (msg.empty()) {
        error = "response message is empty";
        return std::nullopt;
    }
    return msg;
}

std::string HttpSummarizer::summarize(const std::string& diff) {
    std::string error;
    if (auto msg = request(diff, error))
        return *msg;
    log_warning("Summary endpoint failed, using local summary",
                {{"url", opts_.url}, {"error", error}});
    return fallback_.summarize(diff);
}
