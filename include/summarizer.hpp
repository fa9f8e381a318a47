#ifndef SUMMARIZER_HPP
#define SUMMARIZER_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

/**
 * @brief Turns a unified diff into a commit message.
 *
 * Implementations never fail: whatever happens, a non-empty message is
 * returned.
 */
class Summarizer {
  public:
    virtual ~Summarizer() = default;
    virtual std::string summarize(const std::string& diff) = 0;
};

/**
 * @brief Summarizer that describes the patch from its own statistics.
 *
 * Produces e.g. `Update 2 files: src/a.cpp, README.md (+10 -3)`. At most three
 * file names are listed.
 */
class DiffStatSummarizer : public Summarizer {
  public:
    static constexpr const char* kGenericMessage = "Automated update: summarized changes";

    std::string summarize(const std::string& diff) override;
};

struct HttpSummarizerOptions {
    std::string url;
    std::chrono::milliseconds timeout{10000};
    size_t max_bytes = 64 * 1024; ///< Diff text beyond this is cut before sending
    std::optional<std::string> token; ///< Sent as `Authorization: Bearer <token>`
};

/**
 * @brief Summarizer backed by a text-generation HTTP endpoint.
 *
 * POSTs `{"diff": "..."}` and expects `{"message": "..."}` in a 2xx response.
 * Only the first line of the message is kept. Any transport, status or
 * payload problem is logged and answered with the fallback's message.
 */
class HttpSummarizer : public Summarizer {
  public:
    HttpSummarizer(HttpSummarizerOptions opts, Summarizer& fallback);
    std::string summarize(const std::string& diff) override;

  private:
    std::optional<std::string> request(const std::string& diff, std::string& error) const;

    HttpSummarizerOptions opts_;
    Summarizer& fallback_;
};

#endif // SUMMARIZER_HPP
