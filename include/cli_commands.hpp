#pragma once

#include <string>

#include "cache_store.hpp"
#include "options.hpp"

namespace cli {

/**
 * @brief Start the logger according to the logging options.
 */
void setup_logging(const LoggingOptions& opts);

/**
 * @brief Apply `--clear-cache` and `--rescan` to the cache before scanning.
 */
void prepare_cache(CacheStore& cache, const Options& opts);

/**
 * @brief Read the bearer token for the summary endpoint from the environment.
 *
 * @return Contents of `AUTOGITPUSH_SUMMARY_TOKEN`, or an empty string.
 */
std::string summary_token();

/**
 * @brief Execute the monitoring run.
 *
 * Builds the cache, git runner, summarizer and manager from @a opts, then
 * either runs a single check (`--single-run`) or monitors until SIGINT or
 * SIGTERM. Returns `0` on success and non-zero when a single run recorded
 * failures.
 */
int handle_monitoring_run(const Options& opts);

} // namespace cli
