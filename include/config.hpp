#pragma once
#include "logging.hpp"

#include <cstddef>
#include <functional>
#include <string>

/**
 * Runtime configuration, read from the environment at startup.
 *
 *   PORT, HOST                 HTTP listener (8080, 0.0.0.0)
 *   MONGO_URI, MONGO_DB        MongoDB backend; in-memory store when MONGO_URI is unset
 *   FUZZY_MATCH_THRESHOLD      minimum similarity score 0..100 (80)
 *   CALC_BATCH_SIZE            streaming page size (100)
 *   CALC_ERROR_SAMPLE          failures kept per sweep (10)
 *   LEGACY_PENDING_LIMIT       cap of the non-streaming sweep (10000)
 *   LOG_LEVEL, LOG_FILE        logger level / optional file
 *   FACTORS_FILE               JSON or CSV emission factors loaded at startup
 *   ADMIN_API_KEY              bearer token for mutating routes
 */
struct AppConfig
{
    std::string host = "0.0.0.0";
    int         port = 8080;
    std::string mongo_uri;
    std::string mongo_db             = "scopekeeper";
    int         fuzzy_threshold      = 80;
    std::size_t batch_size           = 100;
    std::size_t error_sample         = 10;
    std::size_t legacy_pending_limit = 10000;
    LogLevel    log_level            = LogLevel::Info;
    std::string log_file;
    std::string factors_file;
    std::string admin_api_key;
};

using EnvLookup = std::function<const char*(const char*)>;

// Invalid values keep the default and log a warning.
AppConfig load_config(const EnvLookup& getenv_fn);
AppConfig load_config_from_env();
