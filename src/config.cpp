#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string env_string(const EnvLookup& getenv_fn, const char* name, const std::string& fallback)
{
    const char* v = getenv_fn(name);
    return (v != nullptr && *v != '\0') ? std::string(v) : fallback;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static long long env_integer(const EnvLookup& getenv_fn, const char* name, long long fallback, long long min_value,
                             long long max_value)
{
    const char* v = getenv_fn(name);
    if (v == nullptr || *v == '\0')
        return fallback;
    try
    {
        std::size_t     pos    = 0;
        const long long parsed = std::stoll(v, &pos);
        if (pos != std::string(v).size())
            throw std::invalid_argument("trailing characters");
        if (parsed < min_value || parsed > max_value)
            throw std::out_of_range("out of range");
        return parsed;
    }
    catch (const std::exception& e)
    {
        log_warn(std::string("ignoring ") + name + "=" + v + " (" + e.what() + "), using " +
                 std::to_string(fallback));
        return fallback;
    }
}

AppConfig load_config(const EnvLookup& getenv_fn)
{
    AppConfig cfg;
    cfg.host          = env_string(getenv_fn, "HOST", cfg.host);
    cfg.port          = static_cast<int>(env_integer(getenv_fn, "PORT", cfg.port, 1, 65535));
    cfg.mongo_uri     = env_string(getenv_fn, "MONGO_URI", cfg.mongo_uri);
    cfg.mongo_db      = env_string(getenv_fn, "MONGO_DB", cfg.mongo_db);
    cfg.fuzzy_threshold =
        static_cast<int>(env_integer(getenv_fn, "FUZZY_MATCH_THRESHOLD", cfg.fuzzy_threshold, 0, 100));
    cfg.batch_size = static_cast<std::size_t>(
        env_integer(getenv_fn, "CALC_BATCH_SIZE", static_cast<long long>(cfg.batch_size), 1, 1000000));
    cfg.error_sample = static_cast<std::size_t>(
        env_integer(getenv_fn, "CALC_ERROR_SAMPLE", static_cast<long long>(cfg.error_sample), 0, 100000));
    cfg.legacy_pending_limit = static_cast<std::size_t>(env_integer(
        getenv_fn, "LEGACY_PENDING_LIMIT", static_cast<long long>(cfg.legacy_pending_limit), 1, 100000000));

    const auto level_name = env_string(getenv_fn, "LOG_LEVEL", "");
    if (!level_name.empty())
    {
        if (auto level = log_level_from_string(level_name))
            cfg.log_level = *level;
        else
            log_warn("ignoring LOG_LEVEL=" + level_name + ", using info");
    }
    cfg.log_file      = env_string(getenv_fn, "LOG_FILE", "");
    cfg.factors_file  = env_string(getenv_fn, "FACTORS_FILE", "");
    cfg.admin_api_key = env_string(getenv_fn, "ADMIN_API_KEY", "");
    return cfg;
}

AppConfig load_config_from_env()
{
    return load_config([](const char* name) { return std::getenv(name); });
}
