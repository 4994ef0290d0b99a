#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define CPPHTTPLIB_THREAD_POOL_COUNT 8
#include "api.hpp"
#include "config.hpp"
#include "emission_data_loader.hpp"
#include "logging.hpp"
#include "storage.hpp"

#include <httplib.h>
#ifdef SCOPEKEEPER_WITH_MONGO
#include "mongo_store.hpp"
#endif

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::unique_ptr<IStore> make_store(const AppConfig& cfg)
{
#ifdef SCOPEKEEPER_WITH_MONGO
    if (!cfg.mongo_uri.empty())
    {
        log_info("using MongoDB database " + cfg.mongo_db);
        return std::make_unique<MongoStore>(cfg.mongo_uri, cfg.mongo_db);
    }
#else
    if (!cfg.mongo_uri.empty())
        log_warn("MONGO_URI is set but this build has no MongoDB support; using the in-memory store");
#endif
    log_info("using the in-memory store");
    return std::make_unique<InMemoryStore>();
}

int main()
{
    try
    {
        const AppConfig cfg = load_config_from_env();

        auto& logger = Logger::instance();
        logger.set_level(cfg.log_level);
        if (!cfg.log_file.empty() && !logger.enable_file_logging(cfg.log_file))
            log_warn("could not open log file " + cfg.log_file);

        auto store = make_store(cfg);

        const auto factors = cfg.factors_file.empty() ? EmissionDataLoader::load_defaults()
                                                      : EmissionDataLoader::load_file(cfg.factors_file);
        const auto seeded  = EmissionDataLoader::seed(*store, factors, std::time(nullptr));
        log_info("seeded " + std::to_string(seeded) + " emission factors" +
                 (cfg.factors_file.empty() ? std::string(" (built-in table)") : " from " + cfg.factors_file));

        if (cfg.admin_api_key.empty())
            log_warn("ADMIN_API_KEY is not set; admin routes are open");

        httplib::Server svr;
        configure_routes(svr, *store, cfg);

        log_info("listening on " + cfg.host + ":" + std::to_string(cfg.port));
        if (!svr.listen(cfg.host, cfg.port))
        {
            log_error("could not listen on " + cfg.host + ":" + std::to_string(cfg.port));
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Fatal error: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
