#pragma once
#include "config.hpp"
#include "storage.hpp"

#include <httplib.h>

// Adds all endpoints to `svr` using the given store. Mutating admin routes require
// "Authorization: Bearer <cfg.admin_api_key>" when the key is set.
void configure_routes(httplib::Server& svr, IStore& store, const AppConfig& cfg);
