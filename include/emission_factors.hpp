#pragma once
#include "models.hpp"

#include <string>
#include <vector>

/**
 * Built-in emission factors, used to seed an empty store.
 * Values are kg CO2e per unit.
 * Source: https://www.gov.uk/guidance/greenhouse-gas-reporting-conversion-factors-2024
 */
class DefaultEmissionFactors
{
  public:
    // Scope 2, location based grid factors per kWh, keyed by country.
    static std::vector<EmissionFactor> electricity();

    // Scope 3 category 6, per passenger.km, keyed "{flight range}, {passenger class}".
    static std::vector<EmissionFactor> air_travel();

    // Scope 3 category 1, spend based, per GBP, keyed by supplier category.
    static std::vector<EmissionFactor> goods_services();

    static std::vector<EmissionFactor> all();
};

// Stable id derived from type and identifier, e.g. "ef-air-travel-short-haul-economy-class",
// so that reloading the same factor table updates rows instead of duplicating them.
std::string default_factor_id(ActivityType type, const std::string& lookup_identifier);
