#pragma once
#include "emission_factors.hpp"
#include "storage.hpp"

#include <string>
#include <vector>

/**
 * Loads emission factor reference data and seeds it into a store.
 *
 * Factors without an id get default_factor_id(type, lookup_identifier), so loading
 * the same table twice updates rows in place.
 */
class EmissionDataLoader
{
  public:
    // The built-in DefaultEmissionFactors table.
    static std::vector<EmissionFactor> load_defaults();

    /**
     * Load factors from a JSON string.
     * Expected format: array of objects with keys activity_type, lookup_identifier, unit,
     * co2e_factor, scope and optionally id, category, source, notes.
     *
     * @throws std::runtime_error on malformed input
     */
    static std::vector<EmissionFactor> load_from_json(const std::string& json_str);

    /**
     * Load factors from a CSV string.
     * Expected header: activity_type,lookup_identifier,unit,co2e_factor,scope,category,source
     * Fields may be double-quoted (identifiers such as "Short-haul, Economy class" contain commas).
     * An empty category column means no Scope 3 category.
     *
     * @throws std::runtime_error on malformed input, naming the row
     */
    static std::vector<EmissionFactor> load_from_csv(const std::string& csv_str);

    // Reads a .json or .csv file (chosen by extension).
    static std::vector<EmissionFactor> load_file(const std::string& path);

    // Upserts every factor; returns how many were written.
    static std::size_t seed(IStore& store, const std::vector<EmissionFactor>& factors, std::int64_t now);
};
