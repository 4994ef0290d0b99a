#pragma once
#include "decimal.hpp"

#include <cstdint>
#include <string>

/**
 * Conversions between the units that appear in activity data.
 * Every method is exact fixed-point arithmetic; distance conversions round
 * half-up to the 2 fractional digits distances are stored with.
 */
class UnitNormalizer
{
  public:
    static const Decimal kMilesToKm;  // 1.60934
    static const Decimal kKmToMiles;  // 0.621371
    static const Decimal kTonnesToKg; // 1000

    // Canonical fixed-point value of an input quantity.
    static Decimal normalize(const Decimal& value) { return value; }
    static Decimal normalize(std::int64_t value) { return Decimal::from_int(value); }
    // Accepts "1,234.56", "£5,000", " 42 ". Throws std::invalid_argument for non-numeric text.
    static Decimal normalize(const std::string& value);
    static Decimal normalize(const char* value) { return normalize(std::string(value)); }

    static Decimal miles_to_km(const Decimal& miles);
    static Decimal km_to_miles(const Decimal& km);

    static Decimal tonnes_to_kg(const Decimal& tonnes);
    static Decimal kg_to_tonnes(const Decimal& kg);
};
