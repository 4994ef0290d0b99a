#include "unit_normalizer.hpp"

#include "models.hpp"

const Decimal UnitNormalizer::kMilesToKm{ 160934, 5 };
const Decimal UnitNormalizer::kKmToMiles{ 621371, 6 };
const Decimal UnitNormalizer::kTonnesToKg{ 1000, 0 };

Decimal UnitNormalizer::normalize(const std::string& value)
{
    return Decimal::parse_formatted(value);
}

Decimal UnitNormalizer::miles_to_km(const Decimal& miles)
{
    return (miles * kMilesToKm).quantize(precision::kDistance);
}

Decimal UnitNormalizer::km_to_miles(const Decimal& km)
{
    return (km * kKmToMiles).quantize(precision::kDistance);
}

Decimal UnitNormalizer::tonnes_to_kg(const Decimal& tonnes)
{
    return tonnes * kTonnesToKg;
}

Decimal UnitNormalizer::kg_to_tonnes(const Decimal& kg)
{
    return kg.div_pow10(3);
}
