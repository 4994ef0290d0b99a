#include "calculators.hpp"

#include "logging.hpp"
#include "unit_normalizer.hpp"

#include <stdexcept>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static Decimal tonnes_co2e(const Decimal& quantity, const Decimal& factor)
{
    // factor is kg per unit; result in tonnes
    return UnitNormalizer::kg_to_tonnes(quantity).multiply(factor, precision::kEmission);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static EmissionResult make_result(const Activity& activity, const FactorMatch& match, const Decimal& co2e)
{
    EmissionResult r;
    r.activity           = activity.ref();
    r.emission_factor_id = match.factor.id;
    r.co2e_tonnes        = co2e;
    r.confidence_score   = match.confidence.quantize(precision::kConfidence);
    return r;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static const char* method_of(const FactorMatch& match)
{
    return match.is_exact() ? "exact" : "fuzzy";
}

template <typename Details>
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static Details& details_of(Activity& activity, ActivityType expected)
{
    auto* d = std::get_if<Details>(&activity.details);
    if (d == nullptr)
        throw std::invalid_argument("activity " + activity.id + " is not a " + to_string(expected) + " activity");
    return *d;
}

std::optional<EmissionResult> ElectricityCalculator::calculate(Activity& activity, int fuzzy_threshold) const
{
    auto& usage = details_of<ElectricityUsage>(activity, ActivityType::Electricity);
    log_info("calculating electricity emissions for " + usage.usage_kwh.to_string() + " kWh in " + usage.country);

    auto match = matcher_.match(ActivityType::Electricity, usage.country, fuzzy_threshold);
    if (!match)
    {
        log_error("no emission factor found for electricity in " + usage.country);
        return std::nullopt;
    }

    const auto kwh  = UnitNormalizer::normalize(usage.usage_kwh);
    const auto co2e = tonnes_co2e(kwh, match->factor.co2e_factor);

    auto result                                        = make_result(activity, *match, co2e);
    result.calculation_metadata["usage_kwh"]             = kwh.to_string();
    result.calculation_metadata["country"]               = usage.country;
    result.calculation_metadata["matched_country"]       = match->factor.lookup_identifier;
    result.calculation_metadata["emission_factor_value"] = match->factor.co2e_factor.to_string();
    result.calculation_metadata["unit"]                  = match->factor.unit;
    result.calculation_metadata["calculation_method"]    = method_of(*match);

    log_info("calculated " + co2e.to_string() + " t CO2e for electricity activity " + activity.id +
             " (confidence " + result.confidence_score.to_string() + ")");
    return result;
}

std::optional<EmissionResult> AirTravelCalculator::calculate(Activity& activity, int fuzzy_threshold) const
{
    auto& trip = details_of<AirTravel>(activity, ActivityType::AirTravel);
    log_info("calculating air travel emissions for activity " + activity.id + " (" + trip.flight_range + ", " +
             trip.passenger_class + ")");

    if (!trip.distance_km && !trip.distance_miles)
    {
        log_error("no distance information available for air travel activity " + activity.id);
        return std::nullopt;
    }

    if ((!trip.distance_km || trip.distance_km->is_zero()) && trip.distance_miles &&
        trip.distance_miles->sign() > 0)
        trip.distance_km = UnitNormalizer::miles_to_km(*trip.distance_miles);

    if (!trip.distance_km || trip.distance_km->is_zero())
    {
        log_info("zero-distance flight for activity " + activity.id + ", calculating 0 emissions");
        if (!trip.distance_km)
            trip.distance_km = Decimal(0, precision::kDistance);
    }

    auto match = matcher_.match_air_travel(trip.flight_range, trip.passenger_class, fuzzy_threshold);
    if (!match)
    {
        log_error("no emission factor found for air travel: " + trip.flight_range + ", " + trip.passenger_class);
        return std::nullopt;
    }

    const auto km   = UnitNormalizer::normalize(*trip.distance_km);
    const auto co2e = tonnes_co2e(km, match->factor.co2e_factor);

    auto  result = make_result(activity, *match, co2e);
    auto& meta   = result.calculation_metadata;
    meta["distance_km"] = km.to_string();
    if (trip.distance_miles)
        meta["distance_miles"] = trip.distance_miles->to_string();
    meta["flight_range"]          = trip.flight_range;
    meta["passenger_class"]       = trip.passenger_class;
    meta["matched_identifier"]    = match->factor.lookup_identifier;
    meta["emission_factor_value"] = match->factor.co2e_factor.to_string();
    meta["unit"]                  = match->factor.unit;
    meta["calculation_method"]    = method_of(*match);

    log_info("calculated " + co2e.to_string() + " t CO2e for air travel activity " + activity.id +
             " (confidence " + result.confidence_score.to_string() + ")");
    return result;
}

std::optional<EmissionResult> GoodsServicesCalculator::calculate(Activity& activity, int fuzzy_threshold) const
{
    auto& purchase = details_of<GoodsServices>(activity, ActivityType::GoodsServices);
    log_info("calculating goods/services emissions for spend " + purchase.spend_amount.to_string() + " in " +
             purchase.supplier_category);

    auto match = matcher_.match(ActivityType::GoodsServices, purchase.supplier_category, fuzzy_threshold);
    if (!match)
    {
        log_error("no emission factor found for goods/services category: " + purchase.supplier_category);
        return std::nullopt;
    }

    const auto spend = UnitNormalizer::normalize(purchase.spend_amount);
    const auto co2e  = tonnes_co2e(spend, match->factor.co2e_factor);

    auto  result = make_result(activity, *match, co2e);
    auto& meta   = result.calculation_metadata;
    meta["spend_amount"]          = spend.to_string();
    meta["supplier_category"]     = purchase.supplier_category;
    meta["matched_category"]      = match->factor.lookup_identifier;
    meta["emission_factor_value"] = match->factor.co2e_factor.to_string();
    meta["unit"]                  = match->factor.unit;
    meta["calculation_method"]    = method_of(*match);

    log_info("calculated " + co2e.to_string() + " t CO2e for goods/services activity " + activity.id +
             " (confidence " + result.confidence_score.to_string() + ")");
    return result;
}

void CalculatorRegistry::add(std::shared_ptr<const ICalculator> calculator)
{
    if (!calculator)
        throw std::invalid_argument("calculator must not be null");
    const auto type     = calculator->activity_type();
    calculators_[type] = std::move(calculator);
}

const ICalculator* CalculatorRegistry::find(ActivityType type) const
{
    auto it = calculators_.find(type);
    return it == calculators_.end() ? nullptr : it->second.get();
}

CalculatorRegistry CalculatorRegistry::defaults(const IStore& store)
{
    CalculatorRegistry registry;
    registry.add(std::make_shared<ElectricityCalculator>(store));
    registry.add(std::make_shared<AirTravelCalculator>(store));
    registry.add(std::make_shared<GoodsServicesCalculator>(store));
    return registry;
}
