#pragma once
#include "factor_matcher.hpp"
#include "models.hpp"
#include "storage.hpp"

#include <map>
#include <memory>
#include <optional>

/**
 * Uniform contract of the per-variant emission calculators.
 *
 * calculate() resolves a factor for the activity and returns an unsaved result:
 *   co2e_tonnes = quantity * factor.co2e_factor / 1000   (7 fractional digits)
 * with provenance in calculation_metadata. The caller assigns id, timestamps and
 * calculation_date.
 * An empty optional means NotCalculable (no factor, or no quantity to work with).
 *
 * The activity is taken by reference because a calculator may backfill derived
 * fields (air travel fills distance_km from distance_miles).
 */
class ICalculator
{
  public:
    virtual ~ICalculator() = default;

    virtual ActivityType                  activity_type() const                                     = 0;
    virtual std::optional<EmissionResult> calculate(Activity& activity, int fuzzy_threshold) const = 0;
};

class ElectricityCalculator : public ICalculator
{
  public:
    explicit ElectricityCalculator(const IStore& store) : matcher_(store) {}

    ActivityType                  activity_type() const override { return ActivityType::Electricity; }
    std::optional<EmissionResult> calculate(Activity& activity, int fuzzy_threshold) const override;

  private:
    FactorMatcher matcher_;
};

// Scope 3, category 6 (business travel), distance based.
class AirTravelCalculator : public ICalculator
{
  public:
    explicit AirTravelCalculator(const IStore& store) : matcher_(store) {}

    ActivityType                  activity_type() const override { return ActivityType::AirTravel; }
    std::optional<EmissionResult> calculate(Activity& activity, int fuzzy_threshold) const override;

  private:
    FactorMatcher matcher_;
};

// Scope 3, category 1, spend based.
class GoodsServicesCalculator : public ICalculator
{
  public:
    explicit GoodsServicesCalculator(const IStore& store) : matcher_(store) {}

    ActivityType                  activity_type() const override { return ActivityType::GoodsServices; }
    std::optional<EmissionResult> calculate(Activity& activity, int fuzzy_threshold) const override;

  private:
    FactorMatcher matcher_;
};

// Dispatch table from activity type to calculator.
class CalculatorRegistry
{
  public:
    void add(std::shared_ptr<const ICalculator> calculator);

    // nullptr if no calculator handles the type
    const ICalculator* find(ActivityType type) const;

    std::size_t size() const { return calculators_.size(); }

    // One calculator per activity variant, all reading factors from `store`.
    static CalculatorRegistry defaults(const IStore& store);

  private:
    std::map<ActivityType, std::shared_ptr<const ICalculator>> calculators_;
};
