#pragma once
#include "models.hpp"
#include "storage.hpp"

#include <optional>
#include <string>
#include <vector>

struct FactorMatch
{
    EmissionFactor factor;
    Decimal        confidence; // 2 fractional digits; 1.00 only for exact matches

    bool is_exact() const { return confidence == Decimal(100, precision::kConfidence); }
};

/**
 * Resolves an activity's lookup key to an emission factor.
 *
 * Exact match (case-insensitive, scoped to the activity type) yields confidence 1.00.
 * Otherwise the factor with the highest token-sort similarity is chosen if its
 * score reaches the threshold; confidence is floor(score)/100, at most 0.99.
 * The score is truncated, not rounded: 92.86 gives 0.92.
 * Equal scores are resolved by the smallest lowercase lookup_identifier, then id.
 *
 * Absence of a usable factor is a normal outcome (empty optional), never an exception.
 */
class FactorMatcher
{
  public:
    static constexpr int kDefaultThreshold = 80;

    explicit FactorMatcher(const IStore& store) : store_(store) {}

    std::optional<EmissionFactor> exact_match(ActivityType type, const std::string& lookup_key) const;

    std::optional<FactorMatch> fuzzy_match(ActivityType type, const std::string& lookup_key,
                                           int threshold = kDefaultThreshold) const;

    // Exact first, fuzzy fallback.
    std::optional<FactorMatch> match(ActivityType type, const std::string& lookup_key,
                                     int threshold = kDefaultThreshold) const;

    // Composite key "{flight_range}, {passenger_class}" through match(); then a partial tier
    // that accepts the first factor whose identifier contains both parts (confidence 0.90).
    std::optional<FactorMatch> match_air_travel(const std::string& flight_range,
                                                const std::string& passenger_class,
                                                int                threshold = kDefaultThreshold) const;

  private:
    const IStore& store_;

    static std::optional<EmissionFactor> exact_in(const std::vector<EmissionFactor>& factors,
                                                  const std::string&                 lookup_key);
    static std::optional<FactorMatch>    fuzzy_in(const std::vector<EmissionFactor>& factors,
                                                  const std::string& lookup_key, int threshold);
};
