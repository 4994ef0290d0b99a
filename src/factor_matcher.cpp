#include "factor_matcher.hpp"

#include "fuzzy.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<EmissionFactor> FactorMatcher::exact_in(const std::vector<EmissionFactor>& factors,
                                                      const std::string&                 lookup_key)
{
    const auto key = lower(lookup_key);
    const EmissionFactor* best = nullptr;
    for (const auto& f : factors)
    {
        if (lower(f.lookup_identifier) != key)
            continue;
        // duplicate identifiers: keep the choice deterministic
        if (best == nullptr || f.id < best->id)
            best = &f;
    }
    if (best == nullptr)
        return std::nullopt;
    return *best;
}

std::optional<FactorMatch> FactorMatcher::fuzzy_in(const std::vector<EmissionFactor>& factors,
                                                   const std::string& lookup_key, int threshold)
{
    const EmissionFactor* best       = nullptr;
    double                best_score = -1.0;
    std::string           best_lower;
    for (const auto& f : factors)
    {
        const double score      = fuzzy::token_sort_ratio(lookup_key, f.lookup_identifier);
        const auto   candidate  = lower(f.lookup_identifier);
        const bool   better     = score > best_score;
        const bool   tie_winner = score == best_score &&
                                (candidate < best_lower || (candidate == best_lower && f.id < best->id));
        if (better || tie_winner)
        {
            best       = &f;
            best_score = score;
            best_lower = candidate;
        }
    }

    if (best == nullptr)
        return std::nullopt;

    if (best_score < static_cast<double>(threshold))
    {
        log_info("fuzzy match score " + std::to_string(best_score) + " below threshold " +
                 std::to_string(threshold) + " for '" + lookup_key + "' (best: '" + best->lookup_identifier + "')");
        return std::nullopt;
    }

    auto points = static_cast<std::int64_t>(std::floor(best_score));
    points      = std::min<std::int64_t>(points, 99);
    FactorMatch m{ *best, Decimal(points, precision::kConfidence) };
    log_info("fuzzy matched '" + lookup_key + "' to '" + best->lookup_identifier + "' with confidence " +
             m.confidence.to_string());
    return m;
}

std::optional<EmissionFactor> FactorMatcher::exact_match(ActivityType type, const std::string& lookup_key) const
{
    return exact_in(store_.get_factors_by_activity_type(type), lookup_key);
}

std::optional<FactorMatch> FactorMatcher::fuzzy_match(ActivityType type, const std::string& lookup_key,
                                                      int threshold) const
{
    const auto factors = store_.get_factors_by_activity_type(type);
    if (factors.empty())
    {
        log_warn("no emission factors found for " + to_string(type));
        return std::nullopt;
    }
    return fuzzy_in(factors, lookup_key, threshold);
}

std::optional<FactorMatch> FactorMatcher::match(ActivityType type, const std::string& lookup_key,
                                                int threshold) const
{
    const auto factors = store_.get_factors_by_activity_type(type);
    if (factors.empty())
    {
        log_warn("no emission factors found for " + to_string(type));
        return std::nullopt;
    }

    if (auto exact = exact_in(factors, lookup_key))
    {
        log_debug("exact match found for " + to_string(type) + ": " + lookup_key);
        return FactorMatch{ *exact, Decimal(100, precision::kConfidence) };
    }

    log_debug("no exact match, trying fuzzy match for " + to_string(type) + ": " + lookup_key);
    auto fuzzy = fuzzy_in(factors, lookup_key, threshold);
    if (!fuzzy)
        log_warn("no match found (exact or fuzzy) for " + to_string(type) + ": " + lookup_key);
    return fuzzy;
}

std::optional<FactorMatch> FactorMatcher::match_air_travel(const std::string& flight_range,
                                                           const std::string& passenger_class,
                                                           int                threshold) const
{
    const auto range = trim(flight_range);
    const auto cls   = trim(passenger_class);

    if (auto m = match(ActivityType::AirTravel, range + ", " + cls, threshold))
        return m;

    const auto range_lower = lower(range);
    const auto class_lower = lower(cls);
    for (const auto& f : store_.get_factors_by_activity_type(ActivityType::AirTravel))
    {
        const auto identifier = lower(f.lookup_identifier);
        if (identifier.find(range_lower) != std::string::npos && identifier.find(class_lower) != std::string::npos)
        {
            log_info("partial match found: " + f.lookup_identifier + " for " + range + ", " + cls);
            return FactorMatch{ f, Decimal(90, precision::kConfidence) };
        }
    }

    log_warn("no match found for air travel: " + range + ", " + cls);
    return std::nullopt;
}
