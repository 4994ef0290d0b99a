#pragma once
#include "emission_aggregator.hpp"
#include "emission_calculator.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>

// nlohmann::json conversions for the domain types. Fixed-point values are written as
// decimal strings; readers also accept JSON numbers and re-read their text form.
// Incoming quantities are rounded to the number of fractional digits they are stored with.

void to_json(nlohmann::json& j, const Decimal& d);
void from_json(const nlohmann::json& j, Decimal& d);

void to_json(nlohmann::json& j, const Date& d);
void from_json(const nlohmann::json& j, Date& d);

void to_json(nlohmann::json& j, ActivityType t);
void from_json(const nlohmann::json& j, ActivityType& t);

void to_json(nlohmann::json& j, const EmissionFactor& f);
void from_json(const nlohmann::json& j, EmissionFactor& f);

void to_json(nlohmann::json& j, const Activity& a);
// The type is taken from "activity_type"; see activity_from_json to force one.
void from_json(const nlohmann::json& j, Activity& a);
Activity activity_from_json(const nlohmann::json& j, ActivityType type);

void to_json(nlohmann::json& j, const EmissionResult& r);
void to_json(nlohmann::json& j, const EmissionSummary& s);

void to_json(nlohmann::json& j, const CalculationError& e);
void to_json(nlohmann::json& j, const BatchStatistics& s);
void to_json(nlohmann::json& j, const BatchSummary& s);
void to_json(nlohmann::json& j, const SweepSummary& s);

void to_json(nlohmann::json& j, const SummaryTotal& t);
void to_json(nlohmann::json& j, const BackfillReport& r);
