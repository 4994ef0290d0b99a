#include "emission_factors.hpp"

#include <cctype>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string slug(const std::string& text)
{
    std::string out;
    for (const char c : text)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) != 0)
            out.push_back(static_cast<char>(std::tolower(uc)));
        else if (!out.empty() && out.back() != '-')
            out.push_back('-');
    }
    while (!out.empty() && out.back() == '-')
        out.pop_back();
    return out;
}

std::string default_factor_id(ActivityType type, const std::string& lookup_identifier)
{
    return "ef-" + slug(to_string(type)) + "-" + slug(lookup_identifier);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static EmissionFactor factor(ActivityType type, const std::string& identifier, const std::string& unit,
                             const char* kg_co2e, int scope, std::optional<int> category)
{
    EmissionFactor f;
    f.id                = default_factor_id(type, identifier);
    f.activity_type     = type;
    f.lookup_identifier = identifier;
    f.unit              = unit;
    f.co2e_factor       = Decimal::parse(kg_co2e).quantize(precision::kFactor);
    f.scope             = scope;
    f.category          = category;
    f.source            = "DEFRA-2024";
    return f;
}

std::vector<EmissionFactor> DefaultEmissionFactors::electricity()
{
    const auto t = ActivityType::Electricity;
    std::vector<EmissionFactor> factors;

    // Location-based grid averages
    factors.push_back(factor(t, "United Kingdom", "kWh", "0.20705", ghg::kScope2, std::nullopt));
    factors.push_back(factor(t, "Ireland", "kWh", "0.29600", ghg::kScope2, std::nullopt));
    factors.push_back(factor(t, "France", "kWh", "0.05600", ghg::kScope2, std::nullopt));
    factors.push_back(factor(t, "Germany", "kWh", "0.38000", ghg::kScope2, std::nullopt));
    factors.push_back(factor(t, "United States", "kWh", "0.36900", ghg::kScope2, std::nullopt));

    return factors;
}

std::vector<EmissionFactor> DefaultEmissionFactors::air_travel()
{
    const auto t   = ActivityType::AirTravel;
    const int  cat = ghg::kCategoryBusinessTravel;
    std::vector<EmissionFactor> factors;

    // Business travel, with radiative forcing
    factors.push_back(factor(t, "Domestic, Average passenger", "passenger.km", "0.27258", ghg::kScope3, cat));

    factors.push_back(factor(t, "Short-haul, Average passenger", "passenger.km", "0.18592", ghg::kScope3, cat));
    factors.push_back(factor(t, "Short-haul, Economy class", "passenger.km", "0.18287", ghg::kScope3, cat));
    factors.push_back(factor(t, "Short-haul, Business class", "passenger.km", "0.27430", ghg::kScope3, cat));

    factors.push_back(factor(t, "Long-haul, Average passenger", "passenger.km", "0.26128", ghg::kScope3, cat));
    factors.push_back(factor(t, "Long-haul, Economy class", "passenger.km", "0.20011", ghg::kScope3, cat));
    factors.push_back(factor(t, "Long-haul, Premium economy class", "passenger.km", "0.32016", ghg::kScope3, cat));
    factors.push_back(factor(t, "Long-haul, Business class", "passenger.km", "0.58029", ghg::kScope3, cat));
    factors.push_back(factor(t, "Long-haul, First class", "passenger.km", "0.80044", ghg::kScope3, cat));

    factors.push_back(factor(t, "International, Average passenger", "passenger.km", "0.24587", ghg::kScope3, cat));
    factors.push_back(factor(t, "International, Economy class", "passenger.km", "0.18832", ghg::kScope3, cat));
    factors.push_back(factor(t, "International, Business class", "passenger.km", "0.54608", ghg::kScope3, cat));

    return factors;
}

std::vector<EmissionFactor> DefaultEmissionFactors::goods_services()
{
    const auto t   = ActivityType::GoodsServices;
    const int  cat = ghg::kCategoryPurchasedGoods;
    std::vector<EmissionFactor> factors;

    // Spend based, per GBP spent
    factors.push_back(factor(t, "Computer, electronic and optical products", "GBP", "0.25600", ghg::kScope3, cat));
    factors.push_back(factor(t, "Furniture", "GBP", "0.38200", ghg::kScope3, cat));
    factors.push_back(factor(t, "Paper and paper products", "GBP", "0.54900", ghg::kScope3, cat));
    factors.push_back(factor(t, "Food and beverage serving services", "GBP", "0.36700", ghg::kScope3, cat));
    factors.push_back(factor(t, "Legal and accounting services", "GBP", "0.07700", ghg::kScope3, cat));
    factors.push_back(factor(t, "Computer programming and consultancy services", "GBP", "0.10300", ghg::kScope3, cat));
    factors.push_back(factor(t, "Telecommunications services", "GBP", "0.14800", ghg::kScope3, cat));
    factors.push_back(factor(t, "Wearing apparel", "GBP", "0.42600", ghg::kScope3, cat));

    return factors;
}

std::vector<EmissionFactor> DefaultEmissionFactors::all()
{
    auto out = electricity();
    for (auto&& group : { air_travel(), goods_services() })
        out.insert(out.end(), group.begin(), group.end());
    return out;
}
