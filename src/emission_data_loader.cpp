#include "emission_data_loader.hpp"

#include "json_codec.hpp"
#include "logging.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void trim(std::string& s)
{
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Splits one CSV record; "" inside a quoted field is a literal quote.
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::vector<std::string> split_csv_line(const std::string& line)
{
    std::vector<std::string> fields;
    std::string              field;
    bool                     quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];
        if (quoted)
        {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"')
            {
                field.push_back('"');
                ++i;
            }
            else if (c == '"')
            {
                quoted = false;
            }
            else
            {
                field.push_back(c);
            }
        }
        else if (c == '"')
        {
            quoted = true;
        }
        else if (c == ',')
        {
            fields.push_back(field);
            field.clear();
        }
        else
        {
            field.push_back(c);
        }
    }
    if (quoted)
        throw std::runtime_error("unterminated quoted field");
    fields.push_back(field);
    for (auto& f : fields)
        trim(f);
    return fields;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void assign_default_id(EmissionFactor& factor)
{
    if (factor.id.empty())
        factor.id = default_factor_id(factor.activity_type, factor.lookup_identifier);
}

std::vector<EmissionFactor> EmissionDataLoader::load_defaults()
{
    return DefaultEmissionFactors::all();
}

std::vector<EmissionFactor> EmissionDataLoader::load_from_json(const std::string& json_str)
{
    std::vector<EmissionFactor> factors;

    try
    {
        const auto j = json::parse(json_str);

        if (!j.is_array())
        {
            throw std::runtime_error("Expected JSON array of factors");
        }

        for (const auto& item : j)
        {
            if (!item.is_object())
            {
                throw std::runtime_error("Each factor item must be a JSON object");
            }

            auto factor = item.get<EmissionFactor>();
            if (factor.source.empty())
                factor.source = "UNKNOWN";
            assign_default_id(factor);
            factors.push_back(std::move(factor));
        }
    }
    catch (const json::exception& e)
    {
        throw std::runtime_error(std::string("JSON parsing error: ") + e.what());
    }
    catch (const std::invalid_argument& e)
    {
        throw std::runtime_error(std::string("Invalid factor: ") + e.what());
    }

    return factors;
}

std::vector<EmissionFactor> EmissionDataLoader::load_from_csv(const std::string& csv_str)
{
    std::vector<EmissionFactor> factors;
    std::istringstream          iss(csv_str);
    std::string                 line;

    // Skip header
    if (!std::getline(iss, line))
    {
        throw std::runtime_error("CSV is empty");
    }

    int row_num = 1;
    while (std::getline(iss, line))
    {
        row_num++;

        trim(line);
        if (line.empty())
            continue;

        try
        {
            const auto fields = split_csv_line(line);
            if (fields.size() < 7)
                throw std::runtime_error("expected 7 columns, got " + std::to_string(fields.size()));

            EmissionFactor factor;
            auto           type = activity_type_from_string(fields[0]);
            if (!type)
                throw std::runtime_error("unknown activity type '" + fields[0] + "'");
            factor.activity_type     = *type;
            factor.lookup_identifier = fields[1];
            factor.unit              = fields[2];
            factor.co2e_factor       = Decimal::parse_formatted(fields[3]).quantize(precision::kFactor);
            factor.scope             = std::stoi(fields[4]);
            if (!fields[5].empty())
                factor.category = std::stoi(fields[5]);
            factor.source = fields[6].empty() ? "UNKNOWN" : fields[6];

            if (factor.lookup_identifier.empty())
                throw std::runtime_error("lookup_identifier is empty");
            if (factor.scope < ghg::kScope1 || factor.scope > ghg::kScope3)
                throw std::runtime_error("scope must be 1, 2 or 3");

            assign_default_id(factor);
            factors.push_back(std::move(factor));
        }
        catch (const std::exception& e)
        {
            throw std::runtime_error("CSV format error at row " + std::to_string(row_num) + ": " + e.what());
        }
    }

    return factors;
}

std::vector<EmissionFactor> EmissionDataLoader::load_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("cannot open factors file: " + path);
    std::stringstream buf;
    buf << in.rdbuf();

    const auto ends_with = [&path](const std::string& suffix)
    {
        return path.size() >= suffix.size() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (ends_with(".json"))
        return load_from_json(buf.str());
    if (ends_with(".csv"))
        return load_from_csv(buf.str());
    throw std::runtime_error("factors file must end in .json or .csv: " + path);
}

std::size_t EmissionDataLoader::seed(IStore& store, const std::vector<EmissionFactor>& factors, std::int64_t now)
{
    std::size_t written = 0;
    for (auto factor : factors)
    {
        assign_default_id(factor);
        const auto existing = store.get_factor(factor.id);
        factor.created_at   = existing ? existing->created_at : now;
        factor.updated_at   = now;
        store.put_factor(factor);
        ++written;
    }
    log_info("seeded " + std::to_string(written) + " emission factor(s)");
    return written;
}
