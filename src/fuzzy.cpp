#include "fuzzy.hpp"

#include <rapidfuzz/fuzz.hpp>
#include <rapidfuzz/utils.hpp>

namespace fuzzy
{
std::string preprocess(const std::string& text)
{
    return rapidfuzz::utils::default_process(text);
}

double ratio(const std::string& a, const std::string& b)
{
    return rapidfuzz::fuzz::ratio(a, b);
}

double token_sort_ratio(const std::string& a, const std::string& b)
{
    return rapidfuzz::fuzz::token_sort_ratio(preprocess(a), preprocess(b));
}
} // namespace fuzzy
