#include "decimal.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace
{
using wide = __int128;

wide pow10_wide(int n)
{
    wide p = 1;
    for (int i = 0; i < n; ++i)
        p *= 10;
    return p;
}

std::int64_t narrow(wide v)
{
    if (v > static_cast<wide>(std::numeric_limits<std::int64_t>::max()) ||
        v < static_cast<wide>(std::numeric_limits<std::int64_t>::min()))
        throw std::overflow_error("decimal value out of range");
    return static_cast<std::int64_t>(v);
}

void check_scale(int scale)
{
    if (scale < 0 || scale > Decimal::kMaxScale)
        throw std::overflow_error("decimal scale out of range: " + std::to_string(scale));
}

// Rescale v (at scale `from`) to scale `to` without rounding; to >= from.
wide widen_to(std::int64_t v, int from, int to)
{
    return static_cast<wide>(v) * pow10_wide(to - from);
}

// Drop `digits` trailing decimal digits of v, rounding per mode.
wide shed_digits(wide v, int digits, Decimal::Rounding mode)
{
    if (digits <= 0)
        return static_cast<wide>(narrow(v)) * pow10_wide(-digits);
    const wide divisor   = pow10_wide(digits);
    wide       quotient  = v / divisor;
    const wide remainder = v % divisor;
    if (mode == Decimal::Rounding::HalfUp)
    {
        const wide twice = (remainder < 0 ? -remainder : remainder) * 2;
        if (twice >= divisor)
            quotient += (v < 0 ? -1 : 1);
    }
    return quotient;
}
} // namespace

Decimal::Decimal(std::int64_t units, int scale) : units_(units), scale_(scale)
{
    check_scale(scale);
}

Decimal Decimal::parse(const std::string& text)
{
    if (text.empty())
        throw std::invalid_argument("empty decimal text");

    std::size_t i        = 0;
    bool        negative = false;
    if (text[i] == '+' || text[i] == '-')
    {
        negative = text[i] == '-';
        ++i;
    }

    wide        acc       = 0;
    int         scale     = 0;
    bool        seen_dot  = false;
    std::size_t digits    = 0;
    for (; i < text.size(); ++i)
    {
        const char c = text[i];
        if (c == '.')
        {
            if (seen_dot)
                throw std::invalid_argument("invalid decimal text: " + text);
            seen_dot = true;
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) == 0)
            throw std::invalid_argument("invalid decimal text: " + text);
        acc = acc * 10 + (c - '0');
        ++digits;
        if (seen_dot)
            ++scale;
        if (acc > static_cast<wide>(std::numeric_limits<std::int64_t>::max()) || scale > kMaxScale)
            throw std::overflow_error("decimal text out of range: " + text);
    }
    if (digits == 0)
        throw std::invalid_argument("invalid decimal text: " + text);

    return Decimal(narrow(negative ? -acc : acc), scale);
}

Decimal Decimal::parse_formatted(const std::string& text)
{
    std::string cleaned;
    cleaned.reserve(text.size());
    for (const char c : text)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (c == ',' || c == '$' || c == '\'' || std::isspace(uc) != 0 || uc >= 0x80)
            continue;
        cleaned.push_back(c);
    }
    return parse(cleaned);
}

Decimal Decimal::quantize(int scale, Rounding mode) const
{
    check_scale(scale);
    if (scale >= scale_)
        return Decimal(narrow(widen_to(units_, scale_, scale)), scale);

    return Decimal(narrow(shed_digits(units_, scale_ - scale, mode)), scale);
}

Decimal Decimal::div_pow10(int digits) const
{
    if (digits < 0)
        throw std::invalid_argument("div_pow10 expects a non-negative exponent");
    return Decimal(units_, scale_ + digits);
}

Decimal Decimal::operator+(const Decimal& rhs) const
{
    const int s = scale_ > rhs.scale_ ? scale_ : rhs.scale_;
    return Decimal(narrow(widen_to(units_, scale_, s) + widen_to(rhs.units_, rhs.scale_, s)), s);
}

Decimal Decimal::operator-(const Decimal& rhs) const
{
    return *this + (-rhs);
}

Decimal Decimal::operator*(const Decimal& rhs) const
{
    const int s = scale_ + rhs.scale_;
    check_scale(s);
    return Decimal(narrow(static_cast<wide>(units_) * static_cast<wide>(rhs.units_)), s);
}

Decimal Decimal::multiply(const Decimal& rhs, int scale, Rounding mode) const
{
    check_scale(scale);
    const wide product = static_cast<wide>(units_) * static_cast<wide>(rhs.units_);
    return Decimal(narrow(shed_digits(product, scale_ + rhs.scale_ - scale, mode)), scale);
}

Decimal Decimal::operator-() const
{
    return Decimal(narrow(-static_cast<wide>(units_)), scale_);
}

Decimal& Decimal::operator+=(const Decimal& rhs)
{
    *this = *this + rhs;
    return *this;
}

int Decimal::compare(const Decimal& rhs) const
{
    const int  s = scale_ > rhs.scale_ ? scale_ : rhs.scale_;
    const wide a = widen_to(units_, scale_, s);
    const wide b = widen_to(rhs.units_, rhs.scale_, s);
    return a < b ? -1 : (a > b ? 1 : 0);
}

std::string Decimal::to_string() const
{
    const bool   negative  = units_ < 0;
    wide         magnitude = units_;
    if (negative)
        magnitude = -magnitude;

    std::string digits;
    do
    {
        digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    } while (magnitude > 0);

    if (scale_ > 0)
    {
        if (digits.size() <= static_cast<std::size_t>(scale_))
            digits.insert(0, static_cast<std::size_t>(scale_) + 1 - digits.size(), '0');
        digits.insert(digits.size() - static_cast<std::size_t>(scale_), 1, '.');
    }
    return negative ? "-" + digits : digits;
}

double Decimal::to_double() const
{
    double v = static_cast<double>(units_);
    for (int i = 0; i < scale_; ++i)
        v /= 10.0;
    return v;
}

std::ostream& operator<<(std::ostream& os, const Decimal& d)
{
    return os << d.to_string();
}
