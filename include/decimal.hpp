#pragma once
#include <cstdint>
#include <ostream>
#include <string>

/**
 * Fixed-point decimal number: an integer mantissa and a count of fractional digits.
 * value = units / 10^scale
 *
 * Used for every quantity, factor and emission value so that results keep the
 * number of fractional digits they are stored with (no binary floating point).
 * Operations that cannot be represented throw std::overflow_error.
 */
class Decimal
{
  public:
    static constexpr int kMaxScale = 18;

    enum class Rounding
    {
        HalfUp, // ties away from zero
        Down    // truncate toward zero
    };

    Decimal() = default;
    Decimal(std::int64_t units, int scale);

    static Decimal from_int(std::int64_t value) { return Decimal(value, 0); }

    // Strict parse: optional sign, digits, optional '.' and fraction digits.
    // Throws std::invalid_argument on anything else.
    static Decimal parse(const std::string& text);

    // Lenient parse for human-entered amounts: drops thousands separators, whitespace,
    // '$', '\'' and non-ASCII bytes (currency symbols such as £ or €) before parsing.
    static Decimal parse_formatted(const std::string& text);

    std::int64_t units() const { return units_; }
    int          scale() const { return scale_; }

    bool is_zero() const { return units_ == 0; }
    bool is_negative() const { return units_ < 0; }
    int  sign() const { return units_ > 0 ? 1 : (units_ < 0 ? -1 : 0); }

    // Change the number of fractional digits. Increasing is exact; decreasing rounds.
    Decimal quantize(int scale, Rounding mode = Rounding::HalfUp) const;

    // Exact division by 10^digits (only the scale moves).
    Decimal div_pow10(int digits) const;

    Decimal operator+(const Decimal& rhs) const;
    Decimal operator-(const Decimal& rhs) const;
    Decimal operator*(const Decimal& rhs) const; // exact: scale = lhs.scale + rhs.scale
    Decimal operator-() const;

    // Product rounded to `scale` fractional digits. The full product is kept in
    // 128 bits, so only the rounded result has to fit.
    Decimal multiply(const Decimal& rhs, int scale, Rounding mode = Rounding::HalfUp) const;
    Decimal& operator+=(const Decimal& rhs);

    // Numeric comparison, independent of scale: 1.50 == 1.5
    int  compare(const Decimal& rhs) const;
    bool operator==(const Decimal& rhs) const { return compare(rhs) == 0; }
    bool operator!=(const Decimal& rhs) const { return compare(rhs) != 0; }
    bool operator<(const Decimal& rhs) const { return compare(rhs) < 0; }
    bool operator<=(const Decimal& rhs) const { return compare(rhs) <= 0; }
    bool operator>(const Decimal& rhs) const { return compare(rhs) > 0; }
    bool operator>=(const Decimal& rhs) const { return compare(rhs) >= 0; }

    // Plain decimal text with exactly scale() fractional digits, e.g. "0.3000000".
    std::string to_string() const;

    // Lossy; only for display ratios, never for stored values.
    double to_double() const;

  private:
    std::int64_t units_ = 0;
    int          scale_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Decimal& d);
