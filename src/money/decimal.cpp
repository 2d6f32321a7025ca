/// @file src/money/decimal.cpp
/// @brief Exact decimal arithmetic on a GMP integer mantissa.

#include "pricenorm/decimal.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace pricenorm::money {

namespace {

/// 10^n as an arbitrary-precision integer.
mpz_class power_of_ten(unsigned n) {
    mpz_class p;
    mpz_ui_pow_ui(p.get_mpz_t(), 10, n);
    return p;
}

/// `v` rescaled from `from` to `to` fractional digits (to >= from).
mpz_class rescale(const mpz_class& v, unsigned from, unsigned to) {
    return v * power_of_ten(to - from);
}

/// Digits of |v|, left-padded with zeros to at least `min_len` characters.
std::string abs_digits(const mpz_class& v, std::size_t min_len) {
    mpz_class a = abs(v);
    std::string digits = a.get_str(10);
    if (digits.size() < min_len) {
        digits.insert(0, min_len - digits.size(), '0');
    }
    return digits;
}

bool is_digit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Decimal::Decimal(mpz_class unscaled, unsigned scale)
    : unscaled_(std::move(unscaled)), scale_(scale) {
    canonicalize();
}

Decimal::Decimal(long value) : unscaled_(value), scale_(0) {}

void Decimal::canonicalize() {
    if (unscaled_ == 0) {
        scale_ = 0;
        return;
    }
    while (scale_ > 0 && mpz_divisible_ui_p(unscaled_.get_mpz_t(), 10) != 0) {
        mpz_divexact_ui(unscaled_.get_mpz_t(), unscaled_.get_mpz_t(), 10);
        --scale_;
    }
}

// ─── from_string ──────────────────────────────────────────────────────────────

std::optional<Decimal> Decimal::from_string(std::string_view text) {
    if (text.empty()) return std::nullopt;

    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    std::string digits;
    digits.reserve(text.size());
    unsigned scale = 0;
    bool seen_point = false;

    for (char c : text) {
        if (c == '.') {
            if (seen_point) return std::nullopt;
            seen_point = true;
            continue;
        }
        if (!is_digit(c)) return std::nullopt;
        digits.push_back(c);
        if (seen_point) ++scale;
    }

    if (digits.empty()) return std::nullopt;

    mpz_class unscaled;
    if (unscaled.set_str(digits, 10) != 0) return std::nullopt;
    if (negative) unscaled = -unscaled;

    return Decimal(std::move(unscaled), scale);
}

// ─── Queries ──────────────────────────────────────────────────────────────────

bool Decimal::is_zero() const noexcept {
    return sgn(unscaled_) == 0;
}

bool Decimal::is_negative() const noexcept {
    return sgn(unscaled_) < 0;
}

Decimal Decimal::negated() const {
    return Decimal(-unscaled_, scale_);
}

// ─── rounded ──────────────────────────────────────────────────────────────────

Decimal Decimal::rounded(unsigned places) const {
    if (scale_ <= places) return *this;

    const mpz_class divisor = power_of_ten(scale_ - places);
    mpz_class quotient;
    mpz_class remainder;
    mpz_class magnitude = abs(unscaled_);
    mpz_tdiv_qr(quotient.get_mpz_t(), remainder.get_mpz_t(),
                magnitude.get_mpz_t(), divisor.get_mpz_t());

    // Half away from zero: round the magnitude up on remainder >= divisor/2.
    if (remainder * 2 >= divisor) {
        quotient += 1;
    }
    if (is_negative()) quotient = -quotient;

    return Decimal(std::move(quotient), places);
}

// ─── Rendering ────────────────────────────────────────────────────────────────

std::string Decimal::to_string() const {
    std::string digits = abs_digits(unscaled_, scale_ + 1);
    if (scale_ > 0) {
        digits.insert(digits.size() - scale_, 1, '.');
    }
    if (is_negative()) digits.insert(0, 1, '-');
    return digits;
}

std::string Decimal::to_grouped_string(unsigned places, char group, char decimal) const {
    const Decimal r = rounded(places);
    const mpz_class fixed = rescale(r.unscaled_, r.scale_, places);
    const std::string digits = abs_digits(fixed, places + 1);

    const std::string int_part  = digits.substr(0, digits.size() - places);
    const std::string frac_part = digits.substr(digits.size() - places);

    std::string out;
    out.reserve(digits.size() + digits.size() / 3 + 2);
    if (r.is_negative()) out.push_back('-');

    for (std::size_t i = 0; i < int_part.size(); ++i) {
        if (i > 0 && (int_part.size() - i) % 3 == 0) {
            out.push_back(group);
        }
        out.push_back(int_part[i]);
    }
    if (places > 0) {
        out.push_back(decimal);
        out += frac_part;
    }
    return out;
}

// ─── Comparison ───────────────────────────────────────────────────────────────

bool Decimal::operator==(const Decimal& other) const noexcept {
    // Both sides are canonical.
    return scale_ == other.scale_ && unscaled_ == other.unscaled_;
}

std::strong_ordering Decimal::operator<=>(const Decimal& other) const {
    int c = 0;
    if (scale_ == other.scale_) {
        c = cmp(unscaled_, other.unscaled_);
    } else if (scale_ < other.scale_) {
        c = cmp(rescale(unscaled_, scale_, other.scale_), other.unscaled_);
    } else {
        c = cmp(unscaled_, rescale(other.unscaled_, other.scale_, scale_));
    }
    if (c < 0) return std::strong_ordering::less;
    if (c > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

} // namespace pricenorm::money
