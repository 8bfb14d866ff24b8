#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace mcore::domain {

enum class Currency {
    PLN, EUR, USD, GBP, CHF, CZK, DKK, SEK, NOK, HUF,
    RON, BGN, UAH, TRY, JPY, CNY, AUD, CAD, NZD, ZAR,
    BRL, MXN, INR, KRW, SGD, HKD, THB, IDR, MYR, PHP,
    SAR, KWD, QAR, OMR, AED, BHD, IQD, SYP, EGP,
};

inline constexpr std::size_t kCurrencyCount = 39;

const std::array<Currency, kCurrencyCount>& all_currencies() noexcept;

// Exact, case-sensitive match against the recognized codes.
bool is_valid_currency(const std::string& code) noexcept;
bool is_valid_currency(Currency currency) noexcept;

// Throws InvalidCurrency for codes outside the recognized set.
Currency currency_from_string(const std::string& code);

// Throws InvalidCurrency for a value outside the enumeration.
std::string to_string(Currency currency);

} // namespace mcore::domain
