#include "domain/value_objects/Currency.hpp"

#include "domain/errors/MoneyErrors.hpp"

#include <algorithm>

namespace mcore::domain {

namespace {

struct CurrencyEntry {
    Currency currency;
    const char* code;
};

constexpr std::array<CurrencyEntry, kCurrencyCount> kEntries{{
    {Currency::PLN, "PLN"}, {Currency::EUR, "EUR"}, {Currency::USD, "USD"},
    {Currency::GBP, "GBP"}, {Currency::CHF, "CHF"}, {Currency::CZK, "CZK"},
    {Currency::DKK, "DKK"}, {Currency::SEK, "SEK"}, {Currency::NOK, "NOK"},
    {Currency::HUF, "HUF"}, {Currency::RON, "RON"}, {Currency::BGN, "BGN"},
    {Currency::UAH, "UAH"}, {Currency::TRY, "TRY"}, {Currency::JPY, "JPY"},
    {Currency::CNY, "CNY"}, {Currency::AUD, "AUD"}, {Currency::CAD, "CAD"},
    {Currency::NZD, "NZD"}, {Currency::ZAR, "ZAR"}, {Currency::BRL, "BRL"},
    {Currency::MXN, "MXN"}, {Currency::INR, "INR"}, {Currency::KRW, "KRW"},
    {Currency::SGD, "SGD"}, {Currency::HKD, "HKD"}, {Currency::THB, "THB"},
    {Currency::IDR, "IDR"}, {Currency::MYR, "MYR"}, {Currency::PHP, "PHP"},
    {Currency::SAR, "SAR"}, {Currency::KWD, "KWD"}, {Currency::QAR, "QAR"},
    {Currency::OMR, "OMR"}, {Currency::AED, "AED"}, {Currency::BHD, "BHD"},
    {Currency::IQD, "IQD"}, {Currency::SYP, "SYP"}, {Currency::EGP, "EGP"},
}};

const CurrencyEntry* find_entry(Currency currency) noexcept {
    auto it = std::find_if(kEntries.begin(), kEntries.end(),
                           [&](const CurrencyEntry& e) { return e.currency == currency; });
    return it == kEntries.end() ? nullptr : &*it;
}

const CurrencyEntry* find_entry(const std::string& code) noexcept {
    auto it = std::find_if(kEntries.begin(), kEntries.end(),
                           [&](const CurrencyEntry& e) { return code == e.code; });
    return it == kEntries.end() ? nullptr : &*it;
}

} // namespace

const std::array<Currency, kCurrencyCount>& all_currencies() noexcept {
    static const std::array<Currency, kCurrencyCount> currencies = [] {
        std::array<Currency, kCurrencyCount> out{};
        for (std::size_t i = 0; i < kEntries.size(); ++i) {
            out[i] = kEntries[i].currency;
        }
        return out;
    }();
    return currencies;
}

bool is_valid_currency(const std::string& code) noexcept {
    return find_entry(code) != nullptr;
}

bool is_valid_currency(Currency currency) noexcept {
    return find_entry(currency) != nullptr;
}

Currency currency_from_string(const std::string& code) {
    const auto* entry = find_entry(code);
    if (!entry) {
        throw InvalidCurrency(code);
    }
    return entry->currency;
}

std::string to_string(Currency currency) {
    const auto* entry = find_entry(currency);
    if (!entry) {
        throw InvalidCurrency(std::to_string(static_cast<int>(currency)));
    }
    return entry->code;
}

} // namespace mcore::domain
