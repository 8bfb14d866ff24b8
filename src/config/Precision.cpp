#include "config/Precision.hpp"

#include "config/Settings.hpp"
#include "domain/errors/MoneyErrors.hpp"

namespace mcore::config {

std::atomic<int> Precision::default_scale_{Precision::kDefaultScale};

int Precision::default_scale() noexcept {
    return default_scale_.load(std::memory_order_relaxed);
}

void Precision::set_default_scale(int scale) {
    if (scale < 0 || scale > domain::kMaxScale) {
        throw domain::InvalidScale(scale);
    }
    default_scale_.store(scale, std::memory_order_relaxed);
}

void Precision::configure(const PrecisionSettings& settings) {
    set_default_scale(settings.default_scale);
}

void Precision::reset() noexcept {
    default_scale_.store(kDefaultScale, std::memory_order_relaxed);
}

} // namespace mcore::config
