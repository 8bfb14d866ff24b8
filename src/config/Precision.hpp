#pragma once

#include <atomic>

namespace mcore::config {

struct PrecisionSettings;

// Process-wide default for operations that round without an explicit scale.
// Read on every such call, so reconfiguring takes effect immediately.
class Precision {
public:
    static constexpr int kDefaultScale = 20;

    static int default_scale() noexcept;

    // Throws domain::InvalidScale outside 0..domain::kMaxScale.
    static void set_default_scale(int scale);
    static void configure(const PrecisionSettings& settings);
    static void reset() noexcept;

private:
    static std::atomic<int> default_scale_;
};

} // namespace mcore::config
