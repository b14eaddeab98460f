#pragma once

#include <string>
#include <cstdint>
#include <core/types.hpp>

// A scaled storage metric as reported by the scheduler ("10.2G").
struct StorageValue {
    double size = 0.0;    // magnitude before scaling (10.2)
    std::string scale;    // unit suffix ("G")
    int64_t bytes = 0;    // size * decimal scale factor, truncated
};

// Decimal byte multiplier for a unit suffix: M = 10^6, G = 10^9, T = 10^12.
// Returns 0 for any other suffix.
int64_t storage_scale_factor(const std::string& scale);

// Parse "10.2G" / "512M" / "1.5T".
// Errors: Parse for empty input or a non-numeric magnitude,
//         UnsupportedUnit for any suffix other than M, G, T.
Result<StorageValue> parse_storage_value(const std::string& text);
