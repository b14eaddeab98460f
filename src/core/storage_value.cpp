#include "storage_value.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cmath>

int64_t storage_scale_factor(const std::string& scale) {
    if (scale == "M") return 1000LL * 1000;
    if (scale == "G") return 1000LL * 1000 * 1000;
    if (scale == "T") return 1000LL * 1000 * 1000 * 1000;
    return 0;
}

Result<StorageValue> parse_storage_value(const std::string& text) {
    if (text.empty()) {
        return Result<StorageValue>::Err(ErrorKind::Parse, "empty storage value");
    }

    StorageValue sv;
    sv.scale = text.substr(text.size() - 1);

    auto size = parse_double(text.substr(0, text.size() - 1));
    if (!size) {
        return Result<StorageValue>::Err(ErrorKind::Parse,
            fmt::format("invalid storage magnitude in '{}'", text));
    }
    sv.size = *size;

    int64_t factor = storage_scale_factor(sv.scale);
    if (factor == 0) {
        return Result<StorageValue>::Err(ErrorKind::UnsupportedUnit,
            fmt::format("unsupported storage unit '{}' in '{}'", sv.scale, text));
    }

    // [-2^63, 2^63) is exactly the range that converts to int64 without UB
    constexpr double INT64_LIMIT = 9223372036854775808.0;
    double bytes = sv.size * static_cast<double>(factor);
    if (!std::isfinite(bytes) || bytes < -INT64_LIMIT || bytes >= INT64_LIMIT) {
        return Result<StorageValue>::Err(ErrorKind::Parse,
            fmt::format("storage value '{}' does not fit in 64-bit bytes", text));
    }
    sv.bytes = static_cast<int64_t>(bytes);

    return Result<StorageValue>::Ok(sv);
}
