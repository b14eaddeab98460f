#include "resource.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <limits>

Result<Resource> ResourceList::find(const std::string& key) const {
    for (const auto& r : resources_) {
        if (r.name == key) return Result<Resource>::Ok(r);
    }
    return Result<Resource>::Err(ErrorKind::NotFound,
                                 fmt::format("resource '{}' not found", key));
}

Result<double> ResourceList::get_float(const std::string& key) const {
    auto found = find(key);
    if (found.is_err()) return Result<double>::Fail(found);

    auto v = parse_double(found.value.value);
    if (!v) {
        return Result<double>::Err(ErrorKind::Parse,
            fmt::format("resource '{}': '{}' is not a number", key, found.value.value));
    }
    return Result<double>::Ok(*v);
}

Result<int64_t> ResourceList::get_integer(const std::string& key) const {
    auto found = find(key);
    if (found.is_err()) return Result<int64_t>::Fail(found);

    auto v = parse_int64(found.value.value);
    if (!v) {
        return Result<int64_t>::Err(ErrorKind::Parse,
            fmt::format("resource '{}': '{}' is not an integer", key, found.value.value));
    }
    return Result<int64_t>::Ok(*v);
}

Result<StorageValue> ResourceList::get_storage(const std::string& key) const {
    auto found = find(key);
    if (found.is_err()) return Result<StorageValue>::Fail(found);

    auto sv = parse_storage_value(found.value.value);
    if (sv.is_err()) {
        return Result<StorageValue>::Err(sv.kind,
            fmt::format("resource '{}': {}", key, sv.error));
    }
    return sv;
}

Result<double> ResourceList::load(const std::string& window) const {
    return get_float("load_" + window);
}

Result<int32_t> ResourceList::num_processors() const {
    auto n = get_integer("num_proc");
    if (n.is_err()) return Result<int32_t>::Fail(n);

    if (n.value < std::numeric_limits<int32_t>::min() ||
        n.value > std::numeric_limits<int32_t>::max()) {
        return Result<int32_t>::Err(ErrorKind::Parse,
            fmt::format("num_proc {} out of 32-bit range", n.value));
    }
    return Result<int32_t>::Ok(static_cast<int32_t>(n.value));
}
