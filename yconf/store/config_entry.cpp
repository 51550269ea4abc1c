/*
 * config_entry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-20

Description: One addressable leaf of the configuration store

**************************************************/

#include "config_entry.hpp"

#include <optional>

namespace yconf::store {
auto to_string(EntryOrigin origin) -> std::string_view {
    switch (origin) {
        case EntryOrigin::Parsed:
            return "parsed";
        case EntryOrigin::Api:
            return "api";
    }
    return "unknown";
}

ConfigEntry::ConfigEntry(std::string path, type::Scalar value,
                         std::string description, EntryOrigin origin)
    : path_(std::move(path)),
      values_{std::move(value)},
      array_(false),
      description_(std::move(description)),
      origin_(origin) {}

ConfigEntry::ConfigEntry(std::string path, std::vector<type::Scalar> values,
                         std::string description, EntryOrigin origin)
    : path_(std::move(path)),
      values_(std::move(values)),
      array_(true),
      description_(std::move(description)),
      origin_(origin) {}

auto ConfigEntry::value() const -> const type::Scalar& {
    if (array_) {
        THROW_TYPE_ERROR("'{}' is an array of {} elements, not a scalar",
                         path_, values_.size());
    }
    return values_.front();
}

auto ConfigEntry::element(std::size_t index) const -> const type::Scalar& {
    if (index >= values_.size()) {
        THROW_BOUNDS_ERROR("index {} is out of bounds for '{}' of size {}",
                           index, path_, values_.size());
    }
    return values_[index];
}

auto ConfigEntry::kind() const -> type::ScalarKind {
    if (values_.empty()) {
        return type::ScalarKind::Null;
    }
    const auto first = values_.front().kind();
    for (const auto& scalar : values_) {
        if (scalar.kind() != first) {
            THROW_TYPE_ERROR("'{}' mixes {} and {} elements", path_,
                             type::to_string(first),
                             type::to_string(scalar.kind()));
        }
    }
    return first;
}

auto ConfigEntry::is_homogeneous() const -> bool {
    for (const auto& scalar : values_) {
        if (scalar.kind() != values_.front().kind()) {
            return false;
        }
    }
    return true;
}

auto ConfigEntry::compatible(type::ScalarKind current,
                             type::Scalar& incoming) const -> bool {
    const auto kind = incoming.kind();
    if (current == type::ScalarKind::Null || current == kind) {
        return true;
    }
    if (current == type::ScalarKind::Real &&
        kind == type::ScalarKind::Integer) {
        incoming = type::Scalar::from(incoming.as_real());
        return true;
    }
    return false;
}

void ConfigEntry::assign(type::Scalar value) {
    if (array_) {
        THROW_TYPE_ERROR("'{}' is an array; it cannot be updated with a "
                         "scalar",
                         path_);
    }
    const auto current = values_.front().kind();
    if (!compatible(current, value)) {
        THROW_TYPE_ERROR("cannot update {} entry '{}' with a {} value",
                         type::to_string(current), path_,
                         type::to_string(value.kind()));
    }
    values_.front() = std::move(value);
}

void ConfigEntry::assign(std::vector<type::Scalar> values) {
    if (!array_) {
        THROW_TYPE_ERROR("'{}' is a scalar; it cannot be updated with an "
                         "array",
                         path_);
    }

    // Only a homogeneous, non-null array constrains the incoming kinds.
    std::optional<type::ScalarKind> current;
    if (!values_.empty() && is_homogeneous() &&
        values_.front().kind() != type::ScalarKind::Null) {
        current = values_.front().kind();
    }
    if (current) {
        for (auto& scalar : values) {
            if (!compatible(*current, scalar)) {
                THROW_TYPE_ERROR(
                    "cannot update {} array '{}' with a {} element",
                    type::to_string(*current), path_,
                    type::to_string(scalar.kind()));
            }
        }
    }
    values_ = std::move(values);
}

auto ConfigEntry::same_value(const ConfigEntry& other) const -> bool {
    if (array_ != other.array_ || values_.size() != other.values_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < values_.size(); ++i) {
        if (!values_[i].same_value(other.values_[i])) {
            return false;
        }
    }
    return true;
}
}  // namespace yconf::store
