/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>
#include <functional>

namespace utils {

// A UUID whose type is distinct per Tag, so that ids of different kinds
// cannot be mixed up.
template <typename Tag>
class tagged_uuid {
    boost::uuids::uuid _id = boost::uuids::nil_uuid();
public:
    tagged_uuid() = default;
    explicit tagged_uuid(const boost::uuids::uuid& id) noexcept : _id(id) {}

    static tagged_uuid create_random_id() {
        static thread_local boost::uuids::random_generator gen;
        return tagged_uuid(gen());
    }
    static tagged_uuid create_null_id() noexcept {
        return tagged_uuid();
    }

    const boost::uuids::uuid& uuid() const noexcept {
        return _id;
    }
    bool is_null() const noexcept {
        return _id.is_nil();
    }
    explicit operator bool() const noexcept {
        return !is_null();
    }
    std::string to_sstring() const {
        return boost::uuids::to_string(_id);
    }

    friend bool operator==(const tagged_uuid&, const tagged_uuid&) noexcept = default;
    friend bool operator<(const tagged_uuid& x, const tagged_uuid& y) noexcept {
        return x._id < y._id;
    }
};

} // namespace utils

template <typename Tag>
struct std::hash<utils::tagged_uuid<Tag>> {
    size_t operator()(const utils::tagged_uuid<Tag>& id) const noexcept {
        return boost::uuids::hash_value(id.uuid());
    }
};

template <typename Tag>
struct fmt::formatter<utils::tagged_uuid<Tag>> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const utils::tagged_uuid<Tag>& id, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", id.to_sstring());
    }
};
