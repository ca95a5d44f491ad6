/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
*/

#pragma once

#include <chunkport/log/log.hpp>
#include <chunkport/util/error_code.hpp>
#include <chunkport/util/preprocess.hpp>

#include <fmt/format.h>

namespace chunkport {

namespace util::detail {

template<ErrorCode code, ErrorCategory error_category>
struct Raise {
    static_assert(get_error_category(code) == error_category);

    template<typename...Args>
    [[noreturn]] void operator()(fmt::format_string<Args...> format, Args&&...args) const {
        std::string msg = fmt::format("{} {}", error_code_data<code>.name_,
                                      fmt::vformat(format, fmt::make_format_args(args...)));
        if constexpr(error_category == ErrorCategory::INTERNAL)
            log::root().error(msg);
        throw_error<code>(msg);
    }
};

template<ErrorCode code, ErrorCategory error_category>
struct Check {
    static constexpr Raise<code, error_category> raise{};

    template<typename...Args>
    void operator()(bool cond, fmt::format_string<Args...> format, Args&&...args) const {
        if (CHUNKPORT_UNLIKELY(!cond)) {
            raise(format, std::forward<Args>(args)...);
        }
    }
};
} // namespace util::detail

namespace internal {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::INTERNAL>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace configuration {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::CONFIGURATION>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace sizing {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::SIZING>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace chunk_write {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::CHUNK_WRITE>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace storage {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::STORAGE>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace missing_data {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::MISSING_DATA>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace util {

    constexpr auto check = util::detail::Check<ErrorCode::E_ASSERTION_FAILURE, ErrorCategory::INTERNAL>{};

    constexpr auto check_range_impl = util::detail::Check<ErrorCode::E_INVALID_RANGE, ErrorCategory::INTERNAL>{};

inline void check_range(size_t idx, size_t size, const char *msg) {
    check_range_impl(idx < size, "{} expected  0 <= idx < size, actual idx={}, size={}", msg, idx, size);
}

constexpr auto check_arg = util::detail::Check<ErrorCode::E_INVALID_ARGUMENT, ErrorCategory::INTERNAL>{};

constexpr auto raise_rte = check.raise;

template<typename...Args>
void warn(bool cond, fmt::format_string<Args...> format, Args&&...args) {
    if (CHUNKPORT_UNLIKELY(!cond)) {
        log::root().warn("ASSERTION WARNING: {}", fmt::vformat(format, fmt::make_format_args(args...)));
    }
}

} // namespace util

} // namespace chunkport
