#pragma once

#include <concepts>
#include <cstdint>
#include <format>
#include <string_view>

namespace querywalk::errors {
    static constexpr uint32_t DEFAULT_MAX_DEPTH = 1024;

    inline auto exceeded(std::convertible_to<std::string_view> auto item) {
        return std::format("exceeded {}", item);
    }

    inline auto expected_exactly(std::convertible_to<std::string_view> auto item) {
        return std::format("expected exactly {}", item);
    }
    inline auto expected_for(
        std::convertible_to<std::string_view> auto item,
        std::convertible_to<std::string_view> auto context
    ) {
        return std::format("expected {} for {}", item, context);
    }

    inline auto missing_at(
        std::convertible_to<std::string_view> auto item,
        std::convertible_to<std::string_view> auto context
    ) {
        return std::format("missing {} at {}", item, context);
    }
    inline auto missing_in(
        std::convertible_to<std::string_view> auto item,
        std::convertible_to<std::string_view> auto context
    ) {
        return std::format("missing {} in {}", item, context);
    }

    inline auto unknown(std::convertible_to<std::string_view> auto item) {
        return std::format("unknown {}", item);
    }

    inline auto quoted(std::convertible_to<std::string_view> auto item) {
        return std::format("'{}'", item);
    }
}  // namespace querywalk::errors
