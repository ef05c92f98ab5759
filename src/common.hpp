#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace querywalk {
    /* vendors */
    using Json = nlohmann::ordered_json;

    /* smart pointers */
    template<typename T>
    using Rc = std::shared_ptr<const T>;

    /* containers */
    template<typename T>
    using Vec = std::vector<T>;

    template<typename T>
    using Span = std::span<const T>;

    template<typename K, typename V>
    using Map = std::unordered_map<K, V>;

    /* monads */
    template<typename T, typename E>
    using Result = std::expected<T, E>;

    template<typename T>
    using Option = std::optional<T>;
}  // namespace querywalk
