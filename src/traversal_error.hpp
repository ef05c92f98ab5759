#pragma once

#include <utility>

#include "common.hpp"

namespace querywalk {
    namespace term {
        static constexpr std::string_view RESET = "\033[0m";
        static constexpr std::string_view BOLD = "\033[1m";
        static constexpr std::string_view RED = "\033[31m";
    }  // namespace term

    class TraversalError {
    public:
        enum class Kind : uint8_t {
            ArityViolation,
            ChildCountMismatch,
            DepthExceeded,
            MissingNode,
            UnknownKind,
        };

        TraversalError(Kind kind, std::string message, Json node = {})
            : m_kind(kind)
            , m_message(std::move(message))
            , m_node(std::move(node)) {}

        [[nodiscard]] auto kind() const -> Kind {
            return m_kind;
        }
        [[nodiscard]] auto kind_name() const -> std::string_view;
        [[nodiscard]] auto message() const -> std::string_view {
            return m_message;
        }
        // Dump of the node the error was raised on, null when there is none.
        [[nodiscard]] auto node() const -> const Json& {
            return m_node;
        }

        [[nodiscard]] auto format(bool colored = false) const -> std::string;
        [[nodiscard]] auto to_json() const -> Json;

    private:
        Kind m_kind;
        std::string m_message;
        Json m_node;
    };

    template<typename T>
    using TraversalResult = Result<T, TraversalError>;
}  // namespace querywalk
