#pragma once

#include <any>
#include <type_traits>
#include <utility>

#include "common.hpp"
#include "errors.hpp"
#include "node.hpp"

namespace querywalk {
    struct TraversalOptions {
        // Record the strict ancestors of the original tree in `Context::parents()`.
        bool track_parents = false;
        // Record the ancestors being rebuilt in `Context::new_parents()` (transformer only).
        bool track_new_parents = false;
        // Record child indices from the root in `Context::path()`.
        bool track_path = false;
        uint32_t max_depth = errors::DEFAULT_MAX_DEPTH;
    };

    // State handed to every handler. Values set by the caller are visible at every
    // depth. Deriving a context never changes the one it was derived from.
    class Context {
    public:
        Context() = default;

        template<typename T>
        [[nodiscard]] auto with(std::string key, T&& value) const -> Context {
            auto context = *this;
            auto values = m_values ? std::make_shared<Map<std::string, std::any>>(*m_values)
                                   : std::make_shared<Map<std::string, std::any>>();
            if constexpr (std::is_convertible_v<T, std::string_view>) {
                (*values)[std::move(key)] = std::string(std::string_view(value));
            } else {
                (*values)[std::move(key)] = std::decay_t<T>(std::forward<T>(value));
            }
            context.m_values = std::move(values);
            return context;
        }

        // Empty when the key is missing or holds another type.
        template<typename T>
        [[nodiscard]] auto get(std::string_view key) const -> Option<T> {
            const auto* value = find(key);
            if (value == nullptr) {
                return std::nullopt;
            }
            if (const auto* typed = std::any_cast<T>(value)) {
                return *typed;
            }
            return std::nullopt;
        }
        template<typename T>
        [[nodiscard]] auto get_or(std::string_view key, T fallback) const -> T {
            return get<T>(key).value_or(std::move(fallback));
        }
        [[nodiscard]] auto contains(std::string_view key) const -> bool {
            return find(key) != nullptr;
        }

        // Root first, immediate parent last. Empty at the root and when not tracked.
        [[nodiscard]] auto parents() const -> const Vec<NodePtr>& {
            return m_parents;
        }
        [[nodiscard]] auto new_parents() const -> const Vec<NodePtr>& {
            return m_new_parents;
        }
        [[nodiscard]] auto path() const -> const Vec<uint32_t>& {
            return m_path;
        }
        [[nodiscard]] auto depth() const -> uint32_t {
            return m_depth;
        }

        [[nodiscard]] auto has_ancestor(Node::Kind kind) const -> bool;
        [[nodiscard]] auto has_new_ancestor(Node::Kind kind) const -> bool;

        [[nodiscard]] auto descend() const -> Context;
        [[nodiscard]] auto with_parent(NodePtr parent) const -> Context;
        [[nodiscard]] auto with_new_parent(NodePtr parent) const -> Context;
        [[nodiscard]] auto with_path_index(uint32_t index) const -> Context;

    private:
        [[nodiscard]] auto find(std::string_view key) const -> const std::any*;

        Rc<Map<std::string, std::any>> m_values;
        Vec<NodePtr> m_parents;
        Vec<NodePtr> m_new_parents;
        Vec<uint32_t> m_path;
        uint32_t m_depth {};
    };
}  // namespace querywalk
