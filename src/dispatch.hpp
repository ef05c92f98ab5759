#pragma once

#include <format>
#include <utility>

#include "common.hpp"
#include "errors.hpp"
#include "node.hpp"
#include "traversal_error.hpp"

namespace querywalk {
    // Handlers keyed by node kind, abstract kinds included. A node resolves to the
    // handler of the first kind in its ancestry that has one.
    template<typename Handler>
    class DispatchTable {
    public:
        auto on(Node::Kind kind, Handler handler) -> void {
            m_handlers.insert_or_assign(kind, std::move(handler));
        }
        auto on(std::string_view name, Handler handler) -> TraversalResult<void> {
            auto kind = Node::kind_from_name(name);
            if (!kind) {
                return std::unexpected(TraversalError(
                    TraversalError::Kind::UnknownKind,
                    errors::unknown(std::format("node kind {}", errors::quoted(name)))
                ));
            }
            on(*kind, std::move(handler));
            return {};
        }

        [[nodiscard]] auto contains(Node::Kind kind) const -> bool {
            return m_handlers.contains(kind);
        }
        [[nodiscard]] auto empty() const -> bool {
            return m_handlers.empty();
        }

        // Kind whose handler applies to `kind`, if any.
        [[nodiscard]] auto resolve_kind(Node::Kind kind) const -> Option<Node::Kind> {
            for (auto candidate : Node::ancestry(kind)) {
                if (m_handlers.contains(candidate)) {
                    return candidate;
                }
            }
            return std::nullopt;
        }
        [[nodiscard]] auto resolve(Node::Kind kind) const -> const Handler* {
            auto resolved = resolve_kind(kind);
            if (!resolved) {
                return nullptr;
            }
            return &m_handlers.at(*resolved);
        }

    private:
        Map<Node::Kind, Handler> m_handlers;
    };
}  // namespace querywalk
