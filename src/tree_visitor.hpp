#pragma once

#include <format>
#include <functional>
#include <utility>

#include "common.hpp"
#include "context.hpp"
#include "dispatch.hpp"
#include "errors.hpp"
#include "node.hpp"
#include "traversal_error.hpp"

namespace querywalk {
    // Read-only depth-first walk over a query tree.
    //
    // Handlers are registered per node kind with `on`. A node without a handler for
    // its kind or any of its abstract ancestors goes to `generic_visit`, which emits
    // nothing and visits the children in order. Handlers append their results to
    // the output and may call `generic_visit` themselves to continue into the
    // subtree; emitting before that call yields parents before children.
    template<typename R>
    class TreeVisitor {
    public:
        using Output = Vec<R>;
        using Status = TraversalResult<void>;
        using Handler = std::function<Status(const NodePtr&, const Context&, Output&)>;

        explicit TreeVisitor(TraversalOptions options = {}) : m_options(options) {}
        virtual ~TreeVisitor() = default;
        TreeVisitor(const TreeVisitor&) = delete;
        TreeVisitor(TreeVisitor&&) = delete;
        auto operator=(const TreeVisitor&) -> TreeVisitor& = delete;
        auto operator=(TreeVisitor&&) -> TreeVisitor& = delete;

        [[nodiscard]] auto options() const -> const TraversalOptions& {
            return m_options;
        }

        auto on(Node::Kind kind, Handler handler) -> void {
            m_handlers.on(kind, std::move(handler));
        }
        auto on(std::string_view name, Handler handler) -> TraversalResult<void> {
            return m_handlers.on(name, std::move(handler));
        }

        // Results of every handler over `tree`. Nothing is returned when the walk fails.
        auto visit(const NodePtr& tree, const Context& context = {}) const
            -> TraversalResult<Output> {
            Output output;
            auto status = visit_node(tree, context, output);
            if (!status) {
                return std::unexpected(std::move(status).error());
            }
            return output;
        }

        auto visit_node(const NodePtr& node, const Context& context, Output& output) const
            -> Status {
            if (!node) {
                return std::unexpected(TraversalError(
                    TraversalError::Kind::MissingNode,
                    errors::missing_at("node", std::format("depth {}", context.depth()))
                ));
            }
            if (context.depth() > m_options.max_depth) {
                return std::unexpected(TraversalError(
                    TraversalError::Kind::DepthExceeded,
                    errors::exceeded(std::format("maximum tree depth of {}", m_options.max_depth)),
                    node->to_json_shallow()
                ));
            }
            if (const auto* handler = m_handlers.resolve(node->kind())) {
                return (*handler)(node, context, output);
            }
            return generic_visit(node, context, output);
        }

        virtual auto generic_visit(const NodePtr& node, const Context& context, Output& output)
            const -> Status {
            auto children = node->children();
            for (uint32_t index = 0; index < children.size(); ++index) {
                auto status =
                    visit_node(children[index], child_context(node, index, context), output);
                if (!status) {
                    return status;
                }
            }
            return {};
        }

        virtual auto child_context(const NodePtr& node, uint32_t index, const Context& context)
            const -> Context {
            auto child = context.descend();
            if (m_options.track_parents) {
                child = child.with_parent(node);
            }
            if (m_options.track_path) {
                child = child.with_path_index(index);
            }
            return child;
        }

    private:
        TraversalOptions m_options;
        DispatchTable<Handler> m_handlers;
    };
}  // namespace querywalk
