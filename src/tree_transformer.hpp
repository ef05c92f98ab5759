#pragma once

#include <functional>

#include "common.hpp"
#include "context.hpp"
#include "dispatch.hpp"
#include "node.hpp"
#include "traversal_error.hpp"

namespace querywalk {
    // Rebuilds a query tree bottom-up.
    //
    // Every handler returns the nodes replacing the one it was given: none deletes
    // it, several fan it out into siblings. `generic_visit` visits the children,
    // splices their replacements in order and rebuilds the node around them,
    // keeping its other attributes. Only the whole tree must come out as a single
    // node.
    class TreeTransformer {
    public:
        using Replacements = Vec<NodePtr>;
        using Outcome = TraversalResult<Replacements>;
        using Handler = std::function<Outcome(const NodePtr&, const Context&)>;

        explicit TreeTransformer(TraversalOptions options = {}) : m_options(options) {}
        virtual ~TreeTransformer() = default;
        TreeTransformer(const TreeTransformer&) = delete;
        TreeTransformer(TreeTransformer&&) = delete;
        auto operator=(const TreeTransformer&) -> TreeTransformer& = delete;
        auto operator=(TreeTransformer&&) -> TreeTransformer& = delete;

        [[nodiscard]] auto options() const -> const TraversalOptions& {
            return m_options;
        }

        auto on(Node::Kind kind, Handler handler) -> void {
            m_handlers.on(kind, std::move(handler));
        }
        auto on(std::string_view name, Handler handler) -> TraversalResult<void> {
            return m_handlers.on(name, std::move(handler));
        }

        auto visit(const NodePtr& tree, const Context& context = {}) const
            -> TraversalResult<NodePtr>;

        auto visit_node(const NodePtr& node, const Context& context) const -> Outcome;

        // Replacements of all children of `node`, concatenated in child order.
        auto visit_children(const NodePtr& node, const Context& context) const -> Outcome;
        // `node` rebuilt around the replacements of its children.
        auto rebuild(const NodePtr& node, const Context& context) const
            -> TraversalResult<NodePtr>;

        virtual auto generic_visit(const NodePtr& node, const Context& context) const -> Outcome;
        virtual auto child_context(const NodePtr& node, uint32_t index, const Context& context)
            const -> Context;

    private:
        TraversalOptions m_options;
        DispatchTable<Handler> m_handlers;
    };
}  // namespace querywalk
