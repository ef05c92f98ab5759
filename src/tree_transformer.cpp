#include "tree_transformer.hpp"

#include <algorithm>
#include <format>

#include "errors.hpp"

namespace querywalk {
    auto TreeTransformer::visit(const NodePtr& tree, const Context& context) const
        -> TraversalResult<NodePtr> {
        auto replacements = visit_node(tree, context);
        if (!replacements) {
            return std::unexpected(std::move(replacements).error());
        }
        if (replacements->size() != 1) {
            return std::unexpected(TraversalError(
                TraversalError::Kind::ArityViolation,
                std::format(
                    "the transformation did not produce exactly one result, {}, got {}",
                    errors::expected_exactly("1 node for the tree root"),
                    replacements->size()
                ),
                tree->to_json_shallow()
            ));
        }
        return std::move(replacements->front());
    }

    auto TreeTransformer::visit_node(const NodePtr& node, const Context& context) const
        -> Outcome {
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

        const auto* handler = m_handlers.resolve(node->kind());
        auto replacements = handler ? (*handler)(node, context) : generic_visit(node, context);
        auto is_missing = [](const NodePtr& replacement) { return !replacement; };
        if (replacements && std::ranges::any_of(*replacements, is_missing)) {
            return std::unexpected(TraversalError(
                TraversalError::Kind::MissingNode,
                errors::missing_in(
                    "node",
                    std::format("the replacements of {}", node->kind_name())
                ),
                node->to_json_shallow()
            ));
        }
        return replacements;
    }

    auto TreeTransformer::visit_children(const NodePtr& node, const Context& context) const
        -> Outcome {
        Replacements new_children;
        auto children = node->children();
        new_children.reserve(children.size());

        for (uint32_t index = 0; index < children.size(); ++index) {
            auto replacements = visit_node(children[index], child_context(node, index, context));
            if (!replacements) {
                return std::unexpected(std::move(replacements).error());
            }
            for (auto& replacement : *replacements) {
                new_children.push_back(std::move(replacement));
            }
        }
        return new_children;
    }

    auto TreeTransformer::rebuild(const NodePtr& node, const Context& context) const
        -> TraversalResult<NodePtr> {
        auto new_children = visit_children(node, context);
        if (!new_children) {
            return std::unexpected(std::move(new_children).error());
        }

        const auto child_count = new_children->size();
        auto new_node = node->with_children(std::move(*new_children));
        if (!new_node) {
            return std::unexpected(TraversalError(
                TraversalError::Kind::ChildCountMismatch,
                std::format(
                    "{}, got {}",
                    errors::expected_for(
                        std::format("{} children", node->arity().to_string()),
                        node->kind_name()
                    ),
                    child_count
                ),
                node->to_json_shallow()
            ));
        }
        return std::move(*new_node);
    }

    auto TreeTransformer::generic_visit(const NodePtr& node, const Context& context) const
        -> Outcome {
        auto new_node = rebuild(node, context);
        if (!new_node) {
            return std::unexpected(std::move(new_node).error());
        }
        return Replacements { std::move(*new_node) };
    }

    auto TreeTransformer::child_context(
        const NodePtr& node,
        uint32_t index,
        const Context& context
    ) const -> Context {
        auto child = context.descend();
        if (m_options.track_parents) {
            child = child.with_parent(node);
        }
        if (m_options.track_new_parents) {
            child = child.with_new_parent(node);
        }
        if (m_options.track_path) {
            child = child.with_path_index(index);
        }
        return child;
    }
}  // namespace querywalk
