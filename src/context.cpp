#include "context.hpp"

#include <algorithm>

namespace querywalk {
    namespace {
        auto contains_kind(const Vec<NodePtr>& chain, Node::Kind kind) -> bool {
            return std::ranges::any_of(chain, [kind](const auto& node) {
                return node->is_a(kind);
            });
        }
    }  // namespace

    auto Context::has_ancestor(Node::Kind kind) const -> bool {
        return contains_kind(m_parents, kind);
    }
    auto Context::has_new_ancestor(Node::Kind kind) const -> bool {
        return contains_kind(m_new_parents, kind);
    }

    auto Context::descend() const -> Context {
        auto context = *this;
        context.m_depth++;
        return context;
    }
    auto Context::with_parent(NodePtr parent) const -> Context {
        auto context = *this;
        context.m_parents.push_back(std::move(parent));
        return context;
    }
    auto Context::with_new_parent(NodePtr parent) const -> Context {
        auto context = *this;
        context.m_new_parents.push_back(std::move(parent));
        return context;
    }
    auto Context::with_path_index(uint32_t index) const -> Context {
        auto context = *this;
        context.m_path.push_back(index);
        return context;
    }

    auto Context::find(std::string_view key) const -> const std::any* {
        if (!m_values) {
            return nullptr;
        }
        auto it = m_values->find(std::string(key));
        if (it == m_values->end()) {
            return nullptr;
        }
        return &it->second;
    }
}  // namespace querywalk
