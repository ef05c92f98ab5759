#pragma once

#include <gtest/gtest.h>

#include <ostream>
#include <string>

#include "node.hpp"
#include "traversal_error.hpp"

namespace querywalk {
    inline auto PrintTo(const Node& node, std::ostream* os) -> void {
        *os << node.to_json().dump();
    }
    inline auto PrintTo(const NodePtr& node, std::ostream* os) -> void {
        *os << (node ? node->to_json().dump() : "null");
    }
    inline auto PrintTo(const TraversalError& error, std::ostream* os) -> void {
        *os << error.to_json().dump();
    }
}  // namespace querywalk

namespace querywalk::testing {
    // Structural comparison of two trees, for EXPECT_PRED_FORMAT2.
    inline auto same_tree(
        const char* actual_expr,
        const char* expected_expr,
        const NodePtr& actual,
        const NodePtr& expected
    ) -> ::testing::AssertionResult {
        if (equals(actual, expected)) {
            return ::testing::AssertionSuccess();
        }
        auto dump = [](const NodePtr& node) -> std::string {
            return node ? node->to_json().dump() : "null";
        };
        return ::testing::AssertionFailure()
               << actual_expr << " and " << expected_expr << " differ\n  actual:   "
               << dump(actual) << "\n  expected: " << dump(expected);
    }

    // `depth` nested Not nodes over a word. Levels are released outermost first
    // so no destructor has to recurse through the whole chain.
    class DeepChain {
    public:
        explicit DeepChain(uint32_t depth) {
            m_levels.reserve(depth + 1);
            m_levels.push_back(nodes::word("leaf"));
            for (uint32_t level = 0; level < depth; ++level) {
                m_levels.push_back(nodes::not_op(m_levels.back()));
            }
        }
        ~DeepChain() {
            while (!m_levels.empty()) {
                m_levels.pop_back();
            }
        }
        DeepChain(const DeepChain&) = delete;
        DeepChain(DeepChain&&) = delete;
        auto operator=(const DeepChain&) -> DeepChain& = delete;
        auto operator=(DeepChain&&) -> DeepChain& = delete;

        [[nodiscard]] auto root() const -> const NodePtr& {
            return m_levels.back();
        }

    private:
        Vec<NodePtr> m_levels;
    };

    inline auto text_of(const NodePtr& node) -> std::string {
        if (auto term = node_cast<Term>(node)) {
            return std::string(term->text());
        }
        return std::string(node->kind_name());
    }
}  // namespace querywalk::testing

#define EXPECT_SAME_TREE(actual, expected) \
    EXPECT_PRED_FORMAT2(::querywalk::testing::same_tree, actual, expected)
