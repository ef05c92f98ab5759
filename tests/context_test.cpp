#include <gtest/gtest.h>

#include <string>

#include "context.hpp"

namespace querywalk {
    namespace {
        using namespace nodes;

        TEST(Context, StartsEmpty) {
            Context context;
            EXPECT_FALSE(context.contains("parents"));
            EXPECT_TRUE(context.parents().empty());
            EXPECT_TRUE(context.new_parents().empty());
            EXPECT_TRUE(context.path().empty());
            EXPECT_EQ(context.depth(), 0U);
            EXPECT_FALSE(context.get<std::string>("replacement").has_value());
        }

        TEST(Context, StoresCallerValues) {
            auto context = Context().with("replacement", "rotfl").with("limit", 3);

            EXPECT_EQ(context.get<std::string>("replacement"), "rotfl");
            EXPECT_EQ(context.get<int>("limit"), 3);
            EXPECT_EQ(context.get_or<int>("missing", 7), 7);
            EXPECT_EQ(context.get_or<std::string>("replacement", "lol"), "rotfl");
        }

        TEST(Context, RejectsMismatchedTypes) {
            auto context = Context().with("limit", 3);
            EXPECT_TRUE(context.contains("limit"));
            EXPECT_FALSE(context.get<std::string>("limit").has_value());
            EXPECT_EQ(context.get_or<std::string>("limit", "none"), "none");
        }

        TEST(Context, DerivingLeavesTheOriginalUnchanged) {
            auto base = Context().with("field", "title");
            auto derived = base.with("field", "body").with("extra", true);

            EXPECT_EQ(base.get<std::string>("field"), "title");
            EXPECT_FALSE(base.contains("extra"));
            EXPECT_EQ(derived.get<std::string>("field"), "body");
            EXPECT_EQ(derived.get<bool>("extra"), true);
        }

        TEST(Context, ExtendsChains) {
            auto root = and_op(word("a"), search_field("title", word("b")));
            auto field = root->children()[1];

            auto child = Context().with("key", 1).descend().with_parent(root).with_path_index(1);
            auto grandchild = child.descend().with_parent(field).with_new_parent(field).with_path_index(0);

            EXPECT_EQ(child.depth(), 1U);
            ASSERT_EQ(child.parents().size(), 1U);
            EXPECT_EQ(child.parents().front().get(), root.get());
            EXPECT_EQ(child.path(), (Vec<uint32_t> { 1 }));

            EXPECT_EQ(grandchild.depth(), 2U);
            ASSERT_EQ(grandchild.parents().size(), 2U);
            EXPECT_EQ(grandchild.parents().back().get(), field.get());
            EXPECT_EQ(grandchild.new_parents().size(), 1U);
            EXPECT_EQ(grandchild.path(), (Vec<uint32_t> { 1, 0 }));
            EXPECT_EQ(grandchild.get<int>("key"), 1);

            EXPECT_TRUE(grandchild.has_ancestor(Node::Kind::SearchField));
            EXPECT_TRUE(grandchild.has_ancestor(Node::Kind::BaseOperation));
            EXPECT_FALSE(child.has_ancestor(Node::Kind::SearchField));
            EXPECT_TRUE(grandchild.has_new_ancestor(Node::Kind::SearchField));
            EXPECT_FALSE(grandchild.has_new_ancestor(Node::Kind::AndOperation));
        }
    }  // namespace
}  // namespace querywalk
