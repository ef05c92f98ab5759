#include <gtest/gtest.h>

#include <string>

#include "dispatch.hpp"

namespace querywalk {
    namespace {
        using Kind = Node::Kind;
        using NameTable = DispatchTable<std::string>;

        TEST(DispatchTable, ResolvesToNothingWhenEmpty) {
            NameTable table;
            EXPECT_TRUE(table.empty());
            EXPECT_EQ(table.resolve(Kind::Word), nullptr);
            EXPECT_FALSE(table.resolve_kind(Kind::AndOperation).has_value());
        }

        TEST(DispatchTable, PrefersTheMostSpecificKind) {
            NameTable table;
            table.on(Kind::BaseOperation, "base");
            table.on(Kind::OrOperation, "or");

            ASSERT_NE(table.resolve(Kind::OrOperation), nullptr);
            EXPECT_EQ(*table.resolve(Kind::OrOperation), "or");
            ASSERT_NE(table.resolve(Kind::AndOperation), nullptr);
            EXPECT_EQ(*table.resolve(Kind::AndOperation), "base");
            EXPECT_EQ(table.resolve_kind(Kind::UnknownOperation), Kind::BaseOperation);
            EXPECT_EQ(table.resolve(Kind::Word), nullptr);
        }

        TEST(DispatchTable, DoesNotDependOnRegistrationOrder) {
            NameTable forward;
            forward.on(Kind::Term, "term");
            forward.on(Kind::Phrase, "phrase");

            NameTable backward;
            backward.on(Kind::Phrase, "phrase");
            backward.on(Kind::Term, "term");

            for (const auto* table : { &forward, &backward }) {
                EXPECT_EQ(*table->resolve(Kind::Phrase), "phrase");
                EXPECT_EQ(*table->resolve(Kind::Word), "term");
                EXPECT_EQ(*table->resolve(Kind::Regex), "term");
                EXPECT_EQ(table->resolve(Kind::Proximity), nullptr);
            }
        }

        TEST(DispatchTable, ReplacesAHandler) {
            NameTable table;
            table.on(Kind::Word, "first");
            table.on(Kind::Word, "second");
            EXPECT_EQ(*table.resolve(Kind::Word), "second");
        }

        TEST(DispatchTable, RegistersByName) {
            NameTable table;
            ASSERT_TRUE(table.on("Unary", "unary").has_value());
            EXPECT_TRUE(table.contains(Kind::Unary));
            EXPECT_EQ(*table.resolve(Kind::Not), "unary");
            EXPECT_EQ(*table.resolve(Kind::Prohibit), "unary");
        }

        TEST(DispatchTable, RejectsUnknownNames) {
            NameTable table;
            auto registered = table.on("visit_word", "word");

            ASSERT_FALSE(registered.has_value());
            EXPECT_EQ(registered.error().kind(), TraversalError::Kind::UnknownKind);
            EXPECT_NE(registered.error().message().find("'visit_word'"), std::string_view::npos);
            EXPECT_TRUE(table.empty());
        }
    }  // namespace
}  // namespace querywalk
