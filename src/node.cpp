#include "node.hpp"

#include <algorithm>
#include <format>
#include <magic_enum.hpp>

namespace querywalk {
    namespace {
        using Kind = Node::Kind;

        constexpr std::array TERM_ANCESTRY = { Kind::Term };
        constexpr std::array BASE_APPROX_ANCESTRY = { Kind::BaseApprox };
        constexpr std::array BASE_OPERATION_ANCESTRY = { Kind::BaseOperation };
        constexpr std::array UNARY_ANCESTRY = { Kind::Unary };

        constexpr std::array WORD_ANCESTRY = { Kind::Word, Kind::Term };
        constexpr std::array PHRASE_ANCESTRY = { Kind::Phrase, Kind::Term };
        constexpr std::array REGEX_ANCESTRY = { Kind::Regex, Kind::Term };

        constexpr std::array GROUP_ANCESTRY = { Kind::Group };
        constexpr std::array FIELD_GROUP_ANCESTRY = { Kind::FieldGroup };
        constexpr std::array SEARCH_FIELD_ANCESTRY = { Kind::SearchField };
        constexpr std::array RANGE_ANCESTRY = { Kind::Range };
        constexpr std::array FUZZY_ANCESTRY = { Kind::Fuzzy, Kind::BaseApprox };
        constexpr std::array PROXIMITY_ANCESTRY = { Kind::Proximity, Kind::BaseApprox };
        constexpr std::array BOOST_ANCESTRY = { Kind::Boost };
        constexpr std::array NOT_ANCESTRY = { Kind::Not, Kind::Unary };
        constexpr std::array PLUS_ANCESTRY = { Kind::Plus, Kind::Unary };
        constexpr std::array PROHIBIT_ANCESTRY = { Kind::Prohibit, Kind::Unary };

        constexpr std::array AND_OPERATION_ANCESTRY = { Kind::AndOperation, Kind::BaseOperation };
        constexpr std::array OR_OPERATION_ANCESTRY = { Kind::OrOperation, Kind::BaseOperation };
        constexpr std::array UNKNOWN_OPERATION_ANCESTRY = { Kind::UnknownOperation,
                                                            Kind::BaseOperation };

        constexpr std::array NONE_ITEM_ANCESTRY = { Kind::NoneItem };
    }  // namespace

    auto Arity::to_string() const -> std::string {
        if (m_max == m_min) {
            return std::format("{}", m_min);
        }
        if (!m_max) {
            return std::format("at least {}", m_min);
        }
        return std::format("between {} and {}", m_min, *m_max);
    }

    auto Node::ancestry(Kind kind) -> Span<Kind> {
        switch (kind) {
            case Kind::Term:
                return TERM_ANCESTRY;
            case Kind::BaseApprox:
                return BASE_APPROX_ANCESTRY;
            case Kind::BaseOperation:
                return BASE_OPERATION_ANCESTRY;
            case Kind::Unary:
                return UNARY_ANCESTRY;
            case Kind::Word:
                return WORD_ANCESTRY;
            case Kind::Phrase:
                return PHRASE_ANCESTRY;
            case Kind::Regex:
                return REGEX_ANCESTRY;
            case Kind::Group:
                return GROUP_ANCESTRY;
            case Kind::FieldGroup:
                return FIELD_GROUP_ANCESTRY;
            case Kind::SearchField:
                return SEARCH_FIELD_ANCESTRY;
            case Kind::Range:
                return RANGE_ANCESTRY;
            case Kind::Fuzzy:
                return FUZZY_ANCESTRY;
            case Kind::Proximity:
                return PROXIMITY_ANCESTRY;
            case Kind::Boost:
                return BOOST_ANCESTRY;
            case Kind::Not:
                return NOT_ANCESTRY;
            case Kind::Plus:
                return PLUS_ANCESTRY;
            case Kind::Prohibit:
                return PROHIBIT_ANCESTRY;
            case Kind::AndOperation:
                return AND_OPERATION_ANCESTRY;
            case Kind::OrOperation:
                return OR_OPERATION_ANCESTRY;
            case Kind::UnknownOperation:
                return UNKNOWN_OPERATION_ANCESTRY;
            case Kind::NoneItem:
                return NONE_ITEM_ANCESTRY;
        }
        return {};
    }
    auto Node::is_abstract(Kind kind) -> bool {
        switch (kind) {
            case Kind::Term:
            case Kind::BaseApprox:
            case Kind::BaseOperation:
            case Kind::Unary:
                return true;
            default:
                return false;
        }
    }
    auto Node::kind_name(Kind kind) -> std::string_view {
        return magic_enum::enum_name(kind);
    }
    auto Node::kind_from_name(std::string_view name) -> Option<Kind> {
        auto kind = magic_enum::enum_cast<Kind>(name);
        if (!kind) {
            return std::nullopt;
        }
        return *kind;
    }

    auto Node::is_a(Kind kind) const -> bool {
        auto chain = ancestry(this->kind());
        return std::ranges::find(chain, kind) != chain.end();
    }

    auto Node::with_children(Vec<NodePtr> children) const -> Option<NodePtr> {
        if (!arity().accepts(children.size())) {
            return std::nullopt;
        }
        auto copy = clone();
        copy->replace_children(std::move(children));
        return NodePtr(std::move(copy));
    }
    auto Node::with_decoration(Decoration decoration) const -> NodePtr {
        auto copy = clone();
        copy->m_decoration = std::move(decoration);
        return copy;
    }

    auto Node::to_json() const -> Json {
        auto json = Json { { "type", std::string(kind_name()) } };
        auto decoration = m_decoration.to_json();
        if (!decoration.empty()) {
            json["decoration"] = std::move(decoration);
        }
        return json;
    }
    auto Node::to_json_shallow() const -> Json {
        return Node::to_json();
    }
    auto Node::children_to_json(Span<NodePtr> children) -> Json {
        auto child_list = Json::array();
        for (const auto& child : children) {
            child_list.push_back(child ? child->to_json() : Json());
        }
        return child_list;
    }

    auto Node::equals(const Node& other) const -> bool {
        if (this == &other) {
            return true;
        }
        if (kind() != other.kind() || !same_attributes(other)) {
            return false;
        }
        return std::ranges::equal(children(), other.children(), querywalk::equals);
    }

    auto operator==(const Node& left, const Node& right) -> bool {
        return left.equals(right);
    }
    auto equals(const NodePtr& left, const NodePtr& right) -> bool {
        if (!left || !right) {
            return left == right;
        }
        return left->equals(*right);
    }

    auto NoneItem::instance() -> const NodePtr& {
        static const NodePtr item(new NoneItem());
        return item;
    }
    auto NoneItem::with_children(Vec<NodePtr> children) const -> Option<NodePtr> {
        if (!children.empty()) {
            return std::nullopt;
        }
        return instance();
    }
    auto NoneItem::with_decoration(Decoration /*decoration*/) const -> NodePtr {
        return instance();
    }
    auto NoneItem::clone() const -> std::shared_ptr<Node> {
        return std::shared_ptr<Node>(new NoneItem());
    }
}  // namespace querywalk
