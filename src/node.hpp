#pragma once

#include <array>
#include <utility>

#include "common.hpp"
#include "location.hpp"

namespace querywalk {
    class Node;

    using NodePtr = Rc<Node>;

    // Number of children a node accepts when it is rebuilt.
    class Arity {
    public:
        static constexpr auto none() -> Arity {
            return { 0, 0 };
        }
        static constexpr auto exactly(uint32_t count) -> Arity {
            return { count, count };
        }
        static constexpr auto at_least(uint32_t count) -> Arity {
            return { count, std::nullopt };
        }

        [[nodiscard]] constexpr auto min() const -> uint32_t {
            return m_min;
        }
        [[nodiscard]] constexpr auto max() const -> Option<uint32_t> {
            return m_max;
        }
        [[nodiscard]] constexpr auto accepts(size_t count) const -> bool {
            return count >= m_min && (!m_max || count <= *m_max);
        }

        [[nodiscard]] auto to_string() const -> std::string;

    private:
        constexpr Arity(uint32_t min, Option<uint32_t> max) : m_min(min), m_max(max) {}

        uint32_t m_min;
        Option<uint32_t> m_max;
    };

    class Node {
    public:
        enum class Kind : uint8_t {
            // abstract
            Term,
            BaseApprox,
            BaseOperation,
            Unary,

            // terms
            Word,
            Phrase,
            Regex,

            // wrappers
            Group,
            FieldGroup,
            SearchField,
            Range,
            Fuzzy,
            Proximity,
            Boost,
            Not,
            Plus,
            Prohibit,

            // operations
            AndOperation,
            OrOperation,
            UnknownOperation,

            NoneItem,
        };

        // The kind itself followed by its abstract ancestors, most specific first.
        static auto ancestry(Kind kind) -> Span<Kind>;
        static auto is_abstract(Kind kind) -> bool;
        static auto kind_name(Kind kind) -> std::string_view;
        static auto kind_from_name(std::string_view name) -> Option<Kind>;

        virtual ~Node() = default;
        Node() = default;
        explicit Node(Decoration decoration) : m_decoration(std::move(decoration)) {}
        Node(const Node&) = default;
        Node(Node&&) = default;
        auto operator=(const Node&) -> Node& = default;
        auto operator=(Node&&) -> Node& = default;

        [[nodiscard]] virtual auto kind() const -> Kind = 0;
        [[nodiscard]] auto kind_name() const -> std::string_view {
            return kind_name(kind());
        }
        [[nodiscard]] auto is_a(Kind kind) const -> bool;

        [[nodiscard]] virtual auto children() const -> Span<NodePtr> {
            return {};
        }
        [[nodiscard]] virtual auto arity() const -> Arity {
            return Arity::none();
        }

        // Copy of this node holding `children` in place of its own. Every other
        // attribute is kept. Empty when `arity()` rejects the child count.
        [[nodiscard]] virtual auto with_children(Vec<NodePtr> children) const -> Option<NodePtr>;
        [[nodiscard]] virtual auto with_decoration(Decoration decoration) const -> NodePtr;

        [[nodiscard]] auto decoration() const -> const Decoration& {
            return m_decoration;
        }
        [[nodiscard]] auto span() const -> const Option<SourceSpan>& {
            return m_decoration.span;
        }
        [[nodiscard]] auto head() const -> std::string_view {
            return m_decoration.head;
        }
        [[nodiscard]] auto tail() const -> std::string_view {
            return m_decoration.tail;
        }

        [[nodiscard]] virtual auto to_json() const -> Json;
        // Kind and decoration only, without attributes or children. Bounded in
        // size however deep the tree below is.
        [[nodiscard]] auto to_json_shallow() const -> Json;

        [[nodiscard]] auto equals(const Node& other) const -> bool;

    protected:
        // Called only with a node of the same kind.
        [[nodiscard]] virtual auto same_attributes(const Node& /*other*/) const -> bool {
            return true;
        }
        [[nodiscard]] virtual auto clone() const -> std::shared_ptr<Node> = 0;
        virtual auto replace_children(Vec<NodePtr> /*children*/) -> void {}

        static auto children_to_json(Span<NodePtr> children) -> Json;

    private:
        Decoration m_decoration;
    };

    auto operator==(const Node& left, const Node& right) -> bool;
    auto equals(const NodePtr& left, const NodePtr& right) -> bool;

    // Typed view of a node, null when the node is not a `T`.
    template<typename T>
    auto node_cast(const NodePtr& node) -> Rc<T> {
        return std::dynamic_pointer_cast<const T>(node);
    }

    /* terms */

    class Term : public Node {
    public:
        explicit Term(std::string text, Decoration decoration = {})
            : Node(std::move(decoration))
            , m_text(std::move(text)) {}

        [[nodiscard]] auto text() const -> std::string_view {
            return m_text;
        }

        [[nodiscard]] auto to_json() const -> Json override {
            auto json = Node::to_json();
            json["text"] = m_text;
            return json;
        }

    protected:
        [[nodiscard]] auto same_attributes(const Node& other) const -> bool override {
            return m_text == static_cast<const Term&>(other).m_text;
        }

    private:
        std::string m_text;
    };

    class Word final : public Term {
    public:
        using Term::Term;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Word;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Word>(*this);
        }
    };
    // Text keeps its surrounding double quotes.
    class Phrase final : public Term {
    public:
        using Term::Term;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Phrase;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Phrase>(*this);
        }
    };
    // Text keeps its surrounding slashes.
    class Regex final : public Term {
    public:
        using Term::Term;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Regex;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Regex>(*this);
        }
    };

    /* single child wrappers */

    class Wrapper : public Node {
    public:
        explicit Wrapper(NodePtr expression, Decoration decoration = {})
            : Node(std::move(decoration))
            , m_expression(std::move(expression)) {}

        [[nodiscard]] auto expression() const -> const NodePtr& {
            return m_expression;
        }

        [[nodiscard]] auto children() const -> Span<NodePtr> override {
            return { &m_expression, 1 };
        }
        [[nodiscard]] auto arity() const -> Arity override {
            return Arity::exactly(1);
        }

        [[nodiscard]] auto to_json() const -> Json override {
            auto json = Node::to_json();
            json["expression"] = m_expression ? m_expression->to_json() : Json();
            return json;
        }

    protected:
        auto replace_children(Vec<NodePtr> children) -> void override {
            m_expression = std::move(children.front());
        }

    private:
        NodePtr m_expression;
    };

    class Group final : public Wrapper {
    public:
        using Wrapper::Wrapper;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Group;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Group>(*this);
        }
    };
    // Parenthesized expression directly following a field name: `title:(a OR b)`.
    class FieldGroup final : public Wrapper {
    public:
        using Wrapper::Wrapper;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::FieldGroup;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<FieldGroup>(*this);
        }
    };
    class SearchField final : public Wrapper {
    public:
        SearchField(std::string name, NodePtr expression, Decoration decoration = {})
            : Wrapper(std::move(expression), std::move(decoration))
            , m_name(std::move(name)) {}

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::SearchField;
        }
        [[nodiscard]] auto name() const -> std::string_view {
            return m_name;
        }

        [[nodiscard]] auto to_json() const -> Json override {
            auto json = Wrapper::to_json();
            json["name"] = m_name;
            return json;
        }

    protected:
        [[nodiscard]] auto same_attributes(const Node& other) const -> bool override {
            return m_name == static_cast<const SearchField&>(other).m_name;
        }
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<SearchField>(*this);
        }

    private:
        std::string m_name;
    };

    class BaseApprox : public Wrapper {
    public:
        using Wrapper::Wrapper;
    };

    class Fuzzy final : public BaseApprox {
    public:
        static constexpr double DEFAULT_DEGREE = 0.5;

        explicit Fuzzy(NodePtr term, double degree = DEFAULT_DEGREE, Decoration decoration = {})
            : BaseApprox(std::move(term), std::move(decoration))
            , m_degree(degree) {}

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Fuzzy;
        }
        [[nodiscard]] auto degree() const -> double {
            return m_degree;
        }

        [[nodiscard]] auto to_json() const -> Json override {
            auto json = Wrapper::to_json();
            json["degree"] = m_degree;
            return json;
        }

    protected:
        [[nodiscard]] auto same_attributes(const Node& other) const -> bool override {
            return m_degree == static_cast<const Fuzzy&>(other).m_degree;
        }
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Fuzzy>(*this);
        }

    private:
        double m_degree;
    };
    class Proximity final : public BaseApprox {
    public:
        static constexpr uint32_t DEFAULT_DEGREE = 1;

        explicit Proximity(
            NodePtr phrase,
            uint32_t degree = DEFAULT_DEGREE,
            Decoration decoration = {}
        )
            : BaseApprox(std::move(phrase), std::move(decoration))
            , m_degree(degree) {}

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Proximity;
        }
        [[nodiscard]] auto degree() const -> uint32_t {
            return m_degree;
        }

        [[nodiscard]] auto to_json() const -> Json override {
            auto json = Wrapper::to_json();
            json["degree"] = m_degree;
            return json;
        }

    protected:
        [[nodiscard]] auto same_attributes(const Node& other) const -> bool override {
            return m_degree == static_cast<const Proximity&>(other).m_degree;
        }
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Proximity>(*this);
        }

    private:
        uint32_t m_degree;
    };

    class Boost final : public Wrapper {
    public:
        Boost(NodePtr expression, double force, Decoration decoration = {})
            : Wrapper(std::move(expression), std::move(decoration))
            , m_force(force) {}

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Boost;
        }
        [[nodiscard]] auto force() const -> double {
            return m_force;
        }

        [[nodiscard]] auto to_json() const -> Json override {
            auto json = Wrapper::to_json();
            json["force"] = m_force;
            return json;
        }

    protected:
        [[nodiscard]] auto same_attributes(const Node& other) const -> bool override {
            return m_force == static_cast<const Boost&>(other).m_force;
        }
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Boost>(*this);
        }

    private:
        double m_force;
    };

    class Unary : public Wrapper {
    public:
        using Wrapper::Wrapper;
    };

    class Not final : public Unary {
    public:
        using Unary::Unary;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Not;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Not>(*this);
        }
    };
    class Plus final : public Unary {
    public:
        using Unary::Unary;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Plus;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Plus>(*this);
        }
    };
    class Prohibit final : public Unary {
    public:
        using Unary::Unary;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Prohibit;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Prohibit>(*this);
        }
    };

    /* range */

    class Range final : public Node {
    public:
        Range(
            NodePtr low,
            NodePtr high,
            bool include_low = true,
            bool include_high = true,
            Decoration decoration = {}
        )
            : Node(std::move(decoration))
            , m_bounds { std::move(low), std::move(high) }
            , m_include_low(include_low)
            , m_include_high(include_high) {}

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::Range;
        }
        [[nodiscard]] auto low() const -> const NodePtr& {
            return m_bounds.front();
        }
        [[nodiscard]] auto high() const -> const NodePtr& {
            return m_bounds.back();
        }
        [[nodiscard]] auto include_low() const -> bool {
            return m_include_low;
        }
        [[nodiscard]] auto include_high() const -> bool {
            return m_include_high;
        }

        [[nodiscard]] auto children() const -> Span<NodePtr> override {
            return m_bounds;
        }
        [[nodiscard]] auto arity() const -> Arity override {
            return Arity::exactly(2);
        }

        [[nodiscard]] auto to_json() const -> Json override {
            auto json = Node::to_json();
            json["low"] = low() ? low()->to_json() : Json();
            json["high"] = high() ? high()->to_json() : Json();
            json["includeLow"] = m_include_low;
            json["includeHigh"] = m_include_high;
            return json;
        }

    protected:
        [[nodiscard]] auto same_attributes(const Node& other) const -> bool override {
            const auto& range = static_cast<const Range&>(other);
            return m_include_low == range.m_include_low && m_include_high == range.m_include_high;
        }
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<Range>(*this);
        }
        auto replace_children(Vec<NodePtr> children) -> void override {
            m_bounds = { std::move(children.at(0)), std::move(children.at(1)) };
        }

    private:
        std::array<NodePtr, 2> m_bounds;
        bool m_include_low;
        bool m_include_high;
    };

    /* operations */

    class BaseOperation : public Node {
    public:
        explicit BaseOperation(Vec<NodePtr> operands, Decoration decoration = {})
            : Node(std::move(decoration))
            , m_operands(std::move(operands)) {}

        [[nodiscard]] auto operands() const -> const Vec<NodePtr>& {
            return m_operands;
        }

        [[nodiscard]] auto children() const -> Span<NodePtr> override {
            return m_operands;
        }
        [[nodiscard]] auto arity() const -> Arity override {
            return Arity::at_least(0);
        }

        [[nodiscard]] auto to_json() const -> Json override {
            auto json = Node::to_json();
            json["operands"] = children_to_json(m_operands);
            return json;
        }

    protected:
        auto replace_children(Vec<NodePtr> children) -> void override {
            m_operands = std::move(children);
        }

    private:
        Vec<NodePtr> m_operands;
    };

    class AndOperation : public BaseOperation {
    public:
        using BaseOperation::BaseOperation;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::AndOperation;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<AndOperation>(*this);
        }
    };
    class OrOperation : public BaseOperation {
    public:
        using BaseOperation::BaseOperation;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::OrOperation;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<OrOperation>(*this);
        }
    };
    // Operands separated by whitespace only, whose operator is left to the backend.
    class UnknownOperation : public BaseOperation {
    public:
        using BaseOperation::BaseOperation;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::UnknownOperation;
        }

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override {
            return std::make_shared<UnknownOperation>(*this);
        }
    };

    /* sentinel */

    class NoneItem final : public Node {
    public:
        static auto instance() -> const NodePtr&;

        [[nodiscard]] auto kind() const -> Kind override {
            return Kind::NoneItem;
        }

        [[nodiscard]] auto with_children(Vec<NodePtr> children) const -> Option<NodePtr> override;
        [[nodiscard]] auto with_decoration(Decoration decoration) const -> NodePtr override;

    protected:
        [[nodiscard]] auto clone() const -> std::shared_ptr<Node> override;

    private:
        NoneItem() = default;
    };

    namespace nodes {
        inline auto word(std::string text) -> NodePtr {
            return std::make_shared<const Word>(std::move(text));
        }
        inline auto phrase(std::string text) -> NodePtr {
            return std::make_shared<const Phrase>(std::move(text));
        }
        inline auto regex(std::string text) -> NodePtr {
            return std::make_shared<const Regex>(std::move(text));
        }
        inline auto group(NodePtr expression) -> NodePtr {
            return std::make_shared<const Group>(std::move(expression));
        }
        inline auto field_group(NodePtr expression) -> NodePtr {
            return std::make_shared<const FieldGroup>(std::move(expression));
        }
        inline auto search_field(std::string name, NodePtr expression) -> NodePtr {
            return std::make_shared<const SearchField>(std::move(name), std::move(expression));
        }
        inline auto range(
            NodePtr low,
            NodePtr high,
            bool include_low = true,
            bool include_high = true
        ) -> NodePtr {
            return std::make_shared<const Range>(
                std::move(low),
                std::move(high),
                include_low,
                include_high
            );
        }
        inline auto fuzzy(NodePtr term, double degree = Fuzzy::DEFAULT_DEGREE) -> NodePtr {
            return std::make_shared<const Fuzzy>(std::move(term), degree);
        }
        inline auto proximity(NodePtr phrase, uint32_t degree = Proximity::DEFAULT_DEGREE)
            -> NodePtr {
            return std::make_shared<const Proximity>(std::move(phrase), degree);
        }
        inline auto boost(NodePtr expression, double force) -> NodePtr {
            return std::make_shared<const Boost>(std::move(expression), force);
        }
        inline auto not_op(NodePtr expression) -> NodePtr {
            return std::make_shared<const Not>(std::move(expression));
        }
        inline auto plus(NodePtr expression) -> NodePtr {
            return std::make_shared<const Plus>(std::move(expression));
        }
        inline auto prohibit(NodePtr expression) -> NodePtr {
            return std::make_shared<const Prohibit>(std::move(expression));
        }
        template<typename... Operands>
        auto and_op(Operands... operands) -> NodePtr {
            return std::make_shared<const AndOperation>(Vec<NodePtr> { std::move(operands)... });
        }
        template<typename... Operands>
        auto or_op(Operands... operands) -> NodePtr {
            return std::make_shared<const OrOperation>(Vec<NodePtr> { std::move(operands)... });
        }
        template<typename... Operands>
        auto unknown_op(Operands... operands) -> NodePtr {
            return std::make_shared<const UnknownOperation>(Vec<NodePtr> { std::move(operands)... }
            );
        }
        inline auto none_item() -> NodePtr {
            return NoneItem::instance();
        }
    }  // namespace nodes
}  // namespace querywalk
