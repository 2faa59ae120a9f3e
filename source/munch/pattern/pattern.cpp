//
// Created by aowei on 2026 10月 17.
//

#include <algorithm>
#include <string>
#include <utility>
#include <munch/errors.hpp>
#include <munch/utf8.hpp>
#include <munch/pattern/pattern.hpp>

namespace munch::pattern {
    struct Pattern::Node {
        PatternKind kind;
        SymbolSet set;
        std::shared_ptr<const Node> lhs;
        std::shared_ptr<const Node> rhs;
        int min = 0;
        int max = 0;
    };

    Pattern::Pattern(std::shared_ptr<const Node> node) : node(std::move(node)) {}
}

// 基本构造器
namespace munch::pattern {
    Pattern Pattern::symbols(SymbolSet set) {
        if (set.empty()) {
            throw InvalidPattern("symbol set must not be empty");
        }
        return Pattern(std::make_shared<const Node>(Node{PatternKind::SYMBOL, std::move(set), nullptr, nullptr}));
    }

    Pattern Pattern::seq(const Pattern &first, const Pattern &second) {
        return Pattern(std::make_shared<const Node>(Node{PatternKind::SEQ, {}, first.node, second.node}));
    }

    Pattern Pattern::alt(const Pattern &first, const Pattern &second) {
        return Pattern(std::make_shared<const Node>(Node{PatternKind::OR, {}, first.node, second.node}));
    }

    Pattern Pattern::repeat(const Pattern &body, const int min, const int max) {
        if (min < 0) {
            throw InvalidPattern("repeat lower bound " + std::to_string(min) + " is negative");
        }
        if (min > MAX_REPEAT || max > MAX_REPEAT) {
            throw InvalidPattern("repeat bound " + std::to_string(std::max(min, max)) + " exceeds " +
                                 std::to_string(MAX_REPEAT));
        }
        if (max != UNBOUNDED && max < min) {
            throw InvalidPattern("repeat upper bound " + std::to_string(max) +
                                 " is less than lower bound " + std::to_string(min));
        }
        return Pattern(std::make_shared<const Node>(Node{PatternKind::REPEAT, {}, body.node, nullptr, min, max}));
    }
}

// 便捷构造器
namespace munch::pattern {
    Pattern Pattern::chr(const Symbol symbol) {
        return symbols(SymbolSet::of(symbol));
    }

    Pattern Pattern::range(const Symbol lo, const Symbol hi) {
        if (hi < lo) {
            throw InvalidPattern("inverted range");
        }
        return symbols(SymbolSet(lo, hi));
    }

    Pattern Pattern::literal(const std::string_view utf8) {
        const std::u32string symbols = utf8::decode_all(utf8);
        if (symbols.empty()) {
            throw InvalidPattern("literal must not be empty");
        }
        Pattern result = chr(symbols[0]);
        for (std::size_t i = 1; i < symbols.size(); ++i) {
            result = seq(result, chr(symbols[i]));
        }
        return result;
    }

    Pattern Pattern::any_of(const std::string_view utf8) {
        return symbols(SymbolSet::of_string(utf8));
    }

    Pattern Pattern::none_of(const std::string_view utf8) {
        return symbols(SymbolSet::of_string(utf8).complement());
    }

    Pattern Pattern::any() {
        return symbols(SymbolSet::all());
    }

    Pattern Pattern::eof() {
        return symbols(SymbolSet::of(END_OF_INPUT));
    }

    Pattern Pattern::many(const Pattern &body) {
        return repeat(body, 0, UNBOUNDED);
    }

    Pattern Pattern::many1(const Pattern &body) {
        return repeat(body, 1, UNBOUNDED);
    }

    Pattern Pattern::opt(const Pattern &body) {
        return repeat(body, 0, 1);
    }

    Pattern operator>>(const Pattern &first, const Pattern &second) {
        return Pattern::seq(first, second);
    }

    Pattern operator|(const Pattern &first, const Pattern &second) {
        return Pattern::alt(first, second);
    }
}

// 访问与查询
namespace munch::pattern {
    PatternKind Pattern::kind() const {
        return this->node->kind;
    }

    const SymbolSet &Pattern::symbol_set() const {
        return this->node->set;
    }

    Pattern Pattern::left() const {
        return Pattern(this->node->lhs);
    }

    Pattern Pattern::right() const {
        return Pattern(this->node->rhs);
    }

    int Pattern::min() const {
        return this->node->min;
    }

    int Pattern::max() const {
        return this->node->max;
    }

    bool Pattern::nullable() const {
        switch (this->kind()) {
            case PatternKind::SYMBOL:
                return false;
            case PatternKind::SEQ:
                return this->left().nullable() && this->right().nullable();
            case PatternKind::OR:
                return this->left().nullable() || this->right().nullable();
            case PatternKind::REPEAT:
                return this->min() == 0 || this->left().nullable();
        }
        return false;
    }

    std::string Pattern::to_string() const {
        switch (this->kind()) {
            case PatternKind::SYMBOL:
                return this->symbol_set().to_string();
            case PatternKind::SEQ:
                return "(" + this->left().to_string() + " " + this->right().to_string() + ")";
            case PatternKind::OR:
                return "(" + this->left().to_string() + " | " + this->right().to_string() + ")";
            case PatternKind::REPEAT: {
                const std::string upper = this->max() == UNBOUNDED ? "" : std::to_string(this->max());
                return this->left().to_string() + "{" + std::to_string(this->min()) + "," + upper + "}";
            }
        }
        return {};
    }

    // 结构相等：共享子树直接相等，否则逐层比较
    bool Pattern::operator==(const Pattern &other) const {
        if (this->node == other.node) return true;
        if (this->kind() != other.kind()) return false;
        switch (this->kind()) {
            case PatternKind::SYMBOL:
                return this->symbol_set() == other.symbol_set();
            case PatternKind::SEQ:
            case PatternKind::OR:
                return this->left() == other.left() && this->right() == other.right();
            case PatternKind::REPEAT:
                return this->min() == other.min() && this->max() == other.max() && this->left() == other.left();
        }
        return false;
    }
}
