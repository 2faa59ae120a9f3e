//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_PATTERN_PATTERN_HPP
#define MUNCH_PATTERN_PATTERN_HPP

#include <memory>
#include <string>
#include <string_view>
#include <munch/pattern/symbol_set.hpp>

// 模式代数：不可变的组合子树，子树可共享但不会成环
namespace munch::pattern {
    enum class PatternKind {
        SYMBOL, // 符号集合，叶子
        SEQ,    // 连接
        OR,     // 选择
        REPEAT, // 重复 {min, max}
    };

    class Pattern {
    public:
        // 重复上界：无穷
        static constexpr int UNBOUNDED = -1;
        // 有限重复次数的上限，每次重复都会展开为一份 NFA 片段
        static constexpr int MAX_REPEAT = 1000;

        // 基本构造器，非法参数抛出 InvalidPattern
        static Pattern symbols(SymbolSet set);
        static Pattern seq(const Pattern &first, const Pattern &second);
        static Pattern alt(const Pattern &first, const Pattern &second);
        static Pattern repeat(const Pattern &body, int min, int max);

        // 便捷构造器
        static Pattern chr(Symbol symbol);
        static Pattern range(Symbol lo, Symbol hi);
        // 字符串字面量，按码点连接
        static Pattern literal(std::string_view utf8);
        static Pattern any_of(std::string_view utf8);
        static Pattern none_of(std::string_view utf8);
        // 任意合法码点，不包含输入结束
        static Pattern any();
        // 仅匹配输入结束标记
        static Pattern eof();
        static Pattern many(const Pattern &body);
        static Pattern many1(const Pattern &body);
        static Pattern opt(const Pattern &body);

        [[nodiscard]] PatternKind kind() const;
        // 仅 SYMBOL 有效
        [[nodiscard]] const SymbolSet &symbol_set() const;
        // SEQ/OR 的左右子树，REPEAT 的子树为 left()
        [[nodiscard]] Pattern left() const;
        [[nodiscard]] Pattern right() const;
        [[nodiscard]] int min() const;
        [[nodiscard]] int max() const;

        // 是否能匹配空串
        [[nodiscard]] bool nullable() const;
        [[nodiscard]] std::string to_string() const;

        bool operator==(const Pattern &other) const;
        bool operator!=(const Pattern &other) const { return !(*this == other); }

    private:
        struct Node;

        explicit Pattern(std::shared_ptr<const Node> node);

        std::shared_ptr<const Node> node;
    };

    // a >> b 连接，a | b 选择
    Pattern operator>>(const Pattern &first, const Pattern &second);
    Pattern operator|(const Pattern &first, const Pattern &second);
}

#endif //MUNCH_PATTERN_PATTERN_HPP
