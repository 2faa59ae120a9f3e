//
// Created by aowei on 2026 10月 17.
//

#include <gtest/gtest.h>
#include <munch/errors.hpp>
#include <munch/pattern/regex.hpp>

using namespace munch;
using namespace munch::pattern;

// 测试隐含连接符的插入
TEST(RegexTest, LexerInsertsConcat) {
    const auto tokens = regex::lexer(U"a(b|c)*d");
    const std::vector<regex::TokenType> expected = {
        regex::TokenType::CHAR_SET, regex::TokenType::CONCAT, regex::TokenType::LPAREN,
        regex::TokenType::CHAR_SET, regex::TokenType::OR, regex::TokenType::CHAR_SET,
        regex::TokenType::RPAREN, regex::TokenType::STAR, regex::TokenType::CONCAT,
        regex::TokenType::CHAR_SET,
    };
    ASSERT_EQ(tokens.size(), expected.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        EXPECT_EQ(tokens[i].type, expected[i]) << "token " << i;
    }
}

// 测试后缀表达式：后缀运算符 > 连接 > 选择
TEST(RegexTest, InfixToPostfixPrecedence) {
    const auto postfix = regex::infix_to_postfix(regex::lexer(U"ab*|c"));
    const std::vector<regex::TokenType> expected = {
        regex::TokenType::CHAR_SET, regex::TokenType::CHAR_SET, regex::TokenType::STAR,
        regex::TokenType::CONCAT, regex::TokenType::CHAR_SET, regex::TokenType::OR,
    };
    ASSERT_EQ(postfix.size(), expected.size());
    for (size_t i = 0; i < postfix.size(); ++i) {
        EXPECT_EQ(postfix[i].type, expected[i]) << "token " << i;
    }
}

// 测试解析结果与组合子构造的模式一致
TEST(RegexTest, ParseMatchesCombinators) {
    const Pattern a = Pattern::chr('a');
    const Pattern b = Pattern::chr('b');
    EXPECT_EQ(regex::parse("ab"), a >> b);
    EXPECT_EQ(regex::parse("a|b"), a | b);
    EXPECT_EQ(regex::parse("a*"), Pattern::many(a));
    EXPECT_EQ(regex::parse("a+"), Pattern::many1(a));
    EXPECT_EQ(regex::parse("a?"), Pattern::opt(a));
    EXPECT_EQ(regex::parse("(ab)+"), Pattern::many1(a >> b));
    EXPECT_EQ(regex::parse("ab|b"), (a >> b) | b);
    EXPECT_EQ(regex::parse("a{2}"), Pattern::repeat(a, 2, 2));
    EXPECT_EQ(regex::parse("a{2,}"), Pattern::repeat(a, 2, Pattern::UNBOUNDED));
    EXPECT_EQ(regex::parse("a{2,5}"), Pattern::repeat(a, 2, 5));
}

// 测试字符类
TEST(RegexTest, CharacterClasses) {
    SymbolSet expected('a', 'z');
    expected.insert('_', '_');
    expected.insert('0', '9');
    EXPECT_EQ(regex::parse("[a-z_0-9]").symbol_set(), expected);

    const Pattern negated = regex::parse("[^\"\\\\\\n]");
    EXPECT_FALSE(negated.symbol_set().contains('"'));
    EXPECT_FALSE(negated.symbol_set().contains('\\'));
    EXPECT_FALSE(negated.symbol_set().contains('\n'));
    EXPECT_TRUE(negated.symbol_set().contains('a'));

    // 开头的 ']' 与末尾的 '-' 按字面处理
    const Pattern literal = regex::parse("[]-]");
    EXPECT_TRUE(literal.symbol_set().contains(']'));
    EXPECT_TRUE(literal.symbol_set().contains('-'));
    EXPECT_EQ(literal.symbol_set().ranges().size(), 2);
}

// 测试转义与预定义字符类
TEST(RegexTest, Escapes) {
    EXPECT_EQ(regex::parse("\\n"), Pattern::chr('\n'));
    EXPECT_EQ(regex::parse("\\t"), Pattern::chr('\t'));
    EXPECT_EQ(regex::parse("\\."), Pattern::chr('.'));
    EXPECT_EQ(regex::parse("\\*"), Pattern::chr('*'));
    EXPECT_EQ(regex::parse("\\d").symbol_set(), SymbolSet('0', '9'));
    EXPECT_EQ(regex::parse("\\D").symbol_set(), SymbolSet('0', '9').complement());
    EXPECT_TRUE(regex::parse("\\w").symbol_set().contains('_'));
    EXPECT_TRUE(regex::parse("\\s").symbol_set().contains('\n'));
    EXPECT_FALSE(regex::parse("\\S").symbol_set().contains(' '));
    EXPECT_EQ(regex::parse(".").symbol_set(), SymbolSet::all());
}

// 测试非 ASCII 字符按码点处理
TEST(RegexTest, Unicode) {
    EXPECT_EQ(regex::parse("\xE4\xB8\xAD+"), Pattern::many1(Pattern::chr(0x4E2D)));
    EXPECT_EQ(regex::parse("[\xCE\xB1-\xCF\x89]").symbol_set(), SymbolSet(0x3B1, 0x3C9));
}

// 测试非法正则
TEST(RegexTest, InvalidRegex) {
    EXPECT_THROW(regex::parse(""), InvalidPattern);
    EXPECT_THROW(regex::parse("(ab"), InvalidPattern);
    EXPECT_THROW(regex::parse("ab)"), InvalidPattern);
    EXPECT_THROW(regex::parse("*a"), InvalidPattern);
    EXPECT_THROW(regex::parse("a|"), InvalidPattern);
    EXPECT_THROW(regex::parse("()"), InvalidPattern);
    EXPECT_THROW(regex::parse("[abc"), InvalidPattern);
    EXPECT_THROW(regex::parse("[z-a]"), InvalidPattern);
    EXPECT_THROW(regex::parse("a\\"), InvalidPattern);
    EXPECT_THROW(regex::parse("a{3,2}"), InvalidPattern);
    EXPECT_THROW(regex::parse("a{x}"), InvalidPattern);
    EXPECT_THROW(regex::parse("a{2"), InvalidPattern);
    EXPECT_THROW(regex::parse("a{5000}"), InvalidPattern);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
