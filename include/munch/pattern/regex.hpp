//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_PATTERN_REGEX_HPP
#define MUNCH_PATTERN_REGEX_HPP

#include <string>
#include <string_view>
#include <vector>
#include <munch/pattern/pattern.hpp>

// 正则文本前端：正则字符串 -> Token 列表 -> 后缀表达式 -> Pattern
namespace munch::pattern::regex {
    enum class TokenType {
        CHAR_SET, // 字符或字符类 [a-z]、.、\d 等
        STAR,     // * 闭包
        PLUS,     // + 正闭包
        QUESTION, // ? 可选
        REPEAT,   // {m}、{m,}、{m,n}
        OR,       // | 选择
        LPAREN,   // ( 左括号
        RPAREN,   // ) 右括号
        CONCAT,   // 隐含连接符，仅供内部使用
    };

    struct Token {
        TokenType type;
        SymbolSet set; // 仅 CHAR_SET 有效
        int min = 0;   // 仅 REPEAT 有效
        int max = 0;   // 仅 REPEAT 有效，Pattern::UNBOUNDED 表示无上界
    };
}

// 核心功能函数的声明，出错时抛出 InvalidPattern
namespace munch::pattern::regex {
    // 词法分析：正则（码点序列）-> Token 列表，已插入隐含连接符
    std::vector<Token> lexer(std::u32string_view regex);
    // 语法分析：Token 列表 -> 后缀表达式，调度场算法
    std::vector<Token> infix_to_postfix(const std::vector<Token> &tokens);
    // 后缀表达式 -> Pattern
    Pattern build_pattern(const std::vector<Token> &postfix);
    // 完整流程：UTF-8 正则文本 -> Pattern
    Pattern parse(std::string_view regex);
}

#endif //MUNCH_PATTERN_REGEX_HPP
