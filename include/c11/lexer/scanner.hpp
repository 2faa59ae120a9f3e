//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_C11_SCANNER_HPP
#define MUNCH_C11_SCANNER_HPP

#include <string>
#include <utility>
#include <vector>
#include <munch/lexer/lexer.hpp>


namespace c11 {
    // 词法错误类型枚举
    enum class ErrorType {
        INCOMPLETE_STRING,  // 未闭合的字符串，例如 "Hello
        INCOMPLETE_CHAR,    // 未闭合的字符
        ILLEGAL_ESCAPE,     // 非法转义序列
        INVALID_INTEGER,    // 无效整数，例如 09
        INVALID_CHARACTER,  // 无效字符
        INCOMPLETE_COMMENT, // 未闭合多行注释
    };

    // 词法错误信息结构体，包含错误位置和描述
    struct ScanError {
        ErrorType type;      // 错误类型
        std::string message; // 错误描述
        size_t line;         // 错误行号
        size_t column;       // 错误列号

        ScanError() = delete;

        explicit ScanError(const ErrorType type, std::string message, const size_t line,
                           const size_t column) : type(type),
                                                  message(std::move(message)), line(line), column(column) {}
    };

    // Token 类型枚举
    enum class TokenType {
        TOK_KEYWORD,    // 关键字
        TOK_IDENTIFIER, // 标识符
        TOK_INTEGER,    // 整数常量
        TOK_FLOAT,      // 浮点数常量
        TOK_CHAR,       // 字符常量
        TOK_STRING,     // 字符串常量
        TOK_OPERATOR,   // 运算符
        TOK_PUNCTUATOR, // 标点符号
        TOK_COMMENT,    // 注释
        TOK_UNKNOWN,    // 未知，伴随一条词法错误
        TOK_WHITESPACE, // 空白符号
    };

    // Token 结构体
    struct Token {
        TokenType type;
        std::string value;
        size_t line;
        size_t column;

        Token() = delete;

        explicit Token(const TokenType type, std::string value, const size_t line, const size_t column) : type(type),
            value(std::move(value)), line(line), column(column) {}
    };

    // 扫描结果封装，Token 列表 + 错误列表
    struct ScanResult {
        std::vector<Token> tokens;     // 正常识别的 tokens
        std::vector<ScanError> errors; // 收集的词法错误
    };

    // 一次扫描的状态：字符串/字符/注释上下文中累积的文本及其起点，以及收集的错误
    struct ScanState {
        std::string literal;
        size_t line = 0;
        size_t column = 0;
        std::vector<ScanError> errors;
    };

    // Scanner：根上下文 "c11"，字符串常量在 "string" 上下文，字符常量在 "char" 上下文，多行注释在 "comment" 上下文
    class Scanner {
    public:
        using Lexer = munch::lexer::Lexer<Token, ScanState>;

    private:
        static const std::vector<std::string> keywords;    // 关键字
        static const std::vector<std::string> operators;   // 运算符
        static const std::vector<std::string> punctuators; // 标点符号

        Lexer c11_lexer;

        static Lexer build_lexer();

    public:
        Scanner();
        ~Scanner() = default;
        // 禁止拷贝，但是允许移动
        Scanner(const Scanner &) = delete;
        Scanner &operator=(const Scanner &) = delete;
        Scanner(Scanner &&) = default;
        Scanner &operator=(Scanner &&) = default;
        // 核心扫描接口：输入代码，返回 Token + 错误
        [[nodiscard]] ScanResult scan(const std::string &input,
                                      munch::lexer::Encoding encoding = munch::lexer::Encoding::UTF8) const;
        [[nodiscard]] const Lexer &lexer() const { return this->c11_lexer; }
        static std::string token_type_to_string(TokenType type);
        static std::string error_type_to_string(ErrorType type);
    };
}


#endif //MUNCH_C11_SCANNER_HPP
