//
// Created by aowei on 2026 10月 17.
//

#include <cctype>
#include <unordered_map>
#include <c11/lexer/scanner.hpp>

// 静态变量定义
namespace c11 {
    const std::vector<std::string> Scanner::keywords = {
        "auto", "break", "case", "char", "const", "continue", "default", "do",
        "double", "else", "enum", "extern", "float", "for", "goto", "if",
        "int", "long", "register", "return", "short", "signed", "sizeof", "static",
        "struct", "switch", "typedef", "union", "unsigned", "void", "volatile", "while"
    };

    const std::vector<std::string> Scanner::operators = {
        "->", "++", "--", "<=", ">=", "==", "!=", "&&", "||",
        "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "<<", ">>",
        "<<=", ">>=", "+", "-", "*", "/", "%", "!", "&", "|", "^",
        "~", "<", ">", "=", ".", "?", ":"
    };

    // ':' 已作为运算符
    const std::vector<std::string> Scanner::punctuators = {
        "(", ")", "{", "}", "[", "]", ";", ",", "#", "##"
    };
}

// 匿名数据
namespace c11 {
    namespace {
        using munch::pattern::Pattern;
        using Match = munch::lexer::Match<Token, ScanState>;
        using Action = munch::lexer::Action<Token, ScanState>;

        // TokenType 转字符串 map
        const std::unordered_map<TokenType, std::string> token_type_string_map{
            {TokenType::TOK_KEYWORD, "KEYWORD"},
            {TokenType::TOK_IDENTIFIER, "IDENTIFIER"},
            {TokenType::TOK_INTEGER, "INTEGER"},
            {TokenType::TOK_FLOAT, "FLOAT"},
            {TokenType::TOK_CHAR, "CHAR"},
            {TokenType::TOK_STRING, "STRING"},
            {TokenType::TOK_OPERATOR, "OPERATOR"},
            {TokenType::TOK_PUNCTUATOR, "PUNCTUATOR"},
            {TokenType::TOK_COMMENT, "COMMENT"},
            {TokenType::TOK_WHITESPACE, "WHITESPACE"},
            {TokenType::TOK_UNKNOWN, "UNKNOWN"}
        };
        // ErrorType 转字符串 map
        const std::unordered_map<ErrorType, std::string> error_type_string_map{
            {ErrorType::INCOMPLETE_STRING, "INCOMPLETE_STRING"},
            {ErrorType::INCOMPLETE_CHAR, "INCOMPLETE_CHAR"},
            {ErrorType::ILLEGAL_ESCAPE, "ILLEGAL_ESCAPE"},
            {ErrorType::INVALID_INTEGER, "INVALID_INTEGER"},
            {ErrorType::INVALID_CHARACTER, "INVALID_CHARACTER"},
            {ErrorType::INCOMPLETE_COMMENT, "INCOMPLETE_COMMENT"}
        };

        // 字符串组成的选择模式
        Pattern one_of(const std::vector<std::string> &words) {
            Pattern pattern = Pattern::literal(words.front());
            for (size_t i = 1; i < words.size(); ++i) {
                pattern = pattern | Pattern::literal(words[i]);
            }
            return pattern;
        }

        // 以匹配文本生成 Token
        Action emit(const TokenType type) {
            return [type](Match &match) {
                match.emit(Token(type, match.text(), match.begin().line, match.begin().column));
            };
        }

        void report(Match &match, const ErrorType type, std::string message) {
            match.state().errors.emplace_back(type, std::move(message), match.begin().line, match.begin().column);
        }

        // 进入字符串/字符/注释上下文，记录起点
        Action enter(const std::string &context) {
            return [context](Match &match) {
                ScanState &state = match.state();
                state.literal = match.text();
                state.line = match.begin().line;
                state.column = match.begin().column;
                match.push(context);
            };
        }

        Action append() {
            return [](Match &match) { match.state().literal += match.text(); };
        }

        // 结束字符串/字符/注释上下文，以累积的文本生成 Token
        Action leave(const TokenType type) {
            return [type](Match &match) {
                ScanState &state = match.state();
                state.literal += match.text();
                match.emit(Token(type, std::move(state.literal), state.line, state.column));
                state.literal.clear();
                match.pop();
            };
        }

        // 未闭合：报告错误，已累积的文本作为 UNKNOWN Token
        Action unclosed(const ErrorType type, const std::string &message) {
            return [type, message](Match &match) {
                ScanState &state = match.state();
                state.errors.emplace_back(type, message, state.line, state.column);
                match.emit(Token(TokenType::TOK_UNKNOWN, std::move(state.literal), state.line, state.column));
                state.literal.clear();
                match.pop();
            };
        }

        void illegal_escape(Match &match, std::string message) {
            report(match, ErrorType::ILLEGAL_ESCAPE, std::move(message));
            match.state().literal += match.text();
        }

        // 字符串与字符常量共用的上下文：引号之间逐段累积文本，转义序列在这里检查
        void quoted(munch::lexer::LexerBuilder<Token, ScanState> &builder, const std::string &name, const char quote,
                    const TokenType type, const ErrorType unclosed_error, const std::string &unclosed_message) {
            builder.context(name)
                    .rule(Pattern::chr(static_cast<unsigned char>(quote)), leave(type), name + "-close")
                    .rule(R"(\\(['"?\\abfnrtv]|[0-7]{1,3}|x[0-9a-fA-F]+))", append(), "escape")
                    // \x 后必须跟至少 1 位十六进制数
                    .rule(Pattern::literal("\\x"), [](Match &match) {
                        illegal_escape(match, "Hex escape sequence missing digits (\\x requires 1+ hex digits)");
                    }, "escape-hex-empty")
                    .rule(R"(\\[^\n])", [](Match &match) {
                        illegal_escape(match, "Illegal escape sequence: " + match.text());
                    }, "escape-illegal")
                    .rule(Pattern::chr('\\'), [](Match &match) {
                        illegal_escape(match, "Incomplete escape sequence (ends with '\\')");
                    }, "escape-incomplete")
                    .rule(Pattern::many1(Pattern::none_of(std::string(1, quote) + "\\\n")), append(), "text")
                    .rule(Pattern::chr('\n') | Pattern::eof(), unclosed(unclosed_error, unclosed_message),
                          "unclosed");
        }
    }
}

// Scanner 类函数和辅助函数
namespace c11 {
    // 构造函数：编译全部上下文
    Scanner::Scanner() : c11_lexer(build_lexer()) {}

    // 规则的顺序就是优先级，同样长度的匹配取先声明的规则
    Scanner::Lexer Scanner::build_lexer() {
        munch::lexer::LexerBuilder<Token, ScanState> builder;

        builder.context("c11")
                .rule(Pattern::literal("/*"), enter("comment"), "comment-open")
                .rule(R"(//[^\n]*)", emit(TokenType::TOK_COMMENT), "line-comment")
                .rule(Pattern::chr('"'), enter("string"), "string-open")
                .rule(Pattern::chr('\''), enter("char"), "char-open")
                // 浮点数常量：123.45、.45、123e-5、123.45e+6，可带 f/l 后缀
                .rule(R"(([0-9]+\.[0-9]*|\.[0-9]+)([eE][+-]?[0-9]+)?[fFlL]?|[0-9]+[eE][+-]?[0-9]+[fFlL]?)",
                      emit(TokenType::TOK_FLOAT), "float")
                // 整数常量：十进制、八进制、十六进制，可带 u/l 后缀
                .rule(R"((0[xX][0-9a-fA-F]+|[0-9]+)([uU][lL]{0,2}|[lL]{1,2}[uU]?)?)", [](Match &match) {
                    // 检测非法八进制数，例如 08、09
                    const std::string &value = match.text();
                    if (value.size() > 1 && value[0] == '0' && value[1] != 'x' && value[1] != 'X') {
                        for (size_t i = 1; i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]));
                             ++i) {
                            if (value[i] > '7') {
                                report(match, ErrorType::INVALID_INTEGER,
                                       "Invalid integer literal ('" + value + "')");
                                break;
                            }
                        }
                    }
                    match.emit(Token(TokenType::TOK_INTEGER, value, match.begin().line, match.begin().column));
                }, "integer")
                // 关键字在标识符之前声明，长度相同时优先
                .rule(one_of(keywords), emit(TokenType::TOK_KEYWORD), "keyword")
                .rule(R"([a-zA-Z_][a-zA-Z0-9_]*)", emit(TokenType::TOK_IDENTIFIER), "identifier")
                .rule(one_of(operators), emit(TokenType::TOK_OPERATOR), "operator")
                .rule(one_of(punctuators), emit(TokenType::TOK_PUNCTUATOR), "punctuator")
                // 空白字符不生成 Token
                .rule(R"([ \t\n\r\f\v]+)", nullptr, "whitespace")
                // 其余任意字符都是无效字符，扫描从下一个字符继续
                .rule(Pattern::any(), [](Match &match) {
                    report(match, ErrorType::INVALID_CHARACTER, "Invalid character ('" + match.text() + "')");
                    match.emit(Token(TokenType::TOK_UNKNOWN, match.text(), match.begin().line,
                                     match.begin().column));
                }, "invalid");

        quoted(builder, "string", '"', TokenType::TOK_STRING, ErrorType::INCOMPLETE_STRING,
               "Unclosed string literal (missing '\"')");
        quoted(builder, "char", '\'', TokenType::TOK_CHAR, ErrorType::INCOMPLETE_CHAR,
               "Unclosed character literal (missing ''')");

        builder.context("comment")
                .rule(Pattern::literal("*/"), leave(TokenType::TOK_COMMENT), "comment-close")
                .rule(Pattern::many1(Pattern::none_of("*")), append(), "text")
                .rule(Pattern::chr('*'), append(), "star")
                .rule(Pattern::eof(),
                      unclosed(ErrorType::INCOMPLETE_COMMENT, "Unclosed multi-line comment (missing '*/')"),
                      "unclosed");

        return builder.build();
    }

    // TokenType 转字符串
    std::string Scanner::token_type_to_string(const TokenType type) {
        const auto it = token_type_string_map.find(type);
        if (it != token_type_string_map.end()) {
            return it->second;
        }
        return "UNKNOWN";
    }

    // ErrorType 转字符串
    std::string Scanner::error_type_to_string(const ErrorType type) {
        const auto it = error_type_string_map.find(type);
        if (it != error_type_string_map.end()) {
            return it->second;
        }
        return "UNKNOWN";
    }
}

// Scanner 核心逻辑函数
namespace c11 {
    // 核心扫描逻辑：运行词法分析器，收集 Token 和错误
    ScanResult Scanner::scan(const std::string &input, const munch::lexer::Encoding encoding) const {
        munch::lexer::StringReader reader(input, encoding);
        auto run = this->c11_lexer.run(reader);
        ScanResult result{std::move(run.tokens), std::move(run.user_state.errors)};
        // 根上下文兜底匹配任意字符，正常情况下总能读到输入末尾
        if (run.error) {
            result.errors.emplace_back(ErrorType::INVALID_CHARACTER, run.error->message, run.error->position.line,
                                       run.error->position.column);
        }
        return result;
    }
}
