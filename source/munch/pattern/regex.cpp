//
// Created by aowei on 2026 10月 17.
//

#include <stack>
#include <unordered_map>
#include <munch/errors.hpp>
#include <munch/utf8.hpp>
#include <munch/pattern/regex.hpp>

// 词法分析辅助函数
namespace munch::pattern::regex {
    namespace {
        // 转义字符：\n、\t 等控制字符，其余字符按字面处理
        Symbol escape_symbol(const Symbol c) {
            switch (c) {
                case U'n': return U'\n';
                case U't': return U'\t';
                case U'r': return U'\r';
                case U'f': return U'\f';
                case U'v': return U'\v';
                case U'0': return U'\0';
                default: return c;
            }
        }

        // 预定义字符类 \d \w \s 及其大写取反形式，不是字符类时返回空集合
        SymbolSet escape_class(const Symbol c) {
            SymbolSet set;
            switch (c) {
                case U'd':
                case U'D':
                    set.insert(U'0', U'9');
                    break;
                case U'w':
                case U'W':
                    set.insert(U'a', U'z');
                    set.insert(U'A', U'Z');
                    set.insert(U'0', U'9');
                    set.insert(U'_', U'_');
                    break;
                case U's':
                case U'S':
                    set.insert(U' ', U' ');
                    set.insert(U'\t', U'\r'); // \t \n \v \f \r
                    break;
                default:
                    return set;
            }
            return (c == U'D' || c == U'W' || c == U'S') ? set.complement() : set;
        }

        // 解析转义序列，pos 指向反斜杠，返回后 pos 指向序列之后
        SymbolSet parse_escape(const std::u32string_view regex, std::size_t &pos) {
            if (pos + 1 >= regex.size()) {
                throw InvalidPattern("trailing '\\' in regex");
            }
            const Symbol c = regex[pos + 1];
            pos += 2;
            if (SymbolSet set = escape_class(c); !set.empty()) {
                return set;
            }
            return SymbolSet::of(escape_symbol(c));
        }

        // 解析字符类 [...]，pos 指向 '['
        SymbolSet parse_class(const std::u32string_view regex, std::size_t &pos) {
            ++pos; // 跳过 [
            bool negated = false;
            if (pos < regex.size() && regex[pos] == U'^') {
                negated = true;
                ++pos;
            }
            SymbolSet set;
            bool first = true;
            while (pos < regex.size() && (regex[pos] != U']' || first)) {
                first = false;
                // 单个成员：转义或普通字符
                Symbol lo;
                if (regex[pos] == U'\\') {
                    SymbolSet escaped = parse_escape(regex, pos);
                    // \d 等字符类不能作为范围端点
                    if (escaped.ranges().size() != 1 || escaped.ranges()[0].lo != escaped.ranges()[0].hi) {
                        set.insert(escaped);
                        continue;
                    }
                    lo = escaped.ranges()[0].lo;
                } else {
                    lo = regex[pos++];
                }
                // 范围 a-z，末尾的 '-' 按字面处理
                if (pos + 1 < regex.size() && regex[pos] == U'-' && regex[pos + 1] != U']') {
                    ++pos;
                    Symbol hi;
                    if (regex[pos] == U'\\') {
                        SymbolSet escaped = parse_escape(regex, pos);
                        if (escaped.ranges().size() != 1 || escaped.ranges()[0].lo != escaped.ranges()[0].hi) {
                            throw InvalidPattern("character class used as range bound");
                        }
                        hi = escaped.ranges()[0].lo;
                    } else {
                        hi = regex[pos++];
                    }
                    if (hi < lo) {
                        throw InvalidPattern("inverted range in character class");
                    }
                    set.insert(lo, hi);
                } else {
                    set.insert(lo, lo);
                }
            }
            if (pos >= regex.size()) {
                throw InvalidPattern("unterminated character class (missing ']')");
            }
            ++pos; // 跳过 ]
            return negated ? set.complement() : set;
        }

        int parse_number(const std::u32string_view regex, std::size_t &pos) {
            if (pos >= regex.size() || regex[pos] < U'0' || regex[pos] > U'9') {
                throw InvalidPattern("expected number in repeat bounds");
            }
            int value = 0;
            while (pos < regex.size() && regex[pos] >= U'0' && regex[pos] <= U'9') {
                value = value * 10 + static_cast<int>(regex[pos] - U'0');
                if (value > Pattern::MAX_REPEAT) {
                    throw InvalidPattern("repeat bound too large");
                }
                ++pos;
            }
            return value;
        }

        // 解析重复次数 {m}、{m,}、{m,n}，pos 指向 '{'
        Token parse_repeat(const std::u32string_view regex, std::size_t &pos) {
            ++pos; // 跳过 {
            Token token{TokenType::REPEAT, {}};
            token.min = parse_number(regex, pos);
            token.max = token.min;
            if (pos < regex.size() && regex[pos] == U',') {
                ++pos;
                if (pos < regex.size() && regex[pos] == U'}') {
                    token.max = Pattern::UNBOUNDED;
                } else {
                    token.max = parse_number(regex, pos);
                }
            }
            if (pos >= regex.size() || regex[pos] != U'}') {
                throw InvalidPattern("unterminated repeat bounds (missing '}')");
            }
            ++pos; // 跳过 }
            return token;
        }

        // 前一个 Token 能否结束一个操作数
        bool ends_operand(const TokenType type) {
            return type == TokenType::CHAR_SET || type == TokenType::RPAREN || type == TokenType::STAR ||
                   type == TokenType::PLUS || type == TokenType::QUESTION || type == TokenType::REPEAT;
        }

        // 后一个 Token 能否开始一个操作数
        bool starts_operand(const TokenType type) {
            return type == TokenType::CHAR_SET || type == TokenType::LPAREN;
        }
    }
}

// 核心功能函数实现
namespace munch::pattern::regex {
    // 词法分析：正则 -> Token 列表
    std::vector<Token> lexer(const std::u32string_view regex) {
        std::vector<Token> raw;
        std::size_t pos = 0;
        while (pos < regex.size()) {
            const Symbol c = regex[pos];
            switch (c) {
                case U'*':
                    raw.push_back({TokenType::STAR, {}});
                    ++pos;
                    break;
                case U'+':
                    raw.push_back({TokenType::PLUS, {}});
                    ++pos;
                    break;
                case U'?':
                    raw.push_back({TokenType::QUESTION, {}});
                    ++pos;
                    break;
                case U'|':
                    raw.push_back({TokenType::OR, {}});
                    ++pos;
                    break;
                case U'(':
                    raw.push_back({TokenType::LPAREN, {}});
                    ++pos;
                    break;
                case U')':
                    raw.push_back({TokenType::RPAREN, {}});
                    ++pos;
                    break;
                case U'{':
                    raw.push_back(parse_repeat(regex, pos));
                    break;
                case U'[':
                    raw.push_back({TokenType::CHAR_SET, parse_class(regex, pos)});
                    break;
                case U'\\':
                    raw.push_back({TokenType::CHAR_SET, parse_escape(regex, pos)});
                    break;
                case U'.':
                    raw.push_back({TokenType::CHAR_SET, SymbolSet::all()});
                    ++pos;
                    break;
                default:
                    raw.push_back({TokenType::CHAR_SET, SymbolSet::of(c)});
                    ++pos;
                    break;
            }
        }
        // 自动插入隐含连接符号（例如 "ab" -> "a.CONCAT.b"）
        std::vector<Token> tokens;
        for (std::size_t i = 0; i < raw.size(); ++i) {
            if (i > 0 && ends_operand(raw[i - 1].type) && starts_operand(raw[i].type)) {
                tokens.push_back({TokenType::CONCAT, {}});
            }
            tokens.push_back(std::move(raw[i]));
        }
        return tokens;
    }

    // 语法分析：Token 列表 -> 后缀表达式，调度场算法
    std::vector<Token> infix_to_postfix(const std::vector<Token> &tokens) {
        std::vector<Token> postfix;
        std::stack<TokenType> op_stack;
        std::stack<Token> repeat_stack; // 与栈中的 REPEAT 一一对应，保存重复次数
        // 运算法优先级：后缀运算符(3) > CONCAT(2) > OR(1)
        const std::unordered_map<TokenType, int> precedence = {
            {TokenType::STAR, 3},
            {TokenType::PLUS, 3},
            {TokenType::QUESTION, 3},
            {TokenType::REPEAT, 3},
            {TokenType::CONCAT, 2},
            {TokenType::OR, 1},
        };
        const auto pop_operator = [&] {
            if (op_stack.top() == TokenType::REPEAT) {
                postfix.push_back(repeat_stack.top());
                repeat_stack.pop();
            } else {
                postfix.push_back({op_stack.top(), {}});
            }
            op_stack.pop();
        };
        for (const auto &token: tokens) {
            switch (token.type) {
                // 1. 字符集合：直接加入到后缀表达式
                case TokenType::CHAR_SET: {
                    postfix.push_back(token);
                    break;
                }
                // 2. 左括号：直接入栈，不参与优先级比较
                case TokenType::LPAREN: {
                    op_stack.push(token.type);
                    break;
                }
                // 3. 右括号：弹出元素并添加到后缀表达式直到遇到左括号才停止
                case TokenType::RPAREN: {
                    while (!op_stack.empty() && op_stack.top() != TokenType::LPAREN) {
                        pop_operator();
                    }
                    if (op_stack.empty()) {
                        throw InvalidPattern("mismatched parentheses (missing '(')");
                    }
                    // 弹出左括号
                    op_stack.pop();
                    break;
                }
                // 4. 普通运算符：按优先级弹出
                case TokenType::STAR:
                case TokenType::PLUS:
                case TokenType::QUESTION:
                case TokenType::REPEAT:
                case TokenType::CONCAT:
                case TokenType::OR: {
                    // 弹出优先级 >= 当前运算符
                    while (!op_stack.empty() && op_stack.top() != TokenType::LPAREN &&
                           precedence.at(op_stack.top()) >= precedence.at(token.type)) {
                        pop_operator();
                    }
                    op_stack.push(token.type);
                    if (token.type == TokenType::REPEAT) repeat_stack.push(token);
                    break;
                }
            }
        }
        // 弹出剩余运算符
        while (!op_stack.empty()) {
            if (op_stack.top() == TokenType::LPAREN) {
                throw InvalidPattern("mismatched parentheses (missing ')')");
            }
            pop_operator();
        }
        return postfix;
    }

    // 后缀表达式 -> Pattern
    Pattern build_pattern(const std::vector<Token> &postfix) {
        std::stack<Pattern> pattern_stack;
        const auto pop_operand = [&pattern_stack](const char *op) {
            if (pattern_stack.empty()) {
                throw InvalidPattern(std::string("'") + op + "' is missing an operand");
            }
            Pattern top = pattern_stack.top();
            pattern_stack.pop();
            return top;
        };
        for (const auto &token: postfix) {
            switch (token.type) {
                case TokenType::CHAR_SET:
                    pattern_stack.push(Pattern::symbols(token.set));
                    break;
                case TokenType::STAR:
                    pattern_stack.push(Pattern::many(pop_operand("*")));
                    break;
                case TokenType::PLUS:
                    pattern_stack.push(Pattern::many1(pop_operand("+")));
                    break;
                case TokenType::QUESTION:
                    pattern_stack.push(Pattern::opt(pop_operand("?")));
                    break;
                case TokenType::REPEAT:
                    pattern_stack.push(Pattern::repeat(pop_operand("{}"), token.min, token.max));
                    break;
                case TokenType::CONCAT: {
                    Pattern b = pop_operand("concatenation");
                    Pattern a = pop_operand("concatenation");
                    pattern_stack.push(Pattern::seq(a, b));
                    break;
                }
                case TokenType::OR: {
                    Pattern b = pop_operand("|");
                    Pattern a = pop_operand("|");
                    pattern_stack.push(Pattern::alt(a, b));
                    break;
                }
                case TokenType::LPAREN:
                case TokenType::RPAREN:
                    throw InvalidPattern("parenthesis in postfix expression");
            }
        }
        if (pattern_stack.size() != 1) {
            throw InvalidPattern("mismatched operands/operators");
        }
        return pattern_stack.top();
    }

    Pattern parse(const std::string_view regex) {
        if (regex.empty()) {
            throw InvalidPattern("empty regex is not supported");
        }
        const std::u32string symbols = utf8::decode_all(regex);
        return build_pattern(infix_to_postfix(lexer(symbols)));
    }
}
