//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_ERRORS_HPP
#define MUNCH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

// 编译期错误：模式非法、规则集为空，在任何词法分析运行之前抛出
namespace munch {
    class InvalidPattern : public std::invalid_argument {
    public:
        explicit InvalidPattern(const std::string &message) : std::invalid_argument("Invalid pattern: " + message) {}
    };

    class EmptyRuleSet : public std::invalid_argument {
    public:
        EmptyRuleSet() : std::invalid_argument("Empty rule set: a context needs at least one rule") {}
    };

    // 构建 Lexer 时某个上下文编译失败，带上上下文名称
    class CompileError : public std::invalid_argument {
    public:
        enum class Reason {
            INVALID_PATTERN,
            EMPTY_RULE_SET,
            INVALID_CONTEXT, // 父上下文不存在或继承成环
        };

        CompileError(const Reason reason, std::string context, const std::string &message)
            : std::invalid_argument("Context '" + context + "': " + message), reason(reason),
              context(std::move(context)) {}

        const Reason reason;
        const std::string context;
    };
}

// 运行期错误：上下文栈误用，由动作触发，可恢复
namespace munch {
    class ContextStackError : public std::runtime_error {
    public:
        explicit ContextStackError(const std::string &message) : std::runtime_error(message) {}
    };

    class UnknownContext : public ContextStackError {
    public:
        explicit UnknownContext(std::string name)
            : ContextStackError("Unknown context '" + name + "'"), name(std::move(name)) {}

        const std::string name;
    };

    class StackUnderflow : public ContextStackError {
    public:
        StackUnderflow() : ContextStackError("Context stack underflow: the root context cannot be popped") {}
    };
}

#endif //MUNCH_ERRORS_HPP
