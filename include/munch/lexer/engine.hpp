//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_LEXER_ENGINE_HPP
#define MUNCH_LEXER_ENGINE_HPP

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <munch/automata/dfa.hpp>
#include <munch/lexer/reader.hpp>

// 运行状态与错误
namespace munch::lexer {
    enum class RunState {
        IDLE,         // 没有进行中的匹配
        SCANNING,     // 正在消耗符号
        EMITTING,     // 已提交匹配，正在执行动作
        END_OF_INPUT, // 终止：输入耗尽
        STUCK,        // 终止：当前位置没有规则匹配
        FAILED,       // 终止：动作误用上下文栈
    };

    std::string_view to_string(RunState state);

    enum class ErrorKind {
        STUCK,
        UNKNOWN_CONTEXT,
        STACK_UNDERFLOW,
    };

    std::string_view to_string(ErrorKind kind);

    // 运行期错误：位置与当时的上下文，供调用方生成诊断
    struct LexError {
        ErrorKind kind;
        Position position;
        std::string context;
        std::string message;
    };
}

// 游标：在输入源之上维护前瞻缓冲，回退只发生在缓冲内，不会重新读取输入源
namespace munch::lexer {
    class Cursor {
    public:
        explicit Cursor(Reader &reader);

        // 从当前位置起第 index 个符号，超出输入时返回 END_OF_INPUT
        Symbol at(std::size_t index);
        // 提交前 count 个符号，返回其在输入中的原始字节并推进位置
        std::string commit(std::size_t count);
        [[nodiscard]] const Position &position() const { return this->pos; }
        [[nodiscard]] std::size_t buffered() const { return this->pending.size(); }

    private:
        struct Item {
            Symbol symbol;
            std::string bytes;
        };

        Reader &reader;
        std::deque<Item> pending;
        Position pos;
    };
}

// 最长匹配
namespace munch::lexer {
    struct Attempt {
        enum class Outcome {
            MATCHED,
            STUCK,
            END_OF_INPUT,
        };

        Outcome outcome = Outcome::STUCK;
        automata::RuleId rule = 0;
        std::size_t length = 0;  // 匹配的符号个数，不含输入结束标记
        bool at_eof = false;     // 最佳匹配经过了输入结束标记
        std::size_t scanned = 0; // 本次尝试检查过的符号个数
    };

    // 从 DFA 起始状态出发持续消耗符号，记录最后一次经过的接受状态，
    // 没有转移或输入耗尽时停止；游标不移动，由调用方按 length 提交
    Attempt longest_match(const automata::DFA &dfa, Cursor &cursor);
}

#endif //MUNCH_LEXER_ENGINE_HPP
