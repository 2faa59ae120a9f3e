//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_LEXER_OPTIONS_HPP
#define MUNCH_LEXER_OPTIONS_HPP

#include <munch/automata/dfa.hpp>
#include <munch/lexer/reader.hpp>

namespace munch::lexer {
    // 动作误用上下文栈且未自行处理时的策略
    enum class StackErrorPolicy {
        ABORT,    // 终止本次运行，状态为 FAILED（默认）
        CONTINUE, // 记录日志，保持栈不变继续分析
    };

    struct LexerOptions {
        automata::TieBreak tie_break = automata::TieBreak::EARLIEST_RULE;
        StackErrorPolicy stack_error = StackErrorPolicy::ABORT;
        // 各上下文并行编译
        bool parallel_compile = false;
        // Lexer::run(std::string_view) 使用的输入编码
        Encoding encoding = Encoding::UTF8;
    };
}

#endif //MUNCH_LEXER_OPTIONS_HPP
