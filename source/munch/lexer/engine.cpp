//
// Created by aowei on 2026 10月 17.
//

#include <munch/lexer/engine.hpp>

namespace munch::lexer {
    std::string_view to_string(const RunState state) {
        switch (state) {
            case RunState::IDLE: return "IDLE";
            case RunState::SCANNING: return "SCANNING";
            case RunState::EMITTING: return "EMITTING";
            case RunState::END_OF_INPUT: return "END_OF_INPUT";
            case RunState::STUCK: return "STUCK";
            case RunState::FAILED: return "FAILED";
        }
        return "UNKNOWN";
    }

    std::string_view to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::STUCK: return "STUCK";
            case ErrorKind::UNKNOWN_CONTEXT: return "UNKNOWN_CONTEXT";
            case ErrorKind::STACK_UNDERFLOW: return "STACK_UNDERFLOW";
        }
        return "UNKNOWN";
    }
}

// Cursor 的实现
namespace munch::lexer {
    Cursor::Cursor(Reader &reader) : reader(reader) {}

    Symbol Cursor::at(const std::size_t index) {
        while (this->pending.size() <= index) {
            const Symbol symbol = this->reader.peek();
            if (symbol == END_OF_INPUT) return END_OF_INPUT;
            this->pending.push_back({symbol, std::string(this->reader.peek_bytes())});
            this->reader.advance();
        }
        return this->pending[index].symbol;
    }

    std::string Cursor::commit(const std::size_t count) {
        std::string text;
        for (std::size_t i = 0; i < count && !this->pending.empty(); ++i) {
            const Item &item = this->pending.front();
            text += item.bytes;
            this->pos.advance(item.symbol, item.bytes.size());
            this->pending.pop_front();
        }
        return text;
    }
}

// 最长匹配的实现
namespace munch::lexer {
    Attempt longest_match(const automata::DFA &dfa, Cursor &cursor) {
        Attempt attempt;
        bool matched = false;
        automata::StateId state = dfa.start;
        std::size_t index = 0;
        while (true) {
            const Symbol symbol = cursor.at(index);
            const automata::StateId next = dfa.next(state, symbol);
            if (next == automata::INVALID_STATE) break;
            state = next;
            if (symbol == END_OF_INPUT) {
                // 输入结束标记只喂一次，不计入匹配长度
                ++attempt.scanned;
                if (const auto &accept = dfa.accept(state)) {
                    matched = true;
                    attempt.rule = *accept;
                    attempt.length = index;
                    attempt.at_eof = true;
                }
                break;
            }
            ++index;
            ++attempt.scanned;
            // 更长的匹配总是覆盖之前较短的匹配
            if (const auto &accept = dfa.accept(state)) {
                matched = true;
                attempt.rule = *accept;
                attempt.length = index;
            }
        }
        if (matched) {
            attempt.outcome = Attempt::Outcome::MATCHED;
        } else if (cursor.at(0) == END_OF_INPUT) {
            attempt.outcome = Attempt::Outcome::END_OF_INPUT;
        } else {
            attempt.outcome = Attempt::Outcome::STUCK;
        }
        return attempt;
    }
}
