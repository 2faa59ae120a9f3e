//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_AUTOMATA_DFA_HPP
#define MUNCH_AUTOMATA_DFA_HPP

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <munch/automata/nfa.hpp>

// 字母表划分：把符号空间切成若干区间，NFA 的每个转移标签要么完整包含、要么完全不含某个区间
namespace munch::automata {
    class Alphabet {
    public:
        std::vector<Symbol> starts{0}; // 各区间的起点，升序，starts[0] == 0

    public:
        Alphabet();

        static Alphabet from_nfa(const NFA &nfa);
        // 重建低位符号的快速查找表，修改 starts 后调用
        void reindex();

        [[nodiscard]] std::size_t size() const { return this->starts.size(); }

        [[nodiscard]] std::size_t division_of(const Symbol symbol) const {
            if (symbol < this->low.size()) return this->low[symbol];
            return static_cast<std::size_t>(
                       std::upper_bound(this->starts.begin(), this->starts.end(), symbol) - this->starts.begin()) - 1;
        }

        [[nodiscard]] pattern::SymbolRange division(std::size_t index) const;

    private:
        // 符号 0-255 直接查表
        std::array<std::uint32_t, 256> low{};
    };
}

// DFA 相关定义：稠密转移表，行为状态，列为字母表区间
namespace munch::automata {
    // 同一个 DFA 状态对应多条规则的接受状态时，选哪一条
    enum class TieBreak {
        EARLIEST_RULE, // 先声明的规则优先（默认）
        LATEST_RULE,   // 后声明的规则优先
    };

    class DFA {
    public:
        StateId start = INVALID_STATE;
        Alphabet alphabet;
        std::vector<StateId> transitions;            // transitions[state * alphabet.size() + division]
        std::vector<std::optional<RuleId> > accepts; // 每个状态的接受标记

    public:
        DFA() = default;

        StateId add_state(std::optional<RuleId> accept);

        [[nodiscard]] std::size_t size() const { return this->accepts.size(); }

        // 没有转移时返回 INVALID_STATE
        [[nodiscard]] StateId next(const StateId state, const Symbol symbol) const {
            return this->transitions[state * this->alphabet.size() + this->alphabet.division_of(symbol)];
        }

        [[nodiscard]] StateId next_division(const StateId state, const std::size_t division) const {
            return this->transitions[state * this->alphabet.size() + division];
        }

        [[nodiscard]] const std::optional<RuleId> &accept(const StateId state) const {
            return this->accepts[state];
        }

        // 调试用：打印 DFA 结构
        void dump(std::ostream &out, const std::string &name = "DFA") const;
    };
}

// 核心功能函数的声明
namespace munch::automata {
    // DFA 构建：子集构造法
    DFA build_dfa(const NFA &nfa, TieBreak tie_break = TieBreak::EARLIEST_RULE);
    // DFA 最小化：原始 DFA -> 最小 DFA，起始状态编号为 0
    DFA minimize_dfa(const DFA &original_dfa);
    // 整串匹配：输入全部消耗后所在状态的接受标记，中途失败返回空
    std::optional<RuleId> match(const DFA &dfa, std::u32string_view input);
}

#endif //MUNCH_AUTOMATA_DFA_HPP
