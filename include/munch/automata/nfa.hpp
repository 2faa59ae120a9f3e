//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_AUTOMATA_NFA_HPP
#define MUNCH_AUTOMATA_NFA_HPP

#include <cstddef>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include <munch/pattern/pattern.hpp>

// 自动机公共类型
namespace munch::automata {
    // 状态编号：状态数组中的下标
    using StateId = std::size_t;
    // 规则编号：接受状态上的标记
    using RuleId = std::size_t;

    constexpr StateId INVALID_STATE = std::numeric_limits<StateId>::max();
}

// NFA 相关定义：所有状态保存在同一个数组里，状态之间只通过下标引用
namespace munch::automata {
    struct NFAState {
        std::vector<std::pair<pattern::SymbolSet, StateId> > transitions; // 符号集合 --> 目标状态
        std::vector<StateId> epsilons;                                   // ε 转移
        std::optional<RuleId> accept;                                    // 接受状态对应的规则
    };

    // Thompson 构造的子自动机：唯一入口与唯一出口
    struct Fragment {
        StateId start;
        StateId end;
    };

    class NFA {
    public:
        StateId start = INVALID_STATE;
        std::vector<NFAState> states;

    public:
        NFA() = default;

        StateId add_state();
        void add_transition(StateId from, const pattern::SymbolSet &symbols, StateId to);
        void add_epsilon(StateId from, StateId to);
        // 调试用：打印 NFA 结构
        void dump(std::ostream &out, const std::string &name = "NFA") const;
    };
}

// NFA 构建
namespace munch::automata {
    // 按模式结构后序递归构建子自动机，状态追加到 nfa 中
    Fragment build_fragment(NFA &nfa, const pattern::Pattern &pattern);
    // 每个模式一个子自动机，接受状态标记为其下标，再由一个新的起始状态通过 ε 转移连接
    NFA build_nfa(const std::vector<pattern::Pattern> &patterns);
}

#endif //MUNCH_AUTOMATA_NFA_HPP
