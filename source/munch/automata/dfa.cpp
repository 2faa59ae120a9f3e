//
// Created by aowei on 2026 10月 17.
//

#include <map>
#include <queue>
#include <stack>
#include <stdexcept>
#include <munch/automata/dfa.hpp>

// 字母表划分的实现
namespace munch::automata {
    Alphabet::Alphabet() {
        this->reindex();
    }

    Alphabet Alphabet::from_nfa(const NFA &nfa) {
        // 每个区间 [lo, hi] 贡献两个边界 lo 和 hi + 1
        std::vector<Symbol> bounds{0};
        for (const auto &state: nfa.states) {
            for (const auto &[symbols, _]: state.transitions) {
                for (const auto &[lo, hi]: symbols.ranges()) {
                    bounds.push_back(lo);
                    if (hi != END_OF_INPUT) bounds.push_back(hi + 1);
                }
            }
        }
        std::sort(bounds.begin(), bounds.end());
        bounds.erase(std::unique(bounds.begin(), bounds.end()), bounds.end());
        Alphabet alphabet;
        alphabet.starts = std::move(bounds);
        alphabet.reindex();
        return alphabet;
    }

    void Alphabet::reindex() {
        std::size_t division = 0;
        for (Symbol s = 0; s < this->low.size(); ++s) {
            while (division + 1 < this->starts.size() && this->starts[division + 1] <= s) ++division;
            this->low[s] = static_cast<std::uint32_t>(division);
        }
    }

    pattern::SymbolRange Alphabet::division(const std::size_t index) const {
        const Symbol hi = index + 1 < this->starts.size() ? this->starts[index + 1] - 1 : END_OF_INPUT;
        return {this->starts[index], hi};
    }
}

// DFA 的实现
namespace munch::automata {
    StateId DFA::add_state(std::optional<RuleId> accept) {
        this->accepts.push_back(accept);
        this->transitions.resize(this->transitions.size() + this->alphabet.size(), INVALID_STATE);
        return this->accepts.size() - 1;
    }

    // DFA 调试用打印函数
    void DFA::dump(std::ostream &out, const std::string &name) const {
        out << "=== " << name << " Structure ===" << std::endl;
        out << "Start State: " << (this->start == INVALID_STATE ? "None" : std::to_string(this->start)) << std::endl;
        out << "Accept States: ";
        for (StateId id = 0; id < this->size(); ++id) {
            if (this->accepts[id]) out << id << "(rule " << *this->accepts[id] << ") ";
        }
        out << "\nTransitions:\n";
        for (StateId id = 0; id < this->size(); ++id) {
            for (std::size_t d = 0; d < this->alphabet.size(); ++d) {
                const StateId target = this->next_division(id, d);
                if (target == INVALID_STATE) continue;
                const auto [lo, hi] = this->alphabet.division(d);
                out << "  State " << id << " --" << pattern::SymbolSet(lo, hi).to_string() << "--> State " << target
                        << std::endl;
            }
        }
        out << "===========================\n" << std::endl;
    }
}

// DFA 构建辅助函数
namespace munch::automata {
    namespace {
        // 1. 计算 ε 闭包，结果升序排列，作为 DFA 状态的键
        std::vector<StateId> epsilon_closure(const NFA &nfa, const std::vector<StateId> &states) {
            std::vector<bool> seen(nfa.states.size(), false);
            std::vector<StateId> closure;
            std::stack<StateId> pending;
            for (const StateId s: states) {
                if (!seen[s]) {
                    seen[s] = true;
                    pending.push(s);
                }
            }
            while (!pending.empty()) {
                const StateId current = pending.top();
                pending.pop();
                closure.push_back(current);
                for (const StateId next: nfa.states[current].epsilons) {
                    if (!seen[next]) {
                        seen[next] = true;
                        pending.push(next);
                    }
                }
            }
            std::sort(closure.begin(), closure.end());
            return closure;
        }

        // 2. 计算按区间的转移：区间编号 -> 目标 NFA 状态
        std::map<std::size_t, std::vector<StateId> > move_states(const NFA &nfa, const Alphabet &alphabet,
                                                          const std::vector<StateId> &states) {
            std::map<std::size_t, std::vector<StateId> > result;
            for (const StateId s: states) {
                for (const auto &[symbols, target]: nfa.states[s].transitions) {
                    for (const auto &[lo, hi]: symbols.ranges()) {
                        const std::size_t last = alphabet.division_of(hi);
                        for (std::size_t d = alphabet.division_of(lo); d <= last; ++d) {
                            result[d].push_back(target);
                        }
                    }
                }
            }
            return result;
        }

        // 3. 接受标记：集合中所有接受状态的规则里按 tie_break 取一条
        std::optional<RuleId> accept_tag(const NFA &nfa, const std::vector<StateId> &states,
                                         const TieBreak tie_break) {
            std::optional<RuleId> tag;
            for (const StateId s: states) {
                const auto &accept = nfa.states[s].accept;
                if (!accept) continue;
                if (!tag || (tie_break == TieBreak::EARLIEST_RULE ? *accept < *tag : *accept > *tag)) {
                    tag = accept;
                }
            }
            return tag;
        }
    }
}

// 核心功能函数实现
namespace munch::automata {
    // DFA 构建：NFA -> DFA
    DFA build_dfa(const NFA &nfa, const TieBreak tie_break) {
        if (nfa.start == INVALID_STATE) {
            throw std::invalid_argument("Cannot build DFA from invalid NFA!");
        }
        DFA dfa;
        dfa.alphabet = Alphabet::from_nfa(nfa);
        const std::size_t width = dfa.alphabet.size();
        std::map<std::vector<StateId>, StateId> state_map;
        std::queue<std::vector<StateId> > state_queue;
        // 若状态集合不存在，则创建新的 DFA 状态
        const auto intern = [&](std::vector<StateId> nfa_states) {
            const auto it = state_map.find(nfa_states);
            if (it != state_map.end()) return it->second;
            const StateId id = dfa.add_state(accept_tag(nfa, nfa_states, tie_break));
            state_map.emplace(nfa_states, id);
            state_queue.push(std::move(nfa_states));
            return id;
        };
        // 初始状态：NFA 起始状态的 ε 闭包
        dfa.start = intern(epsilon_closure(nfa, {nfa.start}));
        // 广度优先处理所有的 DFA 状态
        while (!state_queue.empty()) {
            const std::vector<StateId> current = std::move(state_queue.front());
            state_queue.pop();
            const StateId current_id = state_map.at(current);
            for (const auto &[division, targets]: move_states(nfa, dfa.alphabet, current)) {
                const StateId next_id = intern(epsilon_closure(nfa, targets));
                dfa.transitions[current_id * width + division] = next_id;
            }
        }
        return dfa;
    }

    // DFA 最小化：分割法实现
    DFA minimize_dfa(const DFA &original_dfa) {
        const std::size_t n = original_dfa.size();
        const std::size_t width = original_dfa.alphabet.size();
        constexpr std::size_t NO_BLOCK = INVALID_STATE;
        // 1. 初始分割：接受标记相同的状态在同一分区
        std::vector<std::size_t> block(n);
        std::map<std::optional<RuleId>, std::size_t> initial;
        for (StateId s = 0; s < n; ++s) {
            block[s] = initial.emplace(original_dfa.accepts[s], initial.size()).first->second;
        }
        std::size_t block_count = initial.size();
        // 2. 迭代分割直到稳定下来：特征 = 自身分区 + 每个区间的目标分区
        while (true) {
            std::map<std::vector<std::size_t>, std::size_t> groups;
            std::vector<std::size_t> next_block(n);
            for (StateId s = 0; s < n; ++s) {
                std::vector<std::size_t> key;
                key.reserve(width + 1);
                key.push_back(block[s]);
                for (std::size_t d = 0; d < width; ++d) {
                    const StateId target = original_dfa.next_division(s, d);
                    key.push_back(target == INVALID_STATE ? NO_BLOCK : block[target]);
                }
                next_block[s] = groups.emplace(std::move(key), groups.size()).first->second;
            }
            const bool changed = groups.size() != block_count;
            block = std::move(next_block);
            block_count = groups.size();
            if (!changed) break;
        }
        // 3. 构建最小 DFA，取每一个分区的第一个状态为代表，从起始状态广度优先编号
        std::vector<StateId> representative(block_count, INVALID_STATE);
        for (StateId s = 0; s < n; ++s) {
            if (representative[block[s]] == INVALID_STATE) representative[block[s]] = s;
        }
        DFA min_dfa;
        min_dfa.alphabet = original_dfa.alphabet;
        std::vector<StateId> new_id(block_count, INVALID_STATE);
        std::queue<std::size_t> pending;
        const std::size_t start_block = block[original_dfa.start];
        new_id[start_block] = min_dfa.add_state(original_dfa.accepts[representative[start_block]]);
        min_dfa.start = new_id[start_block];
        pending.push(start_block);
        while (!pending.empty()) {
            const std::size_t current = pending.front();
            pending.pop();
            const StateId rep = representative[current];
            for (std::size_t d = 0; d < width; ++d) {
                const StateId target = original_dfa.next_division(rep, d);
                if (target == INVALID_STATE) continue;
                const std::size_t target_block = block[target];
                if (new_id[target_block] == INVALID_STATE) {
                    new_id[target_block] = min_dfa.add_state(original_dfa.accepts[representative[target_block]]);
                    pending.push(target_block);
                }
                min_dfa.transitions[new_id[current] * width + d] = new_id[target_block];
            }
        }
        // 4. 合并转移完全相同的相邻区间，缩小转移表
        std::vector<std::size_t> kept{0};
        for (std::size_t d = 1; d < width; ++d) {
            bool same = true;
            for (StateId s = 0; s < min_dfa.size() && same; ++s) {
                same = min_dfa.next_division(s, d) == min_dfa.next_division(s, kept.back());
            }
            if (!same) kept.push_back(d);
        }
        if (kept.size() == width) return min_dfa;
        DFA compact;
        compact.alphabet.starts.clear();
        for (const std::size_t d: kept) compact.alphabet.starts.push_back(min_dfa.alphabet.starts[d]);
        compact.alphabet.reindex();
        compact.start = min_dfa.start;
        for (StateId s = 0; s < min_dfa.size(); ++s) {
            compact.add_state(min_dfa.accepts[s]);
            for (std::size_t i = 0; i < kept.size(); ++i) {
                compact.transitions[s * kept.size() + i] = min_dfa.next_division(s, kept[i]);
            }
        }
        return compact;
    }

    // 匹配：DFA + 输入序列 -> 整串匹配时的接受标记
    std::optional<RuleId> match(const DFA &dfa, const std::u32string_view input) {
        StateId current = dfa.start;
        if (current == INVALID_STATE) return std::nullopt;
        for (const Symbol c: input) {
            current = dfa.next(current, c);
            if (current == INVALID_STATE) {
                // 无匹配，转移失败
                return std::nullopt;
            }
        }
        return dfa.accept(current);
    }
}
