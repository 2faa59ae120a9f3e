//
// Created by aowei on 2026 10月 17.
//

#include <munch/automata/nfa.hpp>

// NFA 的实现
namespace munch::automata {
    StateId NFA::add_state() {
        this->states.emplace_back();
        return this->states.size() - 1;
    }

    void NFA::add_transition(const StateId from, const pattern::SymbolSet &symbols, const StateId to) {
        this->states[from].transitions.emplace_back(symbols, to);
    }

    void NFA::add_epsilon(const StateId from, const StateId to) {
        this->states[from].epsilons.push_back(to);
    }

    // 调试用打印函数
    void NFA::dump(std::ostream &out, const std::string &name) const {
        out << "=== " << name << " Structure ===" << std::endl;
        out << "Start State: " << (this->start == INVALID_STATE ? "None" : std::to_string(this->start)) << std::endl;
        out << "Accept States: ";
        for (StateId id = 0; id < this->states.size(); ++id) {
            if (this->states[id].accept) out << id << "(rule " << *this->states[id].accept << ") ";
        }
        out << "\nTransitions:\n";
        for (StateId id = 0; id < this->states.size(); ++id) {
            for (const auto &[symbols, target]: this->states[id].transitions) {
                out << "  State " << id << " --" << symbols.to_string() << "--> State " << target << std::endl;
            }
            for (const StateId target: this->states[id].epsilons) {
                out << "  State " << id << " --ε--> State " << target << std::endl;
            }
        }
        out << "===========================\n" << std::endl;
    }
}

// NFA 构建辅助函数，每种组合子对应一个函数
namespace munch::automata {
    namespace {
        // 符号集合的构建：start --set--> end
        Fragment create_symbol_nfa(NFA &nfa, const pattern::SymbolSet &symbols) {
            const StateId start = nfa.add_state();
            const StateId end = nfa.add_state();
            nfa.add_transition(start, symbols, end);
            return {start, end};
        }

        // 空串的构建：start --ε--> end
        Fragment create_empty_nfa(NFA &nfa) {
            const StateId start = nfa.add_state();
            const StateId end = nfa.add_state();
            nfa.add_epsilon(start, end);
            return {start, end};
        }

        // 连接的构建：ab，a 的出口 --ε--> b 的入口
        Fragment create_concatenate_nfa(NFA &nfa, const Fragment a, const Fragment b) {
            nfa.add_epsilon(a.end, b.start);
            return {a.start, b.end};
        }

        // 选择的构建：a|b
        Fragment create_alternative_nfa(NFA &nfa, const Fragment a, const Fragment b) {
            const StateId start = nfa.add_state();
            const StateId end = nfa.add_state();
            // ε 转移：新的起始 -> a/b 的起始；a/b 的出口 -> 新的出口
            nfa.add_epsilon(start, a.start);
            nfa.add_epsilon(start, b.start);
            nfa.add_epsilon(a.end, end);
            nfa.add_epsilon(b.end, end);
            return {start, end};
        }

        // 闭包的构建：a*
        Fragment create_kleene_closure(NFA &nfa, const Fragment a) {
            const StateId start = nfa.add_state();
            const StateId end = nfa.add_state();
            // ε 转移：新起始 -> a 的起始/新的出口；a 的出口 -> a 的起始/新的出口
            nfa.add_epsilon(start, a.start);
            nfa.add_epsilon(start, end);
            nfa.add_epsilon(a.end, a.start);
            nfa.add_epsilon(a.end, end);
            return {start, end};
        }

        // 可选的构建：a?
        Fragment create_optional_nfa(NFA &nfa, const Fragment a) {
            nfa.add_epsilon(a.start, a.end);
            return a;
        }

        // 重复的构建：a{min,max} 展开为 min 个必选副本，后接 max-min 个可选副本或一个闭包
        Fragment create_repeat_nfa(NFA &nfa, const pattern::Pattern &body, const int min, const int max) {
            std::optional<Fragment> result;
            const auto append = [&](const Fragment next) {
                result = result ? create_concatenate_nfa(nfa, *result, next) : next;
            };
            for (int i = 0; i < min; ++i) {
                append(build_fragment(nfa, body));
            }
            if (max == pattern::Pattern::UNBOUNDED) {
                append(create_kleene_closure(nfa, build_fragment(nfa, body)));
            } else {
                for (int i = min; i < max; ++i) {
                    append(create_optional_nfa(nfa, build_fragment(nfa, body)));
                }
            }
            // a{0,0} 只匹配空串
            return result ? *result : create_empty_nfa(nfa);
        }
    }
}

// NFA 构建
namespace munch::automata {
    Fragment build_fragment(NFA &nfa, const pattern::Pattern &pattern) {
        switch (pattern.kind()) {
            case pattern::PatternKind::SYMBOL:
                return create_symbol_nfa(nfa, pattern.symbol_set());
            case pattern::PatternKind::SEQ: {
                const Fragment a = build_fragment(nfa, pattern.left());
                const Fragment b = build_fragment(nfa, pattern.right());
                return create_concatenate_nfa(nfa, a, b);
            }
            case pattern::PatternKind::OR: {
                const Fragment a = build_fragment(nfa, pattern.left());
                const Fragment b = build_fragment(nfa, pattern.right());
                return create_alternative_nfa(nfa, a, b);
            }
            case pattern::PatternKind::REPEAT:
                return create_repeat_nfa(nfa, pattern.left(), pattern.min(), pattern.max());
        }
        return create_empty_nfa(nfa);
    }

    NFA build_nfa(const std::vector<pattern::Pattern> &patterns) {
        NFA nfa;
        nfa.start = nfa.add_state();
        for (RuleId rule = 0; rule < patterns.size(); ++rule) {
            const Fragment fragment = build_fragment(nfa, patterns[rule]);
            nfa.add_epsilon(nfa.start, fragment.start);
            nfa.states[fragment.end].accept = rule;
        }
        return nfa;
    }
}
