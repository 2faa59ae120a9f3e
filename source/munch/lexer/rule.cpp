//
// Created by aowei on 2026 10月 17.
//

#include <algorithm>
#include <numeric>
#include <munch/errors.hpp>
#include <munch/log.hpp>
#include <munch/lexer/rule.hpp>

namespace munch::lexer {
    automata::DFA compile(const std::vector<Rule> &rules, const automata::TieBreak tie_break) {
        if (rules.empty()) {
            throw EmptyRuleSet();
        }
        // 零长度的词法单元永远不会推进游标
        for (const auto &rule: rules) {
            if (rule.pattern.nullable()) {
                throw InvalidPattern("rule '" + rule.name + "' matches the empty string");
            }
        }
        // 按优先级排序，NFA 接受标记为排序后的位置，便于比较优先级
        std::vector<std::size_t> order(rules.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&rules](const std::size_t a, const std::size_t b) {
            return rules[a].priority < rules[b].priority;
        });
        std::vector<pattern::Pattern> patterns;
        patterns.reserve(rules.size());
        for (const std::size_t index: order) patterns.push_back(rules[index].pattern);

        const automata::NFA nfa = automata::build_nfa(patterns);
        const automata::DFA dfa = automata::build_dfa(nfa, tie_break);
        automata::DFA min_dfa = automata::minimize_dfa(dfa);
        // 接受标记映射回 rules 中的下标
        for (auto &accept: min_dfa.accepts) {
            if (accept) accept = order[*accept];
        }
        log::logger()->debug("compiled {} rules: NFA {} states, DFA {} states, minimized {} states, {} divisions",
                             rules.size(), nfa.states.size(), dfa.size(), min_dfa.size(), min_dfa.alphabet.size());
        return min_dfa;
    }
}
