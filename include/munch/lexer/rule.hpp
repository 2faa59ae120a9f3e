//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_LEXER_RULE_HPP
#define MUNCH_LEXER_RULE_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <munch/automata/dfa.hpp>
#include <munch/pattern/pattern.hpp>

namespace munch::lexer {
    // 规则：优先级（声明顺序，越小越优先）+ 模式 + 动作名
    struct Rule {
        std::size_t priority;
        pattern::Pattern pattern;
        std::string name;
    };

    // 编译规则集合为最小 DFA，接受标记为 rules 中的下标
    // 规则为空抛出 EmptyRuleSet，模式能匹配空串抛出 InvalidPattern
    automata::DFA compile(const std::vector<Rule> &rules,
                          automata::TieBreak tie_break = automata::TieBreak::EARLIEST_RULE);
}

#endif //MUNCH_LEXER_RULE_HPP
