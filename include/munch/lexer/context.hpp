//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_LEXER_CONTEXT_HPP
#define MUNCH_LEXER_CONTEXT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace munch::lexer {
    // 上下文编号：上下文表中的下标
    using ContextId = std::size_t;

    // 上下文名称表，名称唯一
    class ContextRegistry {
    public:
        // 已存在时返回原编号
        ContextId define(const std::string &name);
        [[nodiscard]] std::optional<ContextId> find(std::string_view name) const;
        [[nodiscard]] const std::string &name(ContextId id) const { return this->names[id]; }
        [[nodiscard]] std::size_t size() const { return this->names.size(); }

    private:
        std::vector<std::string> names;
        std::unordered_map<std::string, ContextId> index;
    };

    // 上下文栈：栈顶为当前上下文，根上下文始终在栈底
    // 出错时抛出 UnknownContext / StackUnderflow，栈保持不变
    class ContextStack {
    public:
        ContextStack(const ContextRegistry &registry, ContextId root);

        void push(std::string_view name);
        void push(ContextId id);
        void pop();
        [[nodiscard]] ContextId current() const { return this->stack.back(); }
        [[nodiscard]] const std::string &current_name() const { return this->registry.name(this->current()); }
        [[nodiscard]] std::size_t depth() const { return this->stack.size(); }
        // 回到只有根上下文的状态
        void reset();

    private:
        const ContextRegistry &registry;
        std::vector<ContextId> stack;
    };
}

#endif //MUNCH_LEXER_CONTEXT_HPP
