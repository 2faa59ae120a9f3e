//
// Created by aowei on 2026 10月 17.
//

#include <munch/errors.hpp>
#include <munch/log.hpp>
#include <munch/lexer/context.hpp>

// ContextRegistry 的实现
namespace munch::lexer {
    ContextId ContextRegistry::define(const std::string &name) {
        if (const auto it = this->index.find(name); it != this->index.end()) {
            return it->second;
        }
        this->names.push_back(name);
        this->index.emplace(name, this->names.size() - 1);
        return this->names.size() - 1;
    }

    std::optional<ContextId> ContextRegistry::find(const std::string_view name) const {
        const auto it = this->index.find(std::string(name));
        if (it == this->index.end()) return std::nullopt;
        return it->second;
    }
}

// ContextStack 的实现
namespace munch::lexer {
    ContextStack::ContextStack(const ContextRegistry &registry, const ContextId root) : registry(registry) {
        this->stack.push_back(root);
    }

    void ContextStack::push(const std::string_view name) {
        const auto id = this->registry.find(name);
        if (!id) {
            throw UnknownContext(std::string(name));
        }
        this->push(*id);
    }

    void ContextStack::push(const ContextId id) {
        if (id >= this->registry.size()) {
            throw UnknownContext("#" + std::to_string(id));
        }
        this->stack.push_back(id);
        log::logger()->debug("push context '{}' (depth {})", this->registry.name(id), this->stack.size());
    }

    void ContextStack::pop() {
        if (this->stack.size() <= 1) {
            throw StackUnderflow();
        }
        log::logger()->debug("pop context '{}' (depth {})", this->current_name(), this->stack.size() - 1);
        this->stack.pop_back();
    }

    void ContextStack::reset() {
        this->stack.resize(1);
    }
}
