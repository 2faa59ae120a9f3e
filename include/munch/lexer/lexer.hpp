//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_LEXER_LEXER_HPP
#define MUNCH_LEXER_LEXER_HPP

#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <spdlog/fmt/fmt.h>
#include <munch/errors.hpp>
#include <munch/log.hpp>
#include <munch/automata/dfa.hpp>
#include <munch/lexer/context.hpp>
#include <munch/lexer/engine.hpp>
#include <munch/lexer/options.hpp>
#include <munch/lexer/reader.hpp>
#include <munch/lexer/rule.hpp>
#include <munch/pattern/pattern.hpp>
#include <munch/pattern/regex.hpp>

// 前置声明，Token 为调用方的词法单元类型，State 为每次运行独立的用户状态
namespace munch::lexer {
    template<typename Token, typename State = std::monostate>
    class Match;

    template<typename Token, typename State = std::monostate>
    class Session;

    template<typename Token, typename State = std::monostate>
    class Lexer;

    template<typename Token, typename State = std::monostate>
    class LexerBuilder;

    // 规则动作，空动作表示跳过匹配的文本
    template<typename Token, typename State = std::monostate>
    using Action = std::function<void(Match<Token, State> &)>;
}

// 动作句柄：一次匹配的文本与位置，以及对上下文栈、输出、用户状态的访问
namespace munch::lexer {
    template<typename Token, typename State>
    class Match {
    public:
        [[nodiscard]] const std::string &text() const { return this->lexeme; }
        [[nodiscard]] automata::RuleId rule() const { return this->rule_id; }
        [[nodiscard]] const std::string &rule_name() const { return this->name; }
        [[nodiscard]] const Position &begin() const { return this->begin_pos; }
        [[nodiscard]] const Position &end() const { return this->end_pos; }
        // 匹配经过了输入结束标记，本次运行将在动作之后结束
        [[nodiscard]] bool at_eof() const { return this->eof; }
        // 匹配时所在的上下文
        [[nodiscard]] const std::string &context() const { return this->context_name; }

        ContextStack &stack() { return this->context_stack; }
        void push(const std::string_view context) { this->context_stack.push(context); }
        void pop() { this->context_stack.pop(); }
        void emit(Token token) { this->output.push_back(std::move(token)); }
        State &state() { return this->user_state; }

    private:
        friend class Session<Token, State>;

        Match(const std::string &lexeme, const automata::RuleId rule_id, const std::string &name,
              const std::string &context_name, const Position &begin_pos, const Position &end_pos, const bool eof,
              ContextStack &context_stack, std::vector<Token> &output, State &user_state)
            : lexeme(lexeme), rule_id(rule_id), name(name), context_name(context_name), begin_pos(begin_pos),
              end_pos(end_pos), eof(eof), context_stack(context_stack), output(output), user_state(user_state) {}

        const std::string &lexeme;
        automata::RuleId rule_id;
        const std::string &name;
        const std::string &context_name;
        Position begin_pos;
        Position end_pos;
        bool eof;
        ContextStack &context_stack;
        std::vector<Token> &output;
        State &user_state;
    };
}

// 编译好的上下文与运行结果
namespace munch::lexer {
    template<typename Token, typename State = std::monostate>
    struct Context {
        std::string name;
        std::optional<ContextId> parent;
        std::vector<Rule> rules;                   // 含继承自父上下文的规则，下标与 DFA 接受标记一致
        std::vector<Action<Token, State> > actions; // 与 rules 一一对应
        automata::DFA dfa;
    };

    template<typename Token, typename State = std::monostate>
    struct LexResult {
        std::vector<Token> tokens;
        RunState state = RunState::IDLE;
        std::optional<LexError> error;
        State user_state{};

        [[nodiscard]] bool ok() const { return this->state == RunState::END_OF_INPUT; }
    };
}

// Session：一次运行的全部可变状态，单线程使用；同一个 Lexer 可同时驱动多个 Session
namespace munch::lexer {
    template<typename Token, typename State>
    class Session {
    public:
        Session(const Lexer<Token, State> &lexer, Reader &reader);

        // 识别一个词法单元并执行其动作，返回之后的运行状态；终止状态下什么都不做
        RunState step();
        // 运行到终止状态
        RunState run();
        [[nodiscard]] RunState state() const { return this->run_state; }
        [[nodiscard]] bool finished() const {
            return this->run_state == RunState::END_OF_INPUT || this->run_state == RunState::STUCK ||
                   this->run_state == RunState::FAILED;
        }
        [[nodiscard]] const ContextStack &stack() const { return this->context_stack; }
        [[nodiscard]] const Position &position() const { return this->cursor.position(); }
        [[nodiscard]] const std::vector<Token> &tokens() const { return this->output; }
        [[nodiscard]] const std::optional<LexError> &error() const { return this->failure; }
        State &user_state() { return this->data; }
        // 取走输出，Session 之后不应再使用
        LexResult<Token, State> take_result();

    private:
        void dispatch(const Context<Token, State> &context, const Attempt &attempt, const std::string &text,
                      const Position &begin, const Position &end);
        void on_stack_error(ErrorKind kind, const ContextStackError &error, const std::string &context,
                            const Position &position);

        const Lexer<Token, State> &lexer;
        Cursor cursor;
        ContextStack context_stack;
        RunState run_state = RunState::IDLE;
        std::vector<Token> output;
        std::optional<LexError> failure;
        State data{};
    };
}

// Lexer：编译完成后只读，可跨线程共享
namespace munch::lexer {
    template<typename Token, typename State>
    class Lexer {
    public:
        [[nodiscard]] Session<Token, State> session(Reader &reader) const {
            return Session<Token, State>(*this, reader);
        }

        [[nodiscard]] LexResult<Token, State> run(Reader &reader) const {
            Session<Token, State> session(*this, reader);
            session.run();
            return session.take_result();
        }

        [[nodiscard]] LexResult<Token, State> run(const std::string_view text) const {
            StringReader reader(text, this->lexer_options.encoding);
            return this->run(reader);
        }

        [[nodiscard]] const Context<Token, State> &context(const ContextId id) const { return this->contexts[id]; }
        [[nodiscard]] std::optional<ContextId> find(const std::string_view name) const {
            return this->names.find(name);
        }
        [[nodiscard]] const ContextRegistry &registry() const { return this->names; }
        [[nodiscard]] ContextId root() const { return this->root_id; }
        [[nodiscard]] const LexerOptions &options() const { return this->lexer_options; }

    private:
        friend class LexerBuilder<Token, State>;

        Lexer(ContextRegistry names, std::vector<Context<Token, State> > contexts, const ContextId root_id,
              const LexerOptions &lexer_options)
            : names(std::move(names)), contexts(std::move(contexts)), root_id(root_id),
              lexer_options(lexer_options) {}

        ContextRegistry names;
        std::vector<Context<Token, State> > contexts;
        ContextId root_id;
        LexerOptions lexer_options;
    };
}

// LexerBuilder：按上下文收集规则，build() 时一次性编译
namespace munch::lexer {
    template<typename Token, typename State>
    class LexerBuilder {
    public:
        class ContextBuilder {
        public:
            // 规则按调用顺序排定优先级
            ContextBuilder &rule(const pattern::Pattern &pattern, Action<Token, State> action,
                                 std::string name = {}) {
                if (name.empty()) name = "rule#" + std::to_string(this->rules.size());
                this->rules.push_back(Rule{this->rules.size(), pattern, std::move(name)});
                this->actions.push_back(std::move(action));
                return *this;
            }

            // 正则文本写法，非法正则立即抛出 InvalidPattern
            ContextBuilder &rule(const std::string_view regex, Action<Token, State> action, std::string name = {}) {
                if (name.empty()) name = std::string(regex);
                return this->rule(pattern::regex::parse(regex), std::move(action), std::move(name));
            }

            [[nodiscard]] const std::string &name() const { return this->context_name; }

            explicit ContextBuilder(std::string context_name) : context_name(std::move(context_name)) {}

        private:
            friend class LexerBuilder;

            std::string context_name;
            std::optional<std::string> parent;
            std::vector<Rule> rules;
            std::vector<Action<Token, State> > actions;
        };

        explicit LexerBuilder(const LexerOptions &options = {}) : options(options) {}

        // 定义或取回上下文，第一个定义的上下文默认为根上下文
        ContextBuilder &context(const std::string &name) {
            for (auto &builder: this->builders) {
                if (builder.context_name == name) return builder;
            }
            return this->builders.emplace_back(name);
        }

        // 带父上下文：当前上下文没有规则匹配时，按父上下文的规则继续尝试（优先级低于自身规则）
        ContextBuilder &context(const std::string &name, const std::string &parent) {
            ContextBuilder &builder = this->context(name);
            builder.parent = parent;
            return builder;
        }

        LexerBuilder &root(const std::string &name) {
            this->root_name = name;
            return *this;
        }

        // 编译全部上下文，失败时抛出 CompileError
        [[nodiscard]] Lexer<Token, State> build() const;

    private:
        LexerOptions options;
        std::deque<ContextBuilder> builders; // deque 保证返回的引用在继续定义上下文时有效
        std::optional<std::string> root_name;
    };
}

// 常用动作
namespace munch::lexer::actions {
    template<typename Token, typename State = std::monostate>
    Action<Token, State> push_context(std::string name) {
        return [name = std::move(name)](Match<Token, State> &match) { match.push(name); };
    }

    template<typename Token, typename State = std::monostate>
    Action<Token, State> pop_context() {
        return [](Match<Token, State> &match) { match.pop(); };
    }

    template<typename Token, typename State = std::monostate>
    Action<Token, State> skip() {
        return nullptr;
    }
}

// Session 的实现
namespace munch::lexer {
    template<typename Token, typename State>
    Session<Token, State>::Session(const Lexer<Token, State> &lexer, Reader &reader)
        : lexer(lexer), cursor(reader), context_stack(lexer.registry(), lexer.root()) {}

    template<typename Token, typename State>
    RunState Session<Token, State>::step() {
        if (this->finished()) return this->run_state;
        this->run_state = RunState::SCANNING;
        const Context<Token, State> &context = this->lexer.context(this->context_stack.current());
        const Attempt attempt = longest_match(context.dfa, this->cursor);
        switch (attempt.outcome) {
            case Attempt::Outcome::END_OF_INPUT:
                this->run_state = RunState::END_OF_INPUT;
                log::logger()->debug("end of input at {}:{}, {} tokens", this->cursor.position().line,
                                     this->cursor.position().column, this->output.size());
                return this->run_state;
            case Attempt::Outcome::STUCK: {
                const Position &position = this->cursor.position();
                const Symbol symbol = this->cursor.at(0);
                this->run_state = RunState::STUCK;
                this->failure = LexError{
                    ErrorKind::STUCK, position, context.name,
                    "no rule matches U+" + fmt::format("{:04X}", symbol) + " in context '" + context.name + "'"
                };
                log::logger()->warn("stuck at {}:{} in context '{}'", position.line, position.column, context.name);
                return this->run_state;
            }
            case Attempt::Outcome::MATCHED:
                break;
        }
        const Position begin = this->cursor.position();
        const std::string text = this->cursor.commit(attempt.length);
        const Position end = this->cursor.position();
        this->run_state = RunState::EMITTING;
        this->dispatch(context, attempt, text, begin, end);
        if (this->run_state == RunState::FAILED) return this->run_state;
        this->run_state = attempt.at_eof ? RunState::END_OF_INPUT : RunState::IDLE;
        return this->run_state;
    }

    template<typename Token, typename State>
    RunState Session<Token, State>::run() {
        while (!this->finished()) this->step();
        return this->run_state;
    }

    template<typename Token, typename State>
    LexResult<Token, State> Session<Token, State>::take_result() {
        LexResult<Token, State> result;
        result.tokens = std::move(this->output);
        result.state = this->run_state;
        result.error = std::move(this->failure);
        result.user_state = std::move(this->data);
        return result;
    }

    template<typename Token, typename State>
    void Session<Token, State>::dispatch(const Context<Token, State> &context, const Attempt &attempt,
                                         const std::string &text, const Position &begin, const Position &end) {
        const auto &action = context.actions[attempt.rule];
        log::logger()->trace("match rule '{}' in '{}' at {}:{}: \"{}\"", context.rules[attempt.rule].name,
                             context.name, begin.line, begin.column, text);
        if (!action) return;
        Match<Token, State> match(text, attempt.rule, context.rules[attempt.rule].name, context.name, begin, end,
                                  attempt.at_eof, this->context_stack, this->output, this->data);
        try {
            action(match);
        } catch (const UnknownContext &error) {
            this->on_stack_error(ErrorKind::UNKNOWN_CONTEXT, error, context.name, begin);
        } catch (const StackUnderflow &error) {
            this->on_stack_error(ErrorKind::STACK_UNDERFLOW, error, context.name, begin);
        }
    }

    template<typename Token, typename State>
    void Session<Token, State>::on_stack_error(const ErrorKind kind, const ContextStackError &error,
                                               const std::string &context, const Position &position) {
        if (this->lexer.options().stack_error == StackErrorPolicy::CONTINUE) {
            log::logger()->warn("{} at {}:{} in context '{}', continuing", error.what(), position.line,
                                position.column, context);
            return;
        }
        log::logger()->warn("{} at {}:{} in context '{}', aborting", error.what(), position.line, position.column,
                            context);
        this->run_state = RunState::FAILED;
        this->failure = LexError{kind, position, context, error.what()};
    }
}

// LexerBuilder 的实现
namespace munch::lexer {
    template<typename Token, typename State>
    Lexer<Token, State> LexerBuilder<Token, State>::build() const {
        if (this->builders.empty()) {
            throw CompileError(CompileError::Reason::EMPTY_RULE_SET, "", "no context defined");
        }
        ContextRegistry names;
        for (const auto &builder: this->builders) names.define(builder.context_name);

        const std::string &root = this->root_name ? *this->root_name : this->builders.front().context_name;
        const auto root_id = names.find(root);
        if (!root_id) {
            throw CompileError(CompileError::Reason::INVALID_CONTEXT, root, "root context is not defined");
        }

        // 解析父上下文
        std::vector<std::optional<ContextId> > parents(this->builders.size());
        for (std::size_t i = 0; i < this->builders.size(); ++i) {
            const auto &builder = this->builders[i];
            if (!builder.parent) continue;
            const auto parent = names.find(*builder.parent);
            if (!parent) {
                throw CompileError(CompileError::Reason::INVALID_CONTEXT, builder.context_name,
                                   "parent context '" + *builder.parent + "' is not defined");
            }
            parents[i] = parent;
        }

        // 展开继承链：自身规则在前，祖先规则依次在后
        std::vector<Context<Token, State> > contexts(this->builders.size());
        for (std::size_t i = 0; i < this->builders.size(); ++i) {
            auto &context = contexts[i];
            context.name = this->builders[i].context_name;
            context.parent = parents[i];
            std::optional<ContextId> current = i;
            std::size_t depth = 0;
            while (current) {
                if (depth++ > this->builders.size()) {
                    throw CompileError(CompileError::Reason::INVALID_CONTEXT, context.name,
                                       "context inheritance forms a cycle");
                }
                const auto &source = this->builders[*current];
                for (std::size_t r = 0; r < source.rules.size(); ++r) {
                    context.rules.push_back(
                        Rule{context.rules.size(), source.rules[r].pattern, source.rules[r].name});
                    context.actions.push_back(source.actions[r]);
                }
                current = parents[*current];
            }
        }

        const automata::TieBreak tie_break = this->options.tie_break;
        auto compile_context = [tie_break](const Context<Token, State> &context) {
            try {
                return compile(context.rules, tie_break);
            } catch (const InvalidPattern &error) {
                throw CompileError(CompileError::Reason::INVALID_PATTERN, context.name, error.what());
            } catch (const EmptyRuleSet &error) {
                throw CompileError(CompileError::Reason::EMPTY_RULE_SET, context.name, error.what());
            }
        };

        if (this->options.parallel_compile) {
            std::vector<std::future<automata::DFA> > futures;
            futures.reserve(contexts.size());
            for (const auto &context: contexts) {
                futures.push_back(std::async(std::launch::async, compile_context, std::cref(context)));
            }
            for (std::size_t i = 0; i < contexts.size(); ++i) contexts[i].dfa = futures[i].get();
        } else {
            for (auto &context: contexts) context.dfa = compile_context(context);
        }

        log::logger()->info("built lexer: {} contexts, root '{}'", contexts.size(), root);
        return Lexer<Token, State>(std::move(names), std::move(contexts), *root_id, this->options);
    }
}

#endif //MUNCH_LEXER_LEXER_HPP
