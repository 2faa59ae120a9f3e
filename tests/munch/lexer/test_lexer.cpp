//
// Created by aowei on 2026 10月 17.
//

#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <munch/lexer/lexer.hpp>

using namespace munch;
using namespace munch::lexer;
using munch::pattern::Pattern;

namespace {
    struct Tok {
        std::string kind;
        std::string text;

        bool operator==(const Tok &other) const { return kind == other.kind && text == other.text; }
    };

    std::ostream &operator<<(std::ostream &out, const Tok &tok) {
        return out << tok.kind << "(" << tok.text << ")";
    }

    using TokMatch = Match<Tok>;
    using TokAction = Action<Tok>;

    TokAction emit(const std::string &kind) {
        return [kind](TokMatch &match) { match.emit(Tok{kind, match.text()}); };
    }

    // 关键字 + 标识符，关键字先声明
    Lexer<Tok> keyword_lexer(const LexerOptions &options = {}) {
        LexerBuilder<Tok> builder(options);
        builder.context("main")
                .rule(Pattern::literal("if"), emit("KEYWORD"))
                .rule("[a-zA-Z]+", emit("IDENT"))
                .rule("[ \t\n]+", nullptr);
        return builder.build();
    }

    // 根上下文遇到引号进入 string 上下文
    Lexer<Tok> string_lexer(const LexerOptions &options = {}) {
        LexerBuilder<Tok> builder(options);
        builder.context("main")
                .rule("\"", actions::push_context<Tok>("string"))
                .rule("[a-z]+", emit("IDENT"));
        builder.context("string")
                .rule("[^\"]+", emit("STRING_CHUNK"))
                .rule("\"", actions::pop_context<Tok>());
        return builder.build();
    }
}

// 场景 1：最长匹配覆盖优先级
TEST(LexerTest, LongestMatchOverridesPriority) {
    const auto result = keyword_lexer().run("iffy");
    EXPECT_EQ(result.state, RunState::END_OF_INPUT);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"IDENT", "iffy"}}));
}

// 场景 2：同样长度时先声明的规则优先
TEST(LexerTest, EqualLengthEarlierRuleWins) {
    const auto result = keyword_lexer().run("if");
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"KEYWORD", "if"}}));
    EXPECT_EQ(keyword_lexer().run("if iffy fi").tokens,
              (std::vector<Tok>{{"KEYWORD", "if"}, {"IDENT", "iffy"}, {"IDENT", "fi"}}));
}

// 场景 3：上下文切换
TEST(LexerTest, ContextSwitch) {
    const auto result = string_lexer().run("\"ab\"c");
    EXPECT_EQ(result.state, RunState::END_OF_INPUT);
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"STRING_CHUNK", "ab"}, {"IDENT", "c"}}));
}

// 场景 4：当前位置没有规则匹配
TEST(LexerTest, StuckAtStart) {
    const auto result = keyword_lexer().run("1abc");
    EXPECT_EQ(result.state, RunState::STUCK);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.tokens.empty());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::STUCK);
    EXPECT_EQ(result.error->position, (Position{0, 1, 1}));
    EXPECT_EQ(result.error->context, "main");
}

// 卡住时报告所在位置与当前上下文
TEST(LexerTest, StuckInNestedContext) {
    const auto result = string_lexer().run("x \"ab");
    EXPECT_EQ(result.state, RunState::STUCK);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->context, "main");
    EXPECT_EQ(result.error->position.offset, 1);

    // string 上下文中没有规则覆盖输入结束之前的内容
    LexerBuilder<Tok> builder;
    builder.context("main").rule("\"", actions::push_context<Tok>("string"));
    builder.context("string").rule("[a-z]+", emit("WORD")).rule("\"", actions::pop_context<Tok>());
    const auto nested = builder.build().run("\"ab1\"");
    EXPECT_EQ(nested.state, RunState::STUCK);
    ASSERT_TRUE(nested.error.has_value());
    EXPECT_EQ(nested.error->context, "string");
    EXPECT_EQ(nested.error->position.offset, 3);
    EXPECT_EQ(nested.tokens, (std::vector<Tok>{{"WORD", "ab"}}));
}

// 场景 5：空输入
TEST(LexerTest, EmptyInput) {
    const auto result = keyword_lexer().run("");
    EXPECT_EQ(result.state, RunState::END_OF_INPUT);
    EXPECT_TRUE(result.tokens.empty());
    EXPECT_FALSE(result.error.has_value());
}

// 测试同一个状态接受多条规则时可改为后声明的规则优先
TEST(LexerTest, TieBreakOverride) {
    LexerOptions options;
    options.tie_break = automata::TieBreak::LATEST_RULE;
    EXPECT_EQ(keyword_lexer(options).run("if").tokens, (std::vector<Tok>{{"IDENT", "if"}}));
}

// 测试位置信息与跳过规则
TEST(LexerTest, PositionsAndSkip) {
    LexerBuilder<Tok> builder;
    std::vector<Position> begins;
    builder.context("main")
            .rule("[a-z]+", [&begins](TokMatch &match) {
                begins.push_back(match.begin());
                match.emit(Tok{"WORD", match.text()});
            })
            .rule("[ \n]+", actions::skip<Tok>());
    const auto result = builder.build().run("ab cd\n  ef");
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"WORD", "ab"}, {"WORD", "cd"}, {"WORD", "ef"}}));
    ASSERT_EQ(begins.size(), 3);
    EXPECT_EQ(begins[0], (Position{0, 1, 1}));
    EXPECT_EQ(begins[1], (Position{3, 1, 4}));
    EXPECT_EQ(begins[2], (Position{8, 2, 3}));
}

// 测试每次匹配的动作只执行一次，用户状态在每次运行中独立
TEST(LexerTest, ActionsRunOncePerMatch) {
    LexerBuilder<Tok, int> builder;
    builder.context("main")
            .rule("[a-z]", [](Match<Tok, int> &match) { ++match.state(); })
            .rule("[a-z]{3}", [](Match<Tok, int> &match) {
                ++match.state();
                match.emit(Tok{"TRIPLE", match.text()});
            });
    const auto lexer = builder.build();
    const auto first = lexer.run("abcdefg");
    EXPECT_EQ(first.user_state, 3);
    EXPECT_EQ(first.tokens, (std::vector<Tok>{{"TRIPLE", "abc"}, {"TRIPLE", "def"}}));
    const auto second = lexer.run("xy");
    EXPECT_EQ(second.user_state, 2);
}

// 测试输入结束规则
TEST(LexerTest, EndOfInputRule) {
    LexerBuilder<Tok> builder;
    builder.context("main")
            .rule("[a-z]+", emit("WORD"))
            .rule(" ", nullptr)
            .rule(Pattern::eof(), emit("EOF"));
    const auto lexer = builder.build();

    auto result = lexer.run("ab cd");
    EXPECT_EQ(result.state, RunState::END_OF_INPUT);
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"WORD", "ab"}, {"WORD", "cd"}, {"EOF", ""}}));

    result = lexer.run("");
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"EOF", ""}}));
}

// 测试未闭合的字符串：嵌套上下文中的输入结束规则
TEST(LexerTest, UnterminatedStringAtEndOfInput) {
    LexerBuilder<Tok> builder;
    builder.context("main")
            .rule("\"", actions::push_context<Tok>("string"))
            .rule("[a-z]+", emit("IDENT"));
    builder.context("string")
            .rule("[^\"]+", emit("CHUNK"))
            .rule("\"", actions::pop_context<Tok>())
            .rule(Pattern::eof(), [](TokMatch &match) {
                match.emit(Tok{"UNTERMINATED", match.context()});
                match.pop();
            });
    const auto result = builder.build().run("a\"bc");
    EXPECT_EQ(result.state, RunState::END_OF_INPUT);
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"IDENT", "a"}, {"CHUNK", "bc"}, {"UNTERMINATED", "string"}}));
}

// 测试动作拿到的文本与位置一致：含非法字节时仍是输入的原样切片
TEST(LexerTest, TextIsInputSlice) {
    LexerBuilder<Tok> builder;
    std::vector<std::pair<Position, Position> > spans;
    builder.context("main")
            .rule(Pattern::many1(Pattern::any()), [&spans](TokMatch &match) {
                spans.emplace_back(match.begin(), match.end());
                match.emit(Tok{"ANY", match.text()});
            });
    const std::string text = "a\xFF" "b";
    const auto result = builder.build().run(text);
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"ANY", text}}));
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].second.offset - spans[0].first.offset, text.size());
    EXPECT_EQ(spans[0].second.column, 4);
}

// 测试上下文栈的嵌套：注释可以嵌套
TEST(LexerTest, NestedComments) {
    LexerBuilder<Tok> builder;
    builder.context("main")
            .rule("[a-z]+", emit("IDENT"))
            .rule(" +", nullptr)
            .rule("/\\*", actions::push_context<Tok>("comment"));
    builder.context("comment")
            .rule("/\\*", actions::push_context<Tok>("comment"))
            .rule("\\*/", actions::pop_context<Tok>())
            .rule(".", nullptr);
    const auto result = builder.build().run("x /* a /* b */ c */ y");
    EXPECT_EQ(result.state, RunState::END_OF_INPUT);
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"IDENT", "x"}, {"IDENT", "y"}}));
}

// 测试上下文继承：自身规则优先，父上下文规则在后
TEST(LexerTest, ContextInheritance) {
    LexerBuilder<Tok> builder;
    builder.context("main")
            .rule("[a-z]+", emit("WORD"))
            .rule(" +", nullptr)
            .rule("\\{", actions::push_context<Tok>("block"));
    builder.context("block", "main")
            .rule("[0-9]+", emit("NUM"))
            .rule("x", emit("X"))
            .rule("\\}", actions::pop_context<Tok>());
    const auto lexer = builder.build();

    const auto block = lexer.find("block");
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(lexer.context(*block).parent, lexer.find("main"));
    EXPECT_EQ(lexer.context(*block).rules.size(), 6);

    const auto result = lexer.run("a {b 1 x xy} c");
    EXPECT_EQ(result.state, RunState::END_OF_INPUT);
    EXPECT_EQ(result.tokens, (std::vector<Tok>{
                  {"WORD", "a"}, {"WORD", "b"}, {"NUM", "1"}, {"X", "x"}, {"WORD", "xy"}, {"WORD", "c"}
                  }));

    // 回到根上下文之后没有数字规则
    EXPECT_EQ(lexer.run("{1} 2").state, RunState::STUCK);
}

// 测试动作误用上下文栈：默认终止运行
TEST(LexerTest, StackErrorAborts) {
    LexerBuilder<Tok> builder;
    builder.context("main")
            .rule("[a-z]+", emit("WORD"))
            .rule("\\)", actions::pop_context<Tok>())
            .rule("@", actions::push_context<Tok>("nowhere"));
    const auto lexer = builder.build();

    const auto underflow = lexer.run("ab)cd");
    EXPECT_EQ(underflow.state, RunState::FAILED);
    EXPECT_EQ(underflow.tokens, (std::vector<Tok>{{"WORD", "ab"}}));
    ASSERT_TRUE(underflow.error.has_value());
    EXPECT_EQ(underflow.error->kind, ErrorKind::STACK_UNDERFLOW);
    EXPECT_EQ(underflow.error->position.offset, 2);

    const auto unknown = lexer.run("ab@cd");
    EXPECT_EQ(unknown.state, RunState::FAILED);
    ASSERT_TRUE(unknown.error.has_value());
    EXPECT_EQ(unknown.error->kind, ErrorKind::UNKNOWN_CONTEXT);
    EXPECT_EQ(unknown.error->context, "main");
}

// 测试动作误用上下文栈：继续运行，栈保持不变
TEST(LexerTest, StackErrorContinues) {
    LexerOptions options;
    options.stack_error = StackErrorPolicy::CONTINUE;
    LexerBuilder<Tok> builder(options);
    builder.context("main")
            .rule("[a-z]+", emit("WORD"))
            .rule("\\)", actions::pop_context<Tok>());
    const auto result = builder.build().run("ab)cd");
    EXPECT_EQ(result.state, RunState::END_OF_INPUT);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"WORD", "ab"}, {"WORD", "cd"}}));
}

// 测试动作自行处理上下文栈错误
TEST(LexerTest, ActionHandlesStackError) {
    LexerBuilder<Tok> builder;
    builder.context("main")
            .rule("[a-z]+", emit("WORD"))
            .rule("\\)", [](TokMatch &match) {
                try {
                    match.pop();
                } catch (const StackUnderflow &) {
                    match.emit(Tok{"UNBALANCED", match.text()});
                }
            });
    const auto result = builder.build().run("a)b");
    EXPECT_EQ(result.state, RunState::END_OF_INPUT);
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"WORD", "a"}, {"UNBALANCED", ")"}, {"WORD", "b"}}));
}

// 测试逐步驱动
TEST(LexerTest, SessionStep) {
    const auto lexer = string_lexer();
    StringReader reader("a\"b\"c");
    auto session = lexer.session(reader);
    EXPECT_EQ(session.state(), RunState::IDLE);

    EXPECT_EQ(session.step(), RunState::IDLE);
    EXPECT_EQ(session.tokens().size(), 1);
    EXPECT_EQ(session.step(), RunState::IDLE);
    EXPECT_EQ(session.stack().current_name(), "string");
    EXPECT_EQ(session.stack().depth(), 2);
    EXPECT_EQ(session.step(), RunState::IDLE);
    EXPECT_EQ(session.step(), RunState::IDLE);
    EXPECT_EQ(session.stack().current_name(), "main");
    EXPECT_EQ(session.step(), RunState::IDLE);
    EXPECT_EQ(session.position().offset, 5);
    EXPECT_EQ(session.step(), RunState::END_OF_INPUT);
    EXPECT_TRUE(session.finished());
    // 终止状态下不再变化
    EXPECT_EQ(session.step(), RunState::END_OF_INPUT);

    const auto result = session.take_result();
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"IDENT", "a"}, {"STRING_CHUNK", "b"}, {"IDENT", "c"}}));
}

// 测试同一个 Lexer 驱动多个互不影响的 Session
TEST(LexerTest, IndependentSessions) {
    const auto lexer = string_lexer();
    StringReader first_reader("\"abc\"");
    StringReader second_reader("xyz");
    auto first = lexer.session(first_reader);
    auto second = lexer.session(second_reader);
    first.step();
    EXPECT_EQ(first.stack().current_name(), "string");
    second.run();
    EXPECT_EQ(second.stack().current_name(), "main");
    EXPECT_EQ(second.tokens(), (std::vector<Tok>{{"IDENT", "xyz"}}));
    first.run();
    EXPECT_EQ(first.tokens(), (std::vector<Tok>{{"STRING_CHUNK", "abc"}}));
}

// 测试流输入源
TEST(LexerTest, StreamInput) {
    std::istringstream stream("if iffy");
    StreamReader reader(stream);
    const auto result = keyword_lexer().run(reader);
    EXPECT_EQ(result.tokens, (std::vector<Tok>{{"KEYWORD", "if"}, {"IDENT", "iffy"}}));
}

// 测试并行编译与顺序编译结果一致
TEST(LexerTest, ParallelCompile) {
    LexerOptions options;
    options.parallel_compile = true;
    const auto parallel = string_lexer(options);
    const auto sequential = string_lexer();
    for (ContextId id = 0; id < sequential.registry().size(); ++id) {
        EXPECT_EQ(parallel.context(id).dfa.transitions, sequential.context(id).dfa.transitions);
        EXPECT_EQ(parallel.context(id).dfa.accepts, sequential.context(id).dfa.accepts);
    }
    EXPECT_EQ(parallel.run("\"ab\"c").tokens, sequential.run("\"ab\"c").tokens);
}

// 测试规则名称：正则写法默认以正则文本命名
TEST(LexerTest, RuleNames) {
    LexerBuilder<Tok> builder;
    builder.context("main")
            .rule("[a-z]+", [](TokMatch &match) { match.emit(Tok{match.rule_name(), match.text()}); })
            .rule(Pattern::chr(' '), [](TokMatch &match) { match.emit(Tok{match.rule_name(), match.text()}); })
            .rule(Pattern::chr('!'), [](TokMatch &match) { match.emit(Tok{match.rule_name(), match.text()}); },
                  "bang");
    EXPECT_EQ(builder.build().run("ab !").tokens,
              (std::vector<Tok>{{"[a-z]+", "ab"}, {"rule#1", " "}, {"bang", "!"}}));
}

// 测试根上下文可以另行指定
TEST(LexerTest, ExplicitRoot) {
    LexerBuilder<Tok> builder;
    builder.context("letters").rule("[a-z]+", emit("WORD"));
    builder.context("digits").rule("[0-9]+", emit("NUM"));
    builder.root("digits");
    const auto lexer = builder.build();
    EXPECT_EQ(lexer.registry().name(lexer.root()), "digits");
    EXPECT_EQ(lexer.run("42").tokens, (std::vector<Tok>{{"NUM", "42"}}));
}

// 测试构建错误带上上下文名称
TEST(LexerTest, BuildErrors) {
    {
        LexerBuilder<Tok> builder;
        builder.context("main").rule("a", emit("A"));
        builder.context("empty");
        try {
            (void) builder.build();
            FAIL() << "expected CompileError";
        } catch (const CompileError &e) {
            EXPECT_EQ(e.reason, CompileError::Reason::EMPTY_RULE_SET);
            EXPECT_EQ(e.context, "empty");
        }
    }
    {
        LexerBuilder<Tok> builder;
        builder.context("main").rule("a*", emit("A"));
        try {
            (void) builder.build();
            FAIL() << "expected CompileError";
        } catch (const CompileError &e) {
            EXPECT_EQ(e.reason, CompileError::Reason::INVALID_PATTERN);
            EXPECT_EQ(e.context, "main");
        }
    }
    {
        LexerBuilder<Tok> builder;
        builder.context("main", "missing").rule("a", emit("A"));
        EXPECT_THROW((void) builder.build(), CompileError);
    }
    {
        LexerBuilder<Tok> builder;
        builder.context("a", "b").rule("a", emit("A"));
        builder.context("b", "a").rule("b", emit("B"));
        try {
            (void) builder.build();
            FAIL() << "expected CompileError";
        } catch (const CompileError &e) {
            EXPECT_EQ(e.reason, CompileError::Reason::INVALID_CONTEXT);
        }
    }
    {
        LexerBuilder<Tok> builder;
        builder.context("main").rule("a", emit("A"));
        builder.root("other");
        EXPECT_THROW((void) builder.build(), CompileError);
    }
    EXPECT_THROW((void) LexerBuilder<Tok>().build(), CompileError);
    // 非法正则在定义规则时立即报告
    LexerBuilder<Tok> builder;
    EXPECT_THROW(builder.context("main").rule("(a", emit("A")), InvalidPattern);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
