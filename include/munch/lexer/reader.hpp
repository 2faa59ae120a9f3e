//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_LEXER_READER_HPP
#define MUNCH_LEXER_READER_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <munch/symbol.hpp>

namespace munch::lexer {
    enum class Encoding {
        UTF8,   // 按 UTF-8 解码，非法字节解码为 U+FFFD
        LATIN1, // 每个字节就是一个符号
    };

    // 输入中的位置：字节偏移，行号和列号从 1 开始，列按符号计数
    struct Position {
        std::size_t offset = 0;
        std::size_t line = 1;
        std::size_t column = 1;

        // 越过一个符号
        void advance(Symbol symbol, std::size_t width);

        bool operator==(const Position &other) const {
            return offset == other.offset && line == other.line && column == other.column;
        }
        bool operator!=(const Position &other) const { return !(*this == other); }
    };

    // 输入源：按需拉取的符号序列，耗尽后 peek() 一直返回 END_OF_INPUT
    class Reader {
    public:
        virtual ~Reader() = default;

        // 查看下一个符号，不消耗
        virtual Symbol peek() = 0;
        // 下一个符号在输入中的原始字节，输入结束时为空
        virtual std::string_view peek_bytes() = 0;
        // 消耗下一个符号，已耗尽时什么都不做
        virtual void advance() = 0;
        // 已消耗的字节数
        [[nodiscard]] virtual std::size_t offset() const = 0;
        [[nodiscard]] virtual Encoding encoding() const = 0;
    };

    // 内存中的文本，调用方保证 text 在读取期间有效
    class StringReader : public Reader {
    public:
        explicit StringReader(std::string_view text, Encoding encoding = Encoding::UTF8);

        Symbol peek() override;
        std::string_view peek_bytes() override;
        void advance() override;
        [[nodiscard]] std::size_t offset() const override { return this->position; }
        [[nodiscard]] Encoding encoding() const override { return this->input_encoding; }

    private:
        std::string_view text;
        Encoding input_encoding;
        std::size_t position = 0;
        // 当前符号的解码缓存
        std::optional<Symbol> current;
        std::size_t current_width = 0;
    };

    // 标准输入流，逐字节拉取
    class StreamReader : public Reader {
    public:
        explicit StreamReader(std::istream &stream, Encoding encoding = Encoding::UTF8);

        Symbol peek() override;
        std::string_view peek_bytes() override;
        void advance() override;
        [[nodiscard]] std::size_t offset() const override { return this->consumed; }
        [[nodiscard]] Encoding encoding() const override { return this->input_encoding; }

    private:
        void decode_next();

        std::istream &stream;
        Encoding input_encoding;
        std::size_t consumed = 0;
        std::optional<Symbol> current;
        std::string current_bytes;
    };
}

#endif //MUNCH_LEXER_READER_HPP
