//
// Created by aowei on 2026 10月 17.
//

#include <string>
#include <munch/utf8.hpp>
#include <munch/lexer/reader.hpp>

namespace munch::lexer {
    void Position::advance(const Symbol symbol, const std::size_t width) {
        this->offset += width;
        if (symbol == U'\n') {
            this->line++;
            this->column = 1;
        } else {
            this->column++;
        }
    }
}

// StringReader 的实现
namespace munch::lexer {
    StringReader::StringReader(const std::string_view text, const Encoding encoding)
        : text(text), input_encoding(encoding) {}

    Symbol StringReader::peek() {
        if (!this->current) {
            if (this->position >= this->text.size()) {
                this->current = END_OF_INPUT;
                this->current_width = 0;
            } else if (this->input_encoding == Encoding::LATIN1) {
                this->current = static_cast<unsigned char>(this->text[this->position]);
                this->current_width = 1;
            } else {
                Symbol symbol = 0;
                this->current_width = utf8::decode(this->text.substr(this->position), symbol);
                this->current = symbol;
            }
        }
        return *this->current;
    }

    std::string_view StringReader::peek_bytes() {
        this->peek();
        return this->text.substr(this->position, this->current_width);
    }

    void StringReader::advance() {
        this->peek();
        this->position += this->current_width;
        this->current.reset();
    }
}

// StreamReader 的实现
namespace munch::lexer {
    StreamReader::StreamReader(std::istream &stream, const Encoding encoding)
        : stream(stream), input_encoding(encoding) {}

    // 从流中取出下一个符号的全部字节并解码
    void StreamReader::decode_next() {
        const int lead = this->stream.get();
        this->current_bytes.clear();
        if (lead == std::char_traits<char>::eof()) {
            this->current = END_OF_INPUT;
            return;
        }
        std::string &bytes = this->current_bytes;
        bytes += static_cast<char>(lead);
        if (this->input_encoding == Encoding::LATIN1) {
            this->current = static_cast<Symbol>(lead);
            return;
        }
        const std::size_t length = utf8::sequence_length(static_cast<unsigned char>(lead));
        // 只读取续字节，遇到其他字节留给下一个符号
        while (bytes.size() < length) {
            const int next = this->stream.peek();
            if (next == std::char_traits<char>::eof() || !utf8::is_continuation(static_cast<unsigned char>(next))) {
                break;
            }
            bytes += static_cast<char>(this->stream.get());
        }
        // 与 StringReader 相同的规则：读到的字节恰好是 utf8::decode 消耗的字节
        Symbol symbol = 0;
        utf8::decode(bytes, symbol);
        this->current = symbol;
    }

    Symbol StreamReader::peek() {
        if (!this->current) this->decode_next();
        return *this->current;
    }

    std::string_view StreamReader::peek_bytes() {
        this->peek();
        return this->current_bytes;
    }

    void StreamReader::advance() {
        this->peek();
        if (*this->current == END_OF_INPUT) return;
        this->consumed += this->current_bytes.size();
        this->current.reset();
    }
}
