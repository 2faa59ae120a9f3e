//
// Created by aowei on 2026 10月 17.
//

#include <munch/utf8.hpp>

namespace munch::utf8 {
    std::size_t sequence_length(const unsigned char lead) {
        if (lead < 0x80) return 1;
        if ((lead & 0xE0) == 0xC0) return lead >= 0xC2 ? 2 : 0; // 0xC0/0xC1 为过长编码
        if ((lead & 0xF0) == 0xE0) return 3;
        if ((lead & 0xF8) == 0xF0) return lead <= 0xF4 ? 4 : 0;
        return 0;
    }

    bool is_continuation(const unsigned char byte) {
        return (byte & 0xC0) == 0x80;
    }

    std::size_t decode(const std::string_view bytes, Symbol &out) {
        if (bytes.empty()) return 0;
        const auto lead = static_cast<unsigned char>(bytes[0]);
        const std::size_t length = sequence_length(lead);
        if (length == 0) {
            out = REPLACEMENT;
            return 1;
        }
        if (length == 1) {
            out = lead;
            return 1;
        }
        // 首字节中的有效位，之后最多读取 length - 1 个续字节
        Symbol value = lead & (0xFF >> (length + 1));
        std::size_t width = 1;
        while (width < length && width < bytes.size() && is_continuation(static_cast<unsigned char>(bytes[width]))) {
            value = (value << 6) | (static_cast<unsigned char>(bytes[width]) & 0x3F);
            ++width;
        }
        // 截断的序列、过长编码、代理区以及超出范围的码点，连同已读的续字节整体替换
        static constexpr Symbol min_value[] = {0, 0, 0x80, 0x800, 0x10000};
        if (width < length || value < min_value[length] || value > MAX_CODE_POINT ||
            (value >= 0xD800 && value <= 0xDFFF)) {
            out = REPLACEMENT;
            return width;
        }
        out = value;
        return length;
    }

    std::u32string decode_all(std::string_view bytes) {
        std::u32string result;
        result.reserve(bytes.size());
        while (!bytes.empty()) {
            Symbol symbol = 0;
            const std::size_t width = decode(bytes, symbol);
            result.push_back(symbol);
            bytes.remove_prefix(width);
        }
        return result;
    }

    void encode(Symbol symbol, std::string &out) {
        if (symbol > MAX_CODE_POINT) symbol = REPLACEMENT;
        if (symbol < 0x80) {
            out += static_cast<char>(symbol);
        } else if (symbol < 0x800) {
            out += static_cast<char>(0xC0 | (symbol >> 6));
            out += static_cast<char>(0x80 | (symbol & 0x3F));
        } else if (symbol < 0x10000) {
            out += static_cast<char>(0xE0 | (symbol >> 12));
            out += static_cast<char>(0x80 | ((symbol >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (symbol & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (symbol >> 18));
            out += static_cast<char>(0x80 | ((symbol >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((symbol >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (symbol & 0x3F));
        }
    }

    std::string encode(const std::u32string_view symbols) {
        std::string result;
        for (const Symbol s: symbols) encode(s, result);
        return result;
    }
}
