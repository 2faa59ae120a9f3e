//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_UTF8_HPP
#define MUNCH_UTF8_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <munch/symbol.hpp>

namespace munch::utf8 {
    // 非法字节序列解码为替换字符
    constexpr Symbol REPLACEMENT = 0xFFFD;

    // 根据首字节判断序列长度，非法首字节返回 0
    std::size_t sequence_length(unsigned char lead);
    // 是否为续字节 10xxxxxx
    bool is_continuation(unsigned char byte);
    // 解码 bytes 开头的一个码点，返回消耗的字节数（至少为 1，输入为空时为 0）
    // 非法序列消耗首字节及其后至多 length - 1 个续字节，解码为一个 REPLACEMENT
    std::size_t decode(std::string_view bytes, Symbol &out);
    // 解码整个字符串
    std::u32string decode_all(std::string_view bytes);
    // 编码一个码点并追加到 out
    void encode(Symbol symbol, std::string &out);
    std::string encode(std::u32string_view symbols);
}

#endif //MUNCH_UTF8_HPP
