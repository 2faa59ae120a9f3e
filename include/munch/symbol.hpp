//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_SYMBOL_HPP
#define MUNCH_SYMBOL_HPP

#include <cstdint>

namespace munch {
    // 输入符号：Unicode 码点，字节模式下为字节值
    using Symbol = std::uint32_t;

    // 最大合法码点
    constexpr Symbol MAX_CODE_POINT = 0x10FFFF;
    // 输入耗尽标记，不属于任何合法码点，只能通过 Pattern::eof() 匹配
    constexpr Symbol END_OF_INPUT = 0xFFFFFFFF;
}

#endif //MUNCH_SYMBOL_HPP
