//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_PATTERN_SYMBOL_SET_HPP
#define MUNCH_PATTERN_SYMBOL_SET_HPP

#include <string>
#include <string_view>
#include <vector>
#include <munch/symbol.hpp>

namespace munch::pattern {
    // 闭区间 [lo, hi]
    struct SymbolRange {
        Symbol lo;
        Symbol hi;

        bool operator==(const SymbolRange &other) const { return lo == other.lo && hi == other.hi; }
        bool operator!=(const SymbolRange &other) const { return !(*this == other); }
    };

    // 符号集合：有序、互不相交且不相邻的区间列表
    class SymbolSet {
    public:
        SymbolSet() = default;
        // hi < lo 时得到空集合
        SymbolSet(Symbol lo, Symbol hi);

        static SymbolSet of(Symbol symbol);
        // 字符串中出现的所有码点（UTF-8）
        static SymbolSet of_string(std::string_view utf8);
        // 所有合法码点 [0, MAX_CODE_POINT]
        static SymbolSet all();

        void insert(Symbol lo, Symbol hi);
        void insert(const SymbolSet &other);
        // 相对于全部合法码点的补集，结果不包含 END_OF_INPUT
        [[nodiscard]] SymbolSet complement() const;

        [[nodiscard]] bool contains(Symbol symbol) const;
        [[nodiscard]] bool empty() const { return this->intervals.empty(); }
        [[nodiscard]] const std::vector<SymbolRange> &ranges() const { return this->intervals; }
        // 调试输出，例如 [a-z_]
        [[nodiscard]] std::string to_string() const;

        bool operator==(const SymbolSet &other) const { return this->intervals == other.intervals; }
        bool operator!=(const SymbolSet &other) const { return !(*this == other); }

    private:
        std::vector<SymbolRange> intervals;
    };
}

#endif //MUNCH_PATTERN_SYMBOL_SET_HPP
