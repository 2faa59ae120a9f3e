//
// Created by aowei on 2026 10月 17.
//

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <munch/utf8.hpp>
#include <munch/pattern/symbol_set.hpp>

namespace munch::pattern {
    SymbolSet::SymbolSet(const Symbol lo, const Symbol hi) {
        if (lo <= hi) this->intervals.push_back({lo, hi});
    }

    SymbolSet SymbolSet::of(const Symbol symbol) {
        return {symbol, symbol};
    }

    SymbolSet SymbolSet::of_string(const std::string_view utf8) {
        SymbolSet set;
        for (const Symbol s: utf8::decode_all(utf8)) set.insert(s, s);
        return set;
    }

    SymbolSet SymbolSet::all() {
        return {0, MAX_CODE_POINT};
    }

    // 插入区间后合并重叠与相邻的区间
    void SymbolSet::insert(const Symbol lo, const Symbol hi) {
        if (hi < lo) return;
        auto it = std::lower_bound(this->intervals.begin(), this->intervals.end(), lo,
                                   [](const SymbolRange &r, const Symbol value) {
                                       // 与 lo 相邻的区间也需要合并
                                       return r.hi != END_OF_INPUT && r.hi + 1 < value;
                                   });
        SymbolRange merged{lo, hi};
        auto last = it;
        while (last != this->intervals.end() && (merged.hi == END_OF_INPUT || last->lo <= merged.hi + 1)) {
            merged.lo = std::min(merged.lo, last->lo);
            merged.hi = std::max(merged.hi, last->hi);
            ++last;
        }
        it = this->intervals.erase(it, last);
        this->intervals.insert(it, merged);
    }

    void SymbolSet::insert(const SymbolSet &other) {
        for (const auto &[lo, hi]: other.intervals) this->insert(lo, hi);
    }

    SymbolSet SymbolSet::complement() const {
        SymbolSet result;
        Symbol next = 0;
        for (const auto &[lo, hi]: this->intervals) {
            if (lo > MAX_CODE_POINT) break;
            if (lo > next) result.intervals.push_back({next, lo - 1});
            if (hi >= MAX_CODE_POINT) return result;
            next = hi + 1;
        }
        result.intervals.push_back({next, MAX_CODE_POINT});
        return result;
    }

    bool SymbolSet::contains(const Symbol symbol) const {
        const auto it = std::upper_bound(this->intervals.begin(), this->intervals.end(), symbol,
                                         [](const Symbol value, const SymbolRange &r) { return value < r.lo; });
        if (it == this->intervals.begin()) return false;
        return std::prev(it)->hi >= symbol;
    }

    std::string SymbolSet::to_string() const {
        const auto show = [](const Symbol s) -> std::string {
            if (s == END_OF_INPUT) return "<EOF>";
            if (s >= 0x21 && s < 0x7F) return std::string(1, static_cast<char>(s));
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "\\u{%X}", s);
            return buffer;
        };
        if (this->intervals.size() == 1 && this->intervals[0].lo == this->intervals[0].hi) {
            return show(this->intervals[0].lo);
        }
        std::string result = "[";
        for (const auto &[lo, hi]: this->intervals) {
            result += show(lo);
            if (hi != lo) result += "-" + show(hi);
        }
        result += "]";
        return result;
    }
}
