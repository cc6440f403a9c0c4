#ifndef CORE_PARSE_CURSOR_HPP
#define CORE_PARSE_CURSOR_HPP

#include <optional>
#include <string_view>

#include "../../utils/alias.hpp"
#include "../../utils/utils.hpp"

namespace core::parse {
// Forward-only reader over a text view. Every method either consumes what it
// matched or leaves the position where the mismatch was found.
class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text) {}

    bool Done() const { return pos_ >= text_.size(); }
    char Peek() const { return Done() ? '\0' : text_[pos_]; }
    usize Remaining() const { return text_.size() - pos_; }

    bool Expect(char c) {
        if (Peek() != c) return false;
        pos_++;
        return true;
    }

    // Reads between `min` and `max` decimal digits.
    bool Digits(usize min, usize max, int *out) {
        usize count = 0;
        int value = 0;
        while (count < max && !Done() && utils::IsAsciiDigit(Peek())) {
            value = value * 10 + (Peek() - '0');
            pos_++;
            count++;
        }
        if (count < min) return false;
        *out = value;
        return true;
    }

    std::string_view Take(usize count) {
        auto res = text_.substr(pos_, count);
        pos_ += res.size();
        return res;
    }

    // Consumes a run of whitespace, false if there was none.
    bool SkipSpace() {
        usize start = pos_;
        while (!Done() && utils::IsAsciiSpace(Peek())) pos_++;
        return pos_ > start;
    }

    // Non-empty run of non-whitespace characters.
    std::optional<std::string_view> Token() {
        usize start = pos_;
        while (!Done() && !utils::IsAsciiSpace(Peek())) pos_++;
        if (pos_ == start) return std::nullopt;
        return text_.substr(start, pos_ - start);
    }

    // Text between `open` and the next `close`, delimiters consumed.
    std::optional<std::string_view> Enclosed(char open, char close,
                                             bool allow_empty) {
        if (Peek() != open) return std::nullopt;
        auto end = text_.find(close, pos_ + 1);
        if (end == std::string_view::npos) return std::nullopt;
        auto res = text_.substr(pos_ + 1, end - pos_ - 1);
        if (res.empty() && !allow_empty) return std::nullopt;
        pos_ = end + 1;
        return res;
    }

private:
    std::string_view text_;
    usize pos_{};
};
}  // namespace core::parse

#endif
