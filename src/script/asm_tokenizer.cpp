#include "script/asm_tokenizer.h"

#include <cctype>

namespace script {

namespace {

// Length in bytes of the whitespace character starting at text[i], or 0.
// Besides ASCII whitespace this matches the UTF-8 encodings of U+0085,
// U+00A0, U+1680, U+2000..U+200A, U+2028, U+2029, U+202F, U+205F and
// U+3000.
size_t space_width(std::string_view text, size_t i) {
    auto at = [&](size_t k) -> unsigned {
        return i + k < text.size() ? static_cast<unsigned char>(text[i + k])
                                   : 0u;
    };
    const unsigned lead = at(0);
    if (lead < 0x80) {
        return std::isspace(static_cast<int>(lead)) != 0 ? 1 : 0;
    }
    if (lead == 0xc2) {
        return (at(1) == 0x85 || at(1) == 0xa0) ? 2 : 0;
    }
    if (lead == 0xe1) {
        return (at(1) == 0x9a && at(2) == 0x80) ? 3 : 0;
    }
    if (lead == 0xe2) {
        const unsigned b1 = at(1);
        const unsigned b2 = at(2);
        if (b1 == 0x80) {
            return ((b2 >= 0x80 && b2 <= 0x8a) || b2 == 0xa8 || b2 == 0xa9 ||
                    b2 == 0xaf) ? 3 : 0;
        }
        return (b1 == 0x81 && b2 == 0x9f) ? 3 : 0;
    }
    if (lead == 0xe3) {
        return (at(1) == 0x80 && at(2) == 0x80) ? 3 : 0;
    }
    return 0;
}

} // anonymous namespace

std::string_view strip_asm_comment(std::string_view line) {
    // Both markers truncate; the earlier one wins.
    line = line.substr(0, line.find('#'));
    line = line.substr(0, line.find("//"));
    return line;
}

AsmWordIterator::AsmWordIterator(std::string_view text)
    : rest_(text) {}

bool AsmWordIterator::advance_line() {
    if (exhausted_) {
        return false;
    }
    if (rest_.empty()) {
        exhausted_ = true;
        return false;
    }

    std::string_view raw;
    auto nl = rest_.find('\n');
    if (nl == std::string_view::npos) {
        raw = rest_;
        rest_ = {};
    } else {
        raw = rest_.substr(0, nl);
        rest_ = rest_.substr(nl + 1);
    }
    if (!raw.empty() && raw.back() == '\r') {
        raw.remove_suffix(1);
    }

    if (started_) {
        ++line_index_;
    }
    started_ = true;
    word_index_ = 0;
    line_ = strip_asm_comment(raw);
    return true;
}

std::optional<AsmWord> AsmWordIterator::next() {
    for (;;) {
        // Skip leading whitespace on the current line.
        size_t begin = 0;
        while (begin < line_.size()) {
            const size_t w = space_width(line_, begin);
            if (w == 0) break;
            begin += w;
        }
        line_.remove_prefix(begin);

        if (!line_.empty()) {
            // Continuation bytes never look like a lead byte, so stepping
            // one byte at a time cannot split a separator.
            size_t end = 0;
            while (end < line_.size() && space_width(line_, end) == 0) {
                ++end;
            }
            AsmWord word{{line_index_, word_index_++}, line_.substr(0, end)};
            line_.remove_prefix(end);
            return word;
        }

        if (!advance_line()) {
            return std::nullopt;
        }
    }
}

} // namespace script
