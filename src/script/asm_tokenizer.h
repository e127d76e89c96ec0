#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace script {

/// Zero-based location of a word in ASM text. `word` counts
/// whitespace-separated words within `line` and restarts on every line.
struct AsmPosition {
    size_t line = 0;
    size_t word = 0;

    bool operator==(const AsmPosition&) const = default;
};

struct AsmWord {
    AsmPosition position;
    std::string_view text;
};

/// Return the part of @p line before the first "#" or "//", whichever
/// comes first. A line without either marker is returned unchanged.
std::string_view strip_asm_comment(std::string_view line);

// ---------------------------------------------------------------------------
// AsmWordIterator  --  lazy, forward-only word cursor over ASM text
//
// Lines are separated by '\n'; a trailing '\r' is dropped. Comments are
// stripped per line, then the remainder is split on runs of whitespace,
// ASCII or the Unicode spaces encoded as UTF-8 (U+00A0, U+3000, ...).
// The iterator borrows @p text, which must outlive it.
// ---------------------------------------------------------------------------
class AsmWordIterator {
public:
    explicit AsmWordIterator(std::string_view text);

    /// Return the next word, or std::nullopt once the text is exhausted.
    std::optional<AsmWord> next();

private:
    /// Load the next line into line_, returning false at end of text.
    bool advance_line();

    std::string_view rest_;       // text not yet split into lines
    std::string_view line_;       // comment-stripped remainder of current line
    size_t line_index_ = 0;
    size_t word_index_ = 0;
    bool   started_ = false;
    bool   exhausted_ = false;
};

} // namespace script
