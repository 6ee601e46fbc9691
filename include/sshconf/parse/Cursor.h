//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sshconf/parse/Cursor.h
// Purpose: Forward-only scanner over one line of configuration text.
// Key invariants: offset() <= view().size(); every returned run is a subview
//                 of the scanned text.
// Ownership/Lifetime: Borrows the text; the caller keeps it alive.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Character classes of the ssh_config grammar and the cursor the line,
///        expression and argument scanners share.

#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>

namespace sshconf::parse
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief Space or tab. `\r`, `\v` and non-ASCII spaces are content.
[[nodiscard]] constexpr bool isBlank(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

/// @brief ASCII letter; keywords are made of nothing else.
[[nodiscard]] constexpr bool isKeywordChar(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

/// @brief Reads a line left to right, handing back the runs it consumes.
/// @details Consuming functions return the consumed bytes as a view so callers
///          can store keyword, separator and token text without re-slicing.
class Cursor
{
  public:
    explicit Cursor(std::string_view text) noexcept : text_(text) {}

    /// @brief Whole scanned text, consumed or not.
    [[nodiscard]] std::string_view view() const noexcept
    {
        return text_;
    }

    /// @brief Text not yet consumed.
    [[nodiscard]] std::string_view remaining() const noexcept
    {
        return text_.substr(pos_);
    }

    [[nodiscard]] bool atEnd() const noexcept
    {
        return pos_ == text_.size();
    }

    /// @return Next byte, or '\0' at the end.
    [[nodiscard]] char peek() const noexcept
    {
        return atEnd() ? '\0' : text_[pos_];
    }

    /// @brief Bytes consumed so far.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return pos_;
    }

    /// @brief Step over one byte; no effect at the end.
    void advance() noexcept;

    /// @brief Consume @p c if it is next.
    bool consumeIf(char c) noexcept;

    /// @brief Consume the longest prefix whose bytes satisfy @p pred.
    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t start = pos_;
        while (!atEnd() && pred(text_[pos_]))
            ++pos_;
        return text_.substr(start, pos_ - start);
    }

    /// @brief Consume a run of spaces and tabs.
    std::string_view consumeBlanks() noexcept;

    /// @brief Consume everything up to the next space, tab or end.
    std::string_view consumeNonBlank() noexcept;

  private:
    std::string_view text_;
    std::size_t pos_ = 0;
};

} // namespace sshconf::parse
