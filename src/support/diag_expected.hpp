//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Result type for operations that can fail with a diagnostic, such as
//          reading a configuration file or building a PhysicalLine.
// Key invariants: An Expected holds exactly one of a value or a diagnostic.
// Ownership/Lifetime: Expected owns whichever it holds.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sshconf::support
{
using Diag = Diagnostic;

/// @brief Value of type @p T, or the error diagnostic explaining its absence.
/// @details Converts implicitly from either alternative so functions can
///          `return value;` or `return makeError(...);`.
template <class T> class Expected
{
  public:
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : state_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    Expected(Diag diag) : state_(std::in_place_index<1>, std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return state_.index() == 0;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value()
    {
        return std::get<0>(state_);
    }

    /// @pre hasValue()
    const T &value() const
    {
        return std::get<0>(state_);
    }

    /// @pre !hasValue()
    const Diag &error() const &
    {
        return std::get<1>(state_);
    }

  private:
    std::variant<T, Diag> state_;
};

/// @brief Success carries nothing; failure carries the diagnostic.
template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag) : error_(std::move(diag)), failed_(true) {}

    [[nodiscard]] bool hasValue() const
    {
        return !failed_;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre !hasValue()
    const Diag &error() const &
    {
        return error_;
    }

  private:
    Diag error_{Severity::Error, {}, {}};
    bool failed_ = false;
};

/// @brief Error-severity diagnostic at @p loc.
inline Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

} // namespace sshconf::support
