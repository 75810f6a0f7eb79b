/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace trk_guess {

/**
 * @brief Raised for malformed coordinate strings and malformed input rows.
 *
 * Load-time errors are fatal: whoever throws this discards any partially
 * built state.
 */
class ParseError : public std::invalid_argument
{
  public:
    explicit ParseError(const std::string &what) : std::invalid_argument(what) {}

    ParseError(const std::string &what, int lineno) : std::invalid_argument(withLine(what, lineno)), m_lineno(lineno)
    {
    }

    /// Same error with `context` (typically a file name) prefixed to the message
    ParseError(const std::string &context, const ParseError &cause)
        : std::invalid_argument(context + ": " + cause.what()), m_lineno(cause.lineno())
    {
    }

    /// 1-based line number of the offending row, or 0 if not row-related
    int lineno() const { return m_lineno; }

  private:
    static std::string withLine(const std::string &what, int lineno)
    {
        std::stringstream msg;
        msg << what << ": line " << lineno;
        return msg.str();
    }

    int m_lineno{0};
};

} // namespace trk_guess
