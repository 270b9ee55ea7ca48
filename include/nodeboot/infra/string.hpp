/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * The `String` utility class is a static extension to `std::string` used to
 * sanitize configuration values, scan the server's introspection output,
 * render command lines for the log and quote values spliced into SQL.
 */

#pragma once

#include <string>
#include <vector>

namespace nodeboot::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * Whitespace is what `std::isspace` accepts in the "C" locale: space,
     * `\t`, `\n`, `\r`, `\v`, `\f`.
     *
     * @code
     * std::string secret = String::trim("s3cret\n"); // "s3cret"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-casing.
    static std::string to_lower(std::string s);

    static bool starts_with(const std::string& s, const std::string& prefix);
    static bool ends_with(const std::string& s, const std::string& suffix);

    /**
     * @brief Splits on any run of whitespace, dropping empty tokens.
     *
     * `"datadir    /var/lib/mysql/"` yields `{"datadir", "/var/lib/mysql/"}`.
     */
    static std::vector<std::string> split_whitespace(const std::string& s);

    /// @brief Splits into lines on `\n`, removing a trailing `\r` from each line.
    static std::vector<std::string> split_lines(const std::string& s);

    /// @brief Replaces every occurrence of `from` (non-empty) with `to`.
    static std::string replace_all(std::string s, const std::string& from, const std::string& to);

    /**
     * @brief Renders an argument vector as a single line for humans.
     *
     * Arguments containing whitespace or quotes are wrapped in single quotes.
     * The result is for logs and error messages only; it is never executed.
     */
    static std::string join_command(const std::vector<std::string>& argv);

    /**
     * @brief Escapes a value for use inside a single-quoted SQL string literal.
     *
     * Backslashes and single quotes are backslash-escaped (`\\` and `\'`).
     */
    static std::string sql_literal(const std::string& value);

    /// @brief Quotes an SQL identifier with backticks, doubling embedded backticks.
    static std::string sql_identifier(const std::string& name);

    /**
     * @brief Interprets common truthy spellings.
     *
     * `1`, `true`, `yes`, `on` (any case) are true; everything else is false.
     */
    static bool is_truthy(const std::string& value);
};

} // namespace nodeboot::infra
