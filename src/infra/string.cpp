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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "nodeboot/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace nodeboot::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * Implementation Strategy:
 * 1. **Linear Prefix Scan**: Finds the first non-whitespace character.
 * 2. **Empty State Detection**: Early exit for all-whitespace input.
 * 3. **Linear Suffix Scan**: Finds the last non-whitespace character.
 *
 * @note `static_cast<unsigned char>` keeps `std::isspace` defined for bytes
 * above 0x7F on signed-char platforms.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool String::starts_with(const std::string& s, const std::string& prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool String::ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> String::split_whitespace(const std::string& s)
{
    std::vector<std::string> tokens;
    std::istringstream in(s);
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> String::split_lines(const std::string& s)
{
    std::vector<std::string> lines;
    std::string::size_type pos = 0;
    while (pos < s.size()) {
        auto nl = s.find('\n', pos);
        std::string line = s.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (nl == std::string::npos) {
            break;
        }
        pos = nl + 1;
    }
    return lines;
}

std::string String::replace_all(std::string s, const std::string& from, const std::string& to)
{
    if (from.empty()) {
        return s;
    }
    std::string::size_type pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string String::join_command(const std::vector<std::string>& argv)
{
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        bool plain = !arg.empty() && std::none_of(arg.begin(), arg.end(), [](unsigned char c) {
            return std::isspace(c) || c == '\'' || c == '"';
        });
        if (plain) {
            line += arg;
        } else {
            // POSIX shell style: close the quote, emit an escaped quote, reopen.
            line += '\'' + replace_all(arg, "'", "'\\''") + '\'';
        }
    }
    return line;
}

std::string String::sql_literal(const std::string& value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '\'') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string String::sql_identifier(const std::string& name)
{
    return "`" + replace_all(name, "`", "``") + "`";
}

bool String::is_truthy(const std::string& value)
{
    std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace nodeboot::infra
