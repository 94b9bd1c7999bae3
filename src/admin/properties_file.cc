/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

/*
 * Copyright (C) 2019 ScyllaDB Ltd.
 */

#include <rfalter/admin/properties_file.hh>
#include <rfalter/placement/errors.hh>

#include <boost/algorithm/string/trim.hpp>

#include <cstdint>
#include <fstream>
#include <string>

namespace rfalter {

static bool is_continued(const std::string& line) {
    size_t backslashes = 0;
    for (auto it = line.rbegin(); it != line.rend() && *it == '\\'; ++it) {
        backslashes++;
    }
    return backslashes % 2 == 1;
}

static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\f';
}

static void append_utf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

// Decodes tab, newline, return, form feed and unicode escapes; any other
// escaped character stands for itself.
static std::string unescape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] != '\\') {
            out += text[i];
            continue;
        }
        if (++i == text.size()) {
            break;
        }
        switch (text[i]) {
        case 't': out += '\t'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 'f': out += '\f'; break;
        case 'u': {
            if (i + 4 >= text.size()) {
                throw configuration_error("Malformed \\uxxxx encoding in properties file");
            }
            auto digits = text.substr(i + 1, 4);
            if (digits.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
                throw configuration_error("Malformed \\uxxxx encoding in properties file");
            }
            append_utf8(out, static_cast<uint32_t>(std::stoul(digits, nullptr, 16)));
            i += 4;
            break;
        }
        default: out += text[i]; break;
        }
    }
    return out;
}

// First unescaped separator, skipping characters preceded by a backslash.
static size_t find_separator(const std::string& line) {
    for (size_t i = 0; i < line.size(); i++) {
        if (line[i] == '\\') {
            i++;
        } else if (line[i] == '=' || line[i] == ':' || is_blank(line[i])) {
            return i;
        }
    }
    return std::string::npos;
}

static void add_property(properties_map& properties, const std::string& line) {
    auto separator = find_separator(line);
    std::string key = line.substr(0, separator);
    std::string value;
    if (separator != std::string::npos) {
        value = line.substr(separator + 1);
        boost::algorithm::trim_left(value);
        // "key = value": the blank was not the separator yet
        if (is_blank(line[separator]) && !value.empty() && (value[0] == '=' || value[0] == ':')) {
            value.erase(0, 1);
            boost::algorithm::trim_left(value);
        }
        boost::algorithm::trim_right(value);
    }
    properties[unescape(key)] = unescape(value);
}

properties_map parse_properties(std::istream& is) {
    properties_map properties;
    std::string line;
    std::string logical_line;

    while (std::getline(is, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        boost::algorithm::trim_left(line);
        if (logical_line.empty() && (line.empty() || line[0] == '#' || line[0] == '!')) {
            continue;
        }

        if (is_continued(line)) {
            line.pop_back();
            logical_line += line;
            continue;
        }
        logical_line += line;
        add_property(properties, logical_line);
        logical_line.clear();
    }
    if (!logical_line.empty()) {
        add_property(properties, logical_line);
    }
    return properties;
}

properties_map load_properties_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw configuration_error("Could not find or read specified file: " + path);
    }
    return parse_properties(file);
}

}
