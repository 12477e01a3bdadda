// cspyce-build - Configuration File Parser Implementation
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/config_parser.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace cspyce::build {

// ============================================================
// Lexer Implementation
// ============================================================

ConfigLexer::ConfigLexer(std::istream& is) : is_(is) {
    advance();
}

int ConfigLexer::advance() {
    int prev = current_;
    current_ = is_.get();
    if (prev == '\n') {
        line_++;
        column_ = 1;
    } else if (prev != -1) {
        column_++;
    }
    return prev;
}

void ConfigLexer::skipWhitespace() {
    while (current_ == ' ' || current_ == '\t' || current_ == '\r') {
        advance();
    }
    if (current_ == '#') {
        skipComment();
    }
}

void ConfigLexer::skipComment() {
    while (current_ != -1 && current_ != '\n') {
        advance();
    }
}

bool ConfigLexer::isWordChar(int c) const {
    if (c == -1 || std::isspace(c)) return false;
    switch (c) {
        case ',': case '[': case ']': case '"': case '#':
            return false;
        default:
            return true;
    }
}

ConfigToken ConfigLexer::next() {
    ConfigToken tok = lex();
    if (tok.type == ConfigTokenType::LBracket) {
        list_depth_++;
    } else if (tok.type == ConfigTokenType::RBracket && list_depth_ > 0) {
        list_depth_--;
    }
    // Newlines inside [ ... ] continue the current assignment.
    at_line_start_ = (tok.type == ConfigTokenType::Newline && list_depth_ == 0);
    return tok;
}

ConfigToken ConfigLexer::lex() {
    skipWhitespace();

    int startLine = line_;
    int startCol = column_;

    if (current_ == -1) {
        return ConfigToken{ConfigTokenType::Eof, "", startLine, startCol};
    }

    if (current_ == '\n') {
        advance();
        return ConfigToken{ConfigTokenType::Newline, "\n", startLine, startCol};
    }

    switch (current_) {
        case '=': advance(); return ConfigToken{ConfigTokenType::Equals, "=", startLine, startCol};
        case ',': advance(); return ConfigToken{ConfigTokenType::Comma, ",", startLine, startCol};
        case '[': advance(); return ConfigToken{ConfigTokenType::LBracket, "[", startLine, startCol};
        case ']': advance(); return ConfigToken{ConfigTokenType::RBracket, "]", startLine, startCol};
        case '+':
            if (is_.peek() == '=') {
                advance();
                advance();
                return ConfigToken{ConfigTokenType::PlusEquals, "+=", startLine, startCol};
            }
            break;
    }

    if (current_ == '"') {
        advance();  // opening quote
        std::string value;
        while (current_ != -1 && current_ != '"' && current_ != '\n') {
            if (current_ == '\\') {
                advance();
                if (current_ == -1 || current_ == '\n') break;
                switch (current_) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case '\\': value += '\\'; break;
                    case '"': value += '"'; break;
                    default:
                        value += '\\';
                        value += static_cast<char>(current_);
                        break;
                }
            } else {
                value += static_cast<char>(current_);
            }
            advance();
        }
        if (current_ != '"') {
            throw ParseError(startLine, startCol, "Unterminated string");
        }
        advance();  // closing quote
        return ConfigToken{ConfigTokenType::String, value, startLine, startCol};
    }

    // A word ends at whitespace or punctuation. The first word on a line is a
    // key and also ends at `=` or `+=`; values may contain `=` (-DNAME=1).
    const bool key_position = at_line_start_;
    std::string value;
    while (isWordChar(current_)) {
        if (key_position && current_ == '=') break;
        if (key_position && current_ == '+' && is_.peek() == '=') break;
        value += static_cast<char>(current_);
        advance();
    }
    if (value.empty()) {
        throw ParseError(startLine, startCol,
                         std::string("Unexpected character '") + static_cast<char>(current_) + "'");
    }
    return ConfigToken{ConfigTokenType::Word, value, startLine, startCol};
}

// ============================================================
// Parser Implementation
// ============================================================

ConfigParser::ConfigParser(std::istream& is) : lexer_(is) {
    current_ = lexer_.next();
}

ConfigToken ConfigParser::advance() {
    ConfigToken prev = current_;
    current_ = lexer_.next();
    return prev;
}

bool ConfigParser::check(ConfigTokenType type) const {
    return current_.type == type;
}

ConfigToken ConfigParser::expect(ConfigTokenType type, const std::string& msg) {
    if (!check(type)) {
        throw ParseError(current_.line, current_.column, msg);
    }
    return advance();
}

bool ConfigParser::match(ConfigTokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

void ConfigParser::expectEndOfLine() {
    if (check(ConfigTokenType::Eof)) return;
    expect(ConfigTokenType::Newline, "Expected end of line after value");
}

std::string ConfigParser::parseScalar(const std::string& key) {
    if (check(ConfigTokenType::Word) || check(ConfigTokenType::String)) {
        return advance().value;
    }
    throw ParseError(current_.line, current_.column, "Expected value for '" + key + "'");
}

std::vector<std::string> ConfigParser::parseList() {
    // list = "[" (value ("," value)* ","?)? "]"   newlines allowed inside
    expect(ConfigTokenType::LBracket, "Expected '['");
    std::vector<std::string> values;
    while (true) {
        while (match(ConfigTokenType::Newline)) {}
        if (match(ConfigTokenType::RBracket)) break;
        if (check(ConfigTokenType::Eof)) {
            throw ParseError(current_.line, current_.column, "Unterminated list, expected ']'");
        }
        if (!check(ConfigTokenType::Word) && !check(ConfigTokenType::String)) {
            throw ParseError(current_.line, current_.column, "Expected list element");
        }
        values.push_back(advance().value);
        while (match(ConfigTokenType::Newline)) {}
        if (match(ConfigTokenType::Comma)) continue;
        if (check(ConfigTokenType::Eof)) {
            throw ParseError(current_.line, current_.column, "Unterminated list, expected ']'");
        }
        expect(ConfigTokenType::RBracket, "Expected ',' or ']' in list");
        break;
    }
    return values;
}

void ConfigParser::parseAssignment(ConfigOverlay& overlay) {
    // assignment = key ("=" | "+=") (scalar | list)
    ConfigToken key = expect(ConfigTokenType::Word, "Expected option name");
    const OptionInfo* info = find_option(key.value);
    if (!info) {
        throw ParseError(key.line, key.column, "Unknown option '" + key.value + "'");
    }
    const bool is_list = info->type == OptionType::List;

    bool append = false;
    if (check(ConfigTokenType::PlusEquals)) {
        if (!is_list) {
            throw ParseError(current_.line, current_.column,
                             "'+=' is only valid for list options, '" + key.value + "' is not one");
        }
        append = true;
        advance();
    } else {
        expect(ConfigTokenType::Equals, "Expected '=' after '" + key.value + "'");
    }

    if (check(ConfigTokenType::LBracket)) {
        if (!is_list) {
            throw ParseError(current_.line, current_.column,
                             "Option '" + key.value + "' does not take a list");
        }
        auto values = parseList();
        if (append) {
            for (const auto& v : values) overlay.append(key.value, v);
        } else {
            overlay.set_list(key.value, std::move(values));
        }
        expectEndOfLine();
        return;
    }

    const int value_line = current_.line;
    const int value_col = current_.column;
    std::string value = parseScalar(key.value);
    if (is_list) {
        if (append) {
            overlay.append(key.value, value);
        } else {
            overlay.set_list(key.value, {value});
        }
    } else if (info->type == OptionType::Bool) {
        if (!parse_bool(value)) {
            throw ParseError(value_line, value_col,
                             "Option '" + key.value + "' expects true or false, got '" + value + "'");
        }
        overlay.set(key.value, value);
    } else {
        overlay.set(key.value, value);
    }
    expectEndOfLine();
}

ConfigOverlay ConfigParser::parse() {
    ConfigOverlay overlay;
    while (!check(ConfigTokenType::Eof)) {
        if (match(ConfigTokenType::Newline)) continue;
        parseAssignment(overlay);
    }
    return overlay;
}

// ============================================================
// Convenience Functions
// ============================================================

ConfigOverlay ConfigParser::parseString(const std::string& source) {
    std::istringstream iss(source);
    ConfigParser parser(iss);
    return parser.parse();
}

ConfigOverlay ConfigParser::parseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    ConfigParser parser(file);
    return parser.parse();
}

}  // namespace cspyce::build
