// cspyce-build - Configuration File Parser
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "cspyce/build/config.hpp"

#include <istream>
#include <stdexcept>
#include <string>

namespace cspyce::build {

// Parse errors
class ParseError : public std::runtime_error {
public:
    int line;
    int column;
    std::string message;

    ParseError(int line_, int column_, std::string msg)
        : std::runtime_error(formatError(line_, column_, msg)),
          line(line_), column(column_), message(std::move(msg)) {}

private:
    static std::string formatError(int line, int col, const std::string& msg) {
        return "Parse error at line " + std::to_string(line) +
               ", column " + std::to_string(col) + ": " + msg;
    }
};

// Token types
enum class ConfigTokenType {
    Eof,
    Newline,
    Word,        // bare value or key
    String,      // "quoted"
    Equals,      // =
    PlusEquals,  // +=
    Comma,       // ,
    LBracket,    // [
    RBracket,    // ]
};

struct ConfigToken {
    ConfigTokenType type;
    std::string value;
    int line;
    int column;
};

// Lexer - `#` comments run to end of line
class ConfigLexer {
public:
    explicit ConfigLexer(std::istream& is);
    ConfigToken next();

private:
    std::istream& is_;
    int line_ = 1;
    int column_ = 1;
    int current_ = -1;
    bool at_line_start_ = true;
    int list_depth_ = 0;

    ConfigToken lex();
    int advance();
    void skipWhitespace();
    void skipComment();
    [[nodiscard]] bool isWordChar(int c) const;
};

// Parser - one `key = value` assignment per line
class ConfigParser {
public:
    explicit ConfigParser(std::istream& is);

    ConfigOverlay parse();

    static ConfigOverlay parseString(const std::string& source);
    static ConfigOverlay parseFile(const std::string& path);

private:
    ConfigLexer lexer_;
    ConfigToken current_;

    ConfigToken advance();
    [[nodiscard]] bool check(ConfigTokenType type) const;
    ConfigToken expect(ConfigTokenType type, const std::string& msg);
    bool match(ConfigTokenType type);

    void parseAssignment(ConfigOverlay& overlay);
    std::string parseScalar(const std::string& key);
    std::vector<std::string> parseList();
    void expectEndOfLine();
};

}  // namespace cspyce::build
