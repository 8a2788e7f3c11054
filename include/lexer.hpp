#pragma once
#include <string>
#include <vector>
#include "errors.hpp"

enum class TokenKind {
    At, AtAt, LParen, RParen, LBrace, RBrace, LBracket, RBracket,
    Equal, Colon, Question, Comma, Dot,
    String, Number, Boolean, Identifier,
    Newline, Illegal, Eof
};

struct Token {
    TokenKind kind = TokenKind::Eof;
    std::string text;
    int line = 1;
    int column = 1;
};

std::string token_kind_name(TokenKind k);

// Turns declaration text into tokens. Lexical problems (unterminated strings,
// stray characters) are appended to `errors`; lexing always reaches EOF.
class DeclLexer {
public:
    explicit DeclLexer(const std::string& source);

    std::vector<Token> tokenize(std::vector<SyntaxError>& errors);
    const std::vector<std::string>& lines() const { return lines_; }
    std::string line_text(int line) const;

private:
    char peek(size_t ahead = 0) const;
    char advance();
    void skip_blank_and_comments(std::vector<SyntaxError>& errors);
    Token read_string(std::vector<SyntaxError>& errors);
    Token read_number();
    Token read_identifier();
    Token make(TokenKind kind, std::string text, int line, int column) const;

    std::string src_;
    std::vector<std::string> lines_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
};
