#include "lexer.hpp"
#include <cctype>
#include <sstream>

namespace {
    bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
    bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }
    bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
}

std::string token_kind_name(TokenKind k) {
    switch (k) {
        case TokenKind::At:         return "'@'";
        case TokenKind::AtAt:       return "'@@'";
        case TokenKind::LParen:     return "'('";
        case TokenKind::RParen:     return "')'";
        case TokenKind::LBrace:     return "'{'";
        case TokenKind::RBrace:     return "'}'";
        case TokenKind::LBracket:   return "'['";
        case TokenKind::RBracket:   return "']'";
        case TokenKind::Equal:      return "'='";
        case TokenKind::Colon:      return "':'";
        case TokenKind::Question:   return "'?'";
        case TokenKind::Comma:      return "','";
        case TokenKind::Dot:        return "'.'";
        case TokenKind::String:     return "string";
        case TokenKind::Number:     return "number";
        case TokenKind::Boolean:    return "boolean";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::Newline:    return "end of line";
        case TokenKind::Illegal:    return "illegal character";
        case TokenKind::Eof:        return "end of file";
    }
    return "token";
}

DeclLexer::DeclLexer(const std::string& source) : src_(source) {
    std::istringstream in(src_);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines_.push_back(line);
    }
}

std::string DeclLexer::line_text(int line) const {
    if (line < 1 || static_cast<size_t>(line) > lines_.size()) return "";
    return lines_[line - 1];
}

char DeclLexer::peek(size_t ahead) const {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
}

char DeclLexer::advance() {
    char c = peek();
    if (c == '\0') return c;
    ++pos_;
    if (c == '\n') { ++line_; column_ = 1; }
    else ++column_;
    return c;
}

Token DeclLexer::make(TokenKind kind, std::string text, int line, int column) const {
    Token t;
    t.kind = kind;
    t.text = std::move(text);
    t.line = line;
    t.column = column;
    return t;
}

void DeclLexer::skip_blank_and_comments(std::vector<SyntaxError>& errors) {
    for (;;) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r') { advance(); continue; }
        if (c == '/' && peek(1) == '/') {
            while (peek() != '\n' && peek() != '\0') advance();
            continue;
        }
        if (c == '/' && peek(1) == '*') {
            int line = line_, col = column_;
            advance(); advance();
            while (!(peek() == '*' && peek(1) == '/')) {
                if (peek() == '\0') {
                    errors.push_back({line, col, "unterminated block comment", line_text(line)});
                    return;
                }
                advance();
            }
            advance(); advance();
            continue;
        }
        return;
    }
}

Token DeclLexer::read_string(std::vector<SyntaxError>& errors) {
    int line = line_, col = column_;
    advance(); // opening quote
    std::string value;
    for (;;) {
        char c = peek();
        if (c == '\0' || c == '\n') {
            errors.push_back({line, col, "unterminated string literal", line_text(line)});
            break;
        }
        advance();
        if (c == '"') break;
        if (c == '\\') {
            if (peek() == '\0' || peek() == '\n') {
                errors.push_back({line, col, "unterminated string literal", line_text(line)});
                break;
            }
            char e = advance();
            switch (e) {
                case 'n':  value += '\n'; break;
                case 't':  value += '\t'; break;
                case 'r':  value += '\r'; break;
                case '"':  value += '"';  break;
                case '\\': value += '\\'; break;
                default:   value += '\\'; value += e; break;
            }
            continue;
        }
        value += c;
    }
    return make(TokenKind::String, value, line, col);
}

Token DeclLexer::read_number() {
    int line = line_, col = column_;
    std::string text;
    if (peek() == '-') text += advance();
    while (is_digit(peek())) text += advance();
    if (peek() == '.' && is_digit(peek(1))) {
        text += advance();
        while (is_digit(peek())) text += advance();
    }
    return make(TokenKind::Number, text, line, col);
}

Token DeclLexer::read_identifier() {
    int line = line_, col = column_;
    std::string text;
    while (is_ident_char(peek())) text += advance();
    if (text == "true" || text == "false") return make(TokenKind::Boolean, text, line, col);
    return make(TokenKind::Identifier, text, line, col);
}

std::vector<Token> DeclLexer::tokenize(std::vector<SyntaxError>& errors) {
    std::vector<Token> tokens;
    for (;;) {
        skip_blank_and_comments(errors);
        char c = peek();
        int line = line_, col = column_;
        if (c == '\0') {
            tokens.push_back(make(TokenKind::Eof, "", line, col));
            break;
        }
        if (c == '"') { tokens.push_back(read_string(errors)); continue; }
        if (is_digit(c) || (c == '-' && is_digit(peek(1)))) { tokens.push_back(read_number()); continue; }
        if (is_ident_start(c)) { tokens.push_back(read_identifier()); continue; }

        advance();
        TokenKind kind;
        std::string text(1, c);
        switch (c) {
            case '\n': kind = TokenKind::Newline; break;
            case '@':
                if (peek() == '@') { advance(); kind = TokenKind::AtAt; text = "@@"; }
                else kind = TokenKind::At;
                break;
            case '(': kind = TokenKind::LParen;   break;
            case ')': kind = TokenKind::RParen;   break;
            case '{': kind = TokenKind::LBrace;   break;
            case '}': kind = TokenKind::RBrace;   break;
            case '[': kind = TokenKind::LBracket; break;
            case ']': kind = TokenKind::RBracket; break;
            case '=': kind = TokenKind::Equal;    break;
            case ':': kind = TokenKind::Colon;    break;
            case '?': kind = TokenKind::Question; break;
            case ',': kind = TokenKind::Comma;    break;
            case '.': kind = TokenKind::Dot;      break;
            default:
                kind = TokenKind::Illegal;
                errors.push_back({line, col, "unexpected character '" + text + "'", line_text(line)});
                break;
        }
        if (kind != TokenKind::Illegal) tokens.push_back(make(kind, text, line, col));
    }
    return tokens;
}
