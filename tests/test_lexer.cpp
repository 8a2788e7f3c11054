#include <catch2/catch.hpp>
#include "lexer.hpp"

namespace {
    std::vector<TokenKind> kinds(const std::vector<Token>& tokens) {
        std::vector<TokenKind> out;
        for (const auto& t : tokens) out.push_back(t.kind);
        return out;
    }
}

TEST_CASE("Lexer splits a field line", "[lexer]") {
    std::vector<SyntaxError> errors;
    auto tokens = DeclLexer("id Int @id @default(autoincrement())").tokenize(errors);
    REQUIRE(errors.empty());
    std::vector<TokenKind> expected = {
        TokenKind::Identifier, TokenKind::Identifier, TokenKind::At, TokenKind::Identifier,
        TokenKind::At, TokenKind::Identifier, TokenKind::LParen, TokenKind::Identifier,
        TokenKind::LParen, TokenKind::RParen, TokenKind::RParen, TokenKind::Eof,
    };
    REQUIRE(kinds(tokens) == expected);
    REQUIRE(tokens[0].text == "id");
    REQUIRE(tokens[1].column == 4);
}

TEST_CASE("Lexer recognizes block attributes, literals and punctuation", "[lexer]") {
    std::vector<SyntaxError> errors;
    auto tokens = DeclLexer("@@index([a, b]) x String? = -3.5 true").tokenize(errors);
    REQUIRE(errors.empty());
    REQUIRE(tokens[0].kind == TokenKind::AtAt);
    REQUIRE(tokens[3].kind == TokenKind::LBracket);
    REQUIRE(tokens[5].kind == TokenKind::Comma);
    REQUIRE(tokens[11].kind == TokenKind::Question);
    REQUIRE(tokens[12].kind == TokenKind::Equal);
    REQUIRE(tokens[13].kind == TokenKind::Number);
    REQUIRE(tokens[13].text == "-3.5");
    REQUIRE(tokens[14].kind == TokenKind::Boolean);
}

TEST_CASE("Lexer unescapes strings", "[lexer]") {
    std::vector<SyntaxError> errors;
    auto tokens = DeclLexer(R"("a\"b\\c")").tokenize(errors);
    REQUIRE(errors.empty());
    REQUIRE(tokens[0].kind == TokenKind::String);
    REQUIRE(tokens[0].text == "a\"b\\c");
}

TEST_CASE("Lexer drops comments but keeps line breaks", "[lexer]") {
    std::vector<SyntaxError> errors;
    auto tokens = DeclLexer("// leading\nmodel /* inline */ User").tokenize(errors);
    REQUIRE(errors.empty());
    std::vector<TokenKind> expected = {TokenKind::Newline, TokenKind::Identifier, TokenKind::Identifier, TokenKind::Eof};
    REQUIRE(kinds(tokens) == expected);
    REQUIRE(tokens[1].line == 2);
    REQUIRE(tokens[2].text == "User");
}

TEST_CASE("Lexer reports unterminated strings and stray characters", "[lexer]") {
    std::vector<SyntaxError> errors;
    auto tokens = DeclLexer("a = \"open\nb # c").tokenize(errors);
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].line == 1);
    REQUIRE(errors[0].message == "unterminated string literal");
    REQUIRE(errors[1].line == 2);
    REQUIRE(errors[1].message == "unexpected character '#'");
    REQUIRE(errors[1].context == "b # c");
    REQUIRE(tokens.back().kind == TokenKind::Eof);
}

TEST_CASE("A backslash cannot close a string", "[lexer]") {
    std::vector<SyntaxError> errors;
    auto tokens = DeclLexer("a = \"open\\").tokenize(errors);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].message == "unterminated string literal");
    REQUIRE(tokens.back().kind == TokenKind::Eof);
    REQUIRE(tokens[tokens.size() - 2].text == "open");
}
