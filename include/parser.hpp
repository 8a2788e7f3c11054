#pragma once
#include <optional>
#include <string>
#include <vector>
#include "decl.hpp"
#include "errors.hpp"
#include "lexer.hpp"

struct ParseResult {
    DeclSchema schema;
    std::vector<SyntaxError> errors;

    // A schema with errors must not be used for generation.
    bool ok() const { return errors.empty(); }
};

// Best-effort: keeps going after an error so one pass reports as many
// problems as possible.
ParseResult parse_schema(const std::string& text);

// Reads and parses a declaration file. FilesystemError if unreadable.
ParseResult parse_schema_file(const std::string& path);

class DeclParser {
public:
    explicit DeclParser(const std::string& text);
    ParseResult parse();

private:
    const Token& cur() const { return tokens_[pos_]; }
    const Token& at(size_t ahead) const;
    bool is(TokenKind k) const { return cur().kind == k; }
    const Token& next();
    bool accept(TokenKind k);
    void fail(const Token& t, const std::string& message);
    void skip_newlines();
    void skip_line();
    void skip_block();
    bool at_block_start() const;
    bool open_block(const std::string& kind, std::string& name, int& line);
    bool close_block(const std::string& kind, const std::string& name, int line);

    void parse_config_block(std::vector<DeclConfigBlock>& into, const std::string& kind);
    void parse_model();
    void parse_enum();
    std::optional<DeclField> parse_field();
    std::optional<DeclAttribute> parse_attribute();
    bool parse_arguments(std::vector<DeclArgument>& args, const std::string& owner);
    std::optional<DeclValue> parse_value(const std::string& owner);
    bool end_of_line();

    DeclLexer lexer_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    ParseResult result_;
};
