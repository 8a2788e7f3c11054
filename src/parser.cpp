#include "parser.hpp"
#include <fstream>
#include <set>
#include <sstream>

namespace {
    const std::set<std::string> block_keywords = {"datasource", "generator", "model", "enum"};
}

ParseResult parse_schema(const std::string& text) {
    DeclParser parser(text);
    return parser.parse();
}

ParseResult parse_schema_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw FilesystemError("cannot read schema file", path);
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_schema(ss.str());
}

DeclParser::DeclParser(const std::string& text) : lexer_(text) {}

const Token& DeclParser::at(size_t ahead) const {
    size_t i = pos_ + ahead;
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
}

const Token& DeclParser::next() {
    const Token& t = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) ++pos_;
    return t;
}

bool DeclParser::accept(TokenKind k) {
    if (!is(k)) return false;
    next();
    return true;
}

void DeclParser::fail(const Token& t, const std::string& message) {
    result_.errors.push_back({t.line, t.column, message, lexer_.line_text(t.line)});
}

void DeclParser::skip_newlines() {
    while (is(TokenKind::Newline)) next();
}

void DeclParser::skip_line() {
    while (!is(TokenKind::Newline) && !is(TokenKind::Eof)) next();
}

// Skips an unrecognized block up to its matching closing brace.
void DeclParser::skip_block() {
    while (!is(TokenKind::LBrace) && !is(TokenKind::Newline) && !is(TokenKind::Eof)) next();
    if (!is(TokenKind::LBrace)) return;
    int depth = 0;
    while (!is(TokenKind::Eof)) {
        if (is(TokenKind::LBrace)) ++depth;
        if (is(TokenKind::RBrace) && --depth == 0) { next(); return; }
        next();
    }
}

// "model X {" seen while still inside another block means its '}' is missing.
bool DeclParser::at_block_start() const {
    return cur().kind == TokenKind::Identifier && block_keywords.count(cur().text) &&
           at(1).kind == TokenKind::Identifier && at(2).kind == TokenKind::LBrace;
}

ParseResult DeclParser::parse() {
    tokens_ = lexer_.tokenize(result_.errors);
    pos_ = 0;
    for (;;) {
        skip_newlines();
        if (is(TokenKind::Eof)) break;
        const Token& t = cur();
        if (t.kind == TokenKind::Identifier) {
            if (t.text == "datasource") { parse_config_block(result_.schema.datasources, "datasource"); continue; }
            if (t.text == "generator")  { parse_config_block(result_.schema.generators, "generator"); continue; }
            if (t.text == "model")      { parse_model(); continue; }
            if (t.text == "enum")       { parse_enum(); continue; }
            fail(t, "unrecognized block type '" + t.text + "'");
            skip_block();
            continue;
        }
        if (t.kind == TokenKind::RBrace) {
            fail(t, "unbalanced '}' with no open block");
            next();
            continue;
        }
        fail(t, "unexpected " + token_kind_name(t.kind) + " at top level");
        skip_line();
    }
    return std::move(result_);
}

bool DeclParser::open_block(const std::string& kind, std::string& name, int& line) {
    const Token& kw = next();
    line = kw.line;
    if (!is(TokenKind::Identifier)) {
        fail(cur(), "expected a name after '" + kind + "'");
        skip_block();
        return false;
    }
    name = next().text;
    if (!is(TokenKind::LBrace)) {
        fail(cur(), "expected '{' after " + kind + " '" + name + "'");
        skip_block();
        return false;
    }
    next();
    return true;
}

// Called on '}' or at a point where the block can no longer continue.
bool DeclParser::close_block(const std::string& kind, const std::string& name, int line) {
    if (accept(TokenKind::RBrace)) return true;
    std::string msg = "unbalanced braces: " + kind + " '" + name + "' opened at line " +
                      std::to_string(line) + " is missing its closing '}'";
    result_.errors.push_back({line, 1, msg, lexer_.line_text(line)});
    return false;
}

bool DeclParser::end_of_line() {
    if (is(TokenKind::Newline) || is(TokenKind::Eof) || is(TokenKind::RBrace)) return true;
    fail(cur(), "unexpected " + token_kind_name(cur().kind) + " '" + cur().text + "'");
    skip_line();
    return false;
}

void DeclParser::parse_config_block(std::vector<DeclConfigBlock>& into, const std::string& kind) {
    DeclConfigBlock block;
    if (!open_block(kind, block.name, block.line)) return;
    for (;;) {
        skip_newlines();
        if (is(TokenKind::RBrace) || is(TokenKind::Eof) || at_block_start()) break;
        if (!is(TokenKind::Identifier)) {
            fail(cur(), "expected a key in " + kind + " '" + block.name + "'");
            skip_line();
            continue;
        }
        DeclConfigEntry entry;
        entry.line = cur().line;
        entry.name = next().text;
        if (!accept(TokenKind::Equal)) {
            fail(cur(), "expected '=' after '" + entry.name + "'");
            skip_line();
            continue;
        }
        auto value = parse_value(entry.name);
        if (!value) { skip_line(); continue; }
        entry.value = std::move(*value);
        block.entries.push_back(std::move(entry));
        end_of_line();
    }
    close_block(kind, block.name, block.line);
    into.push_back(std::move(block));
}

void DeclParser::parse_model() {
    DeclModel model;
    if (!open_block("model", model.name, model.line)) return;
    for (;;) {
        skip_newlines();
        if (is(TokenKind::RBrace) || is(TokenKind::Eof) || at_block_start()) break;
        if (is(TokenKind::AtAt)) {
            auto attr = parse_attribute();
            if (attr) model.attributes.push_back(std::move(*attr));
            end_of_line();
            continue;
        }
        if (!is(TokenKind::Identifier)) {
            fail(cur(), "expected a field name in model '" + model.name + "', found " + token_kind_name(cur().kind));
            skip_line();
            continue;
        }
        auto field = parse_field();
        if (field) model.fields.push_back(std::move(*field));
    }
    close_block("model", model.name, model.line);
    result_.schema.models.push_back(std::move(model));
}

std::optional<DeclField> DeclParser::parse_field() {
    DeclField field;
    field.line = cur().line;
    field.name = next().text;
    if (!is(TokenKind::Identifier)) {
        fail(cur(), "expected a type for field '" + field.name + "'");
        skip_line();
        return std::nullopt;
    }
    field.type.name = next().text;
    if (field.type.name == "Unsupported") {
        field.type.is_unsupported = true;
        if (!accept(TokenKind::LParen) || !is(TokenKind::String)) {
            fail(cur(), "Unsupported type of field '" + field.name + "' needs a string argument");
            skip_line();
            return std::nullopt;
        }
        field.type.unsupported = next().text;
        if (!accept(TokenKind::RParen)) {
            fail(cur(), "expected ')' after Unsupported type");
            skip_line();
            return std::nullopt;
        }
    }
    if (accept(TokenKind::LBracket)) {
        if (!accept(TokenKind::RBracket)) {
            fail(cur(), "expected ']' in list type of field '" + field.name + "'");
            skip_line();
            return std::nullopt;
        }
        field.type.is_array = true;
    }
    if (accept(TokenKind::Question)) field.type.is_optional = true;

    while (is(TokenKind::At)) {
        auto attr = parse_attribute();
        if (!attr) return field;  // the line was already skipped
        field.attributes.push_back(std::move(*attr));
    }
    end_of_line();
    return field;
}

void DeclParser::parse_enum() {
    DeclEnum en;
    if (!open_block("enum", en.name, en.line)) return;
    for (;;) {
        skip_newlines();
        if (is(TokenKind::RBrace) || is(TokenKind::Eof) || at_block_start()) break;
        if (is(TokenKind::AtAt)) {
            auto attr = parse_attribute();
            if (attr) en.attributes.push_back(std::move(*attr));
            end_of_line();
            continue;
        }
        if (!is(TokenKind::Identifier)) {
            fail(cur(), "expected an enum value in enum '" + en.name + "'");
            skip_line();
            continue;
        }
        DeclEnumValue value;
        value.line = cur().line;
        value.name = next().text;
        bool ok = true;
        while (ok && is(TokenKind::At)) {
            auto attr = parse_attribute();
            if (attr) value.attributes.push_back(std::move(*attr));
            else ok = false;
        }
        en.values.push_back(std::move(value));
        if (ok) end_of_line();
    }
    close_block("enum", en.name, en.line);
    result_.schema.enums.push_back(std::move(en));
}

std::optional<DeclAttribute> DeclParser::parse_attribute() {
    DeclAttribute attr;
    attr.line = cur().line;
    next(); // @ or @@
    if (!is(TokenKind::Identifier)) {
        fail(cur(), "expected an attribute name after '@'");
        skip_line();
        return std::nullopt;
    }
    attr.name = next().text;
    while (is(TokenKind::Dot) && at(1).kind == TokenKind::Identifier) {
        next();
        attr.name += "." + next().text;
    }
    if (is(TokenKind::LParen)) {
        next();
        if (!parse_arguments(attr.args, "@" + attr.name)) {
            skip_line();
            return std::nullopt;
        }
    }
    return attr;
}

// Parses `arg, name: value, ...)` after the opening parenthesis.
bool DeclParser::parse_arguments(std::vector<DeclArgument>& args, const std::string& owner) {
    if (accept(TokenKind::RParen)) return true;
    for (;;) {
        DeclArgument arg;
        if (is(TokenKind::Identifier) && (at(1).kind == TokenKind::Colon || at(1).kind == TokenKind::Equal)) {
            arg.name = next().text;
            next();
        }
        auto value = parse_value(owner);
        if (!value) return false;
        arg.value = std::move(*value);
        args.push_back(std::move(arg));
        if (accept(TokenKind::Comma)) continue;
        if (accept(TokenKind::RParen)) return true;
        fail(cur(), "malformed argument list for " + owner + ": expected ',' or ')' but found " +
                    token_kind_name(cur().kind));
        return false;
    }
}

std::optional<DeclValue> DeclParser::parse_value(const std::string& owner) {
    const Token& t = cur();
    DeclValue v;
    switch (t.kind) {
        case TokenKind::String:
            v.node = DeclScalar{DeclScalar::Kind::String, t.text};
            next();
            return v;
        case TokenKind::Number:
            v.node = DeclScalar{DeclScalar::Kind::Number, t.text};
            next();
            return v;
        case TokenKind::Boolean:
            v.node = DeclScalar{DeclScalar::Kind::Boolean, t.text};
            next();
            return v;
        case TokenKind::LBracket: {
            next();
            DeclList list;
            if (!accept(TokenKind::RBracket)) {
                for (;;) {
                    auto item = parse_value(owner);
                    if (!item) return std::nullopt;
                    list.items.push_back(std::move(*item));
                    if (accept(TokenKind::Comma)) continue;
                    if (accept(TokenKind::RBracket)) break;
                    fail(cur(), "malformed list in " + owner + ": expected ',' or ']' but found " +
                                token_kind_name(cur().kind));
                    return std::nullopt;
                }
            }
            v.node = std::move(list);
            return v;
        }
        case TokenKind::Identifier: {
            std::string name = next().text;
            if (accept(TokenKind::LParen)) {
                DeclCall call;
                call.name = name;
                if (!parse_arguments(call.args, owner)) return std::nullopt;
                v.node = std::move(call);
                return v;
            }
            v.node = DeclScalar{DeclScalar::Kind::Identifier, name};
            return v;
        }
        default:
            fail(t, "malformed argument list for " + owner + ": unexpected " + token_kind_name(t.kind));
            return std::nullopt;
    }
}
