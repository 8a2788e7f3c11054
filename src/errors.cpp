#include "errors.hpp"
#include <fmt/format.h>

std::string SyntaxError::to_string() const {
    std::string out = fmt::format("line {}:{}: {}", line, column, message);
    if (!context.empty()) out += fmt::format("\n  | {}", context);
    return out;
}

namespace {
    std::string summarize(const std::vector<SyntaxError>& errors) {
        std::string out = fmt::format("schema has {} syntax error(s)", errors.size());
        for (const auto& e : errors) out += "\n" + e.to_string();
        return out;
    }

    std::string bullet_list(const std::string& head, const std::vector<std::string>& items) {
        std::string out = head;
        for (const auto& i : items) out += "\n  - " + i;
        return out;
    }
}

SchemaSyntaxError::SchemaSyntaxError(std::vector<SyntaxError> errors)
    : MigrateError(summarize(errors)), errors_(std::move(errors)) {}

ValidationError::ValidationError(std::vector<std::string> issues)
    : MigrateError(bullet_list("schema validation failed:", issues)), issues_(std::move(issues)) {}

DestructiveChangeError::DestructiveChangeError(std::vector<std::string> warnings)
    : MigrateError(bullet_list("the change would lose data; pass accept_data_loss to proceed:", warnings))
    , warnings_(std::move(warnings)) {}

ApplyError::ApplyError(std::string migration, std::string statement, const std::string& cause)
    : MigrateError(fmt::format("migration `{}` failed: {}\nstatement:\n{}", migration, cause, statement))
    , migration_(std::move(migration)), statement_(std::move(statement)) {}
