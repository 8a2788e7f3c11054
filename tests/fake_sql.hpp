#pragma once
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "errors.hpp"
#include "helpers.hpp"
#include "jsonhlp.hpp"
#include "sqlconnection.hpp"

// ---- Test fakes ----

class FakeSQLConnection;

class FakeStatement final : public SQLStatement {
public:
    std::string sql;
    std::vector<std::optional<std::string>> params;
    FakeSQLConnection* owner{nullptr}; // set by connection::prepare

    int exec() override;   // defined after FakeSQLConnection
    jdoc query() override;

protected:
    void set_null(int idx) override { slot(idx) = std::nullopt; }
    void set_text(int idx, std::string value) override { slot(idx) = std::move(value); }

private:
    std::optional<std::string>& slot(int idx) {
        if (params.size() < static_cast<size_t>(idx)) params.resize(idx);
        return params[idx - 1];
    }
};

// Answers queries from a script: the first rule whose fragment occurs in the
// SQL (and whose parameter, when set, is among the bound values) wins.
class FakeSQLConnection final : public SQLConnection {
public:
    struct Rule {
        std::string fragment;
        std::string param;
        std::string rows; // JSON array of row objects
        bool fail = false;
    };

    struct CapturedStatement {
        std::string sql;
        std::vector<std::optional<std::string>> params;
    };

    std::vector<Rule> rules;
    std::vector<std::string> executed;        // execute() calls
    std::vector<CapturedStatement> statements; // prepared statements that ran
    int begins{0}, commits{0}, rollbacks{0};

    void on(const std::string& fragment, const std::string& rows, const std::string& param = "") {
        rules.push_back({fragment, param, rows, false});
    }
    void fail_on(const std::string& fragment, const std::string& param = "") {
        rules.push_back({fragment, param, "[]", true});
    }

    void connect(const std::string&) override {}
    void disconnect() override {}
    bool begin() override { ++begins; tr_started_ = true; return true; }
    bool commit() override { ++commits; tr_started_ = false; return true; }
    void rollback() override { ++rollbacks; tr_started_ = false; }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        auto stmt = std::make_unique<FakeStatement>();
        stmt->owner = this;
        stmt->sql = sql;
        return stmt;
    }

    void execute(const std::string& sql) override {
        executed.push_back(sql);
        if (const Rule* r = match(sql, {}); r && r->fail) throw SqlError("scripted failure", sql);
    }

    const Rule* match(const std::string& sql, const std::vector<std::optional<std::string>>& params) const {
        for (const auto& r : rules) {
            if (sql.find(r.fragment) == std::string::npos) continue;
            if (!r.param.empty()) {
                bool bound = false;
                for (const auto& p : params) bound = bound || (p && *p == r.param);
                if (!bound) continue;
            }
            return &r;
        }
        return nullptr;
    }

    jdoc answer(const std::string& sql, const std::vector<std::optional<std::string>>& params) {
        statements.push_back({sql, params});
        jdoc doc(json::kArrayType);
        const Rule* r = match(sql, params);
        if (!r) return doc;
        if (r->fail) throw SqlError("scripted failure", sql);
        jhlp::parse_str(r->rows, doc);
        return doc;
    }
};

// ---- Inline impls that need full types ----
inline int FakeStatement::exec() {
    owner->answer(sql, params);
    return 1; // rows affected
}

inline jdoc FakeStatement::query() {
    return owner->answer(sql, params);
}
