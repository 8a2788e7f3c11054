#pragma once
#include <string>
#include <vector>

namespace sqlsplit {

    // Splits a script on top-level ';'. Quotes ('...', "...", `...`),
    // comments (--, /* */) and dollar-quoted bodies ($tag$...$tag$) are
    // respected. Comments are dropped; empty statements are skipped.
    std::vector<std::string> split(const std::string& script);

} // namespace sqlsplit
