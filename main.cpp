#include <fstream>
#include <iostream>
#include <sstream>
#include "engine.hpp"
#include "errors.hpp"

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream f(path);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

int main(int argc, char** argv) {
    if (argc != 4) {
        std::cerr << "usage: " << argv[0] << " <provider> <from.schema> <to.schema>" << std::endl;
        return 2;
    }

    std::string from, to;
    if (!read_file(argv[2], from)) {
        std::cerr << "Failed to read " << argv[2] << std::endl;
        return 1;
    }
    if (!read_file(argv[3], to)) {
        std::cerr << "Failed to read " << argv[3] << std::endl;
        return 1;
    }

    try {
        EngineConfig config;
        config.provider = provider_from_name(argv[1]);
        Engine engine(config);
        std::cout << engine.migrate_diff(from, to);
    } catch (const SchemaSyntaxError& e) {
        for (const auto& err : e.errors()) std::cerr << err.to_string() << std::endl;
        return 1;
    } catch (const ValidationError& e) {
        for (const auto& issue : e.issues()) std::cerr << issue << std::endl;
        return 1;
    } catch (const MigrateError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
