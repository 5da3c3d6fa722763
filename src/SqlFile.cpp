#include "SqlFile.hpp"
#include "ErrorHandler.hpp"
#include <fstream>

namespace sqlreplay {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool isCommentLine(const std::string& line) {
    return line.compare(0, 2, "--") == 0 || line[0] == '#';
}

}  // namespace

std::vector<std::string> splitStatements(std::istream& in) {
    std::vector<std::string> statements;
    std::string current;
    std::string line;

    while (std::getline(in, line)) {
        std::string trimmed = trim(line);

        if (current.empty() && (trimmed.empty() || isCommentLine(trimmed))) {
            continue;
        }

        if (!current.empty()) {
            current += '\n';
        }

        if (!trimmed.empty() && trimmed.back() == ';') {
            current += line.substr(0, line.find_last_of(';'));
            std::string stmt = trim(current);
            if (!stmt.empty()) {
                statements.push_back(std::move(stmt));
            }
            current.clear();
        } else {
            current += line;
        }
    }

    std::string rest = trim(current);
    if (!rest.empty()) {
        statements.push_back(std::move(rest));
    }
    return statements;
}

std::vector<std::string> readStatements(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ReplayException("cannot open SQL file " + path.string(), ErrorScope::Upstream);
    }
    return splitStatements(file);
}

}  // namespace sqlreplay
