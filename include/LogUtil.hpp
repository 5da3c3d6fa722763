#pragma once

#include "SqlTypes.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace sqlreplay {

// Statements and arguments longer than this are cut in log output
constexpr size_t kDefaultTruncateLength = 1024;

std::string truncateString(const std::string& str, size_t limit = kDefaultTruncateLength);

std::string formatArgs(const Args& args, size_t limit = kDefaultTruncateLength);
std::string formatArgs(const std::vector<Args>& argsPerStatement,
                       size_t limit = kDefaultTruncateLength);
std::string formatStatements(const std::vector<std::string>& statements,
                             size_t limit = kDefaultTruncateLength);

}  // namespace sqlreplay
