#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace sqlreplay {

/**
 * @brief Split a SQL dump into statements.
 *
 * A statement ends at a line whose last non-blank character is ';'. The
 * terminating ';' is dropped. Blank lines and "--" comment lines between
 * statements are skipped. Trailing text without a terminator becomes the
 * last statement.
 */
std::vector<std::string> splitStatements(std::istream& in);

/**
 * @brief Read and split a SQL file.
 * @throws ReplayException (Upstream scope) if the file cannot be opened.
 */
std::vector<std::string> readStatements(const std::filesystem::path& path);

}  // namespace sqlreplay
