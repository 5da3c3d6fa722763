#include "LogUtil.hpp"
#include <sstream>

namespace sqlreplay {

std::string toDisplayString(const Value& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return "NULL"; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(uint64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
        std::string operator()(const std::string& v) const { return "\"" + v + "\""; }
    };
    return std::visit(Visitor{}, value);
}

std::string truncateString(const std::string& str, size_t limit) {
    if (str.size() <= limit) {
        return str;
    }
    return str.substr(0, limit) + "...";
}

std::string formatArgs(const Args& args, size_t limit) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << toDisplayString(args[i]);
    }
    oss << ']';
    return truncateString(oss.str(), limit);
}

std::string formatArgs(const std::vector<Args>& argsPerStatement, size_t limit) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < argsPerStatement.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << formatArgs(argsPerStatement[i], std::string::npos);
    }
    oss << ']';
    return truncateString(oss.str(), limit);
}

std::string formatStatements(const std::vector<std::string>& statements, size_t limit) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < statements.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << statements[i];
    }
    oss << ']';
    return truncateString(oss.str(), limit);
}

}  // namespace sqlreplay
