#include "version.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <regex>
#include <sstream>

namespace Quiver {

namespace {

    constexpr unsigned long long VERSION_COMPONENT_MAX = 999999999ULL;

} // end anonymous namespace

std::vector<int> parseVersion(const std::string& version)
{
    std::vector<int> parts;
    std::string ver = version;

    // "v1.2.3" is common in tags
    if (!ver.empty() && (ver[0] == 'v' || ver[0] == 'V')) {
        ver.erase(0, 1);
    }

    std::stringstream ss(ver);
    std::string token;
    while (std::getline(ss, token, '.')) {
        size_t digits = 0;
        while (digits < token.size() && std::isdigit(static_cast<unsigned char>(token[digits]))) {
            ++digits;
        }
        if (digits == 0) {
            parts.push_back(0);
            continue;
        }
        // Oversized components saturate so ceilings can still add one
        unsigned long long value = std::strtoull(token.substr(0, digits).c_str(), nullptr, 10);
        parts.push_back(static_cast<int>(std::min<unsigned long long>(value, VERSION_COMPONENT_MAX)));
    }
    return parts;
}

int compareVersionSemantics(const std::string& v1, const std::string& v2)
{
    auto p1 = parseVersion(v1);
    auto p2 = parseVersion(v2);
    size_t n = std::max(p1.size(), p2.size());

    for (size_t i = 0; i < n; ++i) {
        int c1 = (i < p1.size()) ? p1[i] : 0;
        int c2 = (i < p2.size()) ? p2[i] : 0;

        if (c1 < c2) return -1;
        if (c1 > c2) return 1;
    }
    return 0;
}

bool compareVersions(const std::string& version1,
                     const std::string& version2,
                     const std::string& operatorSymbol)
{
    int res = compareVersionSemantics(version1, version2);

    if      (operatorSymbol == ">")   return (res > 0);
    else if (operatorSymbol == ">=")  return (res >= 0);
    else if (operatorSymbol == "<")   return (res < 0);
    else if (operatorSymbol == "<=")  return (res <= 0);
    else if (operatorSymbol == "==" || operatorSymbol == "=") return (res == 0);
    else if (operatorSymbol == "!=")  return (res != 0);

    log_warning("Unknown version comparison operator: '" + operatorSymbol + "'");
    return false;
}

namespace {

    // Upper bound for a caret range: next major, or next minor/patch below 1.0
    std::string caretCeiling(const std::vector<int>& p)
    {
        int major = p.size() > 0 ? p[0] : 0;
        int minor = p.size() > 1 ? p[1] : 0;
        int patch = p.size() > 2 ? p[2] : 0;
        if (major > 0) {
            return std::to_string(major + 1) + ".0.0";
        }
        if (minor > 0 || p.size() < 3) {
            return "0." + std::to_string(minor + 1) + ".0";
        }
        return "0.0." + std::to_string(patch + 1);
    }

    std::string tildeCeiling(const std::vector<int>& p)
    {
        int major = p.size() > 0 ? p[0] : 0;
        int minor = p.size() > 1 ? p[1] : 0;
        if (p.size() < 2) {
            return std::to_string(major + 1) + ".0.0";
        }
        return std::to_string(major) + "." + std::to_string(minor + 1) + ".0";
    }

} // end anonymous namespace

Selector::Selector(const std::string& text)
    : text_(text)
{
    trim(text_);
    if (text_.empty() || text_ == "*" || text_ == "latest") {
        return;
    }

    static const std::regex clauseRegex(R"((\^|~|>=|<=|==|!=|>|<|=)?\s*([vV]?[0-9][\w\.\-\+]*|\*))");
    static const std::regex operatorRegex(R"(\^|~|>=|<=|==|!=|>|<|=)");

    // Join "op version" pairs written with a space, e.g. ">= 1.0"
    std::vector<std::string> tokens;
    for (const auto& raw : splitWhitespace(text_)) {
        if (!tokens.empty() && std::regex_match(tokens.back(), operatorRegex)) {
            tokens.back() += raw;
        } else {
            tokens.push_back(raw);
        }
    }

    for (const auto& token : tokens) {
        std::smatch match;
        if (!std::regex_match(token, match, clauseRegex)) {
            throw std::invalid_argument("Invalid version selector: " + text_);
        }
        std::string op = match[1].str();
        std::string version = match[2].str();
        if (version == "*") {
            continue;
        }

        if (op == "^") {
            clauses_.push_back({">=", version});
            clauses_.push_back({"<", caretCeiling(parseVersion(version))});
        } else if (op == "~") {
            clauses_.push_back({">=", version});
            clauses_.push_back({"<", tildeCeiling(parseVersion(version))});
        } else {
            clauses_.push_back({op.empty() ? "==" : op, version});
        }
    }
}

bool Selector::operator()(const std::string& version) const
{
    for (const auto& clause : clauses_) {
        if (!compareVersions(version, clause.version, clause.op)) {
            return false;
        }
    }
    return true;
}

std::string Selector::toString() const
{
    return text_.empty() ? "*" : text_;
}

} // namespace Quiver
