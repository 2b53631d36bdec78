#ifndef VERSION_HPP
#define VERSION_HPP

#include <string>
#include <vector>

namespace Quiver {

/**
 * @brief Splits a version string (e.g. "1.2.3") into numeric components.
 *        Components that are not numeric count as 0; oversized ones saturate.
 */
std::vector<int> parseVersion(const std::string& version);

/**
 * @brief Compares two dotted version strings numerically.
 * @return -1 if v1 < v2, 0 if equal, 1 if v1 > v2.
 */
int compareVersionSemantics(const std::string& v1, const std::string& v2);

/**
 * @brief Compares two versions with an operator (>, >=, <, <=, ==, =, !=).
 */
bool compareVersions(const std::string& version1,
                     const std::string& version2,
                     const std::string& operatorSymbol);

/**
 * @class Selector
 * @brief A version selector such as "*", "^1.2.0", "~1.2", ">=1.0 <2.0" or "1.4.2".
 *
 * Whitespace-separated clauses must all match.
 */
class Selector
{
public:
    Selector() = default;

    /**
     * @brief Parses a textual selector. An empty string means "*".
     */
    explicit Selector(const std::string& text);

    /**
     * @brief True if `version` satisfies every clause.
     */
    bool operator()(const std::string& version) const;

    bool isAny() const { return clauses_.empty(); }

    /**
     * @brief The selector as given, or "*".
     */
    std::string toString() const;

private:
    struct Clause
    {
        std::string op;
        std::string version;
    };

    std::string text_;
    std::vector<Clause> clauses_;
};

} // namespace Quiver

#endif // VERSION_HPP
