#ifndef REQUIREMENT_HPP
#define REQUIREMENT_HPP

#include "version.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

namespace Quiver {

/**
 * @class Requirement
 * @brief A parsed dependency specifier: one source kind plus install flags.
 *
 * Textual forms:
 *   name[@selector]              registry
 *   git+<url>[@ref]              git, the ref is only looked for after the last '/'
 *   ./dir, ../dir, /dir, ~/dir   path (an archive file is installed by extraction)
 * followed by optional flags: --internal, --pure, --recursive, --develop / -e.
 */
class Requirement
{
public:
    enum class Type
    {
        Registry,
        Git,
        Path
    };

    Type type = Type::Registry;

    /** Package name. Always set for registry requirements. */
    std::string name;

    Selector selector;

    std::string url;
    std::string ref;
    bool recursive = false;

    std::string path;
    bool link = false;

    bool internal = false;
    bool pure = false;

    /**
     * @brief Parses a textual specifier.
     *
     * @param spec       The specifier, optionally followed by flags.
     * @param expectName When true a registry specifier is "name[@selector]";
     *                   otherwise it is a bare selector (manifest values).
     * @throws std::invalid_argument on an empty specifier, an unknown flag or
     *         an invalid selector.
     */
    static Requirement parse(const std::string& spec, bool expectName = true);

    /**
     * @brief Builds a requirement from the value side of a manifest
     *        dependency entry (a string or a mapping).
     */
    static Requirement fromManifestValue(const std::string& name, const YAML::Node& value);

    /**
     * @brief True for a path requirement naming an archive file.
     */
    bool isArchive() const;

    /**
     * @brief The git URL including its "@ref" suffix.
     */
    std::string gitUrlWithRef() const;

    /**
     * @brief Serializes back to the textual form.
     * @param includeName Prefix registry selectors with "name@".
     */
    std::string toString(bool includeName = true) const;
};

} // namespace Quiver

#endif // REQUIREMENT_HPP
