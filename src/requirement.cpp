#include "requirement.hpp"
#include "archive.hpp"
#include "utils.hpp"

#include <stdexcept>

namespace Quiver {

namespace {

    bool startsWith(const std::string& s, const std::string& prefix)
    {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    bool looksLikePath(const std::string& s)
    {
        return startsWith(s, "./") || startsWith(s, "../") || startsWith(s, "/") ||
               startsWith(s, "~/") || s == "." || s == ".." || isArchiveFile(s);
    }

    // Splits "url@ref"; '@' only counts after the last '/' or ':' so that
    // "git@host:repo" keeps its user part.
    void splitGitRef(const std::string& urlWithRef, std::string& url, std::string& ref)
    {
        size_t separator = urlWithRef.find_last_of("/:");
        size_t at = separator == std::string::npos
            ? std::string::npos
            : urlWithRef.find('@', separator);
        if (at == std::string::npos) {
            url = urlWithRef;
            ref.clear();
        } else {
            url = urlWithRef.substr(0, at);
            ref = urlWithRef.substr(at + 1);
        }
    }

} // end anonymous namespace

Requirement Requirement::parse(const std::string& spec, bool expectName)
{
    std::vector<std::string> tokens = splitWhitespace(spec);
    if (tokens.empty()) {
        throw std::invalid_argument("Empty requirement");
    }

    Requirement req;
    std::string source = tokens[0];
    size_t flagStart = 1;

    if (startsWith(source, "git+")) {
        req.type = Type::Git;
        splitGitRef(source.substr(4), req.url, req.ref);
        if (req.url.empty()) {
            throw std::invalid_argument("Missing URL in requirement: " + spec);
        }
    } else if (looksLikePath(source)) {
        req.type = Type::Path;
        req.path = source;
    } else if (expectName) {
        req.type = Type::Registry;
        // Skip the leading '@' of a scoped name
        size_t at = source.find('@', source[0] == '@' ? 1 : 0);
        if (at == std::string::npos) {
            req.name = source;
        } else {
            req.name = source.substr(0, at);
            req.selector = Selector(source.substr(at + 1));
        }
        if (req.name.empty()) {
            throw std::invalid_argument("Missing package name in requirement: " + spec);
        }
    } else {
        req.type = Type::Registry;
        // Selectors may contain spaces (">= 1.0 <2.0"); flags start with '-'
        std::vector<std::string> selectorParts;
        size_t i = 0;
        for (; i < tokens.size() && tokens[i][0] != '-'; ++i) {
            selectorParts.push_back(tokens[i]);
        }
        req.selector = Selector(join(selectorParts, " "));
        flagStart = i;
    }

    for (size_t i = flagStart; i < tokens.size(); ++i) {
        const std::string& flag = tokens[i];
        if (flag == "--internal") {
            req.internal = true;
        } else if (flag == "--pure") {
            req.pure = true;
        } else if (flag == "--recursive") {
            req.recursive = true;
        } else if (flag == "--develop" || flag == "-e") {
            req.link = true;
        } else {
            throw std::invalid_argument("Unknown flag '" + flag + "' in requirement: " + spec);
        }
    }
    return req;
}

Requirement Requirement::fromManifestValue(const std::string& name, const YAML::Node& value)
{
    Requirement req;
    if (value.IsScalar()) {
        req = parse(value.as<std::string>(), false);
    } else if (value.IsMap()) {
        if (value["git"]) {
            req.type = Type::Git;
            splitGitRef(value["git"].as<std::string>(), req.url, req.ref);
            if (value["ref"]) {
                req.ref = value["ref"].as<std::string>();
            }
            req.recursive = value["recursive"] && value["recursive"].as<bool>();
        } else if (value["path"]) {
            req.type = Type::Path;
            req.path = value["path"].as<std::string>();
            req.link = value["link"] && value["link"].as<bool>();
        } else {
            req.type = Type::Registry;
            req.selector = Selector(value["version"] ? value["version"].as<std::string>() : "*");
        }
        req.internal = value["internal"] && value["internal"].as<bool>();
        req.pure = value["pure"] && value["pure"].as<bool>();
    } else if (value.IsNull()) {
        req.type = Type::Registry;
    } else {
        throw std::invalid_argument("Invalid requirement for '" + name + "'");
    }
    req.name = name;
    return req;
}

bool Requirement::isArchive() const
{
    return type == Type::Path && isArchiveFile(path);
}

std::string Requirement::gitUrlWithRef() const
{
    return ref.empty() ? url : url + "@" + ref;
}

std::string Requirement::toString(bool includeName) const
{
    std::string result;
    switch (type) {
        case Type::Registry:
            if (includeName) {
                result = name;
                if (!selector.isAny()) {
                    result += "@" + selector.toString();
                }
            } else {
                result = selector.toString();
            }
            break;
        case Type::Git:
            result = "git+" + gitUrlWithRef();
            if (recursive) {
                result += " --recursive";
            }
            break;
        case Type::Path:
            result = path;
            if (link) {
                result += " --develop";
            }
            break;
    }
    if (internal) {
        result += " --internal";
    }
    if (pure) {
        result += " --pure";
    }
    return result;
}

} // namespace Quiver
