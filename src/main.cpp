#include <iostream>
#include <string>
#include <vector>
#include <regex>
#include <filesystem>
#include <stdexcept>

#include "config.hpp"
#include "environment.hpp"
#include "errors.hpp"
#include "install.hpp"
#include "lifecycle.hpp"
#include "manifest.hpp"
#include "process.hpp"
#include "registry.hpp"
#include "requirement.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

void printHelp()
{
    std::cout << "Quiver (x86_64)\n"
              << "Usage: quiver command [options]\n\n"
              << "Quiver installs packages and their dependencies locally (per project),\n"
              << "globally (per user) or system-wide, and hands python dependencies to pip.\n\n"
              << "Package specifiers:\n"
              << "  [@<scope>/]<package>[@<version>]\n"
              << "  git+<url>[@<ref>]\n"
              << "  <archive>.tar[.<compression>]\n"
              << "  <package_directory>\n"
              << "  ~<pipspec> or pip+<pipspec>\n\n"
              << "Useful commands:\n"
              << "  install      - Install packages (the current package without arguments)\n"
              << "  uninstall    - Uninstall packages\n"
              << "  dirs         - Show the directories of an install location\n"
              << "  bin          - Show the bin directory of an install location\n"
              << "  run          - Run a script of the current package\n"
              << "  init         - Create a quiver.yaml for a new package\n"
              << "  registry     - Manage registries\n";
}

void printInstallUsage()
{
    std::cerr << "Usage: quiver install [SPEC...] [options]\n"
              << "  -U, --upgrade             Reinstall packages that are already installed\n"
              << "  -e, --develop PATH        Install a package directory in development mode\n"
              << "  -g, --global              Install per user\n"
              << "  --root, --system          Install system-wide\n"
              << "  --pip SPEC...             Treat all following arguments as pip requirements\n"
              << "  -R, --recursive           Repair dependencies of satisfied dependencies\n"
              << "  --dev / --production      Install dev dependencies or not\n"
              << "  --save / --save-dev       Save the installed packages to quiver.yaml\n"
              << "  --save-ext                Save the installed packages as extensions\n"
              << "  --internal / --no-internal\n"
              << "  --pure                    Skip entry-point scripts\n"
              << "  -f, --force               Remove directories without a manifest on upgrade\n"
              << "  -PI, --pip-ignore-installed\n"
              << "  -PT, --pip-use-target-option\n"
              << "  --packagedir DIR          Directory of the current package\n"
              << "  -v, --verbose\n";
}

// Helper function: Build the environment of this process, with the
// interpreter and runtime taken from the configuration.
Quiver::Environment makeEnvironment(const Quiver::Config& config)
{
    Quiver::Environment env = Quiver::Environment::fromProcess();
    env.pythonExecutable = config.python;
    env.runtimeExecutable = config.runtime;
    return env;
}

// Helper function: Split a pip requirement line into (name, specifier).
// Lines that are not plain requirements (paths, URLs) yield false.
bool splitPipRequirement(const std::string& line, std::string& name, std::string& specifier)
{
    static const std::regex requirementRegex(R"(^\s*([A-Za-z0-9][A-Za-z0-9._\-]*(?:\[[^\]]*\])?)\s*(.*)$)");
    if (line.find('/') != std::string::npos || line.rfind('.', 0) == 0) {
        return false;
    }
    std::smatch match;
    if (!std::regex_match(line, match, requirementRegex)) {
        return false;
    }
    name = match[1].str();
    specifier = match[2].str();
    Quiver::trim(specifier);
    return true;
}

// Helper function: Parse -g/--root/--system from an argument list.
// Returns false after printing an error when both are set.
bool locationFromArgs(bool global, bool root, Quiver::InstallLocation& location)
{
    try {
        location = Quiver::resolveLocation(global, root);
    } catch (const Quiver::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }
    return true;
}

// Helper function: Ask for one manifest field on standard input. An empty
// reply takes the default, "-" leaves an optional field out.
std::string promptField(const std::string& question, const std::string& fallback, bool optional)
{
    std::string message = question;
    if (!fallback.empty()) {
        message += " [" + fallback + "]";
    }
    while (true) {
        std::cout << message << "? " << std::flush;
        std::string reply;
        if (!std::getline(std::cin, reply)) {
            return fallback;
        }
        Quiver::trim(reply);
        if (reply.empty()) {
            reply = fallback;
        }
        if (reply == "-") {
            return "";
        }
        if (!reply.empty() || optional) {
            return reply;
        }
    }
}

int runCommand(int argc, char* argv[])
{
    // If no command is supplied, show the help message
    if (argc < 2) {
        printHelp();
        return 0;
    }

    // Parse the first argument as the main command
    std::string command = argv[1];
    const std::string configPath = Quiver::Config::defaultPath();

    // -------------------------------------------------------------
    // Registry Command
    // -------------------------------------------------------------
    if (command == "registry") {
        if (argc >= 3) {
            std::string subCommand = argv[2];
            if (subCommand == "list") {
                Quiver::Config config = Quiver::Config::loadFromFile(configPath);
                config.print();
            }
            else if (subCommand == "add" && argc == 5) {
                Quiver::Config config = Quiver::Config::loadFromFile(configPath);
                if (!config.addRegistry(argv[3], argv[4]) || !config.saveToFile(configPath)) {
                    return 1;
                }
            }
            else if (subCommand == "remove" && argc == 4) {
                Quiver::Config config = Quiver::Config::loadFromFile(configPath);
                if (!config.removeRegistry(argv[3]) || !config.saveToFile(configPath)) {
                    return 1;
                }
            }
            else {
                std::cerr << "Unknown or invalid subcommand for 'registry'.\n";
                return 1;
            }
        }
        else {
            std::cerr << "Usage: quiver registry <subcommand>\n"
                      << "  list                     List all registries\n"
                      << "  add <name> <url>         Add a new registry\n"
                      << "  remove <name>            Remove a registry\n";
            return 1;
        }
    }
    // -------------------------------------------------------------
    // Install Command
    // -------------------------------------------------------------
    else if (command == "install") {
        std::vector<std::string> specs;
        std::vector<std::string> developSpecs;
        std::vector<std::string> pipSpecs;
        std::string packageDir = ".";
        bool upgrade = false, global = false, root = false, recursive = false;
        bool dev = false, production = false;
        bool save = false, saveDev = false, saveExt = false;
        bool internal = false, noInternal = false, pure = false;
        bool verbose = false, force = false;
        bool pipIgnoreInstalled = false, pipUseTargetOption = false;

        // Collect arguments after "install"
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "-U" || arg == "--upgrade") upgrade = true;
            else if (arg == "-g" || arg == "--global") global = true;
            else if (arg == "--root" || arg == "--system") root = true;
            else if (arg == "-R" || arg == "--recursive") recursive = true;
            else if (arg == "--dev") dev = true;
            else if (arg == "--production") production = true;
            else if (arg == "--save") save = true;
            else if (arg == "--save-dev") saveDev = true;
            else if (arg == "--save-ext") saveExt = true;
            else if (arg == "--internal") internal = true;
            else if (arg == "--no-internal") noInternal = true;
            else if (arg == "--pure") pure = true;
            else if (arg == "-v" || arg == "--verbose") verbose = true;
            else if (arg == "-f" || arg == "--force") force = true;
            else if (arg == "-PI" || arg == "--pip-ignore-installed") pipIgnoreInstalled = true;
            else if (arg == "-PT" || arg == "--pip-use-target-option") pipUseTargetOption = true;
            else if (arg == "-e" || arg == "--develop" || arg == "--packagedir") {
                if (i + 1 >= argc) {
                    std::cerr << "Error: " << arg << " requires a directory argument.\n";
                    return 1;
                }
                if (arg == "--packagedir") {
                    packageDir = argv[++i];
                } else {
                    developSpecs.push_back(argv[++i]);
                }
            }
            else if (arg == "--pip") {
                // Everything after --pip belongs to pip
                for (i++; i < argc; i++) {
                    pipSpecs.push_back(argv[i]);
                }
            }
            else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Error: unknown option '" << arg << "'\n";
                printInstallUsage();
                return 1;
            }
            else {
                specs.push_back(arg);
            }
        }

        if (save && saveDev) {
            std::cerr << "Error: incompatible flags --save and --save-dev\n";
            return 1;
        }
        if (dev && production) {
            std::cerr << "Error: incompatible flags --dev and --production\n";
            return 1;
        }
        if (saveExt) {
            if (saveDev) {
                std::cout << "warning: --save-ext should not be combined with --save-dev.\n"
                          << "         Extensions must be available during runtime.\n";
            } else {
                save = true;
            }
        }

        Quiver::InstallLocation location;
        if (!locationFromArgs(global, root, location)) {
            return 1;
        }
        if (location != Quiver::InstallLocation::Local && !internal && !noInternal) {
            internal = true;
            std::cout << "Note: implying --internal due to "
                      << (global ? "--global" : "--root") << ".\n";
        }

        const fs::path manifestPath = fs::path(packageDir) / Quiver::MANIFEST_FILE;
        std::error_code ec;
        if ((save || saveDev) && !fs::is_regular_file(manifestPath, ec)) {
            std::cerr << "Error: can not --save, --save-dev or --save-ext without "
                      << Quiver::MANIFEST_FILE << "\n";
            return 1;
        }

        const bool installCurrent = specs.empty() && developSpecs.empty() && pipSpecs.empty();
        if (!dev && !production) {
            dev = installCurrent;
        }

        Quiver::Config config = Quiver::Config::loadFromFile(configPath);
        Quiver::InstallerOptions options;
        options.upgrade = upgrade || installCurrent;
        options.location = location;
        options.recursive = recursive;
        options.verbose = verbose;
        options.force = force;
        options.pipUseTargetOption = pipUseTargetOption || config.pipUseTargetOption;
        options.pipIgnoreInstalled = pipIgnoreInstalled;

        Quiver::Installer installer(options, makeEnvironment(config), Quiver::loadRegistries(config));
        Quiver::InstallContext ctx;

        // No specifiers: install the current package and its dependencies
        if (installCurrent) {
            Quiver::DirectoryInstall params;
            params.develop = true;
            params.dev = dev;
            Quiver::InstallResult result = installer.installFromDirectory(packageDir, params, ctx);
            if (!result.success) {
                std::cerr << "Error: installation failed ("
                          << Quiver::errorName(result.error) << ")\n";
                return 1;
            }
            installer.pythonBridge().relinkScripts(installer.scriptMaker());
            return 0;
        }

        // Sort the specifiers into pip and package requirements
        std::vector<Quiver::Requirement> requirements;
        Quiver::StringPairs pythonDeps;
        std::vector<std::string> pythonExtra;
        auto handleSpec = [&](const std::string& spec, bool develop) -> bool {
            std::string pipLine;
            if (spec.empty()) {
                return true;
            } else if (!develop && spec.rfind("~", 0) == 0) {
                pipLine = spec.substr(1);
            } else if (!develop && spec.rfind("pip+", 0) == 0) {
                pipLine = spec.substr(4);
            } else {
                // -e always names a directory
                std::string line = spec;
                if (develop && line[0] != '.' && line[0] != '/' && line[0] != '~') {
                    line = "./" + line;
                }
                try {
                    Quiver::Requirement req = Quiver::Requirement::parse(line, true);
                    req.link = req.link || develop;
                    req.internal = req.internal || internal;
                    req.pure = req.pure || pure;
                    requirements.push_back(req);
                } catch (const std::invalid_argument& e) {
                    std::cerr << "Error: invalid requirement '" << spec << "': " << e.what() << "\n";
                    return false;
                }
                return true;
            }

            std::string name, specifier;
            if (splitPipRequirement(pipLine, name, specifier)) {
                pythonDeps.emplace_back(name, specifier);
            } else if (save || saveDev) {
                std::cerr << "Error: '" << pipLine << "' is not something we can install "
                          << "with --save/--save-dev\n";
                return false;
            } else {
                pythonExtra.push_back(pipLine);
            }
            return true;
        };
        for (const auto& spec : specs) {
            if (!handleSpec(spec, false)) return 1;
        }
        for (const auto& spec : developSpecs) {
            if (!handleSpec(spec, true)) return 1;
        }
        for (const auto& spec : pipSpecs) {
            if (!handleSpec("pip+" + spec, false)) return 1;
        }

        // Install python dependencies
        if (!pythonDeps.empty() || !pythonExtra.empty()) {
            if (!installer.pythonBridge().install(pythonDeps, pythonExtra)) {
                std::cerr << "Error: installation failed\n";
                return 1;
            }
        }

        // Install packages
        std::vector<std::pair<std::string, Quiver::Requirement>> installed;
        for (auto req : requirements) {
            Quiver::InstallResult result = installer.installFromRequirement(
                req, fs::current_path(), Quiver::DirectoryInstall{}, ctx);
            if (!result.success) {
                std::cerr << "Error: installation failed ("
                          << Quiver::errorName(result.error) << ")\n";
                return 1;
            }
            if (req.type == Quiver::Requirement::Type::Registry) {
                req.selector = Quiver::Selector("~" + result.version);
            }
            installed.emplace_back(result.name, req);
        }
        installer.pythonBridge().relinkScripts(installer.scriptMaker());

        bool saved = true;
        if (saveExt && !installed.empty()) {
            std::cout << "Saving extensions:\n";
            for (const auto& entry : installed) {
                saved = Quiver::PackageManifest::saveExtension(manifestPath, entry.first) && saved;
            }
        }

        if ((save || saveDev) && !installed.empty()) {
            std::cout << "Saving dependencies:\n";
            const std::string field = saveDev ? "dev_dependencies" : "dependencies";
            for (const auto& entry : installed) {
                saved = Quiver::PackageManifest::saveDependency(
                    manifestPath, field, entry.first, entry.second.toString(false)) && saved;
            }
        }

        if ((save || saveDev) && !pythonDeps.empty()) {
            std::cout << "Saving Pip dependencies:\n";
            const std::string field = saveDev ? "dev_python_dependencies" : "python_dependencies";
            const auto& libs = installer.pythonBridge().installedLibs();
            for (const auto& dep : pythonDeps) {
                auto found = libs.find(dep.first);
                if (found == libs.end()) {
                    std::cout << "warning: could not find .dist-info of module \""
                              << dep.first << "\"\n";
                    saved = Quiver::PackageManifest::saveDependency(manifestPath, field, dep.first, "") && saved;
                } else {
                    saved = Quiver::PackageManifest::saveDependency(
                        manifestPath, field, found->second.name, ">=" + found->second.version) && saved;
                }
            }
        }

        if (!saved) {
            std::cerr << "Error: could not update " << manifestPath.string() << "\n";
            return 1;
        }
    }
    // -------------------------------------------------------------
    // Uninstall Command
    // -------------------------------------------------------------
    else if (command == "uninstall") {
        std::vector<std::string> packages;
        bool global = false, root = false, force = false;

        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "-g" || arg == "--global") global = true;
            else if (arg == "--root" || arg == "--system") root = true;
            else if (arg == "-f" || arg == "--force") force = true;
            else packages.push_back(arg);
        }

        if (packages.empty()) {
            std::cerr << "Usage: quiver uninstall <package|directory>... [-g] [--root]\n";
            return 1;
        }

        Quiver::InstallLocation location;
        if (!locationFromArgs(global, root, location)) {
            return 1;
        }

        // Directories name the package they contain
        for (auto& pkg : packages) {
            std::error_code ec;
            if (pkg == "." || fs::exists(pkg, ec)) {
                try {
                    pkg = Quiver::PackageManifest::load(fs::path(pkg) / Quiver::MANIFEST_FILE, pkg).name;
                } catch (const std::runtime_error& e) {
                    std::cerr << "Error: " << e.what() << "\n";
                    return 1;
                }
            }
        }

        Quiver::Config config = Quiver::Config::loadFromFile(configPath);
        Quiver::InstallerOptions options;
        options.location = location;
        options.force = force;
        Quiver::Installer installer(options, makeEnvironment(config), {});

        bool ok = true;
        for (const auto& pkg : packages) {
            ok = installer.uninstall(pkg) && ok;
        }
        return ok ? 0 : 1;
    }
    // -------------------------------------------------------------
    // Dirs / Bin Commands
    // -------------------------------------------------------------
    else if (command == "dirs" || command == "bin") {
        bool global = false, root = false;
        std::string which;

        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "-g" || arg == "--global") global = true;
            else if (arg == "--root" || arg == "--system") root = true;
            else if (arg == "--packages" || arg == "--bin" || arg == "--pip-prefix" ||
                     arg == "--pip-bin" || arg == "--pip-lib" || arg == "--pip") {
                which = arg;
            }
            else {
                std::cerr << "Error: unknown option '" << arg << "'\n";
                return 1;
            }
        }

        Quiver::InstallLocation location;
        if (!locationFromArgs(global, root, location)) {
            return 1;
        }
        Quiver::Config config = Quiver::Config::loadFromFile(configPath);
        Quiver::Environment env = makeEnvironment(config);
        Quiver::Directories dirs = env.directories(location);

        if (command == "bin") {
            std::cout << (which == "--pip" ? dirs.pipBin : dirs.bin).string() << "\n";
        }
        else if (which == "--packages") std::cout << dirs.packages.string() << "\n";
        else if (which == "--bin") std::cout << dirs.bin.string() << "\n";
        else if (which == "--pip-prefix") std::cout << dirs.pipPrefix.string() << "\n";
        else if (which == "--pip-bin") std::cout << dirs.pipBin.string() << "\n";
        else if (which == "--pip-lib") std::cout << dirs.pipLib.string() << "\n";
        else {
            std::cout << "Packages:\t" << dirs.packages.string() << "\n"
                      << "Bin:\t\t" << dirs.bin.string() << "\n"
                      << "Pip Prefix:\t" << dirs.pipPrefix.string() << "\n"
                      << "Pip Bin:\t" << dirs.pipBin.string() << "\n"
                      << "Pip Lib:\t" << dirs.pipLib.string() << "\n";
        }
    }
    // -------------------------------------------------------------
    // Run Command
    // -------------------------------------------------------------
    else if (command == "run") {
        if (argc < 3) {
            std::cerr << "Usage: quiver run <script> [args...]\n";
            return 1;
        }
        std::string script = argv[2];
        std::vector<std::string> scriptArgs(argv + 3, argv + argc);

        Quiver::Config config = Quiver::Config::loadFromFile(configPath);
        Quiver::Environment env = makeEnvironment(config);
        Quiver::Directories dirs = env.directories(Quiver::InstallLocation::Local);

        // A missing manifest leaves only the programs in the bin directory
        Quiver::PackageManifest manifest;
        manifest.directory = env.projectDir;
        const fs::path manifestPath = env.projectDir / Quiver::MANIFEST_FILE;
        std::error_code ec;
        if (fs::is_regular_file(manifestPath, ec)) {
            try {
                manifest = Quiver::PackageManifest::load(manifestPath, env.projectDir);
            } catch (const std::runtime_error& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        }

        Quiver::ScopedEnvironment scoped;
        scoped.prepend("PATH", dirs.bin.string());

        Quiver::PackageLifecycle plc(manifest);
        Quiver::HookStatus status = plc.run(script, scriptArgs, false);
        if (status == Quiver::HookStatus::Succeeded) {
            return 0;
        }
        if (status == Quiver::HookStatus::Failed) {
            return 1;
        }

        fs::path program = dirs.bin / script;
        if (!fs::is_regular_file(program, ec)) {
            std::cerr << "Error: no script '" << script << "'\n";
            return 1;
        }
        std::vector<std::string> commandArgs{program.string()};
        commandArgs.insert(commandArgs.end(), scriptArgs.begin(), scriptArgs.end());
        return Quiver::Process::run(commandArgs) == 0 ? 0 : 1;
    }
    // -------------------------------------------------------------
    // Init Command
    // -------------------------------------------------------------
    else if (command == "init") {
        fs::path directory = ".";
        bool assumeDefaults = false;
        Quiver::StarterManifest fields;
        bool haveName = false, haveVersion = false, haveDescription = false;
        bool haveAuthor = false, haveLicense = false;

        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "-y" || arg == "--yes") {
                assumeDefaults = true;
            }
            else if (arg == "--name" || arg == "--version" || arg == "--description" ||
                     arg == "--author" || arg == "--license") {
                if (i + 1 >= argc) {
                    std::cerr << "Error: " << arg << " requires a value.\n";
                    return 1;
                }
                std::string value = argv[++i];
                if (arg == "--name") { fields.name = value; haveName = true; }
                else if (arg == "--version") { fields.version = value; haveVersion = true; }
                else if (arg == "--description") { fields.description = value; haveDescription = true; }
                else if (arg == "--author") { fields.authors.push_back(value); haveAuthor = true; }
                else { fields.license = value; haveLicense = true; }
            }
            else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Error: unknown option '" << arg << "'\n";
                return 1;
            }
            else {
                directory = arg;
            }
        }

        const fs::path manifestPath = directory / Quiver::MANIFEST_FILE;
        std::error_code ec;
        if (fs::exists(manifestPath, ec)) {
            std::cerr << "Error: \"" << manifestPath.string() << "\" already exists\n";
            return 1;
        }

        std::string defaultName = fs::absolute(directory).lexically_normal().filename().string();
        if (defaultName.empty() || defaultName == ".") {
            defaultName = fs::absolute(directory).lexically_normal().parent_path().filename().string();
        }
        if (!haveName) {
            fields.name = assumeDefaults ? defaultName : promptField("Package Name", defaultName, false);
        }
        if (!assumeDefaults) {
            if (!haveVersion) fields.version = promptField("Package Version", fields.version, false);
            if (!haveDescription) fields.description = promptField("Description", "", true);
            if (!haveAuthor) {
                std::string author = promptField("Author E-Mail(s)", "", true);
                if (!author.empty()) {
                    fields.authors.push_back(author);
                }
            }
            if (!haveLicense) fields.license = promptField("License", fields.license, true);
        }

        if (!fs::is_directory(directory, ec) && !fs::create_directories(directory, ec)) {
            std::cerr << "Error: unable to create \"" << directory.string() << "\": "
                      << ec.message() << "\n";
            return 1;
        }
        if (!Quiver::PackageManifest::create(manifestPath, fields)) {
            return 1;
        }
        std::cout << "Created \"" << manifestPath.string() << "\"\n";
    }
    else {
        std::cerr << "Unknown command: " << command << "\n";
        printHelp();
        return 1;
    }

    return 0;
}

int main(int argc, char* argv[])
{
    try {
        return runCommand(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
