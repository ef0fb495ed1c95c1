//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements command-line handling for `screeps-build`.  Parsing produces a
// CliOptions value; the driver then resolves the project, configures logging
// and hands control to the BuildPipeline.  Diagnostics are printed once, at
// this level, so pipeline stages never write to the terminal themselves
// except through the Logger.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Argument parsing and top-level driver for the screeps-build CLI.

#include "tools/screeps-build/cli.hpp"

#include "support/logger.hpp"
#include "tools/common/project_loader.hpp"
#include "screeps/version.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace screeps::tools
{

namespace
{
support::Diag usageError(std::string msg)
{
    return support::makeError(support::DiagCode::Usage, std::move(msg));
}
} // namespace

support::Expected<CliOptions> parseCommandLine(int argc, char **argv)
{
    CliOptions opts;
    bool haveMode = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            opts.showHelp = true;
        }
        else if (arg == "--version")
        {
            opts.showVersion = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            opts.verbose = true;
        }
        else if (arg == "-C" || arg == "--root")
        {
            if (i + 1 >= argc)
                return usageError(std::string(arg) + " requires a directory");
            opts.root = argv[++i];
        }
        else if (arg.rfind("--root=", 0) == 0)
        {
            opts.root = std::string(arg.substr(7));
            if (opts.root.empty())
                return usageError("--root requires a directory");
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            return usageError("unknown option: " + std::string(arg));
        }
        else
        {
            if (haveMode)
                return usageError("unexpected argument: " + std::string(arg));
            if (arg == "check")
                opts.mode = build::Mode::Check;
            else if (arg == "build")
                opts.mode = build::Mode::Build;
            else
                return usageError("unknown command '" + std::string(arg) +
                                  "'; expected 'check' or 'build'");
            haveMode = true;
        }
    }

    if (!haveMode && !opts.showHelp && !opts.showVersion)
        return usageError("no command given; expected 'check' or 'build'");
    return opts;
}

void printVersion(std::ostream &os)
{
    os << "screeps-build v" << SCREEPS_VERSION_STR << "\n";
}

void printUsage(std::ostream &os)
{
    os << "screeps-build v" << SCREEPS_VERSION_STR
       << " - package cargo-web output for the Screeps runtime\n"
       << "\n"
       << "Usage: screeps-build [options] <check|build>\n"
       << "\n"
       << "Commands:\n"
       << "  check                          Run 'cargo check' for wasm32-unknown-unknown\n"
       << "  build                          Run 'cargo web build' and write target/main.js\n"
       << "                                 and target/compiled.wasm\n"
       << "\n"
       << "Options:\n"
       << "  -C, --root DIR                 Project root (default: current directory)\n"
       << "  -v, --verbose                  Print progress notes\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "The project root may contain a screeps.project manifest:\n"
       << "  cargo <program>                Program used instead of 'cargo'\n"
       << "  release on|off                 Build with --release (default on)\n";
}

int runScreepsBuild(int argc,
                    char **argv,
                    screeps::common::ProcessRunner &runner,
                    std::ostream &out,
                    std::ostream &err)
{
    auto parsed = parseCommandLine(argc, argv);
    if (!parsed)
    {
        support::printDiag(parsed.error(), err);
        printUsage(err);
        return kExitUsage;
    }

    const CliOptions &opts = parsed.value();
    if (opts.showHelp)
    {
        printUsage(out);
        return 0;
    }
    if (opts.showVersion)
    {
        printVersion(out);
        return 0;
    }

    support::Logger log(err, opts.verbose);

    auto config = common::resolveProject(opts.root);
    if (!config)
    {
        log.report(config.error());
        return 1;
    }

    build::BuildPipeline pipeline(std::move(config.value()), runner, log);
    auto result = pipeline.run(opts.mode);
    if (!result)
    {
        log.report(result.error());
        return 1;
    }
    return 0;
}

} // namespace screeps::tools
