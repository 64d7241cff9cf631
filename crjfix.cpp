/// @file
/// @brief Build the aerosoft-crj-interaction-fix package for MSFS.
/// Usage:
///   crjfix --modifications FILE [--template FILE]
///          [--community DIR | --user-cfg FILE] [--quiet]
///
/// Conventions:
/// - C++23, almost-always-auto, exceptions, fs::path, fstreams.
/// - Progress on stdout, one "error: ..." line on stderr on failure.

#include "Errors.hpp"
#include "FileOps.hpp"
#include "Modification.hpp"
#include "Package.hpp"
#include "Settings.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

namespace fs = std::filesystem;

constexpr char DefaultTemplate[] = "ASCRJ_Knob_Infinite_Push_Template.xml";

struct Options {
  fs::path modifications;
  fs::path templateFragment;
  std::optional<fs::path> community;
  std::optional<fs::path> userCfg;
  bool quiet = false;
}; // Options

void Usage(const fs::path& arg0) {
  std::cerr << "usage:\n  " << arg0.filename().string()
            << " --modifications FILE [--template FILE]\n"
               "         [--community DIR | --user-cfg FILE] [--quiet]\n";
} // Usage

auto ParseArgs(int argc, const char* argv[]) -> std::optional<Options> {
  const auto arg0 = fs::path{argv[0]};
  auto opts = Options{};
  opts.templateFragment = arg0.parent_path() / "data" / DefaultTemplate;

  for (auto i = 1; i < argc; ++i) {
    const auto arg = std::string_view{argv[i]};
    auto value = [&]() -> std::optional<fs::path> {
      if (i + 1 >= argc) {
        std::cerr << "error: " << arg << " requires a value\n";
        return std::nullopt;
      }
      return fs::path{argv[++i]};
    };
    auto set = [&](auto& field) {
      auto v = value();
      if (v)
        field = *v;
      return v.has_value();
    };
    auto ok = true;
    if (arg == "--modifications")
      ok = set(opts.modifications);
    else if (arg == "--template")
      ok = set(opts.templateFragment);
    else if (arg == "--community")
      ok = set(opts.community);
    else if (arg == "--user-cfg")
      ok = set(opts.userCfg);
    else if (arg == "--quiet")
      opts.quiet = true;
    else {
      std::cerr << "error: unknown argument '" << arg << "'\n";
      ok = false;
    }
    if (!ok)
      return std::nullopt;
  }

  if (opts.modifications.empty()) {
    std::cerr << "error: --modifications is required\n";
    return std::nullopt;
  }
  if (opts.community && opts.userCfg) {
    std::cerr << "error: --community and --user-cfg are exclusive\n";
    return std::nullopt;
  }
  return opts;
} // ParseArgs

auto ResolveCommunity(const Options& opts, std::ostream& log) -> fs::path {
  if (opts.community)
    return *opts.community;
  log << "Searching for MSFS packages path\n";
  auto packages = opts.userCfg
                ? crj_fix::ReadInstalledPackagesPath(*opts.userCfg)
                : crj_fix::FindPackagesPath(crj_fix::UserCfgCandidates());
  return crj_fix::CommunityFolder(packages);
} // ResolveCommunity

} // local

auto main(int argc, const char* argv[]) -> int {
  const auto opts = ParseArgs(argc, argv);
  if (!opts) {
    Usage(fs::path{argv[0]});
    return EXIT_FAILURE;
  }

  try {
    auto silent = std::ostream{nullptr};
    auto& log = opts->quiet ? silent : std::cout;
    const auto settings = crj_fix::Settings{};

    log << crj_fix::WelcomeMessage(settings);

    const auto catalog = crj_fix::LoadCatalog(opts->modifications);
    const auto fragment = crj_fix::ReadTextFile(opts->templateFragment);
    const auto community = ResolveCommunity(*opts, log);

    auto report = crj_fix::BuildPatchPackage(community, catalog, fragment,
                                             settings, log);
    log << "Patched " << report.models << " models into '"
        << report.patchPackage.string() << "'\n";
    return EXIT_SUCCESS;
  }
  catch (const crj_fix::Error& e) {
    std::cerr << "error: " << e.what() << '\n';
  }
  catch (const std::exception& e) {
    std::cerr << "std::exception: " << e.what() << '\n';
  }
  return EXIT_FAILURE;
} // main
