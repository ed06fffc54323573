// File: src/tools/jade-run/cli.hpp
// Purpose: Option parsing and subcommand handlers for jade-run.
// Key invariants: Exit codes: 0 outcome printed, 1 diagnostics or failed
//                 cases, 2 execution fault.
// Ownership/Lifetime: N/A.
// Links: docs/codemap.md

#pragma once

#include "vm/Trace.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace jaderun
{

inline constexpr int kExitOk = 0;
inline constexpr int kExitDiagnostics = 1;
inline constexpr int kExitFault = 2;

/// @brief Options shared by run and check mode.
struct CliOptions
{
    /// @brief Trace configuration assembled from `--trace` flags.
    jade::vm::TraceConfig trace{};

    /// @brief Step budget; zero defers to JADE_MAX_STEPS, then the default.
    std::uint64_t maxSteps = 0;

    /// @brief Print the entry method's returned value after the outcome.
    bool printReturn = false;

    /// @brief Run every `case` of the listings instead of one method.
    bool check = false;

    /// @brief Non-option arguments in command-line order.
    std::vector<std::string> positional;
};

/// @brief Result of attempting to parse a shared command-line option.
enum class SharedOptionParseResult
{
    NotMatched, ///< Argument does not correspond to a shared option.
    Parsed,     ///< Argument consumed and reflected in the configuration.
    Error       ///< Argument looked like a shared option but was malformed.
};

/// @brief Parse the option at @p index, advancing it past consumed values.
SharedOptionParseResult parseSharedOption(int &index, int argc, char **argv, CliOptions &opts);

/// @brief Split positionals into listing paths (`*.jbc`) and the rest.
void splitPositionals(const std::vector<std::string> &positional,
                      std::vector<std::string> &listings,
                      std::vector<std::string> &rest);

/// @brief Run one method: `<suite.jbc>... <method-id> <inputs>`.
int cmdRun(const CliOptions &opts);

/// @brief Run every case of the listed suites.
int cmdCheck(const CliOptions &opts);

} // namespace jaderun
