/**
 * @file Cli.hpp
 * @brief Command-line front end
 *
 * ```
 * inimerge [options] BASE OVERLAY OUTPUT
 * inimerge --create-example DIR
 * ```
 *
 * Exit codes follow ExitCode: 0 success, 1 failure, 2 usage error,
 * 3 output exists without --force.
 */

#ifndef INIMERGE_CLI_HPP
#define INIMERGE_CLI_HPP

#include <ostream>
#include <string>
#include <vector>

#define INIMERGE_VERSION "1.0.0"

namespace inimerge {

/**
 * @brief Run the tool
 *
 * @param args Full argument vector, program name first
 * @param out Normal output (merged text on --dry-run, reports)
 * @param err Diagnostics (`Error:` / `Warning:` lines)
 * @return Process exit code
 */
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace inimerge

#endif // INIMERGE_CLI_HPP
