#ifndef JMODGEN_PROCESS_PROCESS_H
# define JMODGEN_PROCESS_PROCESS_H

# include <modules/jmodgen/filesystem/filesystem.h>

# include <string>
# include <variant>
# include <vector>

namespace jmodgen::process {

using process_arg_t = std::variant<std::string, filesystem::path_t>;

/**
 * Renders the arguments as a single space separated command line, e.g. for logs and error messages.
 */
std::string command_line(const std::vector<process_arg_t>& args);

/**
 * Creates a new process with the given arguments and waits for it to complete.
 * The first argument is the path of the executable, it is not searched in PATH.
 * Returns a non-negative exit code on success, or the negated value of the signal that caused the process to terminate.
 * An executable that cannot be started exits with 127.
 */
int create_and_wait(const std::vector<process_arg_t>& args);

} // namespace jmodgen::process

#endif // JMODGEN_PROCESS_PROCESS_H
