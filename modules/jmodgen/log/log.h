#ifndef JMODGEN_LOG_LOG_H
# define JMODGEN_LOG_LOG_H

# include <string>

namespace jmodgen {

static const constexpr char* JMODGEN_BIN = "jmodgen";

/**
 * Prints a progress line prefixed with the program name to stdout.
 */
void log(const std::string& msg);

} // namespace jmodgen

#endif // JMODGEN_LOG_LOG_H
