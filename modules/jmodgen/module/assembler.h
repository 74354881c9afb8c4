#ifndef JMODGEN_MODULE_ASSEMBLER_H
# define JMODGEN_MODULE_ASSEMBLER_H

# include <modules/jmodgen/jdk/jdk.h>
# include <modules/jmodgen/process/process.h>
# include "module_deps.h"
# include "module_descriptor.h"

# include <vector>

namespace jmodgen {

static const constexpr char* MODULE_INFO_JAVA = "module-info.java";

/**
 * Builds the javac command compiling `module_info_java` into `staging_dir`.
 *
 * Jars of module path members named like a platform module go on `--upgrade-module-path`,
 * the jars of all other members go on `--module-path`. Members without a jar are skipped.
 */
std::vector<process::process_arg_t> javac_command(const jdk_t& jdk, const module_descriptor_t& descriptor, const filesystem::path_t& staging_dir, const filesystem::path_t& module_info_java);

/**
 * Packages a freshly synthesized module:
 * - recreates the staging directory and extracts the jar of the module's distribution and of every
 *   distribution in `module_deps` into it, later jars overwrite earlier ones
 * - writes `module-info.java` and compiles it with javac
 * - zips the staging directory and moves the result onto the module jar
 * - persists the descriptor
 *
 * Throws external_tool_error_t if javac fails.
 */
void assemble(const jdk_t& jdk, const module_descriptor_t& descriptor, const module_info_t& module_info, const std::vector<dependency_t*>& module_deps);

} // namespace jmodgen

#endif // JMODGEN_MODULE_ASSEMBLER_H
