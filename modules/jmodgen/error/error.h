#ifndef JMODGEN_ERROR_ERROR_H
# define JMODGEN_ERROR_ERROR_H

# include <stdexcept>
# include <string>

namespace jmodgen {

/**
 * Invalid suite or jdk configuration, e.g. a dependency kind that cannot be part of a module,
 * an empty module name, unknown names or dependency cycles.
 * `entity()` names the offending suite or module entity.
 */
class configuration_error_t : public std::runtime_error {
public:
    configuration_error_t(const std::string& entity, const std::string& msg);

    const std::string& entity() const;

private:
    std::string m_entity;
};

/**
 * A persisted module descriptor that was required to exist does not.
 */
class cache_miss_error_t : public std::runtime_error {
public:
    cache_miss_error_t(const std::string& path, const std::string& msg);

    const std::string& path() const;

private:
    std::string m_path;
};

/**
 * An external tool (javac) terminated unsuccessfully.
 * `exit_code()` follows process::create_and_wait, negative values are signals.
 */
class external_tool_error_t : public std::runtime_error {
public:
    external_tool_error_t(const std::string& command, int exit_code, const std::string& msg);

    const std::string& command() const;
    int exit_code() const;

private:
    std::string m_command;
    int m_exit_code;
};

} // namespace jmodgen

#endif // JMODGEN_ERROR_ERROR_H
