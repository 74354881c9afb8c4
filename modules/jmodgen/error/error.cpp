#include "error.h"

namespace jmodgen {

configuration_error_t::configuration_error_t(const std::string& entity, const std::string& msg):
    std::runtime_error(msg),
    m_entity(entity)
{
}

const std::string& configuration_error_t::entity() const {
    return m_entity;
}

cache_miss_error_t::cache_miss_error_t(const std::string& path, const std::string& msg):
    std::runtime_error(msg),
    m_path(path)
{
}

const std::string& cache_miss_error_t::path() const {
    return m_path;
}

external_tool_error_t::external_tool_error_t(const std::string& command, int exit_code, const std::string& msg):
    std::runtime_error(msg),
    m_command(command),
    m_exit_code(exit_code)
{
}

const std::string& external_tool_error_t::command() const {
    return m_command;
}

int external_tool_error_t::exit_code() const {
    return m_exit_code;
}

} // namespace jmodgen
