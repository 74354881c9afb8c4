#include "session.h"

#include <modules/jmodgen/error/error.h>
#include "assembler.h"
#include "descriptor_store.h"
#include "synthesizer.h"

#include <format>

namespace jmodgen {

session_t::session_t(suite_t suite, jdk_t jdk):
    m_suite(std::move(suite)),
    m_jdk(std::move(jdk)),
    m_module_deps(m_suite)
{
}

const suite_t& session_t::suite() const {
    return m_suite;
}

const jdk_t& session_t::jdk() const {
    return m_jdk;
}

module_deps_t& session_t::module_deps() {
    return m_module_deps;
}

const module_descriptor_t* session_t::as_java_module(const distribution_t& dist, bool fatal_if_not_created) {
    const auto it = m_java_modules.find(&dist);
    if (it != m_java_modules.end()) {
        return it->second.get();
    }

    auto descriptor = load(*this, dist, fatal_if_not_created);
    if (!descriptor) {
        return nullptr;
    }
    return memoize(dist, std::move(descriptor));
}

const module_descriptor_t* session_t::make_java_module(const distribution_t& dist) {
    const auto module_info = m_module_deps.module_info(dist, false);
    if (!module_info) {
        return nullptr;
    }

    if (!m_in_progress.insert(&dist).second) {
        throw configuration_error_t(dist.name(), std::format("session_t::make_java_module: module of distribution '{}' depends on itself", dist.name()));
    }

    std::unique_ptr<module_descriptor_t> descriptor;
    try {
        descriptor = synthesize(*this, dist, *module_info);
        assemble(m_jdk, *descriptor, *module_info, m_module_deps.collect(dist));
    } catch (...) {
        m_in_progress.erase(&dist);
        throw ;
    }
    m_in_progress.erase(&dist);

    return memoize(dist, std::move(descriptor));
}

const module_descriptor_t* session_t::java_module(const distribution_t& dist) {
    if (m_in_progress.contains(&dist)) {
        throw configuration_error_t(dist.name(), std::format("session_t::java_module: module of distribution '{}' depends on itself", dist.name()));
    }

    if (!m_module_deps.defines_module(dist)) {
        return nullptr;
    }

    const auto* descriptor = as_java_module(dist, false);
    if (descriptor) {
        return descriptor;
    }
    return make_java_module(dist);
}

void session_t::invalidate(const distribution_t& dist) {
    m_module_deps.invalidate(dist);

    const auto it = m_java_modules.find(&dist);
    if (it == m_java_modules.end()) {
        return ;
    }
    const module_descriptor_t* invalidated = it->second.get();

    std::vector<const distribution_t*> dependents;
    for (const auto& [other_dist, descriptor] : m_java_modules) {
        for (const auto* module : descriptor->modulepath()) {
            if (module == invalidated) {
                dependents.push_back(other_dist);
                break ;
            }
        }
    }

    m_java_modules.erase(it);
    for (const auto* dependent : dependents) {
        invalidate(*dependent);
    }
}

const module_descriptor_t* session_t::memoize(const distribution_t& dist, std::unique_ptr<module_descriptor_t> descriptor) {
    if (m_java_modules.contains(&dist)) {
        invalidate(dist);
    }
    return m_java_modules.emplace(&dist, std::move(descriptor)).first->second.get();
}

} // namespace jmodgen
