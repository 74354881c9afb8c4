#include "process.h"

#include <iostream>
#include <format>

#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

namespace jmodgen::process {

static const char* native_arg(const process_arg_t& arg) {
    return std::visit(
        [](auto&& v) -> const char* {
            return v.c_str();
        },
        arg
    );
}

std::string command_line(const std::vector<process_arg_t>& args) {
    std::string result;
    for (const auto& arg : args) {
        if (!result.empty()) {
            result += " ";
        }
        result += std::visit(
            [](auto&& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    return v;
                } else {
                    static_assert(std::is_same_v<T, filesystem::path_t>, "non-exhaustive visitor!");
                    return v.string();
                }
            },
            arg
        );
    }
    return result;
}

int create_and_wait(const std::vector<process_arg_t>& args) {
    if (args.empty()) {
        throw std::runtime_error("process::create_and_wait: no executable given");
    }

    std::vector<char*> cargs;
    cargs.reserve(args.size() + 1);
    for (const auto& arg : args) {
        cargs.push_back(const_cast<char*>(native_arg(arg)));
    }
    cargs.push_back(nullptr);

    std::cout << command_line(args) << std::endl;

    const auto pid = fork();
    if (pid == -1) {
        throw std::runtime_error(std::format("process::create_and_wait: fork failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        execv(cargs[0], cargs.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::runtime_error(std::format("process::create_and_wait: waitpid failed: {}", std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    } else {
        throw std::runtime_error(std::format("process::create_and_wait: unreachable state reached after waitpid, status: {}", status));
    }
}

} // namespace jmodgen::process
