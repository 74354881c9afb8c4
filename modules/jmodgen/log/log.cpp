#include "log.h"

#include <format>
#include <iostream>

namespace jmodgen {

void log(const std::string& msg) {
    std::cout << std::format("[{}] {}", JMODGEN_BIN, msg) << std::endl;
}

} // namespace jmodgen
