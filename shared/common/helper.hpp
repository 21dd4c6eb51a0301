#pragma once

#include <cxxabi.h>
#include <cstdlib>
#include <string>
#include <vector>

namespace wireup {

inline std::string demangle(const char* name) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    std::string result = (status == 0 && demangled) ? demangled : name;
    std::free(demangled);
    return result;
}

// "a -> b -> c"
inline std::string joinPath(const std::vector<std::string>& names, const char* sep = " -> ") {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += sep;
        out += names[i];
    }
    return out;
}

} // namespace wireup
