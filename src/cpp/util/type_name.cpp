#include <recompose/util/type_name.h>

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace recompose {
    std::string demangle(const std::type_info &info) {
#if defined(__GNUG__)
        int status = 0;
        std::unique_ptr<char, void (*)(void *)> demangled{abi::__cxa_demangle(info.name(), nullptr, nullptr, &status),
                                                          std::free};
        if (status == 0 && demangled) { return std::string{demangled.get()}; }
#endif
        return std::string{info.name()};
    }

    std::string short_type_name(std::string_view demangled) {
        std::string_view base = demangled.substr(0, demangled.find('<'));
        if (base.find("{lambda") != std::string_view::npos) { return "lambda"; }
        auto pos = base.rfind("::");
        if (pos != std::string_view::npos) { base = base.substr(pos + 2); }
        return std::string{base};
    }
} // namespace recompose
