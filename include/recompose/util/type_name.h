#ifndef RECOMPOSE_UTIL_TYPE_NAME_H
#define RECOMPOSE_UTIL_TYPE_NAME_H

#include <recompose/recompose_export.h>

#include <string>
#include <string_view>
#include <typeinfo>

namespace recompose {
    /**
     * The demangled name of the type, falls back to the raw ``type_info::name`` when demangling is unavailable.
     */
    RECOMPOSE_EXPORT std::string demangle(const std::type_info &info);

    /**
     * Strips namespaces and template arguments from a demangled name, ``app::Wrap<int>`` becomes ``Wrap``.
     * Lambda closure types are reported as ``lambda``.
     */
    RECOMPOSE_EXPORT std::string short_type_name(std::string_view demangled);

    template<typename T>
    [[nodiscard]] std::string type_name() { return demangle(typeid(T)); }
} // namespace recompose

#endif // RECOMPOSE_UTIL_TYPE_NAME_H
