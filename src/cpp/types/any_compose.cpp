#include <recompose/types/any_compose.h>
#include <recompose/util/errors.h>

namespace recompose {
    bool operator==(TypeId a, TypeId b) {
        if (a.info == b.info) { return true; }
        if (a.info == nullptr || b.info == nullptr) { return false; }
        return *a.info == *b.info;
    }

    std::string TypeId::name() const { return info ? demangle(*info) : std::string{"<none>"}; }

    void AnyCompose::drive(ScopeState &cx) const {
        if (!_vtable) { throw_error<std::logic_error>("Cannot drive an empty AnyCompose"); }
        _vtable->drive(get_ptr(), cx);
    }
} // namespace recompose
