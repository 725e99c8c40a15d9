#ifndef RECOMPOSE_TYPES_ANY_COMPOSE_H
#define RECOMPOSE_TYPES_ANY_COMPOSE_H

#include <recompose/recompose_export.h>
#include <recompose/types/compose_traits.h>
#include <recompose/util/type_name.h>

#include <cstddef>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace recompose {

    inline constexpr std::size_t RECOMPOSE_COMPOSE_SBO = 4 * sizeof(void *);
    inline constexpr std::size_t RECOMPOSE_COMPOSE_ALIGN = alignof(std::max_align_t);

    /**
     * Structural id of a composable (and the tag of a hook slot).
     */
    struct RECOMPOSE_EXPORT TypeId {
        const std::type_info *info{};

        [[nodiscard]] bool has_value() const noexcept { return info != nullptr; }

        [[nodiscard]] std::string name() const;
    };

    RECOMPOSE_EXPORT bool operator==(TypeId a, TypeId b);

    template<typename T>
    [[nodiscard]] TypeId type_id_of() noexcept { return TypeId{&typeid(T)}; }

    /**
     * Short display name used for tracing and the tree dump.
     */
    template<typename T>
    [[nodiscard]] const std::string &compose_name() {
        static const std::string name{short_type_name(demangle(typeid(T)))};
        return name;
    }

    /**
     * Drive one node, the skip/run decision and recursion into its child. Defined in compose.h.
     */
    template<typename C>
    void drive_node(const C &me, ScopeState &cx);

    /**
     * A type-erased composable.
     *
     * Small values are held inline, larger ones on the heap. The held value can only be replaced in place by a value
     * of the same structural id (reborrow), which keeps the node's nested scope and hooks intact.
     */
    class AnyCompose {
    public:
        // Only ever holds composables, each checked on the way in.
        using data_fields = std::tuple<>;

        AnyCompose() noexcept = default;

        template<typename C>
            requires (!std::same_as<C, AnyCompose> && Composable<C>)
        explicit AnyCompose(C value) {
            emplace<C>(std::move(value));
        }

        AnyCompose(AnyCompose &&other) noexcept {
            if (other._vtable) { other._vtable->move(*this, other); }
        }

        AnyCompose &operator=(AnyCompose &&other) noexcept {
            if (this != &other) {
                reset();
                if (other._vtable) { other._vtable->move(*this, other); }
            }
            return *this;
        }

        AnyCompose(const AnyCompose &) = delete;

        AnyCompose &operator=(const AnyCompose &) = delete;

        ~AnyCompose() { reset(); }

        void reset() noexcept {
            if (_vtable) { _vtable->destroy(*this); }
            _vtable = nullptr;
            _using_heap = false;
        }

        [[nodiscard]] bool has_value() const noexcept { return _vtable != nullptr; }

        [[nodiscard]] TypeId type() const noexcept { return has_value() ? _vtable->type : TypeId{}; }

        [[nodiscard]] std::string_view name() const { return has_value() ? std::string_view{_vtable->name()} : "<empty>"; }

        template<typename C, typename... Args>
            requires Composable<C>
        C &emplace(Args &&... args) {
            reset();
            if constexpr (sizeof(C) <= RECOMPOSE_COMPOSE_SBO && alignof(C) <= RECOMPOSE_COMPOSE_ALIGN) {
                new(storage_ptr()) C(std::forward<Args>(args)...);
                _using_heap = false;
            } else {
                C *p = new C(std::forward<Args>(args)...);
                std::memcpy(_storage, &p, sizeof(C *));
                _using_heap = true;
            }
            _vtable = &vtable_for<C>();
            return *static_cast<C *>(get_ptr());
        }

        template<typename C>
        [[nodiscard]] const C *get_if() const noexcept {
            if (!_vtable || !(_vtable->type == type_id_of<C>())) { return nullptr; }
            return static_cast<const C *>(get_ptr());
        }

        /**
         * Exchange contents with ``incoming`` when both hold the same structural id. On success ``incoming`` is left
         * holding the previous value (to be discarded by the caller) and true is returned. On mismatch nothing is
         * touched and false is returned, the caller must rebuild.
         */
        [[nodiscard]] bool reborrow(AnyCompose &incoming) {
            if (!_vtable || !incoming._vtable || !(_vtable->type == incoming._vtable->type)) { return false; }
            _vtable->exchange(*this, incoming);
            return true;
        }

        /**
         * Drive the held composable against its scope.
         */
        void drive(ScopeState &cx) const;

    private:
        struct VTable {
            TypeId type;
            const std::string &(*name)();
            void (*move)(AnyCompose &, AnyCompose &) noexcept;
            void (*destroy)(AnyCompose &) noexcept;
            void (*exchange)(AnyCompose &, AnyCompose &);
            void (*drive)(const void *, ScopeState &);
        };

        template<typename C>
        static const VTable &vtable_for() {
            static const VTable vt{
                type_id_of<C>(),
                &compose_name<C>,
                // move
                [](AnyCompose &dst, AnyCompose &src) noexcept {
                    if (src._using_heap) {
                        std::memcpy(dst._storage, src._storage, sizeof(C *));
                        dst._using_heap = true;
                    } else {
                        new(dst.storage_ptr()) C(std::move(*static_cast<C *>(src.storage_ptr())));
                        dst._using_heap = false;
                        static_cast<C *>(src.storage_ptr())->~C();
                    }
                    dst._vtable = src._vtable;
                    src._vtable = nullptr;
                    src._using_heap = false;
                },
                // destroy
                [](AnyCompose &self) noexcept {
                    if (self._using_heap) {
                        delete *reinterpret_cast<C **>(self._storage);
                    } else {
                        static_cast<C *>(self.storage_ptr())->~C();
                    }
                },
                // exchange, both sides hold a C
                [](AnyCompose &a, AnyCompose &b) {
                    if (a._using_heap) {
                        unsigned char tmp[sizeof(C *)];
                        std::memcpy(tmp, a._storage, sizeof(C *));
                        std::memcpy(a._storage, b._storage, sizeof(C *));
                        std::memcpy(b._storage, tmp, sizeof(C *));
                        return;
                    }
                    C *ap = static_cast<C *>(a.storage_ptr());
                    C *bp = static_cast<C *>(b.storage_ptr());
                    C tmp(std::move(*ap));
                    std::destroy_at(ap);
                    std::construct_at(ap, std::move(*bp));
                    std::destroy_at(bp);
                    std::construct_at(bp, std::move(tmp));
                },
                // drive
                [](const void *self, ScopeState &cx) { drive_node<C>(*static_cast<const C *>(self), cx); }
            };
            return vt;
        }

        void *storage_ptr() noexcept { return static_cast<void *>(_storage); }

        [[nodiscard]] void *get_ptr() const noexcept {
            if (_using_heap) { return *reinterpret_cast<void *const *>(_storage); }
            return const_cast<void *>(static_cast<const void *>(_storage));
        }

        alignas(RECOMPOSE_COMPOSE_ALIGN) unsigned char _storage[RECOMPOSE_COMPOSE_SBO]{};
        const VTable *_vtable{nullptr};
        bool _using_heap{false};
    };

} // namespace recompose

#endif // RECOMPOSE_TYPES_ANY_COMPOSE_H
