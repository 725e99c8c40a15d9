#ifndef RECOMPOSE_TYPES_COMPOSE_FROM_ITER_H
#define RECOMPOSE_TYPES_COMPOSE_FROM_ITER_H

#include <recompose/types/compose.h>
#include <recompose/types/hooks.h>

#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <vector>

namespace recompose {

    /**
     * Maps each item of ``collection`` to a child built by ``make_item(const Item &)``.
     *
     * Children are addressed by position only, reordering the collection is seen as replacing items in place. When
     * this node runs, every retained position receives its new item and a rebuilt child (exchanged in place, so its
     * hooks survive), new positions mount fresh scopes and removed positions are torn down. A child that should not
     * recompose for an unchanged item can guard itself with use_memo or memo on the item. ``make_item`` is kept in
     * the node, so it must be data itself: a captureless closure, or one bound with data_fn.
     */
    template<std::ranges::input_range Collection, typename F>
    struct FromIter {
        using item_type = std::ranges::range_value_t<Collection>;
        using content_type = std::remove_cvref_t<std::invoke_result_t<const F &, const item_type &>>;
        using data_fields = std::tuple<Collection, F, item_type, content_type>;

        Collection collection;
        F make_item;
    };

    template<std::ranges::input_range Collection, typename F>
    FromIter<std::decay_t<Collection>, std::decay_t<F>> from_iter(Collection &&collection, F &&make_item) {
        return {std::forward<Collection>(collection), std::forward<F>(make_item)};
    }

    template<typename Item, typename C>
    struct FromIterEntry {
        std::optional<Item> item;
        std::optional<C> content;
        ScopeHandle scope;
    };

    template<std::ranges::input_range Collection, typename F>
    struct compose_traits<FromIter<Collection, F>> {
        using iter_type = FromIter<Collection, F>;
        using item_type = typename iter_type::item_type;
        using content_type = typename iter_type::content_type;
        using entry_type = FromIterEntry<item_type, content_type>;

        static_assert(Composable<content_type>, "make_item must return a composable");

        static constexpr bool composable = true;
        static constexpr bool container = true;

        static void drive(const iter_type &me, ScopeState &cx) {
            auto &entries = use_ref(cx, [] { return std::vector<std::unique_ptr<entry_type>>{}; });
            const bool runs = cx.is_parent_changed() || !cx.has_composed();
            if (runs) {
                size_t index = 0;
                for (const auto &item : me.collection) {
                    if (index == entries.size()) {
                        auto entry = std::make_unique<entry_type>();
                        entry->scope = cx.create_child_scope();
                        entries.push_back(std::move(entry));
                    }
                    auto &entry = *entries[index];
                    entry.item.emplace(item);
                    entry.content.emplace(std::invoke(me.make_item, *entry.item));
                    ++index;
                }
                while (entries.size() > index) { entries.pop_back(); }
            }
            for (auto &entry : entries) { drive_element(*entry->content, cx, *entry->scope, runs); }
        }
    };

} // namespace recompose

#endif // RECOMPOSE_TYPES_COMPOSE_FROM_ITER_H
