#pragma once

#include <array-list/comparator.hh>
#include <array-list/fwd.hh>
#include <array-list/optional.hh>

#include <concepts>

namespace al
{
/// The "ordered, indexable sequence" capability that generic list algorithms are written against.
/// Indices are isize; rejected indices are reported through the bool results of the mutators
/// and the empty optional of get().
/// al::array_list<T> models it.
template <class L>
concept ordered_list = requires(L& list, L const& clist, isize i, typename L::value_type const& v) {
    { clist.size() } -> std::convertible_to<isize>;
    { clist.empty() } -> std::convertible_to<bool>;
    { clist.get(i) } -> std::same_as<al::optional<typename L::value_type>>;
    { clist.index_of(v) } -> std::convertible_to<isize>;
    { clist.contains(v) } -> std::convertible_to<bool>;
    clist.values();
    { list.set(i, v) } -> std::convertible_to<bool>;
    { list.insert(i, v) } -> std::convertible_to<bool>;
    { list.remove(i) } -> std::convertible_to<bool>;
    { list.swap(i, i) } -> std::convertible_to<bool>;
    list.sort(al::comparator<typename L::value_type>());
    list.clear();
};

/// Sorts any ordered_list ascending by operator<.
template <ordered_list L>
void sort_ascending(L& list)
{
    list.sort(al::compare_ascending<typename L::value_type>);
}

/// Removes every element equal to value, returns how many were removed.
/// Written purely against the ordered_list capability.
/// value is taken by copy so that it may be an element of list.
template <ordered_list L>
isize remove_all(L& list, typename L::value_type value)
{
    isize removed = 0;
    for (auto i = list.index_of(value); i >= 0; i = list.index_of(value))
    {
        list.remove(i);
        ++removed;
    }
    return removed;
}
} // namespace al
