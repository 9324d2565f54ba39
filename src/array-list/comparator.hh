#pragma once

#include <array-list/fwd.hh>
#include <array-list/function_ref.hh>

namespace al
{
/// Three-way comparison callback used by array_list::sort.
/// Returns a negative value if a orders before b, zero if they are equivalent, positive otherwise.
template <class T>
using comparator = al::function_ref<int(T const&, T const&)>;

/// Orders by operator<, smallest first.
/// Usage:
///   list.sort(al::compare_ascending<int>);
template <class T>
int compare_ascending(T const& a, T const& b)
{
    if (a < b)
        return -1;
    if (b < a)
        return 1;
    return 0;
}

/// Orders by operator<, largest first.
template <class T>
int compare_descending(T const& a, T const& b)
{
    return al::compare_ascending(b, a);
}
} // namespace al
