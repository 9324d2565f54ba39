#include <array-list/array_list.hh>
#include <array-list/list.hh>

#include <nexus/test.hh>

#include <string>

static_assert(al::ordered_list<al::array_list<int>>);
static_assert(al::ordered_list<al::array_list<std::string>>);
static_assert(!al::ordered_list<al::array<int>>);

namespace
{
struct Person
{
    std::string name;
    int age = 0;

    bool operator==(Person const&) const = default;
};

// written purely against the capability, not against array_list
template <al::ordered_list L>
typename L::value_type sum_of(L const& list)
{
    typename L::value_type s = {};
    for (al::isize i = 0; i < list.size(); ++i)
        s += list.get(i).value();
    return s;
}
} // namespace

TEST("list - generic algorithms on array_list")
{
    auto list = al::array_list<int>{3, 1, 2};
    CHECK(sum_of(list) == 6);

    al::sort_ascending(list);
    CHECK(list[0] == 1);
    CHECK(list[1] == 2);
    CHECK(list[2] == 3);
}

TEST("list - remove_all")
{
    SECTION("removes every match and reports the count")
    {
        auto list = al::array_list<int>{1, 2, 1, 3, 1};
        CHECK(al::remove_all(list, 1) == 3);
        CHECK(list.size() == 2);
        CHECK(list[0] == 2);
        CHECK(list[1] == 3);
    }

    SECTION("no match")
    {
        auto list = al::array_list<int>{1, 2};
        CHECK(al::remove_all(list, 9) == 0);
        CHECK(list.size() == 2);
    }

    SECTION("value taken from the list itself")
    {
        auto list = al::array_list<std::string>{"a", "b", "a"};
        CHECK(al::remove_all(list, list[0]) == 2);
        REQUIRE(list.size() == 1);
        CHECK(list[0] == "b");
    }

    SECTION("empty list")
    {
        al::array_list<int> list;
        CHECK(al::remove_all(list, 0) == 0);
    }
}

TEST("comparator - ascending and descending")
{
    CHECK(al::compare_ascending(1, 2) < 0);
    CHECK(al::compare_ascending(2, 1) > 0);
    CHECK(al::compare_ascending(2, 2) == 0);

    CHECK(al::compare_descending(1, 2) > 0);
    CHECK(al::compare_descending(2, 1) < 0);
    CHECK(al::compare_descending(2, 2) == 0);

    CHECK(al::compare_ascending(std::string("abc"), std::string("abd")) < 0);
}

TEST("comparator - sorting records")
{
    auto people = al::array_list<Person>{{"carol", 35}, {"alice", 30}, {"bob", 25}};

    SECTION("by age")
    {
        people.sort([](Person const& a, Person const& b) { return a.age - b.age; });
        CHECK(people[0].name == "bob");
        CHECK(people[1].name == "alice");
        CHECK(people[2].name == "carol");
    }

    SECTION("by name, descending")
    {
        people.sort([](Person const& a, Person const& b) { return al::compare_descending(a.name, b.name); });
        CHECK(people[0].name == "carol");
        CHECK(people[2].name == "alice");
    }

    SECTION("lookups use operator==")
    {
        CHECK(people.index_of(Person{"bob", 25}) == 2);
        CHECK(!people.contains(Person{"bob", 26}));
        CHECK(al::remove_all(people, Person{"alice", 30}) == 1);
        CHECK(people.size() == 2);
    }
}
