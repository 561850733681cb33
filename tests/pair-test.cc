#include <duty/pair.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

static_assert(std::is_aggregate_v<duty::pair<std::string, int>>);
static_assert(std::tuple_size_v<duty::pair<std::string, int>> == 2);
static_assert(std::is_same_v<std::tuple_element_t<0, duty::pair<std::string, int>>, std::string>);
static_assert(std::is_same_v<std::tuple_element_t<1, duty::pair<std::string, int>>, int>);

TEST("pair - map entry")
{
    auto entry = duty::pair<std::string, int>{"key", 7};

    CHECK(entry.first == "key");
    CHECK(entry.second == 7);

    SECTION("bindings by value")
    {
        auto const [k, v] = entry;
        CHECK(k == "key");
        CHECK(v == 7);
    }

    SECTION("bindings by reference write through")
    {
        auto& [k, v] = entry;
        v = 8;
        CHECK(entry.second == 8);
        CHECK(&k == &entry.first);
    }

    SECTION("get keeps constness")
    {
        auto const& ce = entry;
        static_assert(std::is_same_v<decltype(duty::get<0>(ce)), std::string const&>);
        static_assert(std::is_same_v<decltype(duty::get<1>(entry)), int&>);
        CHECK(duty::get<0>(ce) == "key");
    }
}

TEST("pair - move-only value")
{
    auto entry = duty::pair<int, std::unique_ptr<int>>{1, std::make_unique<int>(5)};

    auto taken = duty::get<1>(duty::move(entry));
    REQUIRE(taken != nullptr);
    CHECK(*taken == 5);
    CHECK(entry.second == nullptr);
}

TEST("pair - equality")
{
    auto const a = duty::pair<std::string, int>{"x", 1};

    CHECK(a == duty::pair<std::string, int>{"x", 1});
    CHECK(a != duty::pair<std::string, int>{"x", 2});
    CHECK(a != duty::pair<std::string, int>{"y", 1});
}
