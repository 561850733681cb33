#include <duty/map.hh>

#include <nexus/test.hh>

#include <stdexcept>
#include <string>
#include <unordered_map>

static_assert(duty::map_like<duty::map<std::string, int>>);
static_assert(duty::map_like<duty::map<int, std::string>>);
static_assert(std::is_copy_constructible_v<duty::map<std::string, int>>);

namespace
{
// returns the exception message, or nullopt if nothing was thrown
template <class F>
duty::optional<std::string> key_not_found_message(F&& f)
{
    try
    {
        f();
    }
    catch (duty::key_not_found const& e)
    {
        return std::string(e.what());
    }
    return duty::nullopt;
}
} // namespace

TEST("map - empty map")
{
    auto const m = duty::map<std::string, int>::empty();

    CHECK(m.is_empty());
    CHECK(m.size() == 0);
    CHECK(m.get("a") == duty::nullopt);
    CHECK(!m.contains_key("a"));
    CHECK(m.begin() == m.end());
}

TEST("map - set and get")
{
    auto m = duty::map<std::string, int>();
    m.set("a", 1);
    m.set("b", 2);

    CHECK(m.size() == 2);
    CHECK(m.get("a") == duty::some(1));
    CHECK(m.get("b") == duty::some(2));
    CHECK(m.get("c") == duty::nullopt);
    CHECK(m.contains_key("a"));
    CHECK(!m.contains_key("c"));

    SECTION("overwrite keeps a single entry")
    {
        m.set("a", 10);
        m.set("a", 11);

        CHECK(m.size() == 2);
        CHECK(m.get("a") == duty::some(11));
    }

    SECTION("put is set with a pre-built pair")
    {
        m.put({"c", 3});
        m.put(duty::pair<std::string, int>{"a", 100});

        CHECK(m.size() == 3);
        CHECK(m.get("c") == duty::some(3));
        CHECK(m.get("a") == duty::some(100));
    }
}

TEST("map - at")
{
    auto m = duty::map<std::string, int>{{"a", 1}};

    SECTION("present key")
    {
        CHECK(m.at("a") == 1);
    }

    SECTION("missing key throws key_not_found")
    {
        auto const msg = key_not_found_message([&] { (void)m.at("missing"); });

        REQUIRE(msg.has_value());
        CHECK(msg.value().find("\"missing\"") != std::string::npos);
        CHECK(!m.contains_key("missing")); // no default insertion
    }

    SECTION("key_not_found is an out_of_range")
    {
        bool caught = false;
        try
        {
            (void)m.at("b");
        }
        catch (std::out_of_range const&)
        {
            caught = true;
        }
        CHECK(caught);
    }
}

TEST("map - get_or_else")
{
    auto m = duty::map<std::string, int>{{"a", 1}, {"b", 2}};

    SECTION("constant fallback")
    {
        CHECK(m.get_or_else("a", 5) == 1);
        CHECK(m.get_or_else("c", 5) == 5);
    }

    SECTION("callable fallback is only evaluated on a miss")
    {
        int calls = 0;
        auto const fallback = [&]
        {
            ++calls;
            return 99;
        };

        CHECK(m.get_or_else("a", fallback) == 1);
        CHECK(calls == 0);

        CHECK(m.get_or_else("c", fallback) == 99);
        CHECK(calls == 1);
    }

    SECTION("never mutates")
    {
        CHECK(m.get_or_else("c", [] { return 99; }) == 99);
        CHECK(!m.contains_key("c"));
        CHECK(m.size() == 2);
    }
}

TEST("map - get_or_else_update")
{
    auto m = duty::map<std::string, int>();

    SECTION("evaluates once and persists")
    {
        int counter = 0;
        auto const fallback = [&]
        {
            ++counter;
            return 10 * counter;
        };

        CHECK(m.get_or_else_update("k", fallback) == 10);
        CHECK(m.get_or_else_update("k", fallback) == 10);
        CHECK(counter == 1);
        CHECK(m.contains_key("k"));
        CHECK(m.get("k") == duty::some(10));
    }

    SECTION("present key ignores fallback")
    {
        m.set("k", 1);
        CHECK(m.get_or_else_update("k", 2) == 1);
        CHECK(m.get("k") == duty::some(1));
    }

    SECTION("constant fallback is stored")
    {
        CHECK(m.get_or_else_update("k", 7) == 7);
        CHECK(m.get("k") == duty::some(7));
    }

    SECTION("fallback writing the same key is overwritten by its result")
    {
        auto const result = m.get_or_else_update("k",
                                                 [&]
                                                 {
                                                     m.set("k", 1);
                                                     return 2;
                                                 });

        CHECK(result == 2);
        CHECK(m.get("k") == duty::some(2));
        CHECK(m.size() == 1);
    }

    SECTION("throwing fallback leaves the map unchanged")
    {
        bool thrown = false;
        try
        {
            m.get_or_else_update("k", []() -> int { throw std::runtime_error("fallback failed"); });
        }
        catch (std::runtime_error const&)
        {
            thrown = true;
        }

        CHECK(thrown);
        CHECK(!m.contains_key("k"));
        CHECK(m.is_empty());
    }
}

TEST("map - map_keys")
{
    auto const m = duty::map<int, std::string>{{1, "one"}, {2, "two"}, {3, "three"}};

    SECTION("injective mapping keeps cardinality")
    {
        auto const shifted = m.map_keys([](int k) { return k + 10; });

        CHECK(shifted.size() == 3);
        CHECK(shifted.get(11) == duty::some(std::string("one")));
        CHECK(shifted.get(1) == duty::nullopt);
    }

    SECTION("key type follows the mapping function")
    {
        auto const named = m.map_keys([](int k) { return "#" + std::to_string(k); });
        static_assert(std::is_same_v<decltype(named), duty::map<std::string, std::string> const>);

        CHECK(named.get("#2") == duty::some(std::string("two")));
    }

    SECTION("colliding keys collapse to one entry")
    {
        auto const collapsed = m.map_keys([](int) { return 0; });

        REQUIRE(collapsed.size() == 1);
        auto const v = collapsed.at(0);
        CHECK((v == "one" || v == "two" || v == "three"));
    }

    SECTION("source is untouched")
    {
        (void)m.map_keys([](int k) { return -k; });
        CHECK(m.size() == 3);
        CHECK(m.contains_key(1));
    }
}

TEST("map - map_values")
{
    auto const m = duty::map<std::string, int>{{"a", 1}, {"b", 2}};

    SECTION("applies to every value")
    {
        auto const doubled = m.map_values([](int v) { return v * 2; });

        CHECK(doubled.size() == 2);
        CHECK(doubled.get("a") == duty::some(2));
        CHECK(doubled.get("b") == duty::some(4));
    }

    SECTION("value type follows the mapping function")
    {
        auto const strings = m.map_values([](int v) { return std::to_string(v); });
        static_assert(std::is_same_v<decltype(strings), duty::map<std::string, std::string> const>);

        CHECK(strings.get("a") == duty::some(std::string("1")));
    }

    SECTION("identity yields the same content")
    {
        auto const same = m.map_values(duty::identity_function{});
        CHECK(same.same_content(m));
        CHECK(m.same_content(same));
    }
}

TEST("map - same_content")
{
    auto const a = duty::map<std::string, int>{{"x", 1}, {"y", 2}};

    SECTION("reflexive")
    {
        CHECK(a.same_content(a));
    }

    SECTION("independent of insertion order")
    {
        auto b = duty::map<std::string, int>();
        b.set("y", 2);
        b.set("x", 1);

        CHECK(a.same_content(b));
        CHECK(b.same_content(a));
        CHECK(a == b);
    }

    SECTION("different value")
    {
        auto const b = duty::map<std::string, int>{{"x", 1}, {"y", 3}};
        CHECK(!a.same_content(b));
        CHECK(!b.same_content(a));
        CHECK(a != b);
    }

    SECTION("subset is not the same content, in either direction")
    {
        auto const b = duty::map<std::string, int>{{"x", 1}};
        CHECK(!a.same_content(b));
        CHECK(!b.same_content(a));
    }

    SECTION("empty maps")
    {
        auto const e1 = duty::map<std::string, int>();
        auto const e2 = duty::map<std::string, int>::empty();
        CHECK(e1.same_content(e2));
        CHECK(!e1.same_content(a));
    }
}

TEST("map - native round trip")
{
    auto const native = std::unordered_map<std::string, int>{{"a", 1}, {"b", 2}, {"c", 3}};

    auto const m = duty::map<std::string, int>::from_native(native);
    CHECK(m.size() == 3);
    CHECK(m.get("b") == duty::some(2));

    CHECK(m.to_native() == native);
}

TEST("map - iteration")
{
    auto const m = duty::map<std::string, int>{{"a", 1}, {"b", 2}, {"c", 3}};

    int sum = 0;
    std::string keys;
    for (auto const& [key, value] : m)
    {
        sum += value;
        keys += key;
    }

    CHECK(sum == 6);
    CHECK(keys.size() == 3);

    SECTION("entries are pairs")
    {
        auto const& entry = *m.begin();
        static_assert(std::is_same_v<decltype(entry), duty::pair<std::string, int> const&>);
        CHECK(m.get(entry.first) == duty::some(entry.second));
    }
}

TEST("map - initializer list")
{
    auto const m = duty::map<std::string, int>{{"a", 1}, {"a", 2}, {"b", 3}};

    CHECK(m.size() == 2);
    CHECK(m.get("a") == duty::some(2)); // later entries overwrite
}

TEST("map - to_string")
{
    CHECK(duty::map<std::string, int>().to_string() == "map{}");
    CHECK(duty::map<std::string, int>{{"a", 1}}.to_string() == "map{\"a\": 1}");
    CHECK(duty::to_debug_string(duty::map<int, char>{{1, 'x'}}) == "map{1: 'x'}");

    SECTION("long maps are truncated")
    {
        auto m = duty::map<int, int>();
        for (int i = 0; i < 200; ++i)
            m.set(i, i);

        auto const s = m.to_string();
        CHECK(s.starts_with("map{"));
        CHECK(s.ends_with(", ...}"));
    }
}

TEST("map - basic lookup example")
{
    auto m = duty::map<std::string, int>::empty();
    m.set("a", 1);
    m.set("b", 2);

    CHECK(m.get("a") == duty::some(1));
    CHECK(m.get("c") == duty::nullopt);
    CHECK(m.get_or_else("c", [] { return 99; }) == 99);
    CHECK(m.contains_key("c") == false);
}
