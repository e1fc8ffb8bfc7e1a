#include <fallible/result.hh>

#include <nexus/test.hh>

#include "test-util.hh"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

// result stays trivial when T and E are trivial
static_assert(std::is_constructible_v<fl::result<int, int>>);
static_assert(std::is_constructible_v<fl::result<int, int>, int>);
static_assert(std::is_constructible_v<fl::result<int, int>, fl::err_t<int>>);
static_assert(std::is_trivially_copyable_v<fl::result<int, int>>);
static_assert(std::is_trivially_destructible_v<fl::result<int, int>>);
static_assert(!std::is_trivially_copyable_v<fl::result<std::string, int>>);

// the default error type
static_assert(std::is_same_v<fl::result<int>::error_type, fl::any_error>);

namespace
{
// test type for non-trivial operations
struct non_trivial
{
    int value = 0;
    bool* destroyed = nullptr;

    non_trivial() = default;
    explicit non_trivial(int v) : value(v) {}
    non_trivial(int v, bool* d) : value(v), destroyed(d) {}

    ~non_trivial()
    {
        if (destroyed)
            *destroyed = true;
    }

    non_trivial(non_trivial const&) = default;
    non_trivial(non_trivial&& rhs) noexcept : value(rhs.value), destroyed(rhs.destroyed) { rhs.destroyed = nullptr; }
    non_trivial& operator=(non_trivial const&) = default;
    non_trivial& operator=(non_trivial&& rhs) noexcept
    {
        value = rhs.value;
        destroyed = rhs.destroyed;
        rhs.destroyed = nullptr;
        return *this;
    }

    friend bool operator==(non_trivial const&, non_trivial const&) = default;
};

// move-only type for testing
struct move_only
{
    int value = 0;

    move_only() = default;
    explicit move_only(int v) : value(v) {}

    move_only(move_only const&) = delete;
    move_only(move_only&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }

    ~move_only() = default;
};

// counting type to track special member function calls
struct counting_type
{
    int value = 0;

    static inline int value_ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        value_ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) { ++value_ctor_count; }

    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }

    counting_type& operator=(counting_type const& rhs) = default;
    counting_type& operator=(counting_type&& rhs) noexcept = default;

    ~counting_type() { ++dtor_count; }
};

fl::result<int, std::string> parse_digit(char c)
{
    if (c < '0' || c > '9')
        return fl::err(std::string("not a digit"));
    return c - '0';
}
} // namespace

TEST("result - trivial types")
{
    SECTION("default construction creates error")
    {
        auto const res = fl::result<int, int>{};
        CHECK(!res.is_ok());
        CHECK(res.is_err());
        CHECK(res.error() == 0);
    }

    SECTION("value construction")
    {
        fl::result<int, int> const res = 42;
        CHECK(res.is_ok());
        CHECK(!res.is_err());
        CHECK(res.value() == 42);
    }

    SECTION("ok() and err() markers")
    {
        fl::result<int, int> const a = fl::ok(5);
        fl::result<int, int> const b = fl::err(99);
        CHECK(a.is_ok());
        CHECK(a.value() == 5);
        CHECK(b.is_err());
        CHECK(b.error() == 99);
    }

    SECTION("in-place construction")
    {
        auto const a = fl::result<std::string, std::string>(fl::in_place_value, 3, 'a');
        auto const b = fl::result<std::string, std::string>(fl::in_place_error, 2, 'e');
        CHECK(a.value() == "aaa");
        CHECK(b.error() == "ee");
    }

    SECTION("copy keeps the variant")
    {
        auto const ok = fl::result<int, int>{42};
        auto const ok_copy = ok;
        CHECK(ok_copy.is_ok());
        CHECK(ok_copy.value() == 42);

        auto const e = fl::result<int, int>{fl::err(99)};
        auto const e_copy = e;
        CHECK(e_copy.is_err());
        CHECK(e_copy.error() == 99);
    }

    SECTION("assignment switches variants")
    {
        auto res = fl::result<int, int>{42};
        res = fl::result<int, int>{fl::err(99)};
        CHECK(res.is_err());
        CHECK(res.error() == 99);

        res = fl::result<int, int>{7};
        CHECK(res.is_ok());
        CHECK(res.value() == 7);
    }
}

TEST("result - non-trivial types")
{
    SECTION("string values and errors")
    {
        auto const ok = fl::result<std::string, std::string>{"hello"};
        CHECK(ok.is_ok());
        CHECK(ok.value() == "hello");

        auto const e = fl::result<std::string, std::string>{fl::err(std::string("failed"))};
        CHECK(e.is_err());
        CHECK(e.error() == "failed");
    }

    SECTION("copy assignment between variants")
    {
        auto a = fl::result<std::string, std::string>{"value"};
        auto const b = fl::result<std::string, std::string>{fl::err(std::string("error"))};
        a = b;
        CHECK(a.is_err());
        CHECK(a.error() == "error");
        CHECK(b.error() == "error");
    }

    SECTION("destructor runs for the active payload")
    {
        bool destroyed = false;
        {
            auto res = fl::result<non_trivial, int>{non_trivial{1, &destroyed}};
            CHECK(!destroyed);
        }
        CHECK(destroyed);

        destroyed = false;
        {
            auto res = fl::result<int, non_trivial>{fl::err(non_trivial{1, &destroyed})};
            CHECK(!destroyed);
        }
        CHECK(destroyed);
    }

    SECTION("moved-from result keeps its variant")
    {
        auto a = fl::result<move_only, int>{move_only{3}};
        auto b = fl::move(a);
        CHECK(b.value().value == 3);
        CHECK(a.is_ok());
        CHECK(a.value().value == -1);
    }

    SECTION("unique_ptr payloads")
    {
        auto ok = fl::result<std::unique_ptr<int>, int>{std::make_unique<int>(42)};
        auto moved = fl::move(ok);
        CHECK(*moved.value() == 42);

        auto e = fl::result<int, std::unique_ptr<int>>{fl::err(std::make_unique<int>(99))};
        CHECK(*e.error() == 99);
    }
}

TEST("result - counting special member functions")
{
    SECTION("value construction")
    {
        counting_type::reset_counters();
        {
            auto const res = fl::result<counting_type, int>{counting_type{42}};
            CHECK(res.is_ok());
            CHECK(res.value().value == 42);
        }
        // temp value, moved into the result
        CHECK(counting_type::value_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("error construction")
    {
        counting_type::reset_counters();
        {
            auto const res = fl::result<int, counting_type>{fl::err(counting_type{99})};
            CHECK(res.is_err());
            CHECK(res.error().value == 99);
        }
        // move into fl::err, then move into the result
        CHECK(counting_type::value_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 2);
        CHECK(counting_type::dtor_count == 3);
    }

    SECTION("copy construction")
    {
        counting_type::reset_counters();
        {
            auto const res1 = fl::result<counting_type, int>{counting_type{42}};
            counting_type::reset_counters();
            auto const res2 = res1;
            CHECK(res2.is_ok());
        }
        CHECK(counting_type::copy_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 0);
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("copy assignment - value to error")
    {
        counting_type::reset_counters();
        {
            auto res1 = fl::result<counting_type, int>{counting_type{42}};
            auto res2 = fl::result<counting_type, int>{fl::err(99)};
            counting_type::reset_counters();
            res2 = res1;
            CHECK(res2.is_ok());
            CHECK(res2.value().value == 42);
        }
        // the copy may throw, so it is built in a temporary first
        CHECK(counting_type::copy_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::dtor_count == 3);
    }

    SECTION("move assignment - error to value")
    {
        counting_type::reset_counters();
        {
            auto res1 = fl::result<int, counting_type>{fl::err(counting_type{99})};
            auto res2 = fl::result<int, counting_type>{42};
            counting_type::reset_counters();
            res2 = fl::move(res1);
            CHECK(res2.is_err());
        }
        // nothrow move is constructed in place
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2);
    }
}

TEST("result - value and error observers")
{
    SECTION("references")
    {
        auto res = fl::result<int, int>{42};
        res.value() = 99;
        CHECK(res.value() == 99);

        auto e = fl::result<int, int>{fl::err(99)};
        e.error() = 111;
        CHECK(e.error() == 111);
    }

    SECTION("rvalue access moves")
    {
        auto res = fl::result<move_only, int>{move_only{42}};
        auto moved = fl::move(res).value();
        CHECK(moved.value == 42);

        auto e = fl::result<int, move_only>{fl::err(move_only{99})};
        auto moved_err = fl::move(e).error();
        CHECK(moved_err.value == 99);
    }

    SECTION("is_ok_and / is_err_and")
    {
        int calls = 0;
        auto positive = [&](int v)
        {
            ++calls;
            return v > 0;
        };

        CHECK(fl::result<int, int>{3}.is_ok_and(positive));
        CHECK(!fl::result<int, int>{fl::err(3)}.is_ok_and(positive));
        CHECK(calls == 1);

        CHECK(fl::result<int, int>{fl::err(3)}.is_err_and(positive));
        CHECK(!fl::result<int, int>{3}.is_err_and(positive));
        CHECK(calls == 2);
    }

#if FL_ASSERT_ENABLED
    SECTION("accessing the wrong variant asserts")
    {
        auto const ok = fl::result<int, int>{1};
        auto const e = fl::result<int, int>{fl::err(1)};
        CHECK(test::asserts([&] { (void)ok.error(); }));
        CHECK(test::asserts([&] { (void)e.value(); }));
    }
#endif
}

TEST("result - unwrapping")
{
    SECTION("unwrap on Ok")
    {
        auto res = fl::result<std::string, int>{"abc"};
        static_assert(std::is_same_v<decltype(res.unwrap()), std::string&>);
        static_assert(std::is_same_v<decltype(fl::move(res).unwrap()), std::string>);
        CHECK(res.unwrap() == "abc");
    }

    SECTION("unwrap on Err reports the error")
    {
        auto const res = fl::result<int, std::string>{fl::err(std::string("boom"))};
        CHECK(test::throws_as<fl::result_error>([&] { (void)res.unwrap(); }));
        CHECK(test::thrown_message<fl::result_error>([&] { (void)res.unwrap(); })
              == "Unwrapping value on Err(\"boom\")");
    }

    SECTION("unwrap_err on Ok reports the value")
    {
        auto const res = fl::result<int, std::string>{42};
        CHECK(test::thrown_message<fl::result_error>([&] { (void)res.unwrap_err(); })
              == "Unwrapping error value on Ok(42)");

        auto const e = fl::result<int, std::string>{fl::err(std::string("x"))};
        CHECK(e.unwrap_err() == "x");
    }

    SECTION("expect prefixes the message")
    {
        auto const res = fl::result<int, std::string>{fl::err(std::string("boom"))};
        CHECK(test::thrown_message<fl::result_error>([&] { (void)res.expect("loading config"); })
              == "loading config: \"boom\"");

        auto const ok = fl::result<int, std::string>{42};
        CHECK(ok.expect("loading config") == 42);
        CHECK(test::thrown_message<fl::result_error>([&] { (void)ok.expect_err("should fail"); }) == "should fail: 42");
    }

    SECTION("any_error in the message")
    {
        auto const res = fl::result<int>{fl::err("nope")};
        CHECK(test::thrown_message<fl::result_error>([&] { (void)res.unwrap(); }) == "Unwrapping value on Err(error: nope)");
    }

    SECTION("result_error is a logic_error")
    {
        auto const res = fl::result<int>{fl::err("nope")};
        CHECK(test::throws_as<std::logic_error>([&] { (void)res.unwrap(); }));
    }

    SECTION("unwrap_or_else receives the error")
    {
        auto const e = fl::result<int, std::string>{fl::err(std::string("four"))};
        CHECK(e.unwrap_or_else([](std::string const& s) { return int(s.size()); }) == 4);

        bool called = false;
        auto const ok = fl::result<int, std::string>{1};
        CHECK(ok.unwrap_or_else(
                  [&](std::string const&)
                  {
                      called = true;
                      return 0;
                  })
              == 1);
        CHECK(!called);
    }
}

TEST("result - value_or and error_or")
{
    SECTION("value_or")
    {
        CHECK(fl::result<int, int>{42}.value_or(0) == 42);
        CHECK(fl::result<int, int>{fl::err(99)}.value_or(0) == 0);
        CHECK(fl::result<int, int>{fl::err(99)}.unwrap_or(5) == 5);
    }

    SECTION("error_or")
    {
        CHECK(fl::result<int, int>{fl::err(99)}.error_or(0) == 99);
        CHECK(fl::result<int, int>{42}.error_or(0) == 0);
    }

    SECTION("value_or with move-only type")
    {
        auto res = fl::result<move_only, int>{move_only{42}};
        auto val = fl::move(res).value_or(move_only{0});
        CHECK(val.value == 42);

        auto e = fl::result<move_only, int>{fl::err(99)};
        auto fallback = fl::move(e).value_or(move_only{7});
        CHECK(fallback.value == 7);
    }
}

TEST("result - emplace_value and emplace_error")
{
    SECTION("emplace_value on error result")
    {
        auto res = fl::result<int, int>{fl::err(99)};
        auto& ref = res.emplace_value(42);
        CHECK(res.is_ok());
        CHECK(res.value() == 42);
        CHECK(&ref == &res.value());
    }

    SECTION("emplace_error on value result")
    {
        auto res = fl::result<int, int>{42};
        auto& ref = res.emplace_error(99);
        CHECK(res.is_err());
        CHECK(res.error() == 99);
        CHECK(&ref == &res.error());
    }

    SECTION("emplace with multiple arguments")
    {
        auto res = fl::result<std::string, std::string>{"x"};
        res.emplace_error(5, 'x');
        CHECK(res.error() == "xxxxx");
        res.emplace_value(3, 'v');
        CHECK(res.value() == "vvv");
    }

    SECTION("emplace destroys the previous payload")
    {
        bool destroyed = false;
        auto res = fl::result<non_trivial, int>{non_trivial{99, &destroyed}};
        CHECK(!destroyed);
        res.emplace_error(42);
        CHECK(destroyed);
        CHECK(res.error() == 42);
    }
}

TEST("result - converting constructor")
{
    SECTION("compatible value and error types")
    {
        auto a = fl::result<long, long>{fl::result<int, int>{42}};
        CHECK(a.value() == 42L);

        auto b = fl::result<long, long>{fl::result<int, int>{fl::err(99)}};
        CHECK(b.error() == 99L);
    }

    SECTION("typed error into any_error")
    {
        auto typed = fl::result<int, std::string>{fl::err(std::string("typed error"))};
        fl::result<int> res = typed;
        CHECK(res.is_err());
        CHECK(res.error().message() == "typed error");
    }

    SECTION("converting records the conversion site")
    {
        auto make_typed_error = []() -> fl::result<int, std::string> { return fl::err(std::string("typed error")); };

        auto before = fl::source_location::current();
        auto res = fl::result<int>{make_typed_error()};
        auto after = fl::source_location::current();

        auto site = res.error().site();
        CHECK(std::string_view(site.file_name()) == before.file_name());
        CHECK(site.line() > before.line());
        CHECK(site.line() < after.line());
    }
}

TEST("result - transformations")
{
    SECTION("map and map_err touch one side only")
    {
        auto const ok = fl::result<int, std::string>{2};
        auto const e = fl::result<int, std::string>{fl::err(std::string("bad"))};
        int calls = 0;

        auto doubled = ok.map(
            [&](int v)
            {
                ++calls;
                return v * 2;
            });
        CHECK(doubled.value() == 4);

        auto still_err = e.map(
            [&](int v)
            {
                ++calls;
                return v * 2;
            });
        CHECK(still_err.error() == "bad");
        CHECK(calls == 1);

        auto sized = e.map_err([](std::string const& s) { return s.size(); });
        static_assert(std::is_same_v<decltype(sized), fl::result<int, std::size_t>>);
        CHECK(sized.error() == 3u);
        CHECK(ok.map_err([](std::string const& s) { return s.size(); }).value() == 2);
    }

    SECTION("identity maps are no-ops")
    {
        auto const ok = fl::result<int, std::string>{2};
        auto const e = fl::result<int, std::string>{fl::err(std::string("bad"))};
        auto id = [](auto const& v) { return v; };

        CHECK(ok.map(id) == ok);
        CHECK(e.map(id) == e);
        CHECK(ok.map_err(id) == ok);
        CHECK(e.map_err(id) == e);
    }

    SECTION("map changes the value type")
    {
        auto const res = fl::result<int, std::string>{12}.map([](int v) { return std::to_string(v); });
        static_assert(std::is_same_v<decltype(res), fl::result<std::string, std::string> const>);
        CHECK(res.value() == "12");
    }

    SECTION("map_or / map_or_else")
    {
        auto twice = [](int v) { return v * 2; };
        CHECK(fl::result<int, std::string>{3}.map_or(-1, twice) == 6);
        CHECK(fl::result<int, std::string>{fl::err(std::string("e"))}.map_or(-1, twice) == -1);

        auto err_len = [](std::string const& s) { return int(s.size()); };
        CHECK(fl::result<int, std::string>{3}.map_or_else(err_len, twice) == 6);
        CHECK(fl::result<int, std::string>{fl::err(std::string("four"))}.map_or_else(err_len, twice) == 4);
    }

    SECTION("inspect / inspect_err")
    {
        int seen_value = 0;
        std::string seen_error;

        auto const ok = fl::result<int, std::string>{5}
                            .inspect([&](int const& v) { seen_value = v; })
                            .inspect_err([&](std::string const& e) { seen_error = e; });
        CHECK(ok.value() == 5);
        CHECK(seen_value == 5);
        CHECK(seen_error.empty());

        auto const e = fl::result<int, std::string>{fl::err(std::string("bad"))}
                           .inspect([&](int const& v) { seen_value = v * 100; })
                           .inspect_err([&](std::string const& err) { seen_error = err; });
        CHECK(e.error() == "bad");
        CHECK(seen_value == 5);
        CHECK(seen_error == "bad");
    }

    SECTION("flatten")
    {
        using inner = fl::result<int, std::string>;

        auto ok_ok = fl::result<inner, std::string>{inner{1}};
        CHECK(ok_ok.flatten().value() == 1);

        auto ok_err = fl::result<inner, std::string>{inner{fl::err(std::string("in"))}};
        CHECK(ok_err.flatten().error() == "in");

        auto err = fl::result<inner, std::string>{fl::err(std::string("out"))};
        CHECK(err.flatten().error() == "out");
    }
}

TEST("result - boolean combinators")
{
    auto const ok = fl::result<int, std::string>{1};
    auto const e = fl::result<int, std::string>{fl::err(std::string("e"))};

    SECTION("and_")
    {
        auto const next = fl::result<std::string, std::string>{"next"};
        CHECK(ok.and_(next).value() == "next");
        CHECK(e.and_(next).error() == "e");
    }

    SECTION("and_then chains fallible steps")
    {
        auto to_digit = [](int v) { return parse_digit(char('0' + v)); };
        CHECK(ok.and_then(to_digit).value() == 1);
        CHECK(e.and_then(to_digit).error() == "e");

        auto const chained = parse_digit('7').and_then([](int v) { return parse_digit(char('0' + v + 5)); });
        CHECK(chained.error() == "not a digit");
    }

    SECTION("or_")
    {
        auto const fallback = fl::result<int, int>{5};
        auto const a = ok.or_(fallback);
        static_assert(std::is_same_v<decltype(a), fl::result<int, int> const>);
        CHECK(a.value() == 1);
        CHECK(e.or_(fallback).value() == 5);
    }

    SECTION("or_else recovers from errors")
    {
        int calls = 0;
        auto recover = [&](std::string const& err) -> fl::result<int, int>
        {
            ++calls;
            return int(err.size());
        };

        CHECK(ok.or_else(recover).value() == 1);
        CHECK(calls == 0);
        CHECK(e.or_else(recover).value() == 1);
        CHECK(calls == 1);
    }
}

TEST("result - transpose")
{
    SECTION("option payload")
    {
        auto const some = fl::result<fl::option<int>, std::string>{fl::some(3)}.transpose();
        static_assert(std::is_same_v<decltype(some), fl::option<fl::result<int, std::string>> const>);
        CHECK(some.is_some());
        CHECK(some.value().value() == 3);

        auto const none = fl::result<fl::option<int>, std::string>{fl::option<int>()}.transpose();
        CHECK(none.is_none());

        auto const e = fl::result<fl::option<int>, std::string>{fl::err(std::string("e"))}.transpose();
        CHECK(e.is_some());
        CHECK(e.value().error() == "e");
    }

    SECTION("std::optional payload")
    {
        auto const some = fl::result<std::optional<int>, std::string>{std::optional<int>(4)}.transpose();
        CHECK(some.value().value() == 4);

        auto const none = fl::result<std::optional<int>, std::string>{std::optional<int>()}.transpose();
        CHECK(none.is_none());
    }

    SECTION("pointer payload")
    {
        int x = 0;
        auto const some = fl::result<int*, std::string>{&x}.transpose();
        CHECK(some.value().value() == &x);

        auto const none = fl::result<int*, std::string>{nullptr}.transpose();
        CHECK(none.is_none());
    }

    SECTION("move-only payloads are moved out")
    {
        auto some = fl::result<fl::option<std::unique_ptr<int>>, std::string>{fl::some(std::make_unique<int>(7))}.transpose();
        REQUIRE(some.is_some());
        CHECK(*some.value().value() == 7);

        auto from_std = fl::result<std::optional<std::unique_ptr<int>>, std::string>{std::make_optional(std::make_unique<int>(8))}
                            .transpose();
        REQUIRE(from_std.is_some());
        CHECK(*from_std.value().value() == 8);
    }

    SECTION("zero, false and empty strings are values")
    {
        CHECK(fl::result<int, std::string>{0}.transpose().is_some());
        CHECK(fl::result<bool, std::string>{false}.transpose().is_some());
        CHECK(fl::result<std::string, int>{""}.transpose().value().value().empty());
    }
}

TEST("result - match")
{
    auto describe = [](fl::result<int, std::string> const& r)
    {
        return r.match([](int v) { return "value " + std::to_string(v); },
                       [](std::string const& e) { return "error " + e; });
    };

    CHECK(describe(1) == "value 1");
    CHECK(describe(fl::err(std::string("x"))) == "error x");

    int ok_calls = 0;
    int err_calls = 0;
    fl::result<int, std::string>{fl::err(std::string("x"))}.match([&](int) { ++ok_calls; },
                                                                   [&](std::string const&) { ++err_calls; });
    CHECK(ok_calls == 0);
    CHECK(err_calls == 1);
}

TEST("result - to_string and comparison")
{
    SECTION("to_string")
    {
        CHECK(fl::result<int, std::string>{42}.to_string() == "Ok(42)");
        CHECK(fl::result<int, std::string>{fl::err(std::string("x"))}.to_string() == "Err(\"x\")");
        CHECK(fl::result<std::string, int>{"a\"b"}.to_string() == "Ok(\"a\\\"b\")");
        CHECK(fl::result<fl::option<int>, int>{fl::some(1)}.to_string() == "Ok(Some(1))");
        CHECK(fl::result<int>{fl::err("disk full")}.to_string() == "Err(error: disk full)");
    }

    SECTION("comparison")
    {
        CHECK(fl::result<int, int>{1} == fl::result<int, int>{1});
        CHECK(fl::result<int, int>{1} != fl::result<int, int>{2});
        CHECK(fl::result<int, int>{1} != fl::result<int, int>{fl::err(1)});
        CHECK(fl::result<int, int>{fl::err(1)} == fl::result<int, int>{fl::err(1)});
    }
}

TEST("result - self-assignment safety")
{
    SECTION("self-copy assignment")
    {
        auto res = fl::result<std::string, int>{"kept"};
        auto& alias = res;
        res = alias;
        CHECK(res.value() == "kept");
    }

    SECTION("self-move assignment")
    {
        auto res = fl::result<std::string, int>{fl::err(99)};
        auto& alias = res;
        res = fl::move(alias);
        CHECK(res.is_err());
        CHECK(res.error() == 99);
    }
}

TEST("result - source location capture")
{
    SECTION("fl::err captures location")
    {
        auto before = fl::source_location::current();
        auto res = fl::result<int>{fl::err("test error")};
        auto after = fl::source_location::current();

        auto site = res.error().site();
        CHECK(std::string_view(site.file_name()) == before.file_name());
        CHECK(site.line() > before.line());
        CHECK(site.line() < after.line());
    }

    SECTION("errors without a site are built from the value alone")
    {
        auto res = fl::result<int, std::string>{fl::err("plain")};
        CHECK(res.error() == "plain");
    }
}

TEST("result - and_then converting the error type")
{
    auto to_any = [](int v) -> fl::result<int> { return v + 1; };

    auto const ok = fl::result<int, std::string>{1}.and_then(to_any);
    CHECK(ok.value() == 2);

    auto before = fl::source_location::current();
    auto const failed = fl::result<int, std::string>{fl::err(std::string("bad input"))}.and_then(to_any);
    auto after = fl::source_location::current();

    REQUIRE(failed.is_err());
    CHECK(failed.error().message() == "bad input");
    auto site = failed.error().site();
    CHECK(std::string_view(site.file_name()) == before.file_name());
    CHECK(site.line() > before.line());
    CHECK(site.line() < after.line());
}

TEST("result - with_context on result<T>")
{
    SECTION("lvalue")
    {
        auto res = fl::result<int>{fl::err("base error")};
        res.with_context("additional context");

        auto err_str = res.error().to_string();
        CHECK(err_str.contains("base error"));
        CHECK(err_str.contains("additional context"));
    }

    SECTION("rvalue chaining")
    {
        auto res = fl::result<int>{fl::err("base error")} //
                       .with_context("context 1")         //
                       .with_context("context 2");

        CHECK(res.error().context_count() == 2);
        CHECK(res.error().context(0).message == "context 2");
        CHECK(res.error().context(1).message == "context 1");
    }

    SECTION("value results are left alone")
    {
        auto res = fl::result<int>{42}.with_context("this context is ignored");
        CHECK(res.is_ok());
        CHECK(res.value() == 42);
    }

    SECTION("captures source location")
    {
        auto res = fl::result<int>{fl::err("base error")};

        auto before = fl::source_location::current();
        res.with_context("context message");
        auto after = fl::source_location::current();

        auto site = res.error().context(0).site;
        CHECK(site.line() > before.line());
        CHECK(site.line() < after.line());
    }
}

TEST("result - with_context_lazy on result<T>")
{
    SECTION("callable is invoked on error")
    {
        auto res = fl::result<int>{fl::err("base error")};
        bool invoked = false;

        res.with_context_lazy(
            [&]
            {
                invoked = true;
                return std::string("lazy context");
            });

        CHECK(invoked);
        CHECK(res.error().to_string().contains("lazy context"));
    }

    SECTION("callable is not invoked on success")
    {
        int computation_count = 0;
        auto res = fl::result<int>{42}
                       .with_context_lazy(
                           [&]
                           {
                               ++computation_count;
                               return std::string("expensive context 1");
                           })
                       .with_context_lazy(
                           [&]
                           {
                               ++computation_count;
                               return std::string("expensive context 2");
                           });

        CHECK(computation_count == 0);
        CHECK(res.value() == 42);
    }
}

TEST("result - conversions to option")
{
    auto const ok = fl::result<int, std::string>{1};
    auto const e = fl::result<int, std::string>{fl::err(std::string("e"))};

    CHECK(ok.ok() == 1);
    CHECK(ok.err().is_none());
    CHECK(e.ok().is_none());
    CHECK(e.err() == std::string("e"));
    CHECK(ok.into_option() == 1);

    // no null filtering, an Ok null pointer stays Some
    auto const null = fl::result<int*, int>{nullptr};
    CHECK(null.ok().is_some());
}
