#include <fallible/any_error.hh>
#include <fallible/utility.hh>

#include <nexus/test.hh>

#include <stdexcept>
#include <string>

TEST("any_error - construction")
{
    SECTION("default is empty")
    {
        auto const e = fl::any_error();
        CHECK(e.is_empty());
        CHECK(e.message().empty());
        CHECK(e.context_count() == 0);
    }

    SECTION("from strings")
    {
        CHECK(fl::any_error("literal").message() == "literal");
        CHECK(fl::any_error(std::string("owned")).message() == "owned");
        CHECK(fl::any_error(std::string_view("view")).message() == "view");
        CHECK(!fl::any_error("x").is_empty());
    }

    SECTION("from exceptions")
    {
        auto const e = fl::any_error(std::runtime_error("io failed"));
        CHECK(e.message() == "io failed");
    }

    SECTION("from other values")
    {
        CHECK(fl::any_error(404).message() == "404");
        CHECK(fl::any_error(true).message() == "true");
    }

    SECTION("records where it was created")
    {
        auto before = fl::source_location::current();
        auto e = fl::any_error("test error");
        auto after = fl::source_location::current();

        auto site = e.site();
        CHECK(std::string_view(site.file_name()) == before.file_name());
        CHECK(site.line() > before.line());
        CHECK(site.line() < after.line());
    }
}

TEST("any_error - copy and move")
{
    auto original = fl::any_error("base").with_context("note");

    auto copy = original;
    CHECK(copy == original);
    CHECK(copy.context_count() == 1);

    auto moved = fl::move(copy);
    CHECK(moved.message() == "base");
    CHECK(moved == original);

    copy = moved;
    CHECK(copy.message() == "base");
}

TEST("any_error - context")
{
    SECTION("newest note first")
    {
        auto e = fl::any_error("disk full");
        e.add_context("while writing the log");
        e.add_context("while shutting down");

        REQUIRE(e.context_count() == 2);
        CHECK(e.context(0).message == "while shutting down");
        CHECK(e.context(1).message == "while writing the log");
    }

    SECTION("lvalue and rvalue chaining")
    {
        auto e = fl::any_error("base");
        e.with_context("a").with_context("b");
        CHECK(e.context_count() == 2);

        auto const r = fl::any_error("base").with_context("c");
        CHECK(r.context_count() == 1);
    }

    SECTION("empty errors get a placeholder message")
    {
        auto e = fl::any_error();
        e.add_context("some context");
        CHECK(!e.is_empty());
        CHECK(e.message() == "<empty fl::any_error>");
        CHECK(e.context_count() == 1);
    }

    SECTION("context records its site")
    {
        auto e = fl::any_error("base");
        auto before = fl::source_location::current();
        e.add_context("here");
        auto after = fl::source_location::current();

        CHECK(e.context(0).site.line() > before.line());
        CHECK(e.context(0).site.line() < after.line());
    }
}

TEST("any_error - string forms")
{
    SECTION("one-line form")
    {
        CHECK(to_string(fl::any_error("nope")) == "error: nope");
        CHECK(to_string(fl::any_error()) == "error: <empty fl::any_error>");
        CHECK(fl::to_debug_string(fl::any_error("nope")) == "error: nope");
    }

    SECTION("report lists message and context")
    {
        auto const e = fl::any_error("base error").with_context("while loading");
        auto const report = e.to_string();
        CHECK(report.starts_with("error: base error\n"));
        CHECK(report.contains("any_error-test.cc"));
        CHECK(report.contains("  context: while loading"));
    }
}

TEST("any_error - comparison")
{
    CHECK(fl::any_error("a") == fl::any_error("a"));
    CHECK(fl::any_error("a") != fl::any_error("b"));
    CHECK(fl::any_error("a") != fl::any_error("a").with_context("c"));
    CHECK(fl::any_error() == fl::any_error());
}

TEST("any_error - to_error")
{
    auto capture = [](auto&& thrower)
    {
        try
        {
            thrower();
        }
        catch (...) // converted by the test
        {
            return fl::to_error(std::current_exception());
        }
        return fl::any_error();
    };

    CHECK(capture([] { throw std::invalid_argument("bad arg"); }).message() == "bad arg");
    CHECK(capture([] { throw fl::any_error("typed").with_context("ctx"); }).context_count() == 1);
    CHECK(capture([] { throw std::string("text"); }).message() == "text");
    CHECK(capture([] { throw "c-string"; }).message() == "c-string");
    CHECK(capture([] { throw 13; }).message() == "13");
    CHECK(capture([] { throw 7u; }).message() == "7");
    CHECK(capture([] { throw 42LL; }).message() == "42");

    struct opaque
    {
    };
    CHECK(capture([] { throw opaque{}; }).message() == "unknown exception");
}
