#include <rowtree/core/key.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <compare>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace rowtree;

namespace {

auto int_key(std::int64_t v) -> Key {
    return Key::scalar(v);
}

auto str_key(std::string v) -> Key {
    return Key::scalar(std::move(v));
}

auto order_of(const Key& lhs, const Key& rhs) -> std::strong_ordering {
    auto order = compare(lhs, rhs);
    REQUIRE(order.has_value());
    return *order;
}

}  // namespace

TEST_CASE("String keys follow string order", "[core][key]") {
    REQUIRE(order_of(str_key("abc"), str_key("def")) == std::strong_ordering::less);
    REQUIRE(order_of(str_key("def"), str_key("abc")) == std::strong_ordering::greater);
    REQUIRE(order_of(str_key("abc"), str_key("abc")) == std::strong_ordering::equal);
}

TEST_CASE("Int keys follow integer order", "[core][key]") {
    REQUIRE(order_of(int_key(1), int_key(2)) == std::strong_ordering::less);
    REQUIRE(order_of(int_key(2), int_key(1)) == std::strong_ordering::greater);
    REQUIRE(order_of(int_key(1), int_key(1)) == std::strong_ordering::equal);
    REQUIRE(order_of(int_key(-5), int_key(3)) == std::strong_ordering::less);
}

TEST_CASE("Other scalar kinds order naturally", "[core][key]") {
    REQUIRE(order_of(Key::scalar(1.5), Key::scalar(2.25)) == std::strong_ordering::less);
    REQUIRE(order_of(Key::scalar(false), Key::scalar(true)) == std::strong_ordering::less);
    REQUIRE(order_of(Key::scalar(Date{3}), Key::scalar(Date{2})) ==
            std::strong_ordering::greater);
    REQUIRE(order_of(Key::scalar(Timestamp{7}), Key::scalar(Timestamp{7})) ==
            std::strong_ordering::equal);
}

TEST_CASE("Composite keys compare element-wise", "[core][key]") {
    struct Case {
        std::string s1;
        std::string s2;
        std::int64_t i1;
        std::int64_t i2;
        bool less;
    };
    const std::vector<Case> cases = {
        {"a", "b", 1, 2, true},  {"b", "a", 1, 2, false}, {"a", "a", 1, 2, true},
        {"a", "a", 2, 1, false}, {"a", "a", 1, 1, false},
    };

    for (const auto& c : cases) {
        Key m1 = Key::composite({str_key(c.s1), int_key(c.i1)});
        Key m2 = Key::composite({str_key(c.s2), int_key(c.i2)});
        REQUIRE((order_of(m1, m2) < 0) == c.less);
    }
}

TEST_CASE("A composite prefix sorts before the longer composite", "[core][key]") {
    Key shorter = Key::composite({str_key("a")});
    Key longer = Key::composite({str_key("a"), str_key("b")});

    REQUIRE(order_of(shorter, longer) == std::strong_ordering::less);
    REQUIRE(order_of(longer, shorter) == std::strong_ordering::greater);

    SECTION("a differing shared position still decides first") {
        Key other = Key::composite({str_key("b")});
        REQUIRE(order_of(longer, other) == std::strong_ordering::less);
        REQUIRE(order_of(other, longer) == std::strong_ordering::greater);
    }
}

TEST_CASE("NoKey sorts before every other key", "[core][key]") {
    REQUIRE(order_of(Key::none(), int_key(0)) == std::strong_ordering::less);
    REQUIRE(order_of(str_key(""), Key::none()) == std::strong_ordering::greater);
    REQUIRE(order_of(Key::none(), Key::composite({int_key(1), int_key(2)})) ==
            std::strong_ordering::less);
    REQUIRE(order_of(Key::none(), Key::none()) == std::strong_ordering::equal);
}

TEST_CASE("Comparing mismatched key kinds is an error", "[core][key]") {
    SECTION("int against string") {
        auto order = compare(int_key(1), str_key("1"));
        REQUIRE_FALSE(order.has_value());
        REQUIRE(order.error().kind == ErrorKind::KeyTypeMismatch);
        REQUIRE(order.error().message == "cannot compare int key with string key");
    }

    SECTION("scalar against composite") {
        auto order = compare(int_key(1), Key::composite({int_key(1), int_key(2)}));
        REQUIRE_FALSE(order.has_value());
        REQUIRE(order.error().kind == ErrorKind::KeyTypeMismatch);
    }

    SECTION("mismatch nested inside composites") {
        Key lhs = Key::composite({int_key(1), str_key("x")});
        Key rhs = Key::composite({int_key(1), int_key(2)});
        auto order = compare(lhs, rhs);
        REQUIRE_FALSE(order.has_value());
        REQUIRE(order.error().kind == ErrorKind::KeyTypeMismatch);
    }

    SECTION("an earlier differing position settles the order first") {
        Key lhs = Key::composite({int_key(1), str_key("x")});
        Key rhs = Key::composite({int_key(2), int_key(2)});
        REQUIRE(order_of(lhs, rhs) == std::strong_ordering::less);
    }
}

TEST_CASE("make_key shapes the key by value count", "[core][key]") {
    SECTION("no values") {
        auto key = make_key({});
        REQUIRE(key.has_value());
        REQUIRE(key->is_none());
        REQUIRE(key->kind() == KeyKind::None);
    }

    SECTION("one value") {
        std::vector<Value> values{Value{"foo"}};
        auto key = make_key(values);
        REQUIRE(key.has_value());
        REQUIRE(key->is_scalar());
        REQUIRE(key->kind() == KeyKind::String);
        REQUIRE(std::get<std::string>(key->scalar_value()) == "foo");
    }

    SECTION("several values") {
        std::vector<Value> values{Value{1}, Value{"b"}};
        auto key = make_key(values);
        REQUIRE(key.has_value());
        REQUIRE(key->is_composite());
        REQUIRE(key->parts().size() == 2);
        REQUIRE(key->parts()[0].kind() == KeyKind::Int);
        REQUIRE(key->parts()[1].kind() == KeyKind::String);
    }
}

TEST_CASE("make_key rejects values that cannot be keys", "[core][key]") {
    SECTION("null") {
        std::vector<Value> values{Value{}};
        auto key = make_key(values);
        REQUIRE_FALSE(key.has_value());
        REQUIRE(key.error().kind == ErrorKind::UnsupportedKeyType);
    }

    SECTION("NaN") {
        std::vector<Value> values{Value{std::numeric_limits<double>::quiet_NaN()}};
        auto key = make_key(values);
        REQUIRE_FALSE(key.has_value());
        REQUIRE(key.error().kind == ErrorKind::UnsupportedKeyType);
    }

    SECTION("join result") {
        std::vector<Value> values{Value{1}, Value{make_join_result(Value{1}, std::nullopt)}};
        auto key = make_key(values);
        REQUIRE_FALSE(key.has_value());
        REQUIRE(key.error().kind == ErrorKind::UnsupportedKeyType);
    }
}

TEST_CASE("Keys render for diagnostics", "[core][key]") {
    REQUIRE(to_string(Key::none()) == "()");
    REQUIRE(to_string(int_key(3)) == "3");
    REQUIRE(to_string(str_key("a")) == "\"a\"");
    REQUIRE(to_string(Key::composite({int_key(1), str_key("a")})) == "(1, \"a\")");
}
