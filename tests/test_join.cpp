#include <rowtree/frame/join.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace rowtree;

namespace {

struct Cell {
    std::int64_t i1;
    std::int64_t i2;
    const char* data;
};

auto make_frame(const std::vector<Cell>& cells) -> Frame {
    Frame frame(make_column_indexer({"i1", "i2"}));
    for (const auto& cell : cells) {
        auto put = frame.put(RowData{{"i1", cell.i1}, {"i2", cell.i2}, {"data", cell.data}});
        REQUIRE(put.has_value());
    }
    return frame;
}

auto key_probe(std::int64_t i1, std::int64_t i2) -> RowData {
    return RowData{{"i1", i1}, {"i2", i2}};
}

auto data_of(const Frame& joined, std::int64_t i1, std::int64_t i2) -> JoinResultPtr {
    auto row = joined.get(key_probe(i1, i2));
    REQUIRE(row.has_value());
    REQUIRE(*row != nullptr);
    auto pair = join_result(**row, "data");
    REQUIRE(pair.has_value());
    return *pair;
}

auto as_string(const std::optional<Value>& side) -> std::string {
    REQUIRE(side.has_value());
    return std::get<std::string>(*side);
}

}  // namespace

TEST_CASE("Join pairs rows over the union of keys", "[join]") {
    Frame left = make_frame({{1, 1, "foo"}, {1, 2, "hello"}, {2, 1, "pikachu"}, {0, 1, "nyc"}});
    Frame right = make_frame({{1, 1, "bar"}, {1, 2, "world"}, {2, 1, "raichu"}, {1, 0, "sfo"}});

    auto joined = join(left, right);
    REQUIRE(joined.has_value());
    REQUIRE(joined->size() == 5);

    SECTION("keys on both sides hold both values") {
        auto pair = data_of(*joined, 1, 1);
        REQUIRE(as_string(pair->left) == "foo");
        REQUIRE(as_string(pair->right) == "bar");

        pair = data_of(*joined, 1, 2);
        REQUIRE(as_string(pair->left) == "hello");
        REQUIRE(as_string(pair->right) == "world");

        pair = data_of(*joined, 2, 1);
        REQUIRE(as_string(pair->left) == "pikachu");
        REQUIRE(as_string(pair->right) == "raichu");
    }

    SECTION("a left-only key has an absent right side") {
        auto pair = data_of(*joined, 0, 1);
        REQUIRE(as_string(pair->left) == "nyc");
        REQUIRE_FALSE(pair->right.has_value());
    }

    SECTION("a right-only key has an absent left side") {
        auto pair = data_of(*joined, 1, 0);
        REQUIRE_FALSE(pair->left.has_value());
        REQUIRE(as_string(pair->right) == "sfo");
    }

    SECTION("key columns are paired too") {
        auto row = joined->get(key_probe(1, 0));
        REQUIRE(row.has_value());
        auto i1 = join_result(**row, "i1");
        REQUIRE(i1.has_value());
        REQUIRE_FALSE((*i1)->left.has_value());
        REQUIRE(std::get<std::int64_t>(*(*i1)->right) == 1);
    }

    SECTION("no other keys exist") {
        auto rows = joined->range();
        REQUIRE(rows.has_value());
        std::vector<std::string> rendered;
        for (const auto& row : *rows) {
            auto i1 = join_result(*row, "i1");
            auto i2 = join_result(*row, "i2");
            REQUIRE(i1.has_value());
            REQUIRE(i2.has_value());
            auto first = (*i1)->left ? *(*i1)->left : *(*i1)->right;
            auto second = (*i2)->left ? *(*i2)->left : *(*i2)->right;
            rendered.push_back(to_string(first) + "," + to_string(second));
        }
        REQUIRE(rendered == std::vector<std::string>{"0,1", "1,0", "1,1", "1,2", "2,1"});
    }

    SECTION("inputs are not modified") {
        REQUIRE(left.size() == 4);
        REQUIRE(right.size() == 4);
        auto row = left.get(key_probe(1, 1));
        REQUIRE(row.has_value());
        REQUIRE(std::get<std::string>((*row)->at("data")) == "foo");
    }
}

TEST_CASE("Join keeps columns present on one side only", "[join]") {
    Frame left(make_column_indexer({"id"}));
    Frame right(make_column_indexer({"id"}));
    REQUIRE(left.put(RowData{{"id", 1}, {"name", "ditto"}}).has_value());
    REQUIRE(right.put(RowData{{"id", 1}, {"level", 12}}).has_value());

    auto joined = join(left, right);
    REQUIRE(joined.has_value());
    REQUIRE(joined->size() == 1);

    auto row = joined->get(RowData{{"id", 1}});
    REQUIRE(row.has_value());
    REQUIRE((*row)->size() == 3);

    auto name = join_result(**row, "name");
    REQUIRE(name.has_value());
    REQUIRE(as_string((*name)->left) == "ditto");
    REQUIRE_FALSE((*name)->right.has_value());

    auto level = join_result(**row, "level");
    REQUIRE(level.has_value());
    REQUIRE_FALSE((*level)->left.has_value());
    REQUIRE(std::get<std::int64_t>(*(*level)->right) == 12);
}

TEST_CASE("Join of empty frames is empty", "[join]") {
    Frame left(make_column_indexer({"id"}));
    Frame right(make_column_indexer({"id"}));
    auto joined = join(left, right);
    REQUIRE(joined.has_value());
    REQUIRE(joined->empty());
}

TEST_CASE("Joined frames accept probes shaped like either input", "[join]") {
    Frame left = make_frame({{1, 1, "foo"}});
    Frame right = make_frame({{1, 1, "bar"}});
    auto joined = join(left, right);
    REQUIRE(joined.has_value());

    auto row = joined->get(key_probe(1, 1));
    REQUIRE(row.has_value());
    REQUIRE(*row != nullptr);

    SECTION("a joined row is its own probe") {
        auto again = joined->get(**row);
        REQUIRE(again.has_value());
        REQUIRE(again->get() == row->get());
    }

    SECTION("ranges use plain probes") {
        auto rows = joined->range(greater_or_equal(key_probe(1, 0)) & less_than(key_probe(2, 0)));
        REQUIRE(rows.has_value());
        REQUIRE(rows->size() == 1);
    }
}

TEST_CASE("Joining a joined frame nests the pairs", "[join]") {
    Frame left = make_frame({{1, 1, "foo"}});
    Frame right = make_frame({{1, 1, "bar"}});
    auto joined = join(left, right);
    REQUIRE(joined.has_value());

    auto nested = join(right, *joined);
    REQUIRE(nested.has_value());

    auto row = nested->get(key_probe(1, 1));
    REQUIRE(row.has_value());
    auto data = join_result(**row, "data");
    REQUIRE(data.has_value());
    REQUIRE(as_string((*data)->left) == "bar");
    REQUIRE(kind_of(*(*data)->right) == ValueKind::JoinResult);
}

TEST_CASE("join_result reports structural errors", "[join]") {
    RowData row{{"plain", 1}, {"paired", make_join_result(Value{1}, Value{2})}};

    auto ok = join_result(row, "paired");
    REQUIRE(ok.has_value());
    REQUIRE(std::get<std::int64_t>(*(*ok)->right) == 2);

    auto missing = join_result(row, "absent");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::StructuralJoinError);
    REQUIRE(missing.error().column == "absent");

    auto plain = join_result(row, "plain");
    REQUIRE_FALSE(plain.has_value());
    REQUIRE(plain.error().kind == ErrorKind::StructuralJoinError);
    REQUIRE(plain.error().column == "plain");
}

TEST_CASE("JoinResultIndexer projects pairs before indexing", "[join][indexer]") {
    JoinResultIndexer indexer(make_column_indexer({"id"}));

    auto left_only = indexer.index(RowData{{"id", make_join_result(Value{4}, std::nullopt)}});
    REQUIRE(left_only.has_value());
    REQUIRE(std::get<std::int64_t>(left_only->scalar_value()) == 4);

    auto right_only = indexer.index(RowData{{"id", make_join_result(std::nullopt, Value{5})}});
    REQUIRE(right_only.has_value());
    REQUIRE(std::get<std::int64_t>(right_only->scalar_value()) == 5);

    auto both = indexer.index(RowData{{"id", make_join_result(Value{6}, Value{7})}});
    REQUIRE(both.has_value());
    REQUIRE(std::get<std::int64_t>(both->scalar_value()) == 6);

    auto plain = indexer.index(RowData{{"id", 8}});
    REQUIRE(plain.has_value());
    REQUIRE(std::get<std::int64_t>(plain->scalar_value()) == 8);

    auto empty = indexer.index(RowData{{"id", make_join_result(std::nullopt, std::nullopt)}});
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().kind == ErrorKind::UnsupportedKeyType);
}

TEST_CASE("Join leaves the left indexer's type memory alone", "[join]") {
    auto left_indexer = make_column_indexer({"id"});
    Frame left(left_indexer);
    Frame right(make_column_indexer({"id"}));
    REQUIRE(right.put(RowData{{"id", "a"}}).has_value());

    auto joined = join(left, right);
    REQUIRE(joined.has_value());
    REQUIRE(joined->size() == 1);
    REQUIRE_FALSE(left_indexer->fixed_kind("id").has_value());

    auto put = left.put(RowData{{"id", 1}});
    REQUIRE(put.has_value());
    REQUIRE(left.size() == 1);
}

TEST_CASE("Join needs a left indexer", "[join]") {
    Frame left(nullptr);
    Frame right(make_column_indexer({"id"}));
    auto joined = join(left, right);
    REQUIRE_FALSE(joined.has_value());
    REQUIRE(joined.error().kind == ErrorKind::NullIndexer);
}
