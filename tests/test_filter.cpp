#include <catch2/catch_test_macros.hpp>
#include "query/filter.hpp"
#include "core/error.hpp"

#include <nlohmann/json.hpp>

using namespace relsync;

namespace {

FilterRule rule(std::string property, FilterOperator op, std::optional<SqlValue> value = std::nullopt) {
    FilterRule r;
    r.property = std::move(property);
    r.op = op;
    r.value = std::move(value);
    return r;
}

std::string param_text(const WhereClause& where, size_t i) {
    return to_param(where.params.at(i)).value_or("<null>");
}

} // anonymous namespace

TEST_CASE("Filter: single equals rule", "[filter]") {
    const auto where = render_where({{Logic::AND, {rule("status", FilterOperator::EQUALS, std::string{"Done"})}}});

    CHECK(where.sql == R"(("status" = $1))");
    REQUIRE(where.params.size() == 1);
    CHECK(param_text(where, 0) == "Done");
}

TEST_CASE("Filter: rules joined by group logic", "[filter]") {
    FilterGroup group{Logic::OR, {
        rule("a", FilterOperator::GREATER_THAN, int64_t{3}),
        rule("b", FilterOperator::LESS_OR_EQUAL, 2.5),
    }};
    const auto where = render_where({group});

    CHECK(where.sql == R"(("a" > $1 OR "b" <= $2))");
    CHECK(param_text(where, 0) == "3");
    CHECK(param_text(where, 1) == "2.5");
}

TEST_CASE("Filter: groups are parenthesized and joined by the later group's logic", "[filter]") {
    std::vector<FilterGroup> groups{
        {Logic::OR, {rule("a", FilterOperator::EQUALS, int64_t{1})}},
        {Logic::AND, {}},
        {Logic::OR, {rule("b", FilterOperator::IS_NULL), rule("c", FilterOperator::IS_NOT_NULL)}},
    };
    const auto where = render_where(groups);

    CHECK(where.sql == R"(("a" = $1) OR ("b" IS NULL OR "c" IS NOT NULL))");
    CHECK(where.params.size() == 1);
}

TEST_CASE("Filter: placeholders start at first_param", "[filter]") {
    const auto where = render_where({{Logic::AND, {
        rule("a", FilterOperator::EQUALS, std::string{"x"}),
        rule("b", FilterOperator::NOT_EQUALS, std::string{"y"}),
    }}}, 4);

    CHECK(where.sql == R"(("a" = $4 AND "b" <> $5))");
}

TEST_CASE("Filter: empty group list renders nothing", "[filter]") {
    CHECK(render_where({}).empty());
    CHECK(render_where({{Logic::AND, {}}}).empty());
}

TEST_CASE("Filter: list values use ANY and ALL", "[filter]") {
    const std::vector<std::string> ids{"a1", "b2"};
    const auto where = render_where({{Logic::AND, {
        rule("id", FilterOperator::EQUALS, ids),
        rule("owner", FilterOperator::NOT_EQUALS, ids),
    }}});

    CHECK(where.sql == R"(("id" = ANY($1) AND "owner" <> ALL($2)))");
    CHECK(param_text(where, 0) == R"({"a1","b2"})");
}

TEST_CASE("Filter: contains wraps the value in wildcards", "[filter]") {
    const auto where = render_where({{Logic::AND, {
        rule("name", FilterOperator::CONTAINS, std::string{"bob"}),
        rule("name", FilterOperator::NOT_CONTAINS, std::string{"al%"}),
    }}});

    CHECK(where.sql == R"(("name" ILIKE $1 AND "name" NOT ILIKE $2))");
    CHECK(param_text(where, 0) == "%bob%");
    // Caller-supplied wildcard is kept
    CHECK(param_text(where, 1) == "al%");
}

TEST_CASE("Filter: starts_with and ends_with", "[filter]") {
    const auto where = render_where({{Logic::AND, {
        rule("name", FilterOperator::STARTS_WITH, std::string{"Al"}),
        rule("name", FilterOperator::ENDS_WITH, std::string{"son"}),
    }}});

    CHECK(where.sql == R"(("name" ILIKE $1 AND "name" ILIKE $2))");
    CHECK(param_text(where, 0) == "Al%");
    CHECK(param_text(where, 1) == "%son");
}

TEST_CASE("Filter: underscores in plain values match literally", "[filter]") {
    const auto where = render_where({{Logic::AND, {
        rule("key", FilterOperator::CONTAINS, std::string{"first_name"}),
        rule("key", FilterOperator::STARTS_WITH, std::string{"50%_off"}),
        rule("path", FilterOperator::ENDS_WITH, std::string{"a\\b"}),
        rule("key", FilterOperator::NOT_CONTAINS, std::string{"tmp_%"}),
    }}});

    CHECK(param_text(where, 0) == R"(%first\_name%)");
    CHECK(param_text(where, 1) == R"(50\%\_off%)");
    CHECK(param_text(where, 2) == R"(%a\\b)");
    // The caller's own pattern, _ included, is not escaped
    CHECK(param_text(where, 3) == "tmp_%");
}

TEST_CASE("Filter: emptiness operators take no parameter", "[filter]") {
    const auto where = render_where({{Logic::AND, {
        rule("note", FilterOperator::IS_EMPTY),
        rule("tag", FilterOperator::IS_NOT_EMPTY),
    }}});

    CHECK(where.sql == R"((("note" IS NULL OR "note" = '') AND ("tag" IS NOT NULL AND "tag" <> '')))");
    CHECK(where.params.empty());
}

TEST_CASE("Filter: identifiers are quoted", "[filter]") {
    const auto where = render_where({{Logic::AND, {rule(R"(we"ird)", FilterOperator::IS_NULL)}}});
    CHECK(where.sql == R"(("we""ird" IS NULL))");
}

TEST_CASE("Filter: missing value is malformed", "[filter][error]") {
    CHECK_THROWS_AS(render_where({{Logic::AND, {rule("a", FilterOperator::EQUALS)}}}),
                    MalformedRuleError);
    CHECK_THROWS_AS(render_where({{Logic::AND, {rule("a", FilterOperator::GREATER_THAN, SqlValue{})}}}),
                    MalformedRuleError);
}

TEST_CASE("Filter: list with an ordering operator is malformed", "[filter][error]") {
    const std::vector<std::string> ids{"a"};
    CHECK_THROWS_AS(render_where({{Logic::AND, {rule("a", FilterOperator::GREATER_THAN, ids)}}}),
                    MalformedRuleError);
    CHECK_THROWS_AS(render_where({{Logic::AND, {rule("a", FilterOperator::CONTAINS, ids)}}}),
                    MalformedRuleError);
}

TEST_CASE("Filter: empty property is malformed", "[filter][error]") {
    CHECK_THROWS_AS(render_where({{Logic::AND, {rule("", FilterOperator::IS_NULL)}}}),
                    MalformedRuleError);
}

TEST_CASE("Filter: operator names parse case-insensitively with aliases", "[filter]") {
    CHECK(parse_filter_operator("EQUALS") == FilterOperator::EQUALS);
    CHECK(parse_filter_operator("does_not_contain") == FilterOperator::NOT_CONTAINS);
    CHECK(parse_filter_operator("greater_than_or_equal_to") == FilterOperator::GREATER_OR_EQUAL);
    CHECK(parse_filter_operator("less_than_or_equal_to") == FilterOperator::LESS_OR_EQUAL);

    try {
        (void)parse_filter_operator("regex");
        FAIL("expected UnsupportedOperatorError");
    } catch (const UnsupportedOperatorError& e) {
        CHECK(e.op() == "regex");
        CHECK(e.kind() == ErrorKind::UNSUPPORTED_OPERATOR);
    }
}

TEST_CASE("Filter: JSON form parses groups and rules", "[filter][json]") {
    const auto json = nlohmann::json::parse(R"([
        {"logic": "or", "rules": [
            {"property": "score", "operator": "greater_than", "value": 10},
            {"property": "tags", "operator": "equals", "value": ["x", "y"]},
            {"property": "note", "operator": "is_empty", "value": "ignored"}
        ]}
    ])");

    const auto groups = parse_filter_groups(json);
    REQUIRE(groups.size() == 1);
    CHECK(groups[0].logic == Logic::OR);
    REQUIRE(groups[0].rules.size() == 3);
    CHECK(std::get<int64_t>(*groups[0].rules[0].value) == 10);
    CHECK(std::get<std::vector<std::string>>(*groups[0].rules[1].value).size() == 2);
    CHECK_FALSE(groups[0].rules[2].value.has_value());

    const auto where = render_where(groups);
    CHECK(where.sql == R"(("score" > $1 OR "tags" = ANY($2) OR ("note" IS NULL OR "note" = '')))");
}

TEST_CASE("Filter: JSON structural errors", "[filter][json][error]") {
    using nlohmann::json;
    CHECK_THROWS_AS(parse_filter_groups(json::object()), MalformedRuleError);
    CHECK_THROWS_AS(parse_filter_groups(json::parse(R"([{"logic": "XOR"}])")), MalformedRuleError);
    CHECK_THROWS_AS(parse_filter_groups(json::parse(R"([{"rules": [{"property": "a"}]}])")),
                    MalformedRuleError);
    CHECK_THROWS_AS(parse_filter_groups(json::parse(R"([{"rules": [{"property": "a", "operator": "near"}]}])")),
                    UnsupportedOperatorError);
}
