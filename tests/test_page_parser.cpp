#include <catch2/catch_test_macros.hpp>
#include "source/page_parser.hpp"
#include "core/error.hpp"
#include "mocks/notion_fixtures.hpp"

#include <algorithm>

using namespace relsync;
using namespace relsync::testing::fixtures;

namespace {

const std::string kDealsDb = "1a2b3c4d-0000-4000-8000-00000000d001";
const std::string kPeopleDb = "1a2b3c4d-0000-4000-8000-00000000d002";
const std::string kDealPage = "5e6f7a8b-0000-4000-8000-0000000000a1";

const SqlValue& value_of(const PageRow& row, const std::string& column) {
    const auto it = std::find(row.columns.begin(), row.columns.end(), column);
    REQUIRE(it != row.columns.end());
    return row.values.at(static_cast<size_t>(it - row.columns.begin()));
}

bool has_column(const PageRow& row, const std::string& column) {
    return std::find(row.columns.begin(), row.columns.end(), column) != row.columns.end();
}

} // anonymous namespace

TEST_CASE("PageParser: property types map to column types", "[parser]") {
    CHECK(PageParser::sql_type_for("title") == "VARCHAR(255)");
    CHECK(PageParser::sql_type_for("email") == "VARCHAR(255)");
    CHECK(PageParser::sql_type_for("number") == "FLOAT");
    CHECK(PageParser::sql_type_for("checkbox") == "BOOLEAN");
    CHECK(PageParser::sql_type_for("date") == "TIMESTAMP");
    CHECK(PageParser::sql_type_for("last_edited_time") == "TIMESTAMP");
    CHECK(PageParser::sql_type_for("multi_select") == "TEXT[]");
    CHECK(PageParser::sql_type_for("people") == "TEXT[]");
    CHECK(PageParser::sql_type_for("relation").empty());
    CHECK(PageParser::sql_type_for("rollup").empty());
    CHECK(PageParser::sql_type_for("button") == "TEXT");
}

TEST_CASE("PageParser: table spec puts the key first and skips relations", "[parser][schema]") {
    const PageParser parser;
    const auto db = database(kDealsDb, "Deals", {
        {"Name", property_schema("title")},
        {"Amount", property_schema("number")},
        {"Owner", relation_schema(kPeopleDb)},
        {"Total", property_schema("rollup")},
        {"primary_key_id", property_schema("rich_text")},
    });

    const auto spec = parser.table_spec(db, "crm", "Deals");

    CHECK(spec.schema == "crm");
    CHECK(spec.table == "Deals");
    REQUIRE(spec.columns.size() == 3);
    CHECK(spec.columns[0].name == "primary_key_id");
    CHECK(spec.columns[0].type == "UUID");
    CHECK(spec.columns[0].primary_key);
    CHECK(spec.primary_key_columns() == std::vector<std::string>{"primary_key_id"});
}

TEST_CASE("PageParser: scalar properties", "[parser]") {
    const PageParser parser;
    const auto p = page(kDealPage, kDealsDb, {
        {"Name", title_value("Big deal")},
        {"Notes", {{"type", "rich_text"}, {"rich_text", rich_text("ab")}}},
        {"Amount", {{"type", "number"}, {"number", 12.5}}},
        {"Won", {{"type", "checkbox"}, {"checkbox", true}}},
        {"Stage", {{"type", "select"}, {"select", {{"name", "Open"}}}}},
        {"Email", {{"type", "email"}, {"email", "a@b.c"}}},
        {"Close", {{"type", "date"}, {"date", {{"start", "2024-05-01"}, {"end", nullptr}}}}},
        {"Empty", {{"type", "select"}, {"select", nullptr}}},
    });

    const auto row = parser.parse_page(p);

    CHECK(row.id == "5e6f7a8b0000400080000000000000a1");
    CHECK(row.database_id == "1a2b3c4d00004000800000000000d001");
    REQUIRE(row.columns.front() == "primary_key_id");
    CHECK(std::get<std::string>(row.values.front()) == row.id);

    CHECK(std::get<std::string>(value_of(row, "Name")) == "Big deal");
    CHECK(std::get<double>(value_of(row, "Amount")) == 12.5);
    CHECK(std::get<bool>(value_of(row, "Won")));
    CHECK(std::get<std::string>(value_of(row, "Stage")) == "Open");
    CHECK(std::get<std::string>(value_of(row, "Email")) == "a@b.c");
    CHECK(std::get<std::string>(value_of(row, "Close")) == "2024-05-01");
    CHECK(is_null(value_of(row, "Empty")));
    CHECK(row.relations.empty());
}

TEST_CASE("PageParser: list properties become text arrays", "[parser]") {
    const PageParser parser;
    const nlohmann::json people = nlohmann::json::array({
        {{"object", "user"}, {"id", "u1"}, {"name", "Ada"}},
        {{"object", "user"}, {"id", "u2"}},
    });
    const nlohmann::json files = nlohmann::json::array({
        {{"name", "a.pdf"}, {"file", {{"url", "https://files/a.pdf"}}}},
        {{"name", "b"}, {"external", {{"url", "https://ext/b"}}}},
    });
    const nlohmann::json tags = nlohmann::json::array({
        nlohmann::json{{"name", "x"}},
        nlohmann::json{{"name", "y"}},
    });
    const auto p = page(kDealPage, kDealsDb, {
        {"Tags", {{"type", "multi_select"}, {"multi_select", tags}}},
        {"Team", {{"type", "people"}, {"people", people}}},
        {"Docs", {{"type", "files"}, {"files", files}}},
    });

    const auto row = parser.parse_page(p);

    CHECK(std::get<std::vector<std::string>>(value_of(row, "Tags")) == std::vector<std::string>{"x", "y"});
    CHECK(std::get<std::vector<std::string>>(value_of(row, "Team")) == std::vector<std::string>{"Ada", "u2"});
    CHECK(std::get<std::vector<std::string>>(value_of(row, "Docs")) ==
          std::vector<std::string>{"https://files/a.pdf", "https://ext/b"});
}

TEST_CASE("PageParser: formula and unique_id", "[parser]") {
    const PageParser parser;

    CHECK(std::get<double>(parser.property_value(
        {{"type", "formula"}, {"formula", {{"type", "number"}, {"number", 3}}}})) == 3.0);
    CHECK(std::get<std::string>(parser.property_value(
        {{"type", "formula"}, {"formula", {{"type", "string"}, {"string", "hi"}}}})) == "hi");
    CHECK(std::get<std::string>(parser.property_value(
        {{"type", "formula"}, {"formula", {{"type", "date"}, {"date", {{"start", "2024-01-02"}}}}}})) == "2024-01-02");
    CHECK(is_null(parser.property_value(
        {{"type", "formula"}, {"formula", {{"type", "number"}, {"number", nullptr}}}})));

    CHECK(std::get<std::string>(parser.property_value(
        {{"type", "unique_id"}, {"unique_id", {{"prefix", "TASK"}, {"number", 42}}}})) == "TASK_42");
    CHECK(std::get<std::string>(parser.property_value(
        {{"type", "unique_id"}, {"unique_id", {{"prefix", nullptr}, {"number", 7}}}})) == "7");
}

TEST_CASE("PageParser: title text is truncated on code point boundaries", "[parser]") {
    const PageParser parser("primary_key_id", 4);

    // "héllo wörld": é is two bytes
    const auto value = parser.property_value(title_value("h\xC3\xA9llo w\xC3\xB6rld"));
    CHECK(std::get<std::string>(value) == "h\xC3\xA9ll");

    // Rich text is unbounded
    const auto notes = parser.property_value({{"type", "rich_text"}, {"rich_text", rich_text("abcdefgh")}});
    CHECK(std::get<std::string>(notes) == "abcdefgh");
}

TEST_CASE("PageParser: unknown property types are kept as text", "[parser]") {
    const PageParser parser;
    CHECK(std::get<std::string>(parser.property_value({{"type", "button"}, {"button", {{"k", 1}}}})) == R"({"k":1})");
    CHECK(std::get<std::string>(parser.property_value({{"type", "verification"}, {"verification", "verified"}})) == "verified");
    CHECK(is_null(parser.property_value({{"type", "missing"}})));
}

TEST_CASE("PageParser: relations become edges, empty ones become purge edges", "[parser][relation]") {
    const PageParser parser;
    const auto p = page(kDealPage, kDealsDb, {
        {"Owner", relation_value({"AAAA-bbbb", "cccc"})},
        {"Watchers", relation_value({})},
        {"Reviewers", {{"type", "relation"}, {"relation", nullptr}}},
        {"Total", {{"type", "rollup"}, {"rollup", {{"number", 1}}}}},
    });

    const auto row = parser.parse_page(p);

    CHECK_FALSE(has_column(row, "Owner"));
    CHECK_FALSE(has_column(row, "Total"));
    REQUIRE(row.relations.size() == 3);

    const auto& owner = row.relations.at("Owner");
    REQUIRE(owner.size() == 2);
    CHECK(owner[0].record_id == row.id);
    CHECK(owner[0].related_id == "aaaabbbb");
    CHECK_FALSE(owner[0].is_purge());

    for (const char* name : {"Watchers", "Reviewers"}) {
        const auto& edges = row.relations.at(name);
        REQUIRE(edges.size() == 1);
        CHECK(edges[0].is_purge());
        CHECK(edges[0].record_id == row.id);
    }
}

TEST_CASE("PageParser: properties that are not objects are skipped", "[parser]") {
    const PageParser parser;
    const auto p = page(kDealPage, kDealsDb, {
        {"Name", nullptr},
        {"Score", 5},
        {"Tags", nlohmann::json::array()},
        {"Kind", {{"type", 7}}},
        {"Calc", {{"type", "formula"}, {"formula", "oops"}}},
        {"Stage", {{"type", "select"}, {"select", {{"name", "Won"}}}}},
    });

    PageRow row;
    REQUIRE_NOTHROW(row = parser.parse_page(p));

    CHECK_FALSE(has_column(row, "Name"));
    CHECK_FALSE(has_column(row, "Score"));
    CHECK_FALSE(has_column(row, "Tags"));
    CHECK(is_null(value_of(row, "Kind")));
    CHECK(is_null(value_of(row, "Calc")));
    CHECK(std::get<std::string>(value_of(row, "Stage")) == "Won");
    CHECK(row.relations.empty());

    const auto db = database(kDealsDb, "Deals", {
        {"Name", nullptr},
        {"Owner", relation_schema(kPeopleDb)},
        {"Stage", property_schema("select")},
    });
    const auto spec = parser.table_spec(db, "crm", "Deals");
    REQUIRE(spec.columns.size() == 2);
    CHECK(spec.columns[1].name == "Stage");
    CHECK(PageParser::relation_targets(db).size() == 1);
}

TEST_CASE("PageParser: page without id is a source error", "[parser][error]") {
    const PageParser parser;
    CHECK_THROWS_AS(parser.parse_page({{"object", "page"}}), SourceError);
    CHECK_THROWS_AS(parser.parse_page({{"id", ""}}), SourceError);
}

TEST_CASE("PageParser: descriptor helpers", "[parser]") {
    const auto db = database(kDealsDb, "Deals", {
        {"Owner", relation_schema(kPeopleDb)},
        {"Broken", {{"type", "relation"}, {"relation", nlohmann::json::object()}}},
        {"Name", property_schema("title")},
    });

    CHECK(PageParser::database_title(db) == "Deals");
    CHECK_FALSE(PageParser::database_title(database(kDealsDb, "", nlohmann::json::object())).has_value());

    const auto targets = PageParser::relation_targets(db);
    REQUIRE(targets.size() == 1);
    CHECK(targets.at("Owner") == "1a2b3c4d00004000800000000000d002");

    CHECK(PageParser::parent_database_id(page(kDealPage, kDealsDb, nlohmann::json::object())) ==
          "1a2b3c4d00004000800000000000d001");
    CHECK_FALSE(PageParser::parent_database_id({{"parent", {{"type", "workspace"}}}}).has_value());
}
