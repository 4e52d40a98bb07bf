#include <catch2/catch_test_macros.hpp>
#include "schema/schema_manager.hpp"
#include "core/error.hpp"

using namespace relsync;

namespace {

TableSpec people_spec() {
    TableSpec spec;
    spec.schema = "crm";
    spec.table = "People";
    spec.columns = {
        {"primary_key_id", "UUID", true},
        {"Name", "VARCHAR(255)"},
        {"Tags", "TEXT[]"},
    };
    return spec;
}

JoinTableSpec deals_people() {
    JoinTableSpec spec;
    spec.table_name = "crm_Deals_People";
    spec.schema = "crm";
    spec.join_schema = "Join";
    spec.column1_name = "Deals_id";
    spec.column1_table = "Deals";
    spec.column2_name = "People_id";
    spec.column2_table = "People";
    return spec;
}

} // anonymous namespace

TEST_CASE("SchemaManager: table DDL is idempotent and additive", "[schema]") {
    const auto ddl = SchemaManager::table_ddl(people_spec());

    REQUIRE(ddl.size() == 4);
    CHECK(ddl[0] == R"(CREATE SCHEMA IF NOT EXISTS "crm")");
    CHECK(ddl[1] == R"(CREATE TABLE IF NOT EXISTS "crm"."People" ("primary_key_id" UUID, "Name" VARCHAR(255), "Tags" TEXT[], PRIMARY KEY ("primary_key_id")))");
    CHECK(ddl[2] == R"(ALTER TABLE "crm"."People" ADD COLUMN IF NOT EXISTS "Name" VARCHAR(255))");
    CHECK(ddl[3] == R"(ALTER TABLE "crm"."People" ADD COLUMN IF NOT EXISTS "Tags" TEXT[])");
}

TEST_CASE("SchemaManager: join table references both entity tables", "[schema][join]") {
    const auto ddl = SchemaManager::join_table_ddl(deals_people(), "primary_key_id");

    REQUIRE(ddl.size() == 2);
    CHECK(ddl[0] == R"(CREATE SCHEMA IF NOT EXISTS "Join")");
    CHECK(ddl[1] ==
          R"(CREATE TABLE IF NOT EXISTS "Join"."crm_Deals_People" ()"
          R"("Deals_id" UUID NOT NULL REFERENCES "crm"."Deals" ("primary_key_id") ON DELETE CASCADE, )"
          R"("People_id" UUID NOT NULL REFERENCES "crm"."People" ("primary_key_id") ON DELETE CASCADE, )"
          R"(PRIMARY KEY ("Deals_id", "People_id")))");
}

TEST_CASE("SchemaManager: join table with identical column names is rejected", "[schema][join][error]") {
    auto spec = deals_people();
    spec.column2_name = spec.column1_name;
    CHECK_THROWS_AS(SchemaManager::join_table_ddl(spec, "primary_key_id"), SchemaDefinitionError);

    auto unnamed = deals_people();
    unnamed.table_name = "  ";
    CHECK_THROWS_AS(SchemaManager::join_table_ddl(unnamed, "primary_key_id"), SchemaDefinitionError);
}

TEST_CASE("SchemaManager: invalid table specs are rejected", "[schema][error]") {
    auto duplicate = people_spec();
    duplicate.columns.push_back({"Name", "TEXT"});
    CHECK_THROWS_AS(SchemaManager::validate(duplicate), SchemaDefinitionError);

    auto no_columns = people_spec();
    no_columns.columns.clear();
    CHECK_THROWS_AS(SchemaManager::validate(no_columns), SchemaDefinitionError);

    auto injected = people_spec();
    injected.columns.push_back({"Evil", "TEXT; DROP TABLE x"});
    CHECK_THROWS_AS(SchemaManager::table_ddl(injected), SchemaDefinitionError);

    auto unnamed = people_spec();
    unnamed.table.clear();
    CHECK_THROWS_AS(SchemaManager::validate(unnamed), SchemaDefinitionError);
}

TEST_CASE("SchemaManager: type fragments", "[schema]") {
    CHECK(SchemaManager::is_valid_type("VARCHAR(255)"));
    CHECK(SchemaManager::is_valid_type("TEXT[]"));
    CHECK(SchemaManager::is_valid_type("NUMERIC(10, 2)"));
    CHECK(SchemaManager::is_valid_type("DOUBLE PRECISION"));
    CHECK_FALSE(SchemaManager::is_valid_type(""));
    CHECK_FALSE(SchemaManager::is_valid_type("TEXT -- comment"));
    CHECK_FALSE(SchemaManager::is_valid_type("TEXT\"x"));
}

TEST_CASE("SchemaManager: catalog queries are parameterized", "[schema]") {
    const auto tables = SchemaManager::list_tables_query("crm");
    CHECK(tables.sql.find("information_schema.tables") != std::string::npos);
    REQUIRE(tables.params.size() == 1);
    CHECK(std::get<std::string>(tables.params[0]) == "crm");

    const auto columns = SchemaManager::table_columns_query("crm", "People");
    CHECK(columns.sql.find("ORDER BY ordinal_position") != std::string::npos);
    CHECK(columns.params.size() == 2);
}

TEST_CASE("SchemaManager: loose table name lookup", "[schema][lookup]") {
    const std::vector<std::string> tables{"Deals", "Contact People", "project_tasks"};

    CHECK(find_table_name("Deals", tables) == "Deals");
    CHECK(find_table_name("contactpeople", tables) == "Contact People");
    CHECK(find_table_name("Project Tasks", tables) == "project_tasks");
    CHECK(find_table_name("tasks", tables) == "project_tasks");
    CHECK(find_table_name("all deals", tables) == "Deals");
    CHECK_FALSE(find_table_name("invoices", tables).has_value());
    CHECK_FALSE(find_table_name("anything", {}).has_value());
}
