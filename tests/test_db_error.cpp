#include <catch2/catch_test_macros.hpp>
#include "db/db_error.hpp"
#include "core/error.hpp"

using namespace relsync;

namespace {

DbResultSet failed(std::string sqlstate, std::string message, std::string detail = "") {
    DbResultSet rs;
    rs.success = false;
    rs.sqlstate = std::move(sqlstate);
    rs.error_message = std::move(message);
    rs.error_detail = std::move(detail);
    return rs;
}

} // anonymous namespace

TEST_CASE("DbError: foreign key detail is parsed", "[db_error]") {
    ForeignKeyDetail fk;
    REQUIRE(parse_foreign_key_detail(
        R"(Key (People_id)=(5c1e4f0a-0000-4000-8000-000000000001) is not present in table "People".)", fk));
    CHECK(fk.column == "People_id");
    CHECK(fk.value == "5c1e4f0a-0000-4000-8000-000000000001");
    CHECK(fk.table == "People");

    ForeignKeyDetail none;
    CHECK_FALSE(parse_foreign_key_detail("something else entirely", none));
}

TEST_CASE("DbError: SQLSTATE classes map to typed errors", "[db_error]") {
    CHECK_THROWS_AS(throw_db_error(failed("08006", "connection lost"), "SELECT"), ConnectionError);
    CHECK_THROWS_AS(throw_db_error(failed("08001", "refused"), "SELECT"), ConnectionError);
    CHECK_THROWS_AS(throw_db_error(failed("42P01", "relation does not exist"), "SELECT"), UndefinedTableError);
    CHECK_THROWS_AS(throw_db_error(failed("3F000", "schema does not exist"), "SELECT"), UndefinedTableError);
    CHECK_THROWS_AS(throw_db_error(failed("42703", "column does not exist"), "SELECT"), UndefinedColumnError);
    CHECK_THROWS_AS(throw_db_error(failed("23505", "duplicate key"), "INSERT"), DatabaseError);
}

TEST_CASE("DbError: schema drift errors are database errors with their state", "[db_error]") {
    try {
        throw_db_error(failed("42P01", "relation \"crm.Deals\" does not exist\n"), "SELECT from crm.Deals");
        FAIL("expected UndefinedTableError");
    } catch (const DatabaseError& e) {
        CHECK(e.kind() == ErrorKind::UNDEFINED_TABLE);
        CHECK(e.sqlstate() == "42P01");
        CHECK(std::string(e.what()) == "SELECT from crm.Deals: relation \"crm.Deals\" does not exist");
    }
}

TEST_CASE("DbError: foreign key violation carries the missing key", "[db_error]") {
    const auto result = failed(
        "23503",
        "insert or update on table \"j\" violates foreign key constraint",
        R"(Key (People_id)=(abc) is not present in table "People".)");

    try {
        throw_db_error(result, "INSERT into Join.j");
        FAIL("expected ForeignKeyViolationError");
    } catch (const ForeignKeyViolationError& e) {
        CHECK(e.kind() == ErrorKind::FOREIGN_KEY_VIOLATION);
        CHECK(e.sqlstate() == "23503");
        CHECK(e.key_column() == "People_id");
        CHECK(e.key_value() == "abc");
        CHECK(e.referenced_table() == "People");
    }
}

TEST_CASE("DbError: unparseable foreign key detail still classifies", "[db_error]") {
    try {
        throw_db_error(failed("23503", "fk violation", "garbled"), "");
        FAIL("expected ForeignKeyViolationError");
    } catch (const ForeignKeyViolationError& e) {
        CHECK(e.key_value().empty());
        CHECK(std::string(e.what()) == "fk violation");
    }
}

TEST_CASE("DbError: check_result passes successes through", "[db_error]") {
    DbResultSet ok;
    ok.success = true;
    ok.affected_rows = 3;
    CHECK(check_result(ok, "UPDATE").affected_rows == 3);
    CHECK_THROWS_AS(check_result(failed("XX000", "internal"), "UPDATE"), DatabaseError);
}

TEST_CASE("DbError: error kinds have stable names", "[db_error]") {
    CHECK(std::string(error_kind_to_string(ErrorKind::UNRESOLVABLE_FOREIGN_KEY)) == "UNRESOLVABLE_FOREIGN_KEY");
    CHECK(std::string(error_kind_to_string(ErrorKind::UNDEFINED_COLUMN)) == "UNDEFINED_COLUMN");
}
