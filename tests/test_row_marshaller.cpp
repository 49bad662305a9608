#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "crud/row_marshaller.hpp"
#include "mocks/mock_connection.hpp"

using namespace pgcrud;
using pgcrud::testing::MockConnection;

namespace {

RowMarshaller make_marshaller(MockConnection& conn) {
    return RowMarshaller([&conn](std::string_view text) { return conn.unescape_bytea(text); });
}

AttributeMap typed_attrs() {
    AttributeMap attrs;
    attrs.add(Attribute("id", "int", SemanticType::INT));
    attrs.add(Attribute("ok", "bool", SemanticType::BOOL));
    attrs.add(Attribute("ratio", "float", SemanticType::FLOAT));
    attrs.add(Attribute("price", "num", SemanticType::NUM));
    attrs.add(Attribute("day", "date", SemanticType::DATE));
    attrs.add(Attribute("blob", "bytea", SemanticType::BYTEA));
    attrs.add(Attribute("doc", "json", SemanticType::JSON));
    attrs.add(Attribute("note", "text", SemanticType::TEXT));
    return attrs;
}

} // namespace

TEST_CASE("RowMarshaller: values decoded by semantic type", "[row_marshaller]") {
    MockConnection conn;
    const auto marshaller = make_marshaller(conn);

    const auto result = MockConnection::rows(
        {"id", "ok", "ratio", "price", "day", "blob", "doc", "note"},
        {{"42", "t", "0.25", "12.50", "2024-01-01", "\\x0102", R"({"k":[1,2]})", "hello"}});

    const Record record = marshaller.to_record(result, 0, typed_attrs(), "items");

    CHECK(record.at("id") == 42);
    CHECK(record.at("ok") == true);
    CHECK_THAT(record.at("ratio").get<double>(), Catch::Matchers::WithinAbs(0.25, 1e-9));
    CHECK(record.at("price") == "12.50");
    CHECK(record.at("day") == "2024-01-01");
    REQUIRE(record.at("blob").is_binary());
    const auto& blob = record.at("blob").get_binary();
    CHECK(std::vector<uint8_t>(blob.begin(), blob.end()) == std::vector<uint8_t>{0x01, 0x02});
    CHECK(record.at("doc")["k"][1] == 2);
    CHECK(record.at("note") == "hello");
}

TEST_CASE("RowMarshaller: NULL becomes null", "[row_marshaller]") {
    MockConnection conn;
    const auto marshaller = make_marshaller(conn);

    const auto result = MockConnection::rows({"id", "blob"}, {{std::nullopt, std::nullopt}});
    const Record record = marshaller.to_record(result, 0, typed_attrs(), "items");

    CHECK(record.at("id").is_null());
    CHECK(record.at("blob").is_null());
}

TEST_CASE("RowMarshaller: unparsable values stay text", "[row_marshaller]") {
    MockConnection conn;
    const auto marshaller = make_marshaller(conn);

    CHECK(marshaller.decode("9223372036854775808000", SemanticType::INT) == "9223372036854775808000");
    CHECK(marshaller.decode("{broken", SemanticType::JSON) == "{broken");
    CHECK(marshaller.decode("f", SemanticType::BOOL) == false);
    CHECK(marshaller.decode("x", SemanticType::BOOL) == "x");
}

TEST_CASE("RowMarshaller: unknown columns pass through as text", "[row_marshaller]") {
    MockConnection conn;
    const auto marshaller = make_marshaller(conn);

    const auto result = MockConnection::rows({"computed"}, {{"17"}});
    const Record record = marshaller.to_record(result, 0, typed_attrs(), "items");
    CHECK(record.at("computed") == "17");
}

TEST_CASE("RowMarshaller: oid column is renamed", "[row_marshaller]") {
    MockConnection conn;
    const auto marshaller = make_marshaller(conn);

    AttributeMap attrs;
    attrs.add(Attribute("oid", "int", SemanticType::INT));
    attrs.add(Attribute("name", "text", SemanticType::TEXT));

    const auto result = MockConnection::rows({"oid", "name"}, {{"16384", "a"}});

    Record record = {{"name", "old"}, {"extra", 1}};
    marshaller.merge_row(result, 0, attrs, "legacy", record);

    CHECK(record.at("oid(legacy)") == 16384);
    CHECK_FALSE(record.contains("oid"));
    CHECK(record.at("name") == "a");
    CHECK(record.at("extra") == 1);
}

TEST_CASE("RowMarshaller: out of range row leaves the record alone", "[row_marshaller]") {
    MockConnection conn;
    const auto marshaller = make_marshaller(conn);

    Record record = {{"name", "kept"}};
    marshaller.merge_row(MockConnection::rows({"name"}, {}), 0, typed_attrs(), "items", record);
    CHECK(record.size() == 1);
    CHECK(record.at("name") == "kept");
}
