#include <catch2/catch_test_macros.hpp>
#include "crud/param_preparer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <limits>

using namespace pgcrud;

namespace {

ParamPreparer make_preparer() {
    return ParamPreparer([](const std::vector<uint8_t>& data) {
        return "\\x" + utils::bytes_to_hex(data);
    });
}

} // namespace

TEST_CASE("ParamPreparer: placeholders follow parameter count", "[param_preparer]") {
    auto preparer = make_preparer();

    CHECK(preparer.prepare("a", SemanticType::TEXT) == "$1");
    CHECK(preparer.prepare(2, SemanticType::INT) == "$2");
    CHECK(preparer.prepare(Value(), SemanticType::TEXT) == "NULL");
    CHECK(preparer.prepare("b", SemanticType::TEXT) == "$3");

    REQUIRE(preparer.size() == 3);
    CHECK(preparer.params()[0] == "a");
    CHECK(preparer.params()[1] == "2");
    CHECK(preparer.params()[2] == "b");
}

TEST_CASE("ParamPreparer: bool", "[param_preparer]") {
    SECTION("truthy tokens are case-insensitive") {
        auto preparer = make_preparer();
        CHECK(preparer.prepare("YES", SemanticType::BOOL) == "$1");
        CHECK(preparer.prepare("On", SemanticType::BOOL) == "$2");
        CHECK(preparer.prepare("t", SemanticType::BOOL) == "$3");
        CHECK(preparer.params() == ParamList{"t", "t", "t"});
    }

    SECTION("other strings are false") {
        auto preparer = make_preparer();
        CHECK(preparer.prepare("no", SemanticType::BOOL) == "$1");
        CHECK(preparer.prepare("maybe", SemanticType::BOOL) == "$2");
        CHECK(preparer.params() == ParamList{"f", "f"});
    }

    SECTION("empty string is absent") {
        auto preparer = make_preparer();
        CHECK(preparer.prepare("", SemanticType::BOOL) == "NULL");
        CHECK(preparer.size() == 0);
    }

    SECTION("non-string values use truthiness") {
        auto preparer = make_preparer();
        CHECK(preparer.prepare(0, SemanticType::BOOL) == "$1");
        CHECK(preparer.prepare(true, SemanticType::BOOL) == "$2");
        CHECK(preparer.prepare(5, SemanticType::BOOL) == "$3");
        CHECK(preparer.params() == ParamList{"f", "t", "t"});
    }
}

TEST_CASE("ParamPreparer: date", "[param_preparer]") {
    auto preparer = make_preparer();

    CHECK(preparer.prepare("current_timestamp", SemanticType::DATE) == "current_timestamp");
    CHECK(preparer.prepare("CURRENT_DATE", SemanticType::DATE) == "CURRENT_DATE");
    CHECK(preparer.size() == 0);

    CHECK(preparer.prepare("2024-01-01", SemanticType::DATE) == "$1");
    CHECK(preparer.params()[0] == "2024-01-01");

    CHECK(preparer.prepare("", SemanticType::DATE) == "NULL");
    CHECK(preparer.size() == 1);
}

TEST_CASE("ParamPreparer: numeric classes keep zero", "[param_preparer]") {
    auto preparer = make_preparer();

    CHECK(preparer.prepare(0, SemanticType::INT) == "$1");
    CHECK(preparer.prepare(0.0, SemanticType::FLOAT) == "$2");
    CHECK(preparer.prepare("", SemanticType::NUM) == "NULL");
    CHECK(preparer.prepare("12.50", SemanticType::MONEY) == "$3");
    CHECK(preparer.prepare(false, SemanticType::INT) == "$4");

    REQUIRE(preparer.size() == 4);
    CHECK(preparer.params()[0] == "0");
    CHECK(preparer.params()[2] == "12.50");
    CHECK(preparer.params()[3] == "0");
}

TEST_CASE("ParamPreparer: non-finite floats use server spellings", "[param_preparer]") {
    auto preparer = make_preparer();

    CHECK(preparer.prepare(std::numeric_limits<double>::quiet_NaN(), SemanticType::FLOAT) == "$1");
    CHECK(preparer.prepare(std::numeric_limits<double>::infinity(), SemanticType::FLOAT) == "$2");
    CHECK(preparer.prepare(-std::numeric_limits<double>::infinity(), SemanticType::FLOAT) == "$3");
    CHECK(preparer.prepare(1.5, SemanticType::FLOAT) == "$4");

    CHECK(preparer.params() == ParamList{"NaN", "Infinity", "-Infinity", "1.5"});
    CHECK(ParamPreparer::to_text(std::numeric_limits<double>::quiet_NaN()) == "NaN");
}

TEST_CASE("ParamPreparer: bytea goes through the escaper", "[param_preparer]") {
    auto preparer = make_preparer();

    CHECK(preparer.prepare(Value::binary(std::vector<uint8_t>{0xde, 0xad}), SemanticType::BYTEA) == "$1");
    CHECK(preparer.prepare("AB", SemanticType::BYTEA) == "$2");
    CHECK(preparer.params() == ParamList{"\\xdead", "\\x4142"});

    CHECK_THROWS_AS(preparer.prepare(42, SemanticType::BYTEA), ValidationError);
}

TEST_CASE("ParamPreparer: json is encoded", "[param_preparer]") {
    auto preparer = make_preparer();

    CHECK(preparer.prepare(Value{{"a", 1}}, SemanticType::JSON) == "$1");
    CHECK(preparer.prepare("x", SemanticType::JSON) == "$2");
    CHECK(preparer.params() == ParamList{R"({"a":1})", R"("x")"});
}

TEST_CASE("ParamPreparer: null is absent for every class", "[param_preparer]") {
    auto preparer = make_preparer();
    for (auto type : {SemanticType::BOOL, SemanticType::DATE, SemanticType::INT,
                      SemanticType::BYTEA, SemanticType::JSON, SemanticType::TEXT}) {
        CHECK(preparer.prepare(Value(), type) == "NULL");
    }
    CHECK(preparer.size() == 0);
}

TEST_CASE("ParamPreparer: text rendering of non-strings", "[param_preparer]") {
    CHECK(ParamPreparer::to_text(42) == "42");
    CHECK(ParamPreparer::to_text(true) == "true");
    CHECK(ParamPreparer::to_text("abc") == "abc");
    CHECK(ParamPreparer::to_text(Value::binary(std::vector<uint8_t>{0x01, 0xff})) == "\\x01ff");
}

TEST_CASE("ParamPreparer: take empties the list", "[param_preparer]") {
    auto preparer = make_preparer();
    (void)preparer.prepare("a", SemanticType::TEXT);

    const ParamList taken = preparer.take();
    CHECK(taken.size() == 1);
    CHECK(preparer.size() == 0);
}

TEST_CASE("describe_params: readable rendering", "[param_preparer]") {
    CHECK(describe_params({}).empty());
    CHECK(describe_params({"a", std::nullopt, "it's"}) == R"($1='a', $2=NULL, $3='it\'s')");
    CHECK(describe_params({std::string("\x01")}) == R"($1='\x01')");

    const std::string long_value(100, 'x');
    const std::string described = describe_params({long_value});
    CHECK(described.size() < long_value.size());
    CHECK(described.ends_with("...'"));
}
