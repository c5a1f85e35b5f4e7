#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <string>

using namespace auditpipe;

TEST_CASE("utils: generate_uuid has the v4 layout", "[utils]") {
    const std::string id = utils::generate_uuid();
    REQUIRE(id.size() == 36);
    CHECK(id[8] == '-');
    CHECK(id[13] == '-');
    CHECK(id[14] == '4');
    CHECK(id[18] == '-');
    CHECK(id[23] == '-');
    CHECK(utils::generate_uuid() != id);
}

TEST_CASE("utils: format_timestamp renders UTC with milliseconds", "[utils]") {
    const auto tp = std::chrono::sys_days{std::chrono::year{2026} / 3 / 1} +
                    std::chrono::hours{8} + std::chrono::minutes{15} +
                    std::chrono::seconds{30} + std::chrono::milliseconds{250};
    CHECK(utils::format_timestamp(tp) == "2026-03-01T08:15:30.250Z");
}

TEST_CASE("utils: parse_timestamp accepts the common ISO-8601 forms", "[utils]") {
    const auto base = utils::parse_timestamp("2026-03-01T08:15:30Z");
    REQUIRE(base.has_value());

    SECTION("fractional seconds") {
        const auto tp = utils::parse_timestamp("2026-03-01T08:15:30.250Z");
        REQUIRE(tp.has_value());
        CHECK(*tp - *base == std::chrono::milliseconds{250});
    }

    SECTION("zone offset") {
        const auto tp = utils::parse_timestamp("2026-03-01T02:15:30-06:00");
        REQUIRE(tp.has_value());
        CHECK(*tp == *base);
    }

    SECTION("date only is midnight UTC") {
        const auto tp = utils::parse_timestamp("2026-03-01");
        REQUIRE(tp.has_value());
        CHECK(*base - *tp == std::chrono::hours{8} + std::chrono::minutes{15} + std::chrono::seconds{30});
    }

    SECTION("space separator, no zone") {
        const auto tp = utils::parse_timestamp("2026-03-01 08:15:30");
        REQUIRE(tp.has_value());
        CHECK(*tp == *base);
    }
}

TEST_CASE("utils: parse_timestamp rejects garbage", "[utils]") {
    CHECK_FALSE(utils::parse_timestamp("").has_value());
    CHECK_FALSE(utils::parse_timestamp("yesterday").has_value());
    CHECK_FALSE(utils::parse_timestamp("2026-13-01").has_value());
    CHECK_FALSE(utils::parse_timestamp("2026-02-30").has_value());
    CHECK_FALSE(utils::parse_timestamp("2026-03-01T08:15:30Q").has_value());
}

TEST_CASE("utils: timestamp formatting survives a parse", "[utils]") {
    const auto tp = utils::parse_timestamp("2024-02-29T23:59:59.999Z");
    REQUIRE(tp.has_value());
    CHECK(utils::format_timestamp(*tp) == "2024-02-29T23:59:59.999Z");
}

TEST_CASE("utils: numeric parsing", "[utils]") {
    CHECK(utils::parse_int<int>("42") == 42);
    CHECK(utils::parse_int<int>("42x", -1) == -1);
    CHECK_FALSE(utils::try_parse_int<size_t>("").has_value());
    CHECK(utils::try_parse_double("1.5").value() == 1.5);
    CHECK_FALSE(utils::try_parse_double("1.5.2").has_value());
}

TEST_CASE("utils: hex helpers", "[utils]") {
    const uint8_t raw[] = {0x00, 0xab, 0xff};
    CHECK(utils::bytes_to_hex(raw, 3) == "00abff");
    CHECK(utils::hex_to_bytes("00abff") == std::vector<uint8_t>{0x00, 0xab, 0xff});
    CHECK(utils::hex_to_bytes("abc").empty());
    CHECK(utils::hex_to_bytes("zz").empty());
}

TEST_CASE("utils: string helpers", "[utils]") {
    CHECK(utils::to_lower("CreditScore") == "creditscore");
    CHECK(utils::trim("  a b \n") == "a b");
    CHECK(utils::trim("   ").empty());
    const auto parts = utils::split("KYC,LOGIN,,TRANSFER", ',');
    REQUIRE(parts.size() == 4);
    CHECK(parts[2].empty());
    CHECK(parts[3] == "TRANSFER");
}

TEST_CASE("base64: known vectors", "[utils]") {
    const std::string text = "foobar";
    CHECK(base64::encode(reinterpret_cast<const uint8_t*>(text.data()), text.size()) == "Zm9vYmFy");
    CHECK(base64::encode(reinterpret_cast<const uint8_t*>(text.data()), 4) == "Zm9vYg==");

    const auto decoded = base64::decode("Zm9vYg==");
    REQUIRE(decoded.has_value());
    CHECK(std::string(decoded->begin(), decoded->end()) == "foob");

    const auto one_pad = base64::decode("Zm9vYmE=");
    REQUIRE(one_pad.has_value());
    CHECK(one_pad->size() == 5);

    CHECK(base64::encode(nullptr, 0).empty());
    CHECK(base64::decode("")->empty());
}

TEST_CASE("base64: malformed input is rejected", "[utils]") {
    CHECK_FALSE(base64::decode("Zm9").has_value());
    CHECK_FALSE(base64::decode("Zm9v!!==").has_value());
}

TEST_CASE("JsonValue: equality is strict about types", "[utils][json]") {
    CHECK(JsonValue(1) == JsonValue(1.0));
    CHECK_FALSE(JsonValue(1) == JsonValue("1"));
    CHECK_FALSE(JsonValue(true) == JsonValue(1));
    CHECK(JsonValue() == JsonValue(nullptr));
    CHECK_FALSE(JsonValue() == JsonValue(""));

    JsonValue a = JsonValue::object();
    a.set("x", 1);
    a.set("y", "two");
    JsonValue b = JsonValue::object();
    b.set("y", "two");
    b.set("x", 1);
    CHECK(a == b);
    b.set("z", false);
    CHECK_FALSE(a == b);
}

TEST_CASE("JsonValue: lookups on absent keys do not insert", "[utils][json]") {
    JsonValue obj = JsonValue::object();
    CHECK(obj["missing"].is_null());
    CHECK(obj.size() == 0);
    CHECK(obj.value("missing", std::string("fallback")) == "fallback");
}

TEST_CASE("JsonValue: display strings", "[utils][json]") {
    CHECK(JsonValue(750).to_display_string() == "750");
    CHECK(JsonValue(1.5).to_display_string() == "1.5");
    CHECK(JsonValue(true).to_display_string() == "true");
    CHECK(JsonValue("abc").to_display_string() == "abc");
    CHECK(JsonValue().to_display_string() == "null");
}

TEST_CASE("JsonValue: parse rejects malformed input", "[utils][json]") {
    CHECK_THROWS_AS(JsonValue::parse("{\"a\":"), JsonValue::parse_error);
    const auto v = JsonValue::parse(R"({"a":[1,2,{"b":"c"}]})");
    CHECK(v["a"][2]["b"].get<std::string>() == "c");
}
