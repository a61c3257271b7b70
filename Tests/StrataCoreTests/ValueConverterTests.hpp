#pragma once

#include "TestModels.hpp"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <ratio>
#include <nlohmann/json.hpp>

namespace value_converter_tests {

using namespace strata;

// ============================================================================
// test_column_type_lattice: SQL names both ways
// ============================================================================

void test_column_type_lattice() {
    std::cout << "  test_column_type_lattice..." << std::flush;

    assert(sql_type(column_type::text) == "TEXT");
    assert(sql_type(column_type::integer) == "INTEGER");
    assert(sql_type(column_type::real) == "REAL");
    assert(sql_type(column_type::double_precision) == "DOUBLE");
    assert(sql_type(column_type::numeric) == "NUMERIC");
    assert(sql_type(column_type::boolean) == "BOOLEAN");
    assert(sql_type(column_type::date) == "DATETIME");
    assert(sql_type(column_type::blob) == "BLOB");
    assert(sql_type(column_type::any) == "ANY");

    assert(column_type_from_sql("integer") == column_type::integer);
    assert(column_type_from_sql("DATETIME") == column_type::date);
    assert(column_type_from_sql("double precision") == column_type::double_precision);
    assert(column_type_from_sql("NUMERIC(10,2)") == column_type::numeric);
    assert(column_type_from_sql("Boolean") == column_type::boolean);
    assert(column_type_from_sql("blob") == column_type::blob);
    assert(column_type_from_sql("ANY") == column_type::any);

    // Unknown declarations fall back to TEXT
    assert(column_type_from_sql("VARCHAR(32)") == column_type::text);
    assert(column_type_from_sql("") == column_type::text);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_infer_type: natural column type of host values
// ============================================================================

void test_infer_type() {
    std::cout << "  test_infer_type..." << std::flush;

    auto check = [](type_inference got, column_type type, bool optional) {
        assert(got.type == type);
        assert(got.is_optional == optional);
    };

    check(infer_type(std::string("a")), column_type::text, false);
    check(infer_type(42), column_type::integer, false);
    check(infer_type(int64_t{42}), column_type::integer, false);
    check(infer_type(1.5f), column_type::real, false);
    check(infer_type(1.5), column_type::double_precision, false);
    check(infer_type(true), column_type::boolean, false);
    check(infer_type(timestamp_t{}), column_type::date, false);
    check(infer_type(blob_t{1, 2}), column_type::blob, false);
    check(infer_type(std::vector<std::string>{"x"}), column_type::text, false);
    check(infer_type(std::map<std::string, int>{}), column_type::text, false);
    check(infer_type(Address{"Main St", "Springfield", 12345}), column_type::text, false);

    check(infer_type(std::optional<int>{}), column_type::text, true);
    check(infer_type(std::optional<int>{5}), column_type::integer, true);

    // Raw values
    check(infer_type(storage_value{nullptr}), column_type::text, true);
    check(infer_type(storage_value{int64_t{1}}), column_type::integer, false);
    check(infer_type(storage_value{structured_text{"[]"}}), column_type::text, false);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_to_storage_value: host value into a declared column type
// ============================================================================

void test_to_storage_value() {
    std::cout << "  test_to_storage_value..." << std::flush;

    auto text = to_storage_value(std::string("hello"), column_type::text, false);
    assert(std::get<std::string>(text) == "hello");

    auto integer = to_storage_value(42, column_type::integer, false);
    assert(std::get<int64_t>(integer) == 42);

    // Integers widen into REAL/DOUBLE columns
    auto widened = to_storage_value(42, column_type::real, false);
    assert(std::get<double>(widened) == 42.0);

    // NUMERIC keeps the host's numeric family
    assert(std::holds_alternative<int64_t>(to_storage_value(7, column_type::numeric, false)));
    assert(std::holds_alternative<double>(to_storage_value(7.5, column_type::numeric, false)));

    assert(std::get<bool>(to_storage_value(true, column_type::boolean, false)) == true);

    auto when = timestamp_from_seconds(1700000000.5);
    assert(std::get<timestamp_t>(to_storage_value(when, column_type::date, false)) == when);

    blob_t bytes{0xDE, 0xAD, 0xBE, 0xEF};
    assert(std::get<blob_t>(to_storage_value(bytes, column_type::blob, false)) == bytes);

    // Scalars rendered into TEXT columns
    assert(std::get<std::string>(to_storage_value(42, column_type::text, false)) == "42");
    assert(std::get<std::string>(to_storage_value(false, column_type::text, false)) == "false");
    assert(std::get<std::string>(to_storage_value(2.5, column_type::text, false)) == "2.5");
    assert(std::get<std::string>(to_storage_value(bytes, column_type::text, false)) == "3q2+7w==");

    // Absent optional in a nullable column
    auto absent = to_storage_value(std::optional<int>{}, column_type::integer, true);
    assert(is_null(absent));

    auto present = to_storage_value(std::optional<int>{9}, column_type::integer, true);
    assert(std::get<int64_t>(present) == 9);

    // ANY passes the natural representation through
    assert(std::get<double>(to_storage_value(3.25, column_type::any, false)) == 3.25);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_to_storage_value_errors: incompatible or missing values
// ============================================================================

void test_to_storage_value_errors() {
    std::cout << "  test_to_storage_value_errors..." << std::flush;

    bool threw = false;
    try {
        to_storage_value(std::optional<int>{}, column_type::integer, false);
    } catch (const value_conversion_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        to_storage_value(std::string("abc"), column_type::integer, false);
    } catch (const value_conversion_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        to_storage_value(1, column_type::boolean, false);
    } catch (const value_conversion_error& e) {
        // Still a db_error
        const db_error& base = e;
        assert(std::string(base.what()).size() > 0);
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        to_storage_value(storage_value{std::string("x")}, column_type::blob, false);
    } catch (const value_conversion_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_primitive_round_trip: to_storage_value then from_storage_value
// ============================================================================

void test_primitive_round_trip() {
    std::cout << "  test_primitive_round_trip..." << std::flush;

    std::string s = "round trip";
    assert(from_storage_value<std::string>(to_storage_value(s, column_type::text, false)) == s);

    int64_t big = 9007199254740993LL;
    assert(from_storage_value<int64_t>(to_storage_value(big, column_type::integer, false)) == big);

    double d = 3.141592653589793;
    assert(from_storage_value<double>(to_storage_value(d, column_type::double_precision, false)) == d);

    float f = 0.1f;
    assert(from_storage_value<float>(to_storage_value(f, column_type::real, false)) == f);

    assert(from_storage_value<bool>(to_storage_value(true, column_type::boolean, false)) == true);
    assert(from_storage_value<bool>(to_storage_value(false, column_type::boolean, false)) == false);

    auto when = timestamp_from_seconds(1700000000.123);
    assert(from_storage_value<timestamp_t>(to_storage_value(when, column_type::date, false)) == when);

    blob_t bytes{0, 1, 2, 255};
    assert(from_storage_value<blob_t>(to_storage_value(bytes, column_type::blob, false)) == bytes);

    uint64_t wide = uint64_t{1} << 62;
    assert(from_storage_value<uint64_t>(to_storage_value(wide, column_type::integer, false)) == wide);
    assert(from_storage_value<uint64_t>(to_storage_value(wide, column_type::numeric, false)) == wide);

    // Null never converts
    assert(!from_storage_value<int>(storage_value{nullptr}).has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_integer_width_bounds: no silent wrap into the signed 64-bit column
// ============================================================================

void test_integer_width_bounds() {
    std::cout << "  test_integer_width_bounds..." << std::flush;

    const uint64_t too_big = std::numeric_limits<uint64_t>::max();
    for (column_type type : {column_type::integer, column_type::numeric, column_type::any}) {
        bool threw = false;
        try {
            to_storage_value(too_big, type, false);
        } catch (const value_conversion_error& e) {
            assert(std::string(e.what()).find("18446744073709551615") != std::string::npos);
            threw = true;
        }
        assert(threw);
    }

    bool threw = false;
    try {
        make_storage_value(std::optional<uint64_t>{too_big});
    } catch (const value_conversion_error&) {
        threw = true;
    }
    assert(threw);

    // Largest unsigned value that still fits
    const uint64_t edge = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    auto stored = to_storage_value(edge, column_type::integer, false);
    assert(std::get<int64_t>(stored) == std::numeric_limits<int64_t>::max());
    assert(from_storage_value<uint64_t>(stored) == edge);

    // Narrow targets reject what they cannot hold
    assert(!from_storage_value<uint64_t>(storage_value{int64_t{-1}}).has_value());
    assert(!from_storage_value<uint8_t>(storage_value{int64_t{256}}).has_value());
    assert(from_storage_value<int8_t>(storage_value{int64_t{-128}}) == int8_t{-128});

    // Unsigned JSON numbers past INT64_MAX become REAL, not negative
    auto parsed = from_storage_value<std::vector<storage_value>>(
        storage_value{std::string("[18446744073709551615, 7]")});
    assert(parsed && parsed->size() == 2);
    assert(std::holds_alternative<double>((*parsed)[0]));
    assert(std::get<double>((*parsed)[0]) > 0.0);
    assert((*parsed)[1] == storage_value{int64_t{7}});

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_structured_text: containers and nested records as JSON text
// ============================================================================

void test_structured_text() {
    std::cout << "  test_structured_text..." << std::flush;

    // Empty containers keep their shape
    auto empty_list = to_storage_value(std::vector<std::string>{}, column_type::text, false);
    assert(std::get<structured_text>(empty_list).json == "[]");

    auto empty_map = to_storage_value(std::map<std::string, int>{}, column_type::text, false);
    assert(std::get<structured_text>(empty_map).json == "{}");

    auto decoded_list = from_storage_value<std::vector<std::string>>(empty_list);
    assert(decoded_list.has_value() && decoded_list->empty());

    auto decoded_map = from_storage_value<std::map<std::string, int>>(empty_map);
    assert(decoded_map.has_value() && decoded_map->empty());

    // Populated containers
    std::vector<std::string> tags{"a", "b"};
    auto list = to_storage_value(tags, column_type::text, false);
    assert(std::get<structured_text>(list).json == R"(["a","b"])");
    assert(from_storage_value<std::vector<std::string>>(list) == tags);

    std::map<std::string, int> counters{{"b", 2}, {"a", 1}};
    auto map = to_storage_value(counters, column_type::text, false);
    assert(std::get<structured_text>(map).json == R"({"a":1,"b":2})");
    assert((from_storage_value<std::map<std::string, int>>(map) == counters));

    // Nested record
    Address home{"1 Main St", "Springfield", std::nullopt};
    auto stored = to_storage_value(home, column_type::text, false);
    auto parsed = nlohmann::json::parse(std::get<structured_text>(stored).json);
    assert(parsed["street"] == "1 Main St");
    assert(parsed["city"] == "Springfield");
    assert(parsed["zip"].is_null());
    assert(from_storage_value<Address>(stored) == home);

    // Sequence of records, read back from plain TEXT
    std::vector<Address> history{{"2 Elm St", "Shelbyville", 11111}, {"3 Oak St", "Capital City", std::nullopt}};
    auto history_json = std::get<structured_text>(to_storage_value(history, column_type::text, false)).json;
    assert(from_storage_value<std::vector<Address>>(storage_value{history_json}) == history);

    // Blobs inside JSON are base64
    std::vector<blob_t> chunks{{1, 2, 3}};
    auto chunk_text = std::get<structured_text>(to_storage_value(chunks, column_type::text, false)).json;
    assert(chunk_text == R"(["AQID"])");
    assert(from_storage_value<std::vector<blob_t>>(storage_value{chunk_text}) == chunks);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_structured_text_malformed: bad JSON yields no value
// ============================================================================

void test_structured_text_malformed() {
    std::cout << "  test_structured_text_malformed..." << std::flush;

    assert(!from_storage_value<std::vector<int>>(storage_value{std::string("not json")}).has_value());

    // Right JSON, wrong shape
    assert(!from_storage_value<std::vector<int>>(storage_value{std::string(R"({"a":1})")}).has_value());
    assert(!from_storage_value<Address>(storage_value{std::string(R"({"street":"x"})")}).has_value());

    // Non-text raw values never hold JSON
    assert(!from_storage_value<std::vector<int>>(storage_value{int64_t{4}}).has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_structured_text_encoding_errors: unencodable values raise conversion errors
// ============================================================================

void test_structured_text_encoding_errors() {
    std::cout << "  test_structured_text_encoding_errors..." << std::flush;

    // Invalid UTF-8 in a string element
    std::vector<std::string> bad_tags{"\xff\xfe"};
    bool threw = false;
    try {
        to_storage_value(bad_tags, column_type::text, false);
    } catch (const value_conversion_error& e) {
        assert(std::string(e.what()).find("structured text") != std::string::npos);
        threw = true;
    }
    assert(threw);

    // Embedded structured-text that is not JSON
    std::vector<storage_value> nested{storage_value{structured_text{"{oops"}}};
    threw = false;
    try {
        to_storage_value(nested, column_type::any, false);
    } catch (const value_conversion_error&) {
        threw = true;
    }
    assert(threw);

    // Whole-record conversion reports the same error type
    Contact contact{"c1", "Ada", 36, std::nullopt, true, 1.0, {"ok", "\xc3"}, {}};
    threw = false;
    try {
        to_storage_values(contact);
    } catch (const db_error& e) {
        assert(dynamic_cast<const value_conversion_error*>(&e) != nullptr);
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_boolean_coercion: integer and string forms
// ============================================================================

void test_boolean_coercion() {
    std::cout << "  test_boolean_coercion..." << std::flush;

    assert(from_storage_value<bool>(storage_value{int64_t{1}}) == true);
    assert(from_storage_value<bool>(storage_value{int64_t{0}}) == false);
    assert(from_storage_value<bool>(storage_value{int64_t{5}}) == true);
    assert(from_storage_value<bool>(storage_value{std::string("true")}) == true);
    assert(from_storage_value<bool>(storage_value{std::string("FALSE")}) == false);
    assert(from_storage_value<bool>(storage_value{std::string("1")}) == true);
    assert(from_storage_value<bool>(storage_value{std::string("0")}) == false);

    assert(!from_storage_value<bool>(storage_value{std::string("yes")}).has_value());
    assert(!from_storage_value<bool>(storage_value{2.0}).has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_numeric_coercion: integer/real widening and narrowing
// ============================================================================

void test_numeric_coercion() {
    std::cout << "  test_numeric_coercion..." << std::flush;

    assert(from_storage_value<int>(storage_value{3.0}) == 3);
    assert(!from_storage_value<int>(storage_value{3.5}).has_value());
    assert(from_storage_value<double>(storage_value{int64_t{7}}) == 7.0);

    // Out of range for the target width
    assert(!from_storage_value<int8_t>(storage_value{int64_t{300}}).has_value());
    assert(!from_storage_value<uint32_t>(storage_value{int64_t{-1}}).has_value());
    assert(from_storage_value<uint16_t>(storage_value{int64_t{65535}}) == uint16_t{65535});

    // Strings are not numbers
    assert(!from_storage_value<int>(storage_value{std::string("42")}).has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_date_parsing: every accepted text form
// ============================================================================

void test_date_parsing() {
    std::cout << "  test_date_parsing..." << std::flush;

    const char* forms[] = {
        "2024-03-15T10:30:00Z",
        "2024-03-15 10:30:00.250",
        "2024-03-15 10:30:00",
        "2024-03-15",
    };
    for (const char* form : forms) {
        auto parsed = from_storage_value<timestamp_t>(storage_value{std::string(form)});
        assert(parsed.has_value());
        assert(format_timestamp(*parsed).substr(0, 10) == "2024-03-15");
    }

    auto with_millis = parse_timestamp("2024-03-15 10:30:00.250");
    assert(with_millis && format_timestamp(*with_millis) == "2024-03-15 10:30:00.250");

    auto iso_fraction = parse_timestamp("2024-03-15T10:30:00.5Z");
    assert(iso_fraction && format_iso8601(*iso_fraction) == "2024-03-15T10:30:00.500Z");

    // Offsets normalize to UTC
    auto offset = parse_timestamp("2024-03-15T10:30:00+02:00");
    assert(offset && format_timestamp(*offset) == "2024-03-15 08:30:00.000");

    // Epoch seconds, as number or text
    auto epoch = from_storage_value<timestamp_t>(storage_value{int64_t{1700000000}});
    assert(epoch && timestamp_to_seconds(*epoch) == 1700000000.0);
    auto epoch_text = parse_timestamp("1700000000.5");
    assert(epoch_text && timestamp_to_seconds(*epoch_text) == 1700000000.5);

    assert(!parse_timestamp("2024-13-01").has_value());
    assert(!parse_timestamp("2024-02-30").has_value());
    assert(!parse_timestamp("not a date").has_value());
    assert(!parse_timestamp("").has_value());

    // Instants the clock cannot hold are rejected, never wrapped
    assert(!parse_timestamp("1e300").has_value());
    assert(!from_storage_value<timestamp_t>(storage_value{1e300}).has_value());
    assert(!from_storage_value<timestamp_t>(storage_value{std::numeric_limits<double>::infinity()}).has_value());
    assert(!from_storage_value<timestamp_t>(storage_value{std::numeric_limits<int64_t>::max()}).has_value());
    assert(!from_storage_value<std::vector<timestamp_t>>(storage_value{std::string("[1e300]")}).has_value());

    bool threw = false;
    try {
        timestamp_from_seconds(1e300);
    } catch (const value_conversion_error&) {
        threw = true;
    }
    assert(threw);

    // Nanosecond clocks span roughly 1677 to 2262
    if constexpr (std::ratio_less_equal_v<timestamp_t::period, std::nano>) {
        assert(!parse_timestamp("9999-12-31").has_value());
        assert(!parse_timestamp("1600-01-01 00:00:00").has_value());
        assert(!parse_timestamp("1e13").has_value());
        assert(!from_storage_value<timestamp_t>(storage_value{1e13}).has_value());
    }
    auto late = parse_timestamp("2262-01-01");
    assert(late && format_timestamp(*late) == "2262-01-01 00:00:00.000");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_text_and_blob_inference: cross-type reads only with auto-infer
// ============================================================================

void test_text_and_blob_inference() {
    std::cout << "  test_text_and_blob_inference..." << std::flush;

    storage_value number{int64_t{5}};
    assert(!from_storage_value<std::string>(number).has_value());
    assert(from_storage_value<std::string>(number, true) == std::string("5"));
    assert(from_storage_value<std::string>(storage_value{true}, true) == std::string("true"));

    storage_value encoded{std::string("AQID")};
    assert(!from_storage_value<blob_t>(encoded).has_value());
    assert(from_storage_value<blob_t>(encoded, true) == blob_t({1, 2, 3}));

    // Not base64: raw UTF-8 bytes
    storage_value plain{std::string("hello!")};
    assert(from_storage_value<blob_t>(plain, true) == blob_t({'h', 'e', 'l', 'l', 'o', '!'}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_base64: RFC 4648 vectors
// ============================================================================

void test_base64() {
    std::cout << "  test_base64..." << std::flush;

    assert(base64_encode({}) == "");
    assert(base64_encode({'f'}) == "Zg==");
    assert(base64_encode({'f', 'o'}) == "Zm8=");
    assert(base64_encode({'f', 'o', 'o'}) == "Zm9v");
    assert(base64_encode({'f', 'o', 'o', 'b', 'a', 'r'}) == "Zm9vYmFy");

    assert(base64_decode("Zm9vYmFy") == blob_t({'f', 'o', 'o', 'b', 'a', 'r'}));
    assert(base64_decode("Zg==") == blob_t({'f'}));
    assert(base64_decode("")->empty());
    assert(!base64_decode("Zm9").has_value());
    assert(!base64_decode("Zm9!").has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_normalize_storage_value: raw value in a declared column type
// ============================================================================

void test_normalize_storage_value() {
    std::cout << "  test_normalize_storage_value..." << std::flush;

    auto flag = normalize_storage_value(storage_value{int64_t{0}}, column_type::boolean, false);
    assert(flag && std::get<bool>(*flag) == false);

    auto when = normalize_storage_value(storage_value{std::string("2024-03-15")}, column_type::date, false);
    assert(when && std::holds_alternative<timestamp_t>(*when));

    auto real = normalize_storage_value(storage_value{int64_t{2}}, column_type::real, false);
    assert(real && std::get<double>(*real) == 2.0);

    assert(!normalize_storage_value(storage_value{std::string("x")}, column_type::integer, false).has_value());

    auto null = normalize_storage_value(storage_value{nullptr}, column_type::integer, false);
    assert(null && is_null(*null));

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Value Converter Tests ---" << std::endl;

    test_column_type_lattice();
    test_infer_type();
    test_to_storage_value();
    test_to_storage_value_errors();
    test_primitive_round_trip();
    test_integer_width_bounds();
    test_structured_text();
    test_structured_text_malformed();
    test_structured_text_encoding_errors();
    test_boolean_coercion();
    test_numeric_coercion();
    test_date_parsing();
    test_text_and_blob_inference();
    test_base64();
    test_normalize_storage_value();

    std::cout << "--- Value Converter Tests: All passed ---" << std::endl;
}

} // namespace value_converter_tests
