/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_ir.h"
#include "sjson/sjson_node.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>

using namespace sjson;

namespace {
Node ir_round_trip(const Node& node) {
    return Node::from_ir(node.to_ir());
}
}  // namespace

TEST_CASE("node type names and tags", "[node]") {
    CHECK(Node::null().type_name() == "null");
    CHECK(Node::number(1).type_name() == "number");
    CHECK(Node::string("s").type_name() == "string");
    CHECK(Node::boolean(false).type_name() == "boolean");
    CHECK(Node::array({}).type_name() == "array");
    CHECK(Node::object({}).type_name() == "object");

    CHECK(Node::null().type_tag() == 0);
    CHECK(Node::number(1).type_tag() == 1);
    CHECK(Node::string("s").type_tag() == 2);
    CHECK(Node::boolean(true).type_tag() == 3);
    CHECK(Node::array({}).type_tag() == 4);
    CHECK(Node::object({}).type_tag() == 5);
}

TEST_CASE("object factory treats repeated names as reassignment", "[node][object]") {
    const Node obj = Node::object({
        {"a", Node::number(1)},
        {"b", Node::number(2)},
        {"a", Node::number(3)},
    });
    const auto& props = obj.properties();
    REQUIRE(props.size() == 2);
    CHECK(props[0].first == "a");
    CHECK(props[0].second.as_number() == 3);
    CHECK(props[1].first == "b");
    REQUIRE(obj.find("b") != nullptr);
    CHECK(obj.find("b")->as_number() == 2);
    CHECK(obj.find("missing") == nullptr);
    CHECK(Node::null().find("a") == nullptr);
}

TEST_CASE("leaf IR shapes", "[node][ir]") {
    SECTION("null") {
        REQUIRE(Node::null().to_ir() == Ir::object());
    }
    SECTION("number") {
        const Ir ir = Node::number(100).to_ir();
        REQUIRE(ir["bcd"].is_binary());
        REQUIRE(ir["length"] == 5);
    }
    SECTION("boolean") {
        REQUIRE(Node::boolean(true).to_ir() == Ir{{"value", true}});
    }
    SECTION("UUID string") {
        const Ir ir = Node::string("12345678-1234-a2f7-1234-123456789012").to_ir();
        REQUIRE(ir["length"] == 36);
        REQUIRE(ir["bits"].is_binary());
        REQUIRE(ir["bits"].get_binary().size() == 17);
        REQUIRE(ir["bits"].get_binary().subtype() == 130);
    }
}

TEST_CASE("numbers round trip through the IR", "[node][ir][number]") {
    for (const double v : {123.45, 100.0, 0.0, 1.23e4, 1.23e-2, -123.45}) {
        INFO(v);
        const Node back = ir_round_trip(Node::number(v));
        REQUIRE(back.is_number());
        REQUIRE(back.as_number() == v);
    }
}

TEST_CASE("strings round trip through the IR", "[node][ir][string]") {
    CHECK(ir_round_trip(Node::string("1234567890123456AF9dc2345b789012")).as_string().text()
          == "1234567890123456AF9DC2345B789012");
    CHECK(ir_round_trip(Node::string("12345678-1234-a2f7-1234-123456789012")).as_string().text()
          == "12345678-1234-a2f7-1234-123456789012");

    const std::string long_text(1000, 'q');
    const Node back = ir_round_trip(Node::string(long_text));
    CHECK(back.as_string().text() == long_text);
    CHECK(Node::string(long_text).to_ir()["bits"].get_binary().size() < long_text.size());
}

TEST_CASE("object IR keeps properties and order", "[node][ir][object]") {
    const Node obj = Node::object({{"a", Node::boolean(true)}, {"b", Node::boolean(false)}});
    const Ir ir = obj.to_ir();
    REQUIRE(ir["properties"].size() == 2);
    REQUIRE(ir["properties"].begin().key() == "a");

    const Node back = Node::from_ir(ir);
    REQUIRE(back == obj);
    REQUIRE(back.properties()[0].first == "a");
    REQUIRE(back.properties()[0].second.as_boolean());
    REQUIRE(back.properties()[1].first == "b");
    REQUIRE_FALSE(back.properties()[1].second.as_boolean());

    const Node reversed = Node::object({{"b", Node::boolean(false)}, {"a", Node::boolean(true)}});
    REQUIRE_FALSE(Node::from_ir(reversed.to_ir()) == obj);
}

TEST_CASE("array IR keeps count, order and variants", "[node][ir][array]") {
    const Node arr = Node::array(
        {Node::number(1.0), Node::string("x"), Node::boolean(true), Node::null()}
    );
    const Node back = ir_round_trip(arr);
    REQUIRE(back == arr);
    REQUIRE(back.items().size() == 4);
    CHECK(back.items()[0].as_number() == 1.0);
    CHECK(back.items()[1].as_string().text() == "x");
    CHECK(back.items()[2].as_boolean());
    CHECK(back.items()[3].is_null());
}

TEST_CASE("empty containers are not null", "[node][ir]") {
    const Ir empty_array = Node::array({}).to_ir();
    const Ir empty_object = Node::object({}).to_ir();
    REQUIRE(empty_array == Ir{{"items", Ir::array()}});
    REQUIRE(empty_object == Ir{{"properties", Ir::object()}});
    REQUIRE(empty_array != Node::null().to_ir());

    const Node a = Node::from_ir(empty_array);
    const Node o = Node::from_ir(empty_object);
    REQUIRE(a.is_array());
    REQUIRE(a.items().empty());
    REQUIRE(o.is_object());
    REQUIRE(o.properties().empty());
    REQUIRE_FALSE(a == Node::null());
}

TEST_CASE("mixed document round trips", "[node][ir]") {
    const Node doc = Node::object({
        {"id", Node::string("00112233-4455-6677-8899-AABBCCDDEEFF")},
        {"name", Node::string("widget \xE2\x9C\x93")},
        {"price", Node::number(-12.5e-9)},
        {"tags", Node::array({Node::string("a"), Node::string("")})},
        {"meta", Node::object({{"enabled", Node::boolean(false)}, {"parent", Node::null()}})},
    });
    REQUIRE(ir_round_trip(doc) == doc);
    REQUIRE(Node::from_ir(doc.to_ir(), DecodeOptions{true}) == doc);
}

TEST_CASE("deep nesting does not use the call stack", "[node][ir][deep]") {
    constexpr int kDepth = 1000000;
    Node node = Node::null();
    for (int i = 0; i < kDepth; i++) {
        Node::Items items;
        items.push_back(std::move(node));
        node = Node::array(std::move(items));
    }

    const BitWriter bits = node.to_binary();
    REQUIRE(bits.bit_length() == 3 * (kDepth + 1));

    const Ir ir = node.to_ir();
    const Node back = Node::from_ir(ir);
    const Node* cur = &back;
    int depth = 0;
    bool single_child = true;
    while (cur->is_array()) {
        single_child = single_child && cur->items().size() == 1;
        cur = &cur->items()[0];
        depth++;
    }
    REQUIRE(single_child);
    REQUIRE(depth == kDepth);
    REQUIRE(cur->is_null());

    SECTION("equality") {
        REQUIRE(back == node);

        Node other = Node::number(1.0);
        for (int i = 0; i < kDepth; i++) {
            Node::Items items;
            items.push_back(std::move(other));
            other = Node::array(std::move(items));
        }
        REQUIRE_FALSE(back == other);
    }

    SECTION("copy and destruction") {
        {
            const Node copy = node;
            REQUIRE(copy == node);
        }
        node = Node::null();
        REQUIRE(node.is_null());
    }
}
