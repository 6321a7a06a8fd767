/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson/sjson_bit_writer.h"
#include "sjson/sjson_node_type.h"
#include "sjson/sjson_options.h"
#include "sjson/sjson_string_codec.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sjson {
class IrTreeDecoder;
class JsonTreeImporter;

// Immutable document value. Each node owns its children.
class Node {
   public:
    using Items = std::vector<Node>;
    using Properties = std::vector<std::pair<std::string, Node>>;

    struct NullValue {
        bool operator==(const NullValue&) const { return true; }
    };

    Node() : data_(NullValue{}) {}
    // Copy, destruction and equality walk the tree with a heap stack, so
    // nesting depth is bounded by memory only.
    Node(const Node& other);
    Node(Node&&) noexcept = default;
    Node& operator=(const Node& other);
    Node& operator=(Node&&) noexcept = default;
    ~Node();

    static Node null() { return Node(); }
    static Node number(double value);
    static Node string(std::string text);
    static Node boolean(bool value);
    static Node array(Items items);
    // A repeated name replaces the earlier value and keeps its position.
    static Node object(Properties properties);

    NodeType type() const { return static_cast<NodeType>(data_.index()); }
    std::string_view type_name() const { return sjson::type_name(type()); }
    std::uint8_t type_tag() const { return sjson::type_tag(type()); }

    bool is_null() const { return type() == NodeType::Null; }
    bool is_number() const { return type() == NodeType::Number; }
    bool is_string() const { return type() == NodeType::String; }
    bool is_boolean() const { return type() == NodeType::Boolean; }
    bool is_array() const { return type() == NodeType::Array; }
    bool is_object() const { return type() == NodeType::Object; }

    double as_number() const { return std::get<double>(data_); }
    const StringValue& as_string() const { return std::get<StringValue>(data_); }
    bool as_boolean() const { return std::get<bool>(data_); }
    const Items& items() const { return std::get<Items>(data_); }
    const Properties& properties() const { return std::get<Properties>(data_); }

    const Node* find(std::string_view name) const;

    nlohmann::ordered_json to_ir(const EncodeOptions& opt = {}) const;
    BitWriter to_binary(const EncodeOptions& opt = {}) const;
    static Node from_ir(const nlohmann::ordered_json& ir, const DecodeOptions& opt = {});

    bool operator==(const Node& other) const;

   private:
    // index == wire tag: 0 null, 1 number, 2 string, 3 boolean, 4 array, 5 object
    std::variant<NullValue, double, StringValue, bool, Items, Properties> data_;

    // Moves direct children into `out` and leaves this container empty.
    void release_children(std::vector<Node>& out);

    friend class IrTreeDecoder;
    friend class JsonTreeImporter;
class JsonTreeImporter;
};
}  // namespace sjson
