/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_ir.h"

#include "sjson/sjson_error.h"
#include "sjson/sjson_node.h"
#include "sjson/sjson_number_codec.h"
#include "sjson/sjson_string_codec.h"

#include <span>
#include <string>

namespace sjson {
namespace {
const std::array<IrShapeRule, 6> kIrShapeRules = {{
    {NodeType::Number, "bcd", [](const Ir& ir) { return ir.contains("bcd"); }},
    {NodeType::Boolean,
     "value:boolean",
     [](const Ir& ir) { return ir.contains("value") && ir.at("value").is_boolean(); }},
    {NodeType::String,
     "length+bits",
     [](const Ir& ir) { return ir.contains("length") && ir.contains("bits"); }},
    {NodeType::Null, "{}", [](const Ir& ir) { return ir.empty(); }},
    {NodeType::Array, "items", [](const Ir& ir) { return ir.contains("items"); }},
    {NodeType::Object, "properties", [](const Ir& ir) { return ir.contains("properties"); }},
}};

std::string describe(const Ir& ir) {
    return ir.dump(-1, ' ', false, Ir::error_handler_t::replace);
}

const Ir& require_key(const Ir& ir, const char* key, ErrorKind kind) {
    if (!ir.is_object() || !ir.contains(key)) {
        throw CodecError(kind, std::string("IR is missing key '") + key + "': " + describe(ir));
    }
    return ir.at(key);
}

std::size_t read_length(const Ir& ir) {
    const Ir& v = require_key(ir, "length", ErrorKind::InvalidField);
    if (v.is_number_unsigned()) {
        return v.get<std::size_t>();
    }
    if (v.is_number_integer() && v.get<std::int64_t>() >= 0) {
        return static_cast<std::size_t>(v.get<std::int64_t>());
    }
    throw CodecError(ErrorKind::InvalidField, "'length' must be a non-negative integer");
}

const Ir::binary_t& read_binary(const Ir& v, const char* key) {
    if (!v.is_binary()) {
        throw CodecError(ErrorKind::InvalidField, std::string("'") + key + "' must be binary");
    }
    return v.get_binary();
}

const Ir& read_container(const Ir& ir, const char* key, Ir::value_t type) {
    const Ir& v = require_key(ir, key, ErrorKind::UnknownShape);
    if (v.type() != type) {
        throw CodecError(
            ErrorKind::InvalidField,
            std::string("'") + key + "' must be "
                + (type == Ir::value_t::array ? "an array" : "an object")
        );
    }
    return v;
}

Ir encode_leaf_ir(const Node& node, const EncodeOptions& opt) {
    Ir out = Ir::object();
    switch (node.type()) {
        case NodeType::Null:
            break;
        case NodeType::Number: {
            BcdNumber bcd = encode_bcd(node.as_number());
            out["bcd"] = Ir::binary(std::move(bcd.bcd));
            out["length"] = bcd.length;
            break;
        }
        case NodeType::String: {
            const EncodedString enc = encode_string(node.as_string(), opt.compression);
            out["length"] = enc.length;
            out["bits"] = bits_to_ir(enc.bits);
            break;
        }
        case NodeType::Boolean:
            out["value"] = node.as_boolean();
            break;
        case NodeType::Array:
        case NodeType::Object:
            throw std::logic_error("encode_leaf_ir called on a container");
    }
    return out;
}
}  // namespace

const std::array<IrShapeRule, 6>& ir_shape_rules() {
    return kIrShapeRules;
}

NodeType classify_ir(const Ir& ir) {
    if (ir.is_object()) {
        for (const auto& rule : kIrShapeRules) {
            if (rule.matches(ir)) {
                return rule.type;
            }
        }
    }
    throw CodecError(ErrorKind::UnknownShape, "Unknown data format: " + describe(ir));
}

Ir bits_to_ir(const BitWriter& bits) {
    Ir::binary_t::container_type bytes = bits.to_bytes();
    if ((bits.bit_length() & 7) == 0) {
        return Ir::binary(std::move(bytes));
    }
    return Ir::binary(std::move(bytes), static_cast<std::uint64_t>(bits.bit_length()));
}

IrBits bits_from_ir(const Ir& value) {
    const auto& bin = read_binary(value, "bits");
    IrBits out;
    out.bytes.assign(bin.begin(), bin.end());
    out.bit_length = out.bytes.size() * 8;
    if (bin.has_subtype()) {
        const std::uint64_t bit_length = bin.subtype();
        if (bit_length > out.bytes.size() * 8 || bit_length + 8 <= out.bytes.size() * 8) {
            throw CodecError(
                ErrorKind::InvalidField,
                "'bits' subtype " + std::to_string(bit_length) + " does not fit "
                    + std::to_string(out.bytes.size()) + " bytes"
            );
        }
        out.bit_length = static_cast<std::size_t>(bit_length);
    }
    return out;
}

Node decode_null_ir(const Ir& ir) {
    if (!ir.is_object() || !ir.empty()) {
        throw CodecError(
            ErrorKind::UnknownShape, "Null IR must be an empty object: " + describe(ir)
        );
    }
    return Node::null();
}

Node decode_number_ir(const Ir& ir) {
    const auto& bcd = read_binary(require_key(ir, "bcd", ErrorKind::UnknownShape), "bcd");
    return Node::number(
        decode_bcd(std::span<const std::uint8_t>(bcd.data(), bcd.size()), read_length(ir))
    );
}

Node decode_string_ir(const Ir& ir, const DecodeOptions& opt) {
    const Ir& bits_value = require_key(ir, "bits", ErrorKind::UnknownShape);
    require_key(ir, "length", ErrorKind::UnknownShape);
    const IrBits bits = bits_from_ir(bits_value);
    StringValue value = decode_string(bits.bytes, bits.bit_length, read_length(ir), opt.debug);
    return Node::string(value.text());
}

Node decode_boolean_ir(const Ir& ir) {
    const Ir& v = require_key(ir, "value", ErrorKind::UnknownShape);
    if (!v.is_boolean()) {
        throw CodecError(ErrorKind::InvalidBooleanValue, "Value must be a boolean: " + describe(v));
    }
    return Node::boolean(v.get<bool>());
}

// Builds the tree with an explicit stack: containers are created with
// placeholder children whose slots are filled when their frame is popped.
class IrTreeDecoder {
   public:
    explicit IrTreeDecoder(const DecodeOptions& opt) : opt_(opt) {}

    Node run(const Ir& ir, NodeType root_type) {
        Node root;
        fill(ir, root_type, root);
        while (!stack_.empty()) {
            const Frame f = stack_.back();
            stack_.pop_back();
            fill(*f.ir, classify_ir(*f.ir), *f.slot);
        }
        return root;
    }

   private:
    struct Frame {
        const Ir* ir;
        Node* slot;
    };

    void fill(const Ir& ir, NodeType type, Node& slot) {
        switch (type) {
            case NodeType::Null:
                slot = decode_null_ir(ir);
                break;
            case NodeType::Number:
                slot = decode_number_ir(ir);
                break;
            case NodeType::String:
                slot = decode_string_ir(ir, opt_);
                break;
            case NodeType::Boolean:
                slot = decode_boolean_ir(ir);
                break;
            case NodeType::Array: {
                const Ir& items = read_container(ir, "items", Ir::value_t::array);
                auto& children = slot.data_.emplace<Node::Items>(items.size());
                for (std::size_t i = items.size(); i-- > 0;) {
                    stack_.push_back(Frame{&items[i], &children[i]});
                }
                break;
            }
            case NodeType::Object: {
                const Ir& props = read_container(ir, "properties", Ir::value_t::object);
                auto& children = slot.data_.emplace<Node::Properties>();
                children.reserve(props.size());
                for (const auto& kv : props.items()) {
                    children.emplace_back(kv.key(), Node());
                }
                std::size_t i = children.size();
                for (auto it = props.rbegin(); it != props.rend(); ++it) {
                    stack_.push_back(Frame{&*it, &children[--i].second});
                }
                break;
            }
        }
    }

    const DecodeOptions& opt_;
    std::vector<Frame> stack_;
};

Node decode_array_ir(const Ir& ir, const DecodeOptions& opt) {
    read_container(ir, "items", Ir::value_t::array);
    return IrTreeDecoder(opt).run(ir, NodeType::Array);
}

Node decode_object_ir(const Ir& ir, const DecodeOptions& opt) {
    read_container(ir, "properties", Ir::value_t::object);
    return IrTreeDecoder(opt).run(ir, NodeType::Object);
}

Node decode_ir(const Ir& ir, const DecodeOptions& opt) {
    return IrTreeDecoder(opt).run(ir, classify_ir(ir));
}

Ir encode_ir(const Node& root, const EncodeOptions& opt) {
    struct Frame {
        const Node* node;
        Ir* slot;
    };

    Ir out;
    std::vector<Frame> stack;
    stack.push_back(Frame{&root, &out});
    while (!stack.empty()) {
        const Frame f = stack.back();
        stack.pop_back();
        const Node& node = *f.node;

        if (node.is_array()) {
            const auto& items = node.items();
            *f.slot = Ir::object();
            Ir& list = (*f.slot)["items"] = Ir::array();
            list.get_ref<Ir::array_t&>().resize(items.size());
            for (std::size_t i = items.size(); i-- > 0;) {
                stack.push_back(Frame{&items[i], &list[i]});
            }
            continue;
        }
        if (node.is_object()) {
            const auto& props = node.properties();
            *f.slot = Ir::object();
            Ir& map = (*f.slot)["properties"] = Ir::object();
            for (const auto& kv : props) {
                map[kv.first] = nullptr;
            }
            // names are unique, so map order matches props order
            std::size_t i = 0;
            std::vector<Frame> members;
            members.reserve(props.size());
            for (auto it = map.begin(); it != map.end(); ++it, ++i) {
                members.push_back(Frame{&props[i].second, &*it});
            }
            stack.insert(stack.end(), members.rbegin(), members.rend());
            continue;
        }
        *f.slot = encode_leaf_ir(node, opt);
    }
    return out;
}
}  // namespace sjson
