/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_binary_encoder.h"

#include "sjson/sjson_error.h"
#include "sjson/sjson_name_dictionary.h"
#include "sjson/sjson_node.h"
#include "sjson/sjson_number_codec.h"
#include "utils/log.h"

#include <limits>
#include <optional>
#include <vector>

namespace sjson {
namespace {
struct Pending {
    const Node* node = nullptr;
    // Set for object members: written right before the member's encoding.
    std::optional<std::uint32_t> name_index;
};

void write_object_header(
    BitWriter& out,
    const Node::Properties& props,
    std::vector<Pending>& stack
) {
    if (props.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw CodecError(
            ErrorKind::IndexOutOfRange,
            "Object has " + std::to_string(props.size()) + " properties, count field is 32-bit"
        );
    }

    NameDictionary dict;
    std::vector<std::uint32_t> indices;
    indices.reserve(props.size());
    for (const auto& kv : props) {
        indices.push_back(dict.index_of(kv.first));
    }

    out.write_bits(static_cast<std::uint32_t>(props.size()), 32);
    for (std::size_t i = props.size(); i-- > 0;) {
        stack.push_back(Pending{&props[i].second, indices[i]});
    }
}
}  // namespace

BitWriter encode_binary(const Node& root, const EncodeOptions& opt) {
    BitWriter out;
    std::vector<Pending> stack;
    stack.push_back(Pending{&root, std::nullopt});

    while (!stack.empty()) {
        const Pending cur = stack.back();
        stack.pop_back();
        if (cur.name_index.has_value()) {
            write_name_index(out, *cur.name_index);
        }

        const Node& node = *cur.node;
        out.write_bits(node.type_tag(), kTypeTagBits);
        switch (node.type()) {
            case NodeType::Null:
                break;
            case NodeType::Number: {
                const BcdNumber bcd = encode_bcd(node.as_number());
                out.write_bytes(bcd.bcd);
                break;
            }
            case NodeType::String:
                out.append(encode_string(node.as_string(), opt.compression).bits);
                break;
            case NodeType::Boolean:
                out.write_bit(node.as_boolean());
                break;
            case NodeType::Array: {
                const auto& items = node.items();
                for (std::size_t i = items.size(); i-- > 0;) {
                    stack.push_back(Pending{&items[i], std::nullopt});
                }
                break;
            }
            case NodeType::Object:
                write_object_header(out, node.properties(), stack);
                break;
        }
    }

    if (opt.debug) {
        SJSON_LOG_INFO(
            "Binary export: root=%s bits=%zu bytes=%zu",
            std::string(root.type_name()).c_str(), out.bit_length(), out.byte_length()
        );
    }
    return out;
}
}  // namespace sjson
