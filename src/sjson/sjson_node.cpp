/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_node.h"

#include "sjson/sjson_binary_encoder.h"
#include "sjson/sjson_ir.h"

#include <unordered_map>

namespace sjson {
Node::Node(const Node& other) : data_(NullValue{}) {
    struct Frame {
        const Node* from;
        Node* to;
    };
    std::vector<Frame> stack;
    stack.push_back(Frame{&other, this});
    while (!stack.empty()) {
        const Frame f = stack.back();
        stack.pop_back();
        switch (f.from->type()) {
            case NodeType::Array: {
                const auto& src = f.from->items();
                auto& dst = f.to->data_.emplace<Items>(src.size());
                for (std::size_t i = src.size(); i-- > 0;) {
                    stack.push_back(Frame{&src[i], &dst[i]});
                }
                break;
            }
            case NodeType::Object: {
                const auto& src = f.from->properties();
                auto& dst = f.to->data_.emplace<Properties>();
                dst.reserve(src.size());
                for (const auto& kv : src) {
                    dst.emplace_back(kv.first, Node());
                }
                for (std::size_t i = src.size(); i-- > 0;) {
                    stack.push_back(Frame{&src[i].second, &dst[i].second});
                }
                break;
            }
            default:
                f.to->data_ = f.from->data_;
                break;
        }
    }
}

Node& Node::operator=(const Node& other) {
    if (this != &other) {
        *this = Node(other);
    }
    return *this;
}

Node::~Node() {
    std::vector<Node> pending;
    release_children(pending);
    while (!pending.empty()) {
        Node last = std::move(pending.back());
        pending.pop_back();
        last.release_children(pending);
    }
}

void Node::release_children(std::vector<Node>& out) {
    if (auto* items = std::get_if<Items>(&data_)) {
        for (auto& child : *items) {
            out.push_back(std::move(child));
        }
        items->clear();
    } else if (auto* props = std::get_if<Properties>(&data_)) {
        for (auto& kv : *props) {
            out.push_back(std::move(kv.second));
        }
        props->clear();
    }
}

Node Node::number(double value) {
    Node n;
    n.data_ = value;
    return n;
}

Node Node::string(std::string text) {
    Node n;
    n.data_ = StringValue(std::move(text));
    return n;
}

Node Node::boolean(bool value) {
    Node n;
    n.data_.emplace<bool>(value);
    return n;
}

Node Node::array(Items items) {
    Node n;
    n.data_ = std::move(items);
    return n;
}

Node Node::object(Properties properties) {
    Properties unique;
    unique.reserve(properties.size());
    std::unordered_map<std::string, std::size_t> seen;
    for (auto& [name, value] : properties) {
        const auto it = seen.find(name);
        if (it != seen.end()) {
            unique[it->second].second = std::move(value);
            continue;
        }
        seen.emplace(name, unique.size());
        unique.emplace_back(std::move(name), std::move(value));
    }
    Node n;
    n.data_ = std::move(unique);
    return n;
}

const Node* Node::find(std::string_view name) const {
    if (!is_object()) {
        return nullptr;
    }
    for (const auto& kv : properties()) {
        if (kv.first == name) {
            return &kv.second;
        }
    }
    return nullptr;
}

nlohmann::ordered_json Node::to_ir(const EncodeOptions& opt) const {
    return encode_ir(*this, opt);
}

BitWriter Node::to_binary(const EncodeOptions& opt) const {
    return encode_binary(*this, opt);
}

Node Node::from_ir(const nlohmann::ordered_json& ir, const DecodeOptions& opt) {
    return decode_ir(ir, opt);
}

bool Node::operator==(const Node& other) const {
    std::vector<std::pair<const Node*, const Node*>> stack;
    stack.emplace_back(this, &other);
    while (!stack.empty()) {
        const auto [a, b] = stack.back();
        stack.pop_back();
        if (a->data_.index() != b->data_.index()) {
            return false;
        }
        switch (a->type()) {
            case NodeType::Array: {
                const auto& lhs = a->items();
                const auto& rhs = b->items();
                if (lhs.size() != rhs.size()) {
                    return false;
                }
                for (std::size_t i = 0; i < lhs.size(); i++) {
                    stack.emplace_back(&lhs[i], &rhs[i]);
                }
                break;
            }
            case NodeType::Object: {
                const auto& lhs = a->properties();
                const auto& rhs = b->properties();
                if (lhs.size() != rhs.size()) {
                    return false;
                }
                for (std::size_t i = 0; i < lhs.size(); i++) {
                    if (lhs[i].first != rhs[i].first) {
                        return false;
                    }
                    stack.emplace_back(&lhs[i].second, &rhs[i].second);
                }
                break;
            }
            default:
                if (!(a->data_ == b->data_)) {
                    return false;
                }
                break;
        }
    }
    return true;
}
}  // namespace sjson
