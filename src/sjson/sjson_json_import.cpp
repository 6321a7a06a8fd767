/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_json_import.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace sjson {
using Json = nlohmann::ordered_json;

class JsonTreeImporter {
   public:
    Node run(const Json& doc) {
        Node root;
        fill(doc, root);
        while (!stack_.empty()) {
            const Frame f = stack_.back();
            stack_.pop_back();
            fill(*f.doc, *f.slot);
        }
        return root;
    }

   private:
    struct Frame {
        const Json* doc;
        Node* slot;
    };

    void fill(const Json& doc, Node& slot) {
        switch (doc.type()) {
            case Json::value_t::null:
                slot = Node::null();
                return;
            case Json::value_t::boolean:
                slot = Node::boolean(doc.get<bool>());
                return;
            case Json::value_t::number_integer:
            case Json::value_t::number_unsigned:
            case Json::value_t::number_float:
                slot = Node::number(doc.get<double>());
                return;
            case Json::value_t::string:
                slot = Node::string(doc.get<std::string>());
                return;
            case Json::value_t::array: {
                auto& children = slot.data_.emplace<Node::Items>(doc.size());
                for (std::size_t i = doc.size(); i-- > 0;) {
                    stack_.push_back(Frame{&doc[i], &children[i]});
                }
                return;
            }
            case Json::value_t::object: {
                // object keys are already unique
                auto& children = slot.data_.emplace<Node::Properties>();
                children.reserve(doc.size());
                for (const auto& kv : doc.items()) {
                    children.emplace_back(kv.key(), Node());
                }
                std::size_t i = children.size();
                for (auto it = doc.rbegin(); it != doc.rend(); ++it) {
                    stack_.push_back(Frame{&*it, &children[--i].second});
                }
                return;
            }
            case Json::value_t::binary:
            case Json::value_t::discarded:
                break;
        }
        throw std::invalid_argument(
            std::string("JSON value has no SJSON equivalent: ") + doc.type_name()
        );
    }

    std::vector<Frame> stack_;
};

Node node_from_json(const Json& doc) {
    return JsonTreeImporter().run(doc);
}
}  // namespace sjson
