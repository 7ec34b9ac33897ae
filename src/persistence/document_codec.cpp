/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The prefvault project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "document_codec.h"
#include "config.h"
#include "../util/base64.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace prefvault { 
namespace persist {

namespace {

template <typename Writer>
void write_value(Writer& writer, const Value& value) {
    switch (value_type(value)) {
        case ValueType::Bool:
            writer.Bool(std::get<bool>(value));
            break;
        case ValueType::String: {
            const auto& s = std::get<std::string>(value);
            writer.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
            break;
        }
        case ValueType::StringList:
            writer.StartArray();
            for (const auto& s : std::get<StringList>(value)) {
                writer.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
            }
            writer.EndArray();
            break;
        case ValueType::BoolMap:
            // std::map iterates sorted, so nested keys are canonical too
            writer.StartObject();
            for (const auto& [k, b] : std::get<BoolMap>(value)) {
                writer.Key(k.data(), static_cast<rapidjson::SizeType>(k.size()));
                writer.Bool(b);
            }
            writer.EndObject();
            break;
        case ValueType::Blob: {
            std::string b64 = util::base64_encode(std::get<Blob>(value));
            writer.String(b64.data(), static_cast<rapidjson::SizeType>(b64.size()));
            break;
        }
    }
}

std::string as_string(const rapidjson::Value& j) {
    return std::string(j.GetString(), j.GetStringLength());
}

// Convert a JSON node to the given semantic type; false on mismatch
bool convert(const rapidjson::Value& j, ValueType type, Value& out) {
    switch (type) {
        case ValueType::Bool:
            if (!j.IsBool()) return false;
            out = j.GetBool();
            return true;

        case ValueType::String:
            if (!j.IsString()) return false;
            out = as_string(j);
            return true;

        case ValueType::StringList: {
            if (!j.IsArray()) return false;
            StringList list;
            list.reserve(j.Size());
            for (rapidjson::SizeType i = 0; i < j.Size(); i++) {
                if (!j[i].IsString()) return false;
                list.push_back(as_string(j[i]));
            }
            out = std::move(list);
            return true;
        }

        case ValueType::BoolMap: {
            if (!j.IsObject()) return false;
            BoolMap map;
            for (auto it = j.MemberBegin(); it != j.MemberEnd(); ++it) {
                if (!it->value.IsBool()) return false;
                map[as_string(it->name)] = it->value.GetBool();
            }
            out = std::move(map);
            return true;
        }

        case ValueType::Blob: {
            if (!j.IsString()) return false;
            auto bytes = util::base64_decode(as_string(j));
            if (!bytes) return false;
            out = std::move(*bytes);
            return true;
        }
    }
    return false;
}

std::optional<ValueType> infer_type(const rapidjson::Value& j) {
    if (j.IsBool())   return ValueType::Bool;
    if (j.IsString()) return ValueType::String;
    if (j.IsArray())  return ValueType::StringList;
    if (j.IsObject()) return ValueType::BoolMap;
    return std::nullopt;
}

// Writer::Accept recurses once per level, so bound the depth of anything
// we serialize back out. Walks with an explicit stack.
bool nested_deeper_than(const rapidjson::Value& root, size_t limit) {
    std::vector<std::pair<const rapidjson::Value*, size_t>> pending{{&root, 1}};
    while (!pending.empty()) {
        auto [node, depth] = pending.back();
        pending.pop_back();
        if (depth > limit) return true;
        if (node->IsArray()) {
            for (auto it = node->Begin(); it != node->End(); ++it) {
                if (it->IsArray() || it->IsObject()) pending.push_back({&*it, depth + 1});
            }
        } else if (node->IsObject()) {
            for (auto it = node->MemberBegin(); it != node->MemberEnd(); ++it) {
                if (it->value.IsArray() || it->value.IsObject()) {
                    pending.push_back({&it->value, depth + 1});
                }
            }
        }
    }
    return false;
}

PersistResult parse_error(const rapidjson::Document& doc) {
    std::ostringstream msg;
    msg << "JSON parse error at offset " << doc.GetErrorOffset()
        << ": " << rapidjson::GetParseError_En(doc.GetParseError());
    return PersistResult::failure(PersistError::Decode, 0, msg.str());
}

} // namespace

std::string DocumentCodec::encode(const ValueMap& values) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(document::kIndentChar, document::kIndentWidth);

    writer.StartObject();
    for (const auto& [name, value] : values) {
        writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
        write_value(writer, value);
    }
    writer.EndObject();

    std::string out(buffer.GetString(), buffer.GetSize());
    out.push_back('\n');
    return out;
}

PersistResult DocumentCodec::decode(const std::string& text, ValueMap& out) {
    if (text.empty()) {
        return PersistResult::failure(PersistError::Decode, 0, "empty document");
    }
    if (text.size() > document::kMaxDocumentBytes) {
        return PersistResult::failure(PersistError::Decode, 0, "document exceeds size limit");
    }

    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseIterativeFlag>(text.data(), text.size());

    // Check for parse errors
    if (doc.HasParseError()) {
        return parse_error(doc);
    }

    // Validate it's an object
    if (!doc.IsObject()) {
        return PersistResult::failure(PersistError::Decode, 0, "document root is not an object");
    }

    ValueMap values;
    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string name = as_string(it->name);
        Value value;

        if (auto key = key_from_name(name)) {
            ValueType expected = key_type(*key);
            if (!convert(it->value, expected, value)) {
                warning() << "Dropping '" << name << "': stored value is not a "
                          << value_type_name(expected);
                continue;
            }
        } else {
            auto inferred = infer_type(it->value);
            if (!inferred || !convert(it->value, *inferred, value)) {
                warning() << "Dropping unknown entry '" << name << "': unsupported JSON type";
                continue;
            }
        }

        values[name] = std::move(value);
    }

    out.swap(values);
    return PersistResult::success();
}

PersistResult DocumentCodec::set_bool_member(const std::string& text, const std::string& name,
                                             bool value, std::string& out) {
    if (text.size() > document::kMaxDocumentBytes) {
        return PersistResult::failure(PersistError::Decode, 0, "document exceeds size limit");
    }

    rapidjson::Document doc;
    if (text.empty()) {
        doc.SetObject();
    } else {
        doc.Parse<rapidjson::kParseIterativeFlag>(text.data(), text.size());
        if (doc.HasParseError()) {
            return parse_error(doc);
        }
    }
    if (!doc.IsObject()) {
        return PersistResult::failure(PersistError::Decode, 0, "document root is not an object");
    }
    if (nested_deeper_than(doc, document::kMaxNestingDepth)) {
        return PersistResult::failure(PersistError::Decode, 0, "document nested too deeply to rewrite");
    }

    auto& alloc = doc.GetAllocator();
    const rapidjson::Value key(rapidjson::StringRef(name.data(), static_cast<rapidjson::SizeType>(name.size())));
    auto it = doc.FindMember(key);
    if (it != doc.MemberEnd()) {
        it->value.SetBool(value);
    } else {
        doc.AddMember(rapidjson::Value(name.data(), static_cast<rapidjson::SizeType>(name.size()), alloc),
                      rapidjson::Value(value), alloc);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(document::kIndentChar, document::kIndentWidth);
    doc.Accept(writer);

    out.assign(buffer.GetString(), buffer.GetSize());
    out.push_back('\n');
    return PersistResult::success();
}

std::string DocumentCodec::encode_value(const Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    write_value(writer, value);
    return std::string(buffer.GetString(), buffer.GetSize());
}

PersistResult DocumentCodec::decode_value(const std::string& text, ValueType expected, Value& out) {
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseIterativeFlag>(text.data(), text.size());
    if (doc.HasParseError()) {
        return parse_error(doc);
    }

    Value value;
    if (!convert(doc, expected, value)) {
        return PersistResult::failure(PersistError::Decode, 0,
            std::string("expected a JSON value of type ") + value_type_name(expected));
    }
    out = std::move(value);
    return PersistResult::success();
}

} // namespace persist
} // namespace prefvault
