#pragma once

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <string>
#include <memory>

namespace pdf_outline {

using JsonDocument = rapidjson::Document;
using JsonValue = rapidjson::Value;
using JsonAllocator = rapidjson::MemoryPoolAllocator<>;

// Builds the output document with rapidjson; member order is insertion order,
// so the same outline always serializes to the same bytes.
class JsonBuilder {
public:
    JsonBuilder() : doc_(std::make_unique<JsonDocument>()) {
        doc_->SetObject();
    }

    JsonDocument* document() { return doc_.get(); }
    JsonAllocator& allocator() { return doc_->GetAllocator(); }

    JsonValue string(const std::string& text) {
        JsonValue value;
        value.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator());
        return value;
    }

    void add(JsonValue& object, const char* key, JsonValue value) {
        object.AddMember(rapidjson::StringRef(key), value, allocator());
    }

    void add(const char* key, JsonValue value) {
        add(*doc_, key, std::move(value));
    }

    std::string serialize(bool pretty = false) const {
        rapidjson::StringBuffer buffer;
        buffer.Clear();

        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            doc_->Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            doc_->Accept(writer);
        }

        return std::string(buffer.GetString(), buffer.GetSize());
    }

private:
    std::unique_ptr<JsonDocument> doc_;
};

} // namespace pdf_outline
