#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace appcast {

// Loosely typed, insertion-ordered mapping of every top-level feed field.
using ExtensionFields = nlohmann::ordered_json;

// Release descriptor fetched from the remote appcast.
struct Feed {
    std::string version;
    std::string artifact_url;
    std::optional<std::string> signature;

    std::string title;
    std::string release_notes_url;
    std::string pub_date;

    ExtensionFields extension_fields = ExtensionFields::object();

    bool HasSignature() const { return signature.has_value() && !signature->empty(); }

    // nullptr when the raw payload did not carry `key`.
    const ExtensionFields* FindExtension(const std::string& key) const {
        auto it = extension_fields.find(key);
        return it == extension_fields.end() ? nullptr : &*it;
    }
};

} // namespace appcast
