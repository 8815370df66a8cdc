#include "appcast/feed/feed_parser.hpp"

#include "appcast/util/logger.hpp"

#include <initializer_list>

namespace appcast {

using json = nlohmann::json;

namespace {

const json* FindFirst(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end())
            return &*it;
    }
    return nullptr;
}

std::expected<std::string, std::string> RequiredString(const json& j,
                                                       std::initializer_list<const char*> keys) {
    const json* v = FindFirst(j, keys);
    if (!v)
        return std::unexpected(std::string("missing '") + *keys.begin() + "'");
    if (!v->is_string())
        return std::unexpected(std::string("'") + *keys.begin() + "' must be a string");
    std::string s = v->get<std::string>();
    if (s.empty())
        return std::unexpected(std::string("'") + *keys.begin() + "' is empty");
    return s;
}

std::optional<std::string> OptionalString(const json& j, std::initializer_list<const char*> keys) {
    const json* v = FindFirst(j, keys);
    if (!v || v->is_null())
        return std::nullopt;
    if (!v->is_string()) {
        LogWarn("Feed field '%s' ignored: expected string, got %s", *keys.begin(), v->type_name());
        return std::nullopt;
    }
    return v->get<std::string>();
}

std::expected<Feed, std::string> ParseTyped(const std::string& raw) {
    auto j = json::parse(raw, nullptr, false);
    if (j.is_discarded())
        return std::unexpected("Syntax Error: feed is not valid JSON");
    if (!j.is_object())
        return std::unexpected("JSON root must be an object");

    Feed feed;

    auto version = RequiredString(j, {"version"});
    if (!version)
        return std::unexpected(version.error());
    feed.version = std::move(*version);

    auto artifact_url = RequiredString(j, {"artifactUrl", "artifact_url"});
    if (!artifact_url)
        return std::unexpected(artifact_url.error());
    feed.artifact_url = std::move(*artifact_url);

    feed.signature = OptionalString(j, {"signature", "dsa_signature"});
    if (feed.signature && feed.signature->empty())
        feed.signature.reset();

    feed.title = OptionalString(j, {"title"}).value_or("");
    feed.release_notes_url = OptionalString(j, {"releaseNotesUrl", "release_notes_url"}).value_or("");
    feed.pub_date = OptionalString(j, {"pubDate", "pub_date"}).value_or("");

    return feed;
}

std::expected<ExtensionFields, std::string> ParseExtensions(const std::string& raw) {
    auto j = ExtensionFields::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::unexpected("extension pass could not read feed object");
    return j;
}

} // namespace

std::expected<Feed, std::string> FeedParser::Parse(const std::string& raw) const {
    if (raw.find_first_not_of(" \t\n\r") == std::string::npos) {
        return std::unexpected("Empty input");
    }

    LogDebug("Deserializing feed (%zu bytes)", raw.size());

    auto feed = ParseTyped(raw);
    if (!feed)
        return std::unexpected(feed.error());

    auto extensions = ParseExtensions(raw);
    if (!extensions)
        return std::unexpected(extensions.error());
    feed->extension_fields = std::move(*extensions);

    LogDebug("Feed version=%s artifact=%s fields=%zu",
             feed->version.c_str(),
             feed->artifact_url.c_str(),
             feed->extension_fields.size());
    return feed;
}

} // namespace appcast
