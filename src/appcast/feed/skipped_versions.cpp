#include "appcast/feed/skipped_versions.hpp"

#include "appcast/util/errors.hpp"
#include "appcast/util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>

namespace appcast {

bool InMemorySkippedVersionStore::IsSkipped(const std::string& version) const {
    return skipped_.has_value() && *skipped_ == version;
}

Result InMemorySkippedVersionStore::Skip(const std::string& version) {
    skipped_ = version;
    return Result::Ok();
}

JsonFileSkippedVersionStore::JsonFileSkippedVersionStore(std::string path) : path_(std::move(path)) {}

std::optional<std::string> JsonFileSkippedVersionStore::Load() const {
    std::ifstream is(path_);
    if (!is.good())
        return std::nullopt;

    auto j = nlohmann::json::parse(is, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LogWarn("Ignoring unreadable skipped-version file: %s", path_.c_str());
        return std::nullopt;
    }
    auto it = j.find("skipped_version");
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

bool JsonFileSkippedVersionStore::IsSkipped(const std::string& version) const {
    const auto skipped = Load();
    return skipped.has_value() && *skipped == version;
}

Result JsonFileSkippedVersionStore::Skip(const std::string& version) {
    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream os(tmp_path, std::ios::trunc);
        if (!os.good())
            return Result::Fail(errc::kIo, "cannot write " + tmp_path);
        os << nlohmann::json{{"skipped_version", version}}.dump(2) << "\n";
        os.close();
        if (!os.good())
            return Result::Fail(errc::kIo, "write failed: " + tmp_path);
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        const int e = errno;
        std::remove(tmp_path.c_str());
        return Result::FromErrno("rename failed: " + path_, e);
    }
    return Result::Ok();
}

} // namespace appcast
