#pragma once

#include "appcast/util/result.hpp"

#include <optional>
#include <string>

namespace appcast {

// Remembers the release the user chose to skip.
class ISkippedVersionStore {
public:
    virtual ~ISkippedVersionStore() = default;
    virtual bool IsSkipped(const std::string& version) const = 0;
    virtual Result Skip(const std::string& version) = 0;
};

class InMemorySkippedVersionStore final : public ISkippedVersionStore {
public:
    bool IsSkipped(const std::string& version) const override;
    Result Skip(const std::string& version) override;

private:
    std::optional<std::string> skipped_;
};

// Persists {"skipped_version": "..."} in a JSON file, replaced atomically on write.
class JsonFileSkippedVersionStore final : public ISkippedVersionStore {
public:
    explicit JsonFileSkippedVersionStore(std::string path);

    bool IsSkipped(const std::string& version) const override;
    Result Skip(const std::string& version) override;

    std::optional<std::string> Load() const;

private:
    std::string path_;
};

} // namespace appcast
