#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "key_adhesion/types.hpp"

namespace kb::adh {

class SessionStore {
public:
    explicit SessionStore(std::filesystem::path directory);

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }
    void setDirectory(std::filesystem::path directory) { directory_ = std::move(directory); }

    // Writes session_YYYYMMDD_HHMMSS.json into the directory, creating it if needed.
    std::filesystem::path save(const KeySession& session) const;
    std::filesystem::path saveAs(const KeySession& session, const std::filesystem::path& path) const;

    [[nodiscard]] KeySession load(const std::filesystem::path& path) const;
    [[nodiscard]] std::vector<std::filesystem::path> listSessions() const;

    [[nodiscard]] static nlohmann::json toJson(const KeySession& session);
    [[nodiscard]] static KeySession fromJson(const nlohmann::json& json);

private:
    std::filesystem::path directory_;
};

}  // namespace kb::adh
