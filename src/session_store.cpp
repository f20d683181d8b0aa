#include "key_adhesion/session_store.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace kb::adh {

namespace {

std::string timestampedName(int attempt) {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << "session_" << std::put_time(&local, "%Y%m%d_%H%M%S");
    if (attempt > 0) {
        oss << '_' << attempt;
    }
    oss << ".json";
    return oss.str();
}

KeyEventType parseEventType(const std::string& value) {
    if (value == "press") return KeyEventType::Press;
    if (value == "release") return KeyEventType::Release;
    throw std::runtime_error("Unknown event_type: " + value);
}

}  // namespace

SessionStore::SessionStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

nlohmann::json SessionStore::toJson(const KeySession& session) {
    nlohmann::json events = nlohmann::json::array();
    for (const auto& ev : session.events) {
        events.push_back({
            {"key", ev.key()},
            {"event_type", eventTypeName(ev.type())},
            {"timestamp", ev.timestamp()},
        });
    }
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [key, value] : session.metadata) {
        metadata[key] = value;
    }
    return {
        {"start_time", session.start_time},
        {"end_time", session.end_time},
        {"metadata", metadata},
        {"events", events},
    };
}

KeySession SessionStore::fromJson(const nlohmann::json& json) {
    KeySession session;
    try {
        session.start_time = json.at("start_time").get<double>();
        session.end_time = json.at("end_time").get<double>();
        for (const auto& item : json.at("events")) {
            session.events.emplace_back(item.at("key").get<std::string>(),
                                        parseEventType(item.at("event_type").get<std::string>()),
                                        item.at("timestamp").get<double>());
        }
        if (auto it = json.find("metadata"); it != json.end() && it->is_object()) {
            for (const auto& entry : it->items()) {
                const auto& value = entry.value();
                session.metadata[entry.key()] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
    } catch (const nlohmann::json::exception& err) {
        throw std::runtime_error("Malformed session: " + std::string(err.what()));
    }
    return session;
}

std::filesystem::path SessionStore::save(const KeySession& session) const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create session directory " + directory_.string() + ": " + ec.message());
    }
    std::filesystem::path path;
    for (int attempt = 0;; ++attempt) {
        path = directory_ / timestampedName(attempt);
        if (!std::filesystem::exists(path, ec)) {
            break;
        }
    }
    return saveAs(session, path);
}

std::filesystem::path SessionStore::saveAs(const KeySession& session, const std::filesystem::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open session file for writing: " + path.string());
    }
    out << toJson(session).dump(2) << '\n';
    if (!out) {
        throw std::runtime_error("Failed to write session file: " + path.string());
    }
    return path;
}

KeySession SessionStore::load(const std::filesystem::path& path) const {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open session file: " + path.string());
    }
    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& err) {
        throw std::runtime_error("Session JSON parse error in " + path.string() + ": " + err.what());
    }
    return fromJson(json);
}

std::vector<std::filesystem::path> SessionStore::listSessions() const {
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    if (!std::filesystem::exists(directory_, ec)) {
        return out;
    }
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (ec) break;
        if (!entry.is_regular_file(ec)) continue;
        const auto name = entry.path().filename().string();
        if (name.rfind("session_", 0) == 0 && entry.path().extension() == ".json") {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace kb::adh
