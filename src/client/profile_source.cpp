#include "client/profile_source.hpp"
#include "protocol/messages.hpp"
#include "util/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

// Constructor
JsonFileProfileSource::JsonFileProfileSource(std::string path) : path_(std::move(path)) {
    if (path_.empty()) throw std::invalid_argument("profile path is empty");
}

ContextPayload JsonFileProfileSource::fetch(const std::string& userId) {
    std::ifstream in(path_);
    if (!in) throw std::runtime_error("cannot open profile " + path_);

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid profile " + path_ + ": " + e.what());
    }
    if (!doc.is_object()) throw std::runtime_error("profile " + path_ + " is not a JSON object");

    const json* profile = &doc;
    auto users = doc.find("users");
    if (users != doc.end() && users->is_object()) {
        auto it = users->find(userId);
        if (it == users->end()) throw std::runtime_error("no profile for user " + userId + " in " + path_);
        profile = &*it;
    }

    ContextPayload payload = contextFromJson(*profile);
    Log::info("Profile", "Loaded " + std::to_string(payload.starStories.size()) + " stories, " +
                             std::to_string(payload.talkingPoints.size()) + " talking points, " +
                             std::to_string(payload.qaPairs.size()) + " Q&A pairs for " +
                             (userId.empty() ? std::string("default user") : userId));
    return payload;
}
