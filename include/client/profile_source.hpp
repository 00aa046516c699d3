#ifndef PROFILE_SOURCE_HPP
#define PROFILE_SOURCE_HPP

#include "core/types.hpp"

#include <string>
#include <utility>

// Where the client gets the candidate's background for a user identity.
class ProfileSource {
public:
    virtual ~ProfileSource() = default;

    // Throws std::runtime_error when the profile cannot be read.
    virtual ContextPayload fetch(const std::string& userId) = 0;
};

// Profile kept in a JSON file. The file holds either one profile
//   {"resume_text": ..., "star_stories": [...], "talking_points": [...], "qa_pairs": [...]}
// or several keyed by user:
//   {"users": {"<user id>": {...}, ...}}
// The file is re-read on every fetch so edits show up on the next upload.
class JsonFileProfileSource : public ProfileSource {
public:
    explicit JsonFileProfileSource(std::string path);

    ContextPayload fetch(const std::string& userId) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Fixed profile, or none.
class StaticProfileSource : public ProfileSource {
public:
    explicit StaticProfileSource(ContextPayload payload = ContextPayload()) : payload_(std::move(payload)) {}

    ContextPayload fetch(const std::string&) override { return payload_; }

private:
    ContextPayload payload_;
};

#endif
