#include "client/profile_source.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string writeProfile(const std::string& name, const std::string& content) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(JsonFileProfileSource, ReadsSingleProfile) {
    const std::string path = writeProfile("profile_single.json", R"({
        "resume_text": "Backend engineer, 6 years.",
        "star_stories": [{"id": "s1", "title": "Design dispute", "tags": ["conflict"]}],
        "talking_points": ["Led the billing migration"],
        "qa_pairs": [{"id": "q1", "question": "Why us?", "answer": "Mission.", "question_type": "general"}]
    })");

    JsonFileProfileSource source(path);
    const ContextPayload c = source.fetch("anyone");
    EXPECT_EQ(c.resumeText, "Backend engineer, 6 years.");
    ASSERT_EQ(c.starStories.size(), 1u);
    EXPECT_EQ(c.starStories[0].id, "s1");
    EXPECT_EQ(c.starStories[0].tags, (std::vector<std::string>{"conflict"}));
    EXPECT_EQ(c.talkingPoints, (std::vector<std::string>{"Led the billing migration"}));
    ASSERT_EQ(c.qaPairs.size(), 1u);
    EXPECT_EQ(c.qaPairs[0].answer, "Mission.");
}

TEST(JsonFileProfileSource, PicksTheConfiguredUser) {
    const std::string path = writeProfile("profile_users.json", R"({
        "users": {
            "alex": {"resume_text": "Alex"},
            "sam": {"resume_text": "Sam"}
        }
    })");

    JsonFileProfileSource source(path);
    EXPECT_EQ(source.fetch("sam").resumeText, "Sam");
    EXPECT_THROW(source.fetch("nobody"), std::runtime_error);
}

TEST(JsonFileProfileSource, ReportsUnreadableFiles) {
    EXPECT_THROW(JsonFileProfileSource(""), std::invalid_argument);
    EXPECT_THROW(JsonFileProfileSource(::testing::TempDir() + "missing_profile.json").fetch("u"), std::runtime_error);

    const std::string broken = writeProfile("profile_broken.json", "{\"resume_text\": ");
    EXPECT_THROW(JsonFileProfileSource(broken).fetch("u"), std::runtime_error);
}
