#include "core/config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string writeTemp(const std::string& name, const std::string& content) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(Config, ServerDefaults) {
    ::unsetenv("CUECARD_WHISPER_MODEL");
    const ServerConfig c = loadServerConfig({});
    EXPECT_EQ(c.server.bindIp, "127.0.0.1");
    EXPECT_EQ(c.server.port, 8765);
    EXPECT_EQ(c.server.session.generationTimeoutMs, 20000);
    EXPECT_EQ(c.answers.maxStories, 2u);
    EXPECT_EQ(c.whisper.language, "en");
    EXPECT_FALSE(c.help);
}

TEST(Config, FileThenEnvironmentThenFlags) {
    const std::string path = writeTemp("cuecard_server.json", R"({
        "port": 9000,
        "bind": "0.0.0.0",
        "whisper": {"model": "from-file.bin", "threads": 2, "language": "de"},
        "generation": {"timeout_ms": 5000, "max_stories": 3}
    })");

    ::setenv("CUECARD_WHISPER_MODEL", "from-env.bin", 1);
    ServerConfig c = loadServerConfig({"--config", path});
    EXPECT_EQ(c.server.port, 9000);
    EXPECT_EQ(c.server.bindIp, "0.0.0.0");
    EXPECT_EQ(c.modelPath, "from-env.bin");
    EXPECT_EQ(c.whisper.threads, 2);
    EXPECT_EQ(c.server.session.language, "de");
    EXPECT_EQ(c.server.session.generationTimeoutMs, 5000);
    EXPECT_EQ(c.answers.maxStories, 3u);

    c = loadServerConfig({"--config", path, "--port", "9100", "--model", "from-flag.bin"});
    EXPECT_EQ(c.server.port, 9100);
    EXPECT_EQ(c.modelPath, "from-flag.bin");
    ::unsetenv("CUECARD_WHISPER_MODEL");
}

TEST(Config, BadInputIsRejected) {
    EXPECT_THROW(loadServerConfig({"--port"}), std::invalid_argument);
    EXPECT_THROW(loadServerConfig({"--port", "http"}), std::invalid_argument);
    EXPECT_THROW(loadServerConfig({"--port", "70000"}), std::invalid_argument);
    EXPECT_THROW(loadServerConfig({"--frobnicate"}), std::invalid_argument);
    EXPECT_THROW(loadServerConfig({"--timeout-ms", "0"}), std::invalid_argument);
    EXPECT_THROW(loadServerConfig({"--config", "/nonexistent/cuecard.json"}), std::runtime_error);

    const std::string wrongType = writeTemp("cuecard_bad.json", R"({"port": "eighty"})");
    EXPECT_THROW(loadServerConfig({"--config", wrongType}), std::invalid_argument);
}

TEST(Config, ClientLayersAndEndpointCheck) {
    ::unsetenv("CUECARD_URL");
    ::setenv("CUECARD_USER", "env-user", 1);

    const std::string path = writeTemp("cuecard_client.json", R"({
        "url": "tcp://interview.local:7000",
        "profile": "me.json",
        "audio": {"chunk_ms": 500, "silence_ms": 1200},
        "reconnect": {"max_attempts": 3}
    })");

    ClientConfig c = loadClientConfig({"--config", path, "--language", "ko"});
    EXPECT_EQ(c.transport.url, "tcp://interview.local:7000");
    EXPECT_EQ(c.transport.userId, "env-user");
    EXPECT_EQ(c.session.userId, "env-user");
    EXPECT_EQ(c.session.language, "ko");
    EXPECT_EQ(c.profilePath, "me.json");
    EXPECT_EQ(c.capture.chunkMs, 500);
    EXPECT_EQ(c.capture.silenceMs, 1200);
    EXPECT_EQ(c.transport.reconnect.maxAttempts, 3);

    c = loadClientConfig({"--user", "flag-user", "--no-auto-finalize"});
    EXPECT_EQ(c.transport.userId, "flag-user");
    EXPECT_FALSE(c.session.finalizeOnSilence);

    EXPECT_THROW(loadClientConfig({"--url", "localhost"}), std::invalid_argument);
    ::unsetenv("CUECARD_USER");

    EXPECT_THROW(loadClientConfig({}), std::invalid_argument);
    EXPECT_THROW(loadClientConfig({"--user", ""}), std::invalid_argument);
    EXPECT_TRUE(loadClientConfig({"--help"}).help);
    EXPECT_TRUE(loadClientConfig({"--list-devices"}).listDevices);
}
