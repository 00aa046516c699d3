#include "audio/audio_chunker.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace {

AudioChunker::Config oneSecondAt16k() {
    AudioChunker::Config c;
    c.sampleRate = 16000;
    c.channels = 1;
    c.chunkMs = 1000;
    return c;
}

} // namespace

TEST(AudioChunker, EmitsFixedSizeChunksWithIncreasingSequence) {
    AudioChunker chunker(oneSecondAt16k());
    ASSERT_EQ(chunker.samplesPerChunk(), 16000u);

    std::vector<int16_t> buffer(800, 100);
    std::vector<AudioChunk> chunks;
    for (int i = 0; i < 60; ++i) {
        for (auto& c : chunker.push(buffer.data(), buffer.size(), 1000 + i * 50)) chunks.push_back(std::move(c));
    }

    ASSERT_EQ(chunks.size(), 3u);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].sequence, i);
        EXPECT_EQ(chunks[i].samples.size(), 16000u);
        EXPECT_EQ(chunks[i].durationMs(), 1000);
    }
    EXPECT_EQ(chunks[0].timestampMs, 1000);
    EXPECT_EQ(chunks[1].timestampMs, 2000);
}

TEST(AudioChunker, SplitsABufferThatSpansTwoChunks) {
    AudioChunker::Config c = oneSecondAt16k();
    c.chunkMs = 100;   // 1600 samples
    AudioChunker chunker(c);

    std::vector<int16_t> buffer(4000, 0);
    const auto chunks = chunker.push(buffer.data(), buffer.size(), 0);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].sequence, 0u);
    EXPECT_EQ(chunks[1].sequence, 1u);

    const auto rest = chunker.flush(0);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].samples.size(), 800u);
    EXPECT_EQ(rest[0].sequence, 2u);
}

TEST(AudioChunker, PauseDiscardsAudioWithoutConsumingSequenceNumbers) {
    AudioChunker::Config c = oneSecondAt16k();
    c.chunkMs = 100;
    AudioChunker chunker(c);

    std::vector<int16_t> buffer(1600, 0);
    ASSERT_EQ(chunker.push(buffer.data(), buffer.size(), 0).size(), 1u);

    chunker.pause();
    EXPECT_TRUE(chunker.push(buffer.data(), buffer.size(), 100).empty());
    EXPECT_TRUE(chunker.flush(150).empty());

    chunker.resume();
    const auto chunks = chunker.push(buffer.data(), buffer.size(), 200);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].sequence, 1u);
}

TEST(AudioChunker, ChunkCarriesItsLevel) {
    AudioChunker::Config c = oneSecondAt16k();
    c.chunkMs = 10;
    AudioChunker chunker(c);

    std::vector<int16_t> loud(160, 16384);
    std::vector<int16_t> quiet(160, 0);
    EXPECT_FLOAT_EQ(chunker.push(loud.data(), loud.size(), 0).at(0).level, 100.0f);
    EXPECT_FLOAT_EQ(chunker.push(quiet.data(), quiet.size(), 10).at(0).level, 0.0f);
}

TEST(AudioChunker, RejectsEmptyGeometry) {
    AudioChunker::Config c = oneSecondAt16k();
    c.chunkMs = 0;
    EXPECT_THROW(AudioChunker{c}, std::invalid_argument);
}
