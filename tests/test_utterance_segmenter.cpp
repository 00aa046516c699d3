#include "stt/utterance_segmenter.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

std::vector<float> tone(int ms, float amplitude) {
    std::vector<float> out(static_cast<std::size_t>(16 * ms));
    for (std::size_t i = 0; i < out.size(); ++i) out[i] = (i % 2 ? amplitude : -amplitude);
    return out;
}

} // namespace

TEST(UtteranceSegmenter, OpensOnSpeechAndClosesAfterTheStopHang) {
    UtteranceSegmenter seg(UtteranceSegmenter::Config{});

    const auto quiet = tone(300, 0.0f);
    EXPECT_FALSE(seg.feed(quiet.data(), quiet.size()));
    EXPECT_FALSE(seg.isListening());

    const auto speech = tone(1000, 0.1f);
    EXPECT_FALSE(seg.feed(speech.data(), speech.size()));
    EXPECT_TRUE(seg.isListening());

    const auto tail = tone(600, 0.0f);
    EXPECT_TRUE(seg.feed(tail.data(), tail.size()));
    EXPECT_TRUE(seg.hasUtterance());
    EXPECT_FALSE(seg.isListening());

    // pre-roll, the speech after the start hang, then the stop hang
    EXPECT_GE(seg.utteranceMs(), 1700);
    EXPECT_LE(seg.utteranceMs(), 1850);
}

TEST(UtteranceSegmenter, ShortClicksDoNotOpenASegment) {
    UtteranceSegmenter seg(UtteranceSegmenter::Config{});
    for (int i = 0; i < 20; ++i) {
        const auto click = tone(40, 0.2f);
        const auto gap = tone(100, 0.0f);
        seg.feed(click.data(), click.size());
        seg.feed(gap.data(), gap.size());
    }
    EXPECT_FALSE(seg.isListening());
    EXPECT_FALSE(seg.hasUtterance());
}

TEST(UtteranceSegmenter, LongSpeechIsCutAtTheMaximum) {
    UtteranceSegmenter::Config config;
    config.maxUtteranceMs = 1000;
    UtteranceSegmenter seg(config);

    const auto speech = tone(2000, 0.1f);
    EXPECT_TRUE(seg.feed(speech.data(), speech.size()));
    EXPECT_LE(seg.utteranceMs(), 1020);

    seg.reset();
    EXPECT_FALSE(seg.hasUtterance());
    EXPECT_TRUE(seg.utterance().empty());
}
