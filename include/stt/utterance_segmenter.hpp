#ifndef UTTERANCE_SEGMENTER_HPP
#define UTTERANCE_SEGMENTER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Energy-based speech segmenter over 16 kHz mono floats. A segment opens after
// startHangMs of speech (with preRollMs of audio kept from before it) and
// closes after stopHangMs of quiet or maxUtteranceMs of audio.
class UtteranceSegmenter {
public:
    struct Config {
        int sampleRate = 16000;
        int frameMs = 20;

        float vadStartRms = 0.014f;
        float vadStopRms = 0.011f;
        int startHangMs = 80;
        int stopHangMs = 550;

        int maxUtteranceMs = 30000;
        int preRollMs = 250;
    };

    explicit UtteranceSegmenter(Config config);

    // Feeds samples; returns true when this call closed the open segment.
    // Samples after the closing frame are kept as pre-roll for the next one.
    bool feed(const float* samples, std::size_t count);

    bool isListening() const { return listening_; }
    bool hasUtterance() const { return finished_; }

    // Audio of the open or just-closed segment.
    const std::vector<float>& utterance() const { return utterance_; }
    int utteranceMs() const;

    // Clears the segment. Pre-roll is kept unless clearPreRoll is set.
    void reset(bool clearPreRoll = false);

private:
    bool feedFrame(const float* x, int n);
    float rms(const float* x, int n) const;
    void pushPreRoll(const float* x, int n);

    Config config_;

    bool listening_ = false;
    bool finished_ = false;

    int samplesPerFrame_ = 0;
    int speechMs_ = 0;
    int silenceMs_ = 0;

    std::vector<float> frame_;
    std::vector<float> preRoll_;
    std::vector<float> utterance_;
};

#endif
