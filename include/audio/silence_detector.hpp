#ifndef SILENCE_DETECTOR_HPP
#define SILENCE_DETECTOR_HPP

// Counts consecutive quiet buffers. Fires once when the quiet run reaches
// silenceMs, then stays quiet until a buffer above threshold re-arms it.
class SilenceDetector {
public:
    struct Config {
        float threshold = 5.0f;   // level units (0..100)
        int silenceMs = 800;
    };

    explicit SilenceDetector(Config config);

    // Returns true exactly when this buffer completes a silence interval.
    bool feed(float level, int bufferMs);

    bool armed() const { return armed_; }
    int silenceMs() const { return silenceMs_; }

    void reset();

private:
    Config config_;

    bool armed_ = true;
    int silenceMs_ = 0;
};

#endif
