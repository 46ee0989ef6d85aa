#pragma once

#include "utils/config.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <string_view>
#include <vector>

namespace livenotes {
namespace audio {

/**
 * AudioAccumulator - per-session buffer of streamed WebM/EBML fragments
 *
 * Fragments are kept in arrival order. The first fragment, when it starts
 * with the EBML signature, donates its leading bytes as the container header
 * so that later fragments can be turned back into a decodable file once the
 * buffer has been trimmed.
 *
 * Not thread-safe: owned and driven by a single session.
 */
class AudioAccumulator {
public:
    using Clock = std::chrono::steady_clock;
    using Fragment = std::vector<uint8_t>;

    static constexpr std::array<uint8_t, 4> kContainerMagic = {0x1A, 0x45, 0xDF, 0xA3};

    explicit AudioAccumulator(const utils::TriggerSettings& settings,
                              Clock::time_point created = Clock::now());

    void ingest(std::string_view fragment);

    /**
     * Trigger policy: enough fragments, or a smaller batch after an idle
     * period, or too many buffered bytes.
     */
    bool shouldAttempt(Clock::time_point now = Clock::now()) const;

    /**
     * Header plus buffered fragments, or the fragments alone when the first
     * one already starts with the container signature. Empty when no header
     * was captured or nothing is buffered.
     */
    std::vector<uint8_t> buildContainer() const;

    void markAttempt(Clock::time_point when) { lastProcessTime_ = when; }

    // Successful transcript: keep a short overlap and clear the silence streak
    void recordTranscript();

    // Unusable attempt. Returns true when the buffer was trimmed as a result.
    bool recordSilentAttempt();

    bool hasHeader() const { return !header_.empty(); }
    const std::vector<uint8_t>& getHeader() const { return header_; }
    const std::deque<Fragment>& getFragments() const { return fragments_; }

    size_t getBufferedFragments() const { return fragments_.size(); }
    size_t getTotalBufferedBytes() const { return totalBufferedBytes_; }
    size_t getChunkCount() const { return chunkCount_; }
    size_t getSilentAttempts() const { return silentAttempts_; }
    Clock::time_point getLastProcessTime() const { return lastProcessTime_; }

    static bool startsWithMagic(const uint8_t* data, size_t size);

private:
    void keepLast(size_t count);

    utils::TriggerSettings settings_;

    std::deque<Fragment> fragments_;
    std::vector<uint8_t> header_;
    size_t totalBufferedBytes_;
    size_t chunkCount_;
    size_t silentAttempts_;
    Clock::time_point lastProcessTime_;
};

} // namespace audio
} // namespace livenotes
