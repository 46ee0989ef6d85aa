#include "audio/audio_accumulator.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cstring>

namespace livenotes {
namespace audio {

constexpr std::array<uint8_t, 4> AudioAccumulator::kContainerMagic;

AudioAccumulator::AudioAccumulator(const utils::TriggerSettings& settings, Clock::time_point created)
    : settings_(settings),
      totalBufferedBytes_(0),
      chunkCount_(0),
      silentAttempts_(0),
      lastProcessTime_(created) {
}

bool AudioAccumulator::startsWithMagic(const uint8_t* data, size_t size) {
    return size >= kContainerMagic.size() &&
           std::memcmp(data, kContainerMagic.data(), kContainerMagic.size()) == 0;
}

void AudioAccumulator::ingest(std::string_view fragment) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(fragment.data());

    chunkCount_++;
    totalBufferedBytes_ += fragment.size();

    if (chunkCount_ == 1 && startsWithMagic(bytes, fragment.size())) {
        size_t header_size = std::min(fragment.size(), settings_.headerCaptureBytes);
        header_.assign(bytes, bytes + header_size);
        utils::Logger::info("Captured container header (" + std::to_string(header_size) + " bytes)");
    }

    fragments_.emplace_back(bytes, bytes + fragment.size());

    utils::Logger::debug("Fragment " + std::to_string(chunkCount_) + ": " +
                         std::to_string(fragment.size()) + " bytes, buffered " +
                         std::to_string(fragments_.size()) + " fragments / " +
                         std::to_string(totalBufferedBytes_) + " bytes");
}

bool AudioAccumulator::shouldAttempt(Clock::time_point now) const {
    auto idle = std::chrono::duration<double>(now - lastProcessTime_).count();

    return fragments_.size() >= settings_.chunkCount ||
           (fragments_.size() >= settings_.timedChunkCount && idle > settings_.idleSeconds) ||
           totalBufferedBytes_ > settings_.maxBufferedBytes;
}

std::vector<uint8_t> AudioAccumulator::buildContainer() const {
    std::vector<uint8_t> container;
    if (fragments_.empty() || header_.empty()) {
        return container;
    }

    const Fragment& first = fragments_.front();
    bool self_contained = startsWithMagic(first.data(), first.size());

    container.reserve(totalBufferedBytes_ + (self_contained ? 0 : header_.size()));
    if (!self_contained) {
        container.insert(container.end(), header_.begin(), header_.end());
    }
    for (const auto& fragment : fragments_) {
        container.insert(container.end(), fragment.begin(), fragment.end());
    }
    return container;
}

void AudioAccumulator::recordTranscript() {
    silentAttempts_ = 0;
    if (fragments_.size() > settings_.keepChunksAfterTranscript) {
        keepLast(settings_.keepChunksAfterTranscript);
    }
}

bool AudioAccumulator::recordSilentAttempt() {
    silentAttempts_++;

    if (silentAttempts_ > settings_.silentAttemptLimit &&
        fragments_.size() > settings_.silentTrimThreshold) {
        utils::Logger::info("Too many silent attempts, trimming buffer to last " +
                            std::to_string(settings_.keepChunksAfterSilence) + " fragments");
        keepLast(settings_.keepChunksAfterSilence);
        silentAttempts_ = 0;
        return true;
    }
    return false;
}

void AudioAccumulator::keepLast(size_t count) {
    while (fragments_.size() > count) {
        totalBufferedBytes_ -= fragments_.front().size();
        fragments_.pop_front();
    }
}

} // namespace audio
} // namespace livenotes
