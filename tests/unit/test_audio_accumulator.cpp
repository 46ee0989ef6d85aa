#include "audio/audio_accumulator.hpp"
#include "mocks/mock_services.hpp"
#include <gtest/gtest.h>
#include <chrono>

using namespace livenotes;
using namespace livenotes::audio;
using livenotes::test::makeFragment;

class AudioAccumulatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        start = AudioAccumulator::Clock::now();
        accumulator = std::make_unique<AudioAccumulator>(settings, start);
    }

    utils::TriggerSettings settings;
    AudioAccumulator::Clock::time_point start;
    std::unique_ptr<AudioAccumulator> accumulator;
};

TEST_F(AudioAccumulatorTest, CapturesHeaderFromFirstContainerFragment) {
    accumulator->ingest(makeFragment(8000, true));

    ASSERT_TRUE(accumulator->hasHeader());
    EXPECT_EQ(accumulator->getHeader().size(), 5000u);
    EXPECT_EQ(accumulator->getHeader()[0], 0x1A);
    EXPECT_EQ(accumulator->getHeader()[3], 0xA3);
    EXPECT_EQ(accumulator->getChunkCount(), 1u);
    EXPECT_EQ(accumulator->getTotalBufferedBytes(), 8000u);
}

TEST_F(AudioAccumulatorTest, ShortFirstFragmentIsCapturedWhole) {
    accumulator->ingest(makeFragment(1200, true));
    EXPECT_EQ(accumulator->getHeader().size(), 1200u);
}

TEST_F(AudioAccumulatorTest, NoHeaderWithoutSignature) {
    accumulator->ingest(makeFragment(4096));
    accumulator->ingest(makeFragment(4096, true));

    // Only the session's first fragment may donate the header
    EXPECT_FALSE(accumulator->hasHeader());
    EXPECT_TRUE(accumulator->buildContainer().empty());
}

TEST_F(AudioAccumulatorTest, TriggersOnTenthFragment) {
    for (int i = 0; i < 9; ++i) {
        accumulator->ingest(makeFragment(10, i == 0));
        EXPECT_FALSE(accumulator->shouldAttempt(start));
    }
    accumulator->ingest(makeFragment(10));
    EXPECT_TRUE(accumulator->shouldAttempt(start));
}

TEST_F(AudioAccumulatorTest, TriggersOnIdleWithFiveFragments) {
    for (int i = 0; i < 5; ++i) {
        accumulator->ingest(makeFragment(100, i == 0));
    }

    EXPECT_FALSE(accumulator->shouldAttempt(start + std::chrono::seconds(10)));
    EXPECT_TRUE(accumulator->shouldAttempt(start + std::chrono::seconds(11)));
}

TEST_F(AudioAccumulatorTest, IdleAloneIsNotEnough) {
    for (int i = 0; i < 4; ++i) {
        accumulator->ingest(makeFragment(100, i == 0));
    }
    EXPECT_FALSE(accumulator->shouldAttempt(start + std::chrono::minutes(5)));
}

TEST_F(AudioAccumulatorTest, TriggersOnBufferedBytes) {
    accumulator->ingest(makeFragment(100000, true));
    accumulator->ingest(makeFragment(100000));
    EXPECT_FALSE(accumulator->shouldAttempt(start));

    accumulator->ingest(makeFragment(1));
    EXPECT_TRUE(accumulator->shouldAttempt(start));
}

TEST_F(AudioAccumulatorTest, MarkAttemptResetsIdleClock) {
    for (int i = 0; i < 5; ++i) {
        accumulator->ingest(makeFragment(100, i == 0));
    }
    auto later = start + std::chrono::seconds(30);
    accumulator->markAttempt(later);

    EXPECT_EQ(accumulator->getLastProcessTime(), later);
    EXPECT_FALSE(accumulator->shouldAttempt(later + std::chrono::seconds(5)));
}

TEST_F(AudioAccumulatorTest, ContainerUsesFragmentsAsIsWhenFirstHasSignature) {
    accumulator->ingest(makeFragment(6000, true));
    accumulator->ingest(makeFragment(3000));

    auto container = accumulator->buildContainer();
    EXPECT_EQ(container.size(), 9000u);
}

TEST_F(AudioAccumulatorTest, ContainerPrependsHeaderAfterTrim) {
    accumulator->ingest(makeFragment(6000, true));
    accumulator->ingest(makeFragment(3000, false, 'a'));
    accumulator->ingest(makeFragment(3000, false, 'b'));
    accumulator->recordTranscript();

    ASSERT_EQ(accumulator->getBufferedFragments(), 2u);
    auto container = accumulator->buildContainer();
    ASSERT_EQ(container.size(), 5000u + 6000u);
    EXPECT_TRUE(AudioAccumulator::startsWithMagic(container.data(), container.size()));
    EXPECT_EQ(container[5000], 'a');
    EXPECT_EQ(container.back(), 'b');
}

TEST_F(AudioAccumulatorTest, TranscriptKeepsLastTwoFragments) {
    for (int i = 0; i < 10; ++i) {
        accumulator->ingest(makeFragment(4096, i == 0));
    }
    accumulator->recordSilentAttempt();
    accumulator->recordTranscript();

    EXPECT_EQ(accumulator->getBufferedFragments(), 2u);
    EXPECT_EQ(accumulator->getTotalBufferedBytes(), 8192u);
    EXPECT_EQ(accumulator->getSilentAttempts(), 0u);
    EXPECT_EQ(accumulator->getChunkCount(), 10u);
}

TEST_F(AudioAccumulatorTest, SilenceTrimsAfterFourthAttempt) {
    for (int i = 0; i < 8; ++i) {
        accumulator->ingest(makeFragment(1000, i == 0));
    }

    EXPECT_FALSE(accumulator->recordSilentAttempt());
    EXPECT_FALSE(accumulator->recordSilentAttempt());
    EXPECT_FALSE(accumulator->recordSilentAttempt());
    EXPECT_EQ(accumulator->getBufferedFragments(), 8u);

    EXPECT_TRUE(accumulator->recordSilentAttempt());
    EXPECT_EQ(accumulator->getBufferedFragments(), 3u);
    EXPECT_EQ(accumulator->getTotalBufferedBytes(), 3000u);
    EXPECT_EQ(accumulator->getSilentAttempts(), 0u);
}

TEST_F(AudioAccumulatorTest, SilenceDoesNotTrimSmallBuffer) {
    for (int i = 0; i < 5; ++i) {
        accumulator->ingest(makeFragment(1000, i == 0));
    }
    for (int i = 0; i < 6; ++i) {
        EXPECT_FALSE(accumulator->recordSilentAttempt());
    }
    EXPECT_EQ(accumulator->getBufferedFragments(), 5u);
    EXPECT_EQ(accumulator->getSilentAttempts(), 6u);
}
