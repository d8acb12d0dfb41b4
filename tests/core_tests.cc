#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/hash.h"
#include "core/log.h"
#include "core/rng.h"
#include "grids/coord.h"

namespace {

using sprocket::core::LogLevel;

struct CapturedLine {
    LogLevel level = LogLevel::Info;
    std::string category;
    std::string message;
};

class SinkCapture {
public:
    SinkCapture() {
        sprocket::core::setLogSink([this](LogLevel level, std::string_view category, std::string_view message) {
            lines.push_back(CapturedLine{level, std::string(category), std::string(message)});
        });
    }
    ~SinkCapture() {
        sprocket::core::setLogSink(nullptr);
    }

    std::vector<CapturedLine> lines;
};

TEST(Log, ParseAcceptsNamesAliasesAndDigits) {
    using sprocket::core::parseLogLevel;
    EXPECT_EQ(parseLogLevel("error", LogLevel::Info), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("ERR", LogLevel::Info), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("Warning", LogLevel::Info), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("debug", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("4", LogLevel::Info), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("loud", LogLevel::Warn), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("", LogLevel::Debug), LogLevel::Debug);
}

TEST(Log, NamesMatchParser) {
    for (const LogLevel level : {LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug, LogLevel::Trace}) {
        EXPECT_EQ(sprocket::core::parseLogLevel(sprocket::core::logLevelName(level), LogLevel::Info), level);
    }
}

TEST(Log, ShouldLogFollowsCurrentLevel) {
    const sprocket::core::ScopedLogLevel scoped(LogLevel::Warn);
    EXPECT_EQ(sprocket::core::logLevel(), LogLevel::Warn);
    EXPECT_TRUE(sprocket::core::shouldLog(LogLevel::Error));
    EXPECT_TRUE(sprocket::core::shouldLog(LogLevel::Warn));
    EXPECT_FALSE(sprocket::core::shouldLog(LogLevel::Info));

    sprocket::core::setLogLevel(LogLevel::Trace);
    EXPECT_TRUE(sprocket::core::shouldLog(LogLevel::Trace));
}

TEST(Log, DisabledLevelSkipsStreamExpression) {
    const sprocket::core::ScopedLogLevel scoped(LogLevel::Error);
    SinkCapture capture;
    int evaluated = 0;
    SPROCKET_LOGD("test") << "never " << ++evaluated;
    EXPECT_EQ(evaluated, 0);
    SPROCKET_LOGE("test") << "expected error line " << ++evaluated;
    EXPECT_EQ(evaluated, 1);
    EXPECT_EQ(capture.lines.size(), 1u);
}

TEST(Log, SinkReceivesCategoryAndTrimmedMessage) {
    const sprocket::core::ScopedLogLevel scoped(LogLevel::Debug);
    SinkCapture capture;
    SPROCKET_LOGI("controls") << "rebound " << 2 << "\n";
    SPROCKET_LOGT("controls") << "filtered out";

    ASSERT_EQ(capture.lines.size(), 1u);
    EXPECT_EQ(capture.lines[0].level, LogLevel::Info);
    EXPECT_EQ(capture.lines[0].category, "controls");
    EXPECT_EQ(capture.lines[0].message, "rebound 2");
}

TEST(Log, SinkMayLogFromInsideItself) {
    const sprocket::core::ScopedLogLevel scoped(LogLevel::Info);
    std::vector<std::string> received;
    sprocket::core::setLogSink([&received](LogLevel, std::string_view, std::string_view message) {
        received.emplace_back(message);
        if (received.size() == 1) {
            SPROCKET_LOGI("sink") << "nested";
        }
    });
    SPROCKET_LOGI("test") << "outer";
    sprocket::core::setLogSink(nullptr);

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], "outer");
    EXPECT_EQ(received[1], "nested");
}

TEST(Log, ThrowingSinkDoesNotEscapeLogLine) {
    const sprocket::core::ScopedLogLevel scoped(LogLevel::Info);
    int calls = 0;
    sprocket::core::setLogSink([&calls](LogLevel, std::string_view, std::string_view) {
        ++calls;
        throw std::runtime_error("sink failure");
    });
    SPROCKET_LOGW("test") << "expected warning, sink throws";
    SPROCKET_LOGW("test") << "expected warning, sink throws again";
    sprocket::core::setLogSink(nullptr);

    EXPECT_EQ(calls, 2);
}

TEST(Log, ScopedLevelRestoresPrevious) {
    const LogLevel before = sprocket::core::logLevel();
    {
        const sprocket::core::ScopedLogLevel scoped(LogLevel::Trace);
        EXPECT_EQ(sprocket::core::logLevel(), LogLevel::Trace);
    }
    EXPECT_EQ(sprocket::core::logLevel(), before);
}

TEST(Hash, HashCodeIsDeterministicAndMixed) {
    EXPECT_EQ(sprocket::core::hashCode(42), sprocket::core::hashCode(42));
    EXPECT_NE(sprocket::core::hashCode(42), sprocket::core::hashCode(43));
    EXPECT_NE(sprocket::core::hashCode(0), 0u);
    EXPECT_EQ(sprocket::core::hashCode(std::string("tile")), sprocket::core::hashCode(std::string("tile")));

    const sprocket::grids::ICoord cell{12, -4};
    EXPECT_EQ(sprocket::core::hashCode(cell), sprocket::core::hashCode(sprocket::grids::ICoord(12, -4)));
    EXPECT_NE(sprocket::core::hashCode(cell), sprocket::core::hashCode(sprocket::grids::ICoord(-4, 12)));
}

TEST(Hash, NearbyIntegersSpreadAcrossLowBits) {
    std::unordered_set<std::uint64_t> buckets;
    for (int i = 0; i < 64; ++i) {
        buckets.insert(sprocket::core::hashCode(i) & 0xffu);
    }
    EXPECT_GT(buckets.size(), 40u);
}

TEST(Hash, CombineIsOrderSensitive) {
    const std::size_t ab = sprocket::core::hashCombine(sprocket::core::hashCombine(0, 1), 2);
    const std::size_t ba = sprocket::core::hashCombine(sprocket::core::hashCombine(0, 2), 1);
    EXPECT_NE(ab, ba);
}

TEST(Pcg32, SeedDeterminesSequence) {
    sprocket::core::Pcg32 a(1234);
    sprocket::core::Pcg32 b(1234);
    sprocket::core::Pcg32 c(4321);
    bool anyDifferent = false;
    for (int i = 0; i < 32; ++i) {
        const std::uint32_t va = a.nextU32();
        EXPECT_EQ(va, b.nextU32());
        anyDifferent = anyDifferent || va != c.nextU32();
    }
    EXPECT_TRUE(anyDifferent);
}

TEST(Pcg32, FloatsStayInUnitInterval) {
    sprocket::core::Pcg32 rng;
    for (int i = 0; i < 10000; ++i) {
        const float value = rng.nextFloat01();
        EXPECT_GE(value, 0.0f);
        EXPECT_LT(value, 1.0f);
    }
}

} // namespace
