#include "console.hpp"
#include "panic.hpp"
#include "scripted_console.hpp"
#include <cstdio>
#include <gtest/gtest.h>
#include <memory>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>
#include <string>

namespace {

std::optional<std::string> read_line(ScriptedConsole &console, size_t capacity = 64) {
    std::string buffer(capacity, '\0');
    auto count =
        console_read_line(console, reinterpret_cast<uint8_t *>(buffer.data()), buffer.size());
    if (!count) {
        return std::nullopt;
    }
    buffer.resize(*count);
    return buffer;
}

TEST(ConsoleTest, ReadsOneLineAndEchoes) {
    ScriptedConsole console("hello\rnext\r");
    EXPECT_EQ(read_line(console), std::optional<std::string>("hello"));
    EXPECT_EQ(console.output(), "hello\n");
    EXPECT_EQ(read_line(console), std::optional<std::string>("next"));
    EXPECT_TRUE(console.closed());
}

TEST(ConsoleTest, EmptyLineYieldsNothing) {
    ScriptedConsole console("\r");
    EXPECT_FALSE(read_line(console).has_value());
    EXPECT_EQ(console.output(), "\n");
}

TEST(ConsoleTest, StopsWhenBufferIsFull) {
    ScriptedConsole console("abcdef\r");
    EXPECT_EQ(read_line(console, 4), std::optional<std::string>("abcd"));
    EXPECT_EQ(console.output(), "abcd");
}

TEST(ConsoleTest, ClosedInputEndsPartialLine) {
    ScriptedConsole console("tail");
    EXPECT_EQ(read_line(console), std::optional<std::string>("tail"));
    EXPECT_FALSE(read_line(console).has_value());
}

TEST(ConsoleTest, PrintsNumbers) {
    ScriptedConsole console;
    console_print_number(console, 0);
    console_print(console, " ");
    console_print_number(console, 18446744073709551615ull);
    EXPECT_EQ(console.output(), "0 18446744073709551615");
}

TEST(ConsoleTest, PrintNarrowsCharactersToOneByte) {
    ScriptedConsole console;
    // U+00E9 fits in a byte
    console_print(console, "caf\xc3\xa9!");
    EXPECT_EQ(console.output(), "caf\xe9!");

    ScriptedConsole wide;
    // one '?' per character, not per byte
    console_print(wide, "\xe4\xbd\xa0\xe5\xa5\xbd \xf0\x9f\x98\x80.");
    EXPECT_EQ(wide.output(), "?? ?.");

    ScriptedConsole broken;
    console_print(broken, "a\xff" "b\xc3");
    EXPECT_EQ(broken.output(), "a?b?");
}

TEST(ConsoleTest, Utf8Validation) {
    auto valid = [](const std::string &s) {
        return is_valid_utf8(reinterpret_cast<const uint8_t *>(s.data()), s.size());
    };
    EXPECT_TRUE(valid(""));
    EXPECT_TRUE(valid("plain ascii"));
    EXPECT_TRUE(valid("\xe4\xbd\xa0\xe5\xa5\xbd"));
    EXPECT_TRUE(valid("\xf0\x9f\x98\x80"));
    EXPECT_FALSE(valid("\xff"));
    EXPECT_FALSE(valid("\xe4\xbd"));         // truncated
    EXPECT_FALSE(valid("\xc0\xaf"));         // overlong
    EXPECT_FALSE(valid("\xed\xa0\x80"));     // surrogate
    EXPECT_FALSE(valid("\xf4\x90\x80\x80")); // beyond U+10FFFF
}

TEST(ConsoleTest, LogSinkWritesThroughConsole) {
    ScriptedConsole console;
    auto sink = std::make_shared<console_sink_st>(console);
    spdlog::logger logger("console", sink);
    logger.set_pattern("[%l] %v");
    logger.info("frame 0x{:x}", 0x80400);
    EXPECT_EQ(console.output(), "[info] frame 0x80400\n");
}

TEST(PanicDeathTest, ReportsMessageAndLocation) {
    EXPECT_DEATH(
        BOOTMM_PANIC("value {} out of range", 42),
        "Panicked with message: \"value 42 out of range\" at .*console_test.cpp:[0-9]+"
    );
    EXPECT_DEATH(BOOTMM_ASSERT(1 + 1 == 3, "math is broken"), "math is broken");
}

// marks every line it prints so the panic output can be told apart from stderr
class StderrConsole : public ConsoleInterface {
public:
    void putchar(uint8_t ch) override {
        if (m_line_start) {
            std::fputs("[console] ", stderr);
        }
        std::fputc(ch, stderr);
        m_line_start = ch == '\n';
    }
    std::optional<uint8_t> getchar() override { return std::nullopt; }

private:
    bool m_line_start = true;
};

TEST(PanicDeathTest, WritesToPanicConsole) {
    StderrConsole console;
    EXPECT_DEATH(
        {
            set_panic_console(&console);
            BOOTMM_PANIC("halt");
        },
        "\\[console\\] Panicked with message: \"halt\""
    );
}

} // namespace
