#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>
#include <string_view>

/**
 * @brief 字符控制台（对应SBI legacy console_putchar / console_getchar）
 */
class ConsoleInterface {
public:
    virtual ~ConsoleInterface() = default;

    /**
     * @brief 输出一个字节
     */
    virtual void putchar(uint8_t ch) = 0;

    /**
     * @brief 非阻塞读取一个字节
     * @return 读到的字节，尚无输入时返回std::nullopt
     */
    virtual std::optional<uint8_t> getchar() = 0;

    /**
     * @brief 输入端是否已经永久关闭（仅主机模拟有意义，真实串口永远不会关闭）
     */
    virtual bool closed() const { return false; }
};

/**
 * @brief 使用主机stdin/stdout的控制台，'\n'会被转换为'\r'交给内核
 */
class StdioConsole : public ConsoleInterface {
public:
    void putchar(uint8_t ch) override;
    std::optional<uint8_t> getchar() override;
    bool closed() const override { return m_eof; }

private:
    bool m_eof = false;
};

// 按UTF-8字符打印字符串，U+00FF以内的字符输出为单个字节，其余字符和非法字节输出为'?'
void console_print(ConsoleInterface &console, std::string_view str);

// 以十进制打印一个数
void console_print_number(ConsoleInterface &console, uint64_t number);

/**
 * @brief 轮询读取一行，回显读到的字符
 * @param buffer 输出缓冲区
 * @param capacity 缓冲区大小，写满后立即返回
 * @return 读到的字节数；空行（或控制台已关闭且未读到内容）返回std::nullopt
 * @note '\r'结束一行，并回显'\n'
 */
std::optional<size_t> console_read_line(ConsoleInterface &console, uint8_t *buffer, size_t capacity);

bool is_valid_utf8(const uint8_t *data, size_t size);

/**
 * @brief spdlog sink：把格式化好的日志逐字节写到控制台
 */
template <typename Mutex> class console_sink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit console_sink(ConsoleInterface &console) : m_console(console) {}

protected:
    void sink_it_(const spdlog::details::log_msg &msg) override {
        spdlog::memory_buf_t formatted;
        spdlog::sinks::base_sink<Mutex>::formatter_->format(msg, formatted);
        for (char ch : formatted) {
            m_console.putchar(static_cast<uint8_t>(ch));
        }
    }
    void flush_() override {}

private:
    ConsoleInterface &m_console;
};

using console_sink_mt = console_sink<std::mutex>;
using console_sink_st = console_sink<spdlog::details::null_mutex>;
