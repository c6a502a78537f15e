#pragma once

#include "console.hpp"
#include <spdlog/fmt/fmt.h>
#include <string>

/**
 * @brief 致命错误：打印诊断信息（消息与源码位置）后停机，不会返回
 * @note 主机模拟中停机即结束进程
 */
[[noreturn]] void kernel_panic(const char *file, int line, const std::string &message);

/**
 * @brief 设置panic信息输出的控制台，nullptr表示只输出到stderr与日志
 */
void set_panic_console(ConsoleInterface *console);

#define BOOTMM_PANIC(...) ::kernel_panic(__FILE__, __LINE__, fmt::format(__VA_ARGS__))

#define BOOTMM_ASSERT(cond, ...)                                                                   \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            BOOTMM_PANIC(__VA_ARGS__);                                                             \
        }                                                                                          \
    } while (0)
