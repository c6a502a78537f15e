#include "console.hpp"
#include <cstdio>

namespace {

// 解码一个UTF-8字符，返回其字节数；非法或截断的序列返回0
size_t decode_utf8(const uint8_t *data, size_t size, uint32_t &cp) {
    uint8_t lead = data[0];
    size_t extra;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xe0) == 0xc0) {
        extra = 1;
        cp = lead & 0x1f;
    } else if ((lead & 0xf0) == 0xe0) {
        extra = 2;
        cp = lead & 0x0f;
    } else if ((lead & 0xf8) == 0xf0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        return 0;
    }
    if (size <= extra) {
        return 0;
    }
    for (size_t k = 1; k <= extra; k++) {
        if ((data[k] & 0xc0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (data[k] & 0x3f);
    }
    // overlong encodings, surrogates, beyond U+10FFFF
    static constexpr uint32_t min_cp[4] = {0, 0x80, 0x800, 0x10000};
    if (cp < min_cp[extra] || (cp >= 0xd800 && cp <= 0xdfff) || cp > 0x10ffff) {
        return 0;
    }
    return extra + 1;
}

} // namespace

void StdioConsole::putchar(uint8_t ch) {
    std::fputc(ch, stdout);
    if (ch == '\n') {
        std::fflush(stdout);
    }
}

std::optional<uint8_t> StdioConsole::getchar() {
    if (m_eof) {
        return std::nullopt;
    }
    int ch = std::fgetc(stdin);
    if (ch == EOF) {
        m_eof = true;
        return std::nullopt;
    }
    if (ch == '\n') {
        return static_cast<uint8_t>('\r');
    }
    return static_cast<uint8_t>(ch);
}

void console_print(ConsoleInterface &console, std::string_view str) {
    const auto *data = reinterpret_cast<const uint8_t *>(str.data());
    size_t i = 0;
    while (i < str.size()) {
        uint32_t cp;
        size_t len = decode_utf8(data + i, str.size() - i, cp);
        if (len == 0) {
            // 非法字节单独替换
            console.putchar('?');
            i++;
            continue;
        }
        console.putchar(cp < 0x100 ? static_cast<uint8_t>(cp) : '?');
        i += len;
    }
}

void console_print_number(ConsoleInterface &console, uint64_t number) {
    if (number == 0) {
        console.putchar('0');
        return;
    }
    uint8_t buffer[20];
    int index = 0;
    while (number > 0) {
        buffer[index++] = static_cast<uint8_t>(number % 10) + '0';
        number /= 10;
    }
    for (int i = index - 1; i >= 0; i--) {
        console.putchar(buffer[i]);
    }
}

std::optional<size_t> console_read_line(
    ConsoleInterface &console, uint8_t *buffer, size_t capacity
) {
    size_t count = 0;
    for (;;) {
        std::optional<uint8_t> ch = console.getchar();
        if (!ch) {
            if (console.closed()) {
                break;
            }
            continue;
        }
        if (*ch == '\r') {
            console.putchar('\n');
            break;
        }
        if (count == capacity) {
            break;
        }
        console.putchar(*ch);
        buffer[count++] = *ch;
    }
    if (count == 0) {
        return std::nullopt;
    }
    return count;
}

bool is_valid_utf8(const uint8_t *data, size_t size) {
    size_t i = 0;
    while (i < size) {
        uint32_t cp;
        size_t len = decode_utf8(data + i, size - i, cp);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}
