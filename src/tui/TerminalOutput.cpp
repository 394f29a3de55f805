// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>
#include <format>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>

namespace manzai::tui
{

namespace
{
    struct Codepoint
    {
        char32_t value = 0;
        std::size_t length = 1;
    };

    auto decodeAt(std::string_view text, std::size_t pos) -> Codepoint
    {
        auto const lead = static_cast<unsigned char>(text[pos]);
        auto cp = Codepoint {};
        if (lead < 0x80)
            return Codepoint { .value = lead, .length = 1 };
        if ((lead & 0xE0) == 0xC0)
            cp = Codepoint { .value = static_cast<char32_t>(lead & 0x1F), .length = 2 };
        else if ((lead & 0xF0) == 0xE0)
            cp = Codepoint { .value = static_cast<char32_t>(lead & 0x0F), .length = 3 };
        else if ((lead & 0xF8) == 0xF0)
            cp = Codepoint { .value = static_cast<char32_t>(lead & 0x07), .length = 4 };
        else
            return Codepoint { .value = 0xFFFD, .length = 1 };

        auto consumed = std::size_t { 1 };
        while (consumed < cp.length && pos + consumed < text.size()
               && (static_cast<unsigned char>(text[pos + consumed]) & 0xC0) == 0x80)
        {
            cp.value = (cp.value << 6) | (static_cast<unsigned char>(text[pos + consumed]) & 0x3F);
            ++consumed;
        }
        if (consumed != cp.length)
            return Codepoint { .value = 0xFFFD, .length = consumed };
        return cp;
    }

    auto isWide(char32_t cp) noexcept -> bool
    {
        // East Asian Wide and Fullwidth blocks.
        return (cp >= 0x1100 && cp <= 0x115F) || (cp >= 0x2E80 && cp <= 0x303E) || (cp >= 0x3041 && cp <= 0x33FF)
               || (cp >= 0x3400 && cp <= 0x4DBF) || (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0xA000 && cp <= 0xA4CF)
               || (cp >= 0xAC00 && cp <= 0xD7A3) || (cp >= 0xF900 && cp <= 0xFAFF) || (cp >= 0xFE30 && cp <= 0xFE4F)
               || (cp >= 0xFF00 && cp <= 0xFF60) || (cp >= 0xFFE0 && cp <= 0xFFE6)
               || (cp >= 0x1F300 && cp <= 0x1F64F) || (cp >= 0x1F900 && cp <= 0x1F9FF)
               || (cp >= 0x20000 && cp <= 0x3FFFD);
    }

    auto columnsOf(char32_t cp) noexcept -> int
    {
        return isWide(cp) ? 2 : 1;
    }
} // namespace

auto displayWidth(std::string_view text) -> int
{
    auto width = 0;
    for (auto pos = std::size_t { 0 }; pos < text.size();)
    {
        auto const cp = decodeAt(text, pos);
        width += columnsOf(cp.value);
        pos += cp.length;
    }
    return width;
}

auto truncateToWidth(std::string_view text, int width) -> std::string
{
    auto used = 0;
    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto const cp = decodeAt(text, pos);
        if (used + columnsOf(cp.value) > width)
            break;
        used += columnsOf(cp.value);
        pos += cp.length;
    }
    return std::string(text.substr(0, pos));
}

auto centerText(std::string_view text, int width) -> std::string
{
    if (width <= 0)
        return {};

    auto result = truncateToWidth(text, width);
    auto const padding = width - displayWidth(result);
    auto const left = padding / 2;
    result.insert(0, static_cast<std::size_t>(left), ' ');
    result.append(static_cast<std::size_t>(padding - left), ' ');
    return result;
}

// --- TerminalOutput ---

TerminalOutput::TerminalOutput(int fd): _fd(fd)
{
}

auto TerminalOutput::initialize() -> VoidResult
{
    if (!::isatty(_fd))
        return makeError(ErrorCode::DeviceUnavailable, std::format("File descriptor {} is not a terminal", _fd));

    updateDimensions();
    return {};
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    appendSgr(style);
    _buffer.append(text);
    appendSgrReset();
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::clearScreen()
{
    _buffer += "\033[2J\033[H";
}

void TerminalOutput::fillScreen(Color const& background)
{
    // Erase-display paints with the current background color.
    appendSgr(Style { .bg = background });
    _buffer += "\033[2J\033[H";
    appendSgrReset();
}

void TerminalOutput::enterAltScreen()
{
    _buffer += "\033[?1049h";
}

void TerminalOutput::leaveAltScreen()
{
    _buffer += "\033[?1049l";
}

void TerminalOutput::showCursor()
{
    _buffer += "\033[?25h";
}

void TerminalOutput::hideCursor()
{
    _buffer += "\033[?25l";
}

void TerminalOutput::beginSynchronized()
{
    _buffer += "\033[?2026h";
}

void TerminalOutput::endSynchronized()
{
    _buffer += "\033[?2026l";
}

auto TerminalOutput::flush() -> VoidResult
{
    auto offset = std::size_t { 0 };
    while (offset < _buffer.size())
    {
        auto const n = ::write(_fd, _buffer.data() + offset, _buffer.size() - offset);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            _buffer.clear();
            return makeError(ErrorCode::IoError, std::format("Terminal write failed: {}", std::strerror(errno)));
        }
        offset += static_cast<std::size_t>(n);
    }
    _buffer.clear();
    return {};
}

auto TerminalOutput::columns() const noexcept -> int
{
    return _cols;
}

auto TerminalOutput::rows() const noexcept -> int
{
    return _rows;
}

auto TerminalOutput::updateDimensions() -> bool
{
    auto ws = winsize {};
    if (ioctl(_fd, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0 || ws.ws_row == 0)
        return false;

    auto const changed = ws.ws_col != _cols || ws.ws_row != _rows;
    _cols = ws.ws_col;
    _rows = ws.ws_row;
    return changed;
}

void TerminalOutput::appendSgr(Style const& style)
{
    auto const isDefaultFg = std::holds_alternative<std::monostate>(style.fg);
    auto const isDefaultBg = std::holds_alternative<std::monostate>(style.bg);
    if (isDefaultFg && isDefaultBg && !style.bold && !style.dim)
        return;

    _buffer += "\033[";
    auto needSemicolon = false;
    auto const appendSep = [&]() {
        if (needSemicolon)
            _buffer += ';';
        needSemicolon = true;
    };

    if (style.bold)
    {
        appendSep();
        _buffer += '1';
    }
    if (style.dim)
    {
        appendSep();
        _buffer += '2';
    }

    if (auto const* idx = std::get_if<std::uint8_t>(&style.fg))
    {
        appendSep();
        _buffer += std::format("38;5;{}", *idx);
    }
    else if (auto const* rgb = std::get_if<RgbColor>(&style.fg))
    {
        appendSep();
        _buffer += std::format("38;2;{};{};{}", rgb->r, rgb->g, rgb->b);
    }

    if (auto const* idx = std::get_if<std::uint8_t>(&style.bg))
    {
        appendSep();
        _buffer += std::format("48;5;{}", *idx);
    }
    else if (auto const* rgb = std::get_if<RgbColor>(&style.bg))
    {
        appendSep();
        _buffer += std::format("48;2;{};{};{}", rgb->r, rgb->g, rgb->b);
    }

    _buffer += 'm';
}

void TerminalOutput::appendSgrReset()
{
    _buffer += "\033[m";
}

} // namespace manzai::tui
