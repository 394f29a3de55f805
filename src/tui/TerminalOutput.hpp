// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace manzai::tui
{

/// @brief RGB color representation.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    auto operator==(RgbColor const&) const -> bool = default;
};

/// @brief Color representation: default, 256-color index, or true color (RGB).
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

/// @brief Text styling attributes for terminal output.
struct Style
{
    Color fg;          ///< Foreground color.
    Color bg;          ///< Background color.
    bool bold = false; ///< Bold text.
    bool dim = false;  ///< Dim/faint text.
};

/// @brief Buffered, styled output to a terminal file descriptor.
///
/// Output is collected in an internal buffer and written on flush().
class TerminalOutput
{
  public:
    /// @param fd File descriptor of the terminal (STDOUT_FILENO or an opened tty).
    explicit TerminalOutput(int fd);

    /// @brief Queries the terminal dimensions.
    /// @return Success, or DeviceUnavailable if the descriptor is not a terminal.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Writes styled text at the current cursor position.
    void write(std::string_view text, Style const& style = {});

    /// @brief Writes raw text without styling.
    void writeRaw(std::string_view text);

    /// @brief Moves the cursor to an absolute position (1-based).
    void moveTo(int row, int col);

    /// @brief Clears the entire screen.
    void clearScreen();

    /// @brief Fills the entire screen with the given background color.
    void fillScreen(Color const& background);

    void enterAltScreen();
    void leaveAltScreen();
    void showCursor();
    void hideCursor();

    /// @brief Starts a synchronized update (CSI ?2026h) so the frame is shown without tearing.
    void beginSynchronized();

    /// @brief Ends a synchronized update (CSI ?2026l).
    void endSynchronized();

    /// @brief Writes the buffer to the terminal.
    /// @return Success or IoError when the write fails.
    auto flush() -> VoidResult;

    [[nodiscard]] auto columns() const noexcept -> int;
    [[nodiscard]] auto rows() const noexcept -> int;

    /// @brief Updates the cached terminal dimensions.
    /// @return True if the dimensions changed.
    auto updateDimensions() -> bool;

    /// @brief Returns the pending (unflushed) output.
    [[nodiscard]] auto pending() const noexcept -> std::string_view { return _buffer; }

    /// @brief Drops the pending output without writing it.
    void discard() noexcept { _buffer.clear(); }

  private:
    int _fd;
    std::string _buffer; ///< Output buffer for batching writes.
    int _cols = 80;
    int _rows = 24;

    void appendSgr(Style const& style);
    void appendSgrReset();
};

/// @brief Returns the number of terminal columns a UTF-8 string occupies.
///
/// East Asian wide characters (kana, kanji, fullwidth forms) take two columns.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

/// @brief Returns the longest prefix of text that fits into width columns.
/// The cut is always on a code point boundary.
[[nodiscard]] auto truncateToWidth(std::string_view text, int width) -> std::string;

/// @brief Truncates text to width columns and pads it with spaces on both sides to exactly width columns.
[[nodiscard]] auto centerText(std::string_view text, int width) -> std::string;

} // namespace manzai::tui
