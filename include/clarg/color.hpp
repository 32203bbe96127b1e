#ifndef CLARG_COLOR_HPP
#define CLARG_COLOR_HPP

#include <cstdlib>
#include <string>
#include <string_view>

namespace clarg {

enum class ColorMode {
    Auto,
    Always,
    Never,
};

enum class ColorRole {
    Section, // dump headers
    Name,    // --name in the dump
    Warning, // [WARNING]: prefix
};

struct ColorTheme {
    std::string reset{"\x1b[0m"};
    std::string section{"\x1b[1m\x1b[36m"}; // bold cyan
    std::string name{"\x1b[33m"};           // yellow
    std::string warning{"\x1b[1m\x1b[31m"}; // bold red
};

namespace color {

enum class Stream {
    Stdout,
    Stderr,
    Other,
};

// Returns true if the underlying stream is a terminal.
bool isTty(Stream stream);

// Windows: enables VT sequences for the console. Non-Windows: no-op returning true.
bool enableVirtualTerminalProcessing(Stream stream);

inline bool envNoColor() {
    // https://no-color.org/
    return std::getenv("NO_COLOR") != nullptr;
}

inline bool envTermDumb() {
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) == "dumb";
}

// Always -> true, Never -> false, Auto -> terminal without NO_COLOR or TERM=dumb.
bool enabled(ColorMode mode, Stream stream);

// `text` wrapped in the role's escape sequence, or unchanged when `on` is false.
std::string paint(const ColorTheme& theme, ColorRole role, std::string_view text, bool on);

} // namespace color
} // namespace clarg

#endif // CLARG_COLOR_HPP
