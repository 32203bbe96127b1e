#include "catch2/catch.hpp"
#include "clarg/color.hpp"

using namespace clarg;

TEST_CASE( "color modes", "[color]" ) {
    REQUIRE(color::enabled(ColorMode::Always, color::Stream::Other));
    REQUIRE(!color::enabled(ColorMode::Never, color::Stream::Stdout));
    // Auto never colors a stream that is not a terminal.
    REQUIRE(!color::enabled(ColorMode::Auto, color::Stream::Other));
}

TEST_CASE( "paint", "[color]" ) {
    const ColorTheme theme{};
    REQUIRE(color::paint(theme, ColorRole::Warning, "[WARNING]:", false) == "[WARNING]:");
    REQUIRE(color::paint(theme, ColorRole::Warning, "[WARNING]:", true) == theme.warning + "[WARNING]:" + theme.reset);

    ColorTheme plain;
    plain.section.clear();
    REQUIRE(color::paint(plain, ColorRole::Section, "Flags:", true) == "Flags:");
}
