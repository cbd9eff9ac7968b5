#include <catch2/catch_test_macros.hpp>

#include <app/ui/canvas.hpp>

#include <clocale>
#include <string>

using namespace app::ui;

namespace canvas_tests {

// Switches character classification to UTF-8 for the duration of a test
struct Utf8Locale {
    std::string previous;
    bool active = false;

    Utf8Locale() {
        if (const char *current = std::setlocale(LC_CTYPE, nullptr)) {
            previous = current;
        }
        active = std::setlocale(LC_CTYPE, "C.UTF-8") != nullptr;
    }

    ~Utf8Locale() {
        if (!previous.empty()) {
            std::setlocale(LC_CTYPE, previous.c_str());
        }
    }
};

TEST_CASE("Text width counts terminal columns", "[canvas]") {
    const Utf8Locale locale{};
    if (!locale.active) {
        WARN("C.UTF-8 locale is not available");
        return;
    }

    CHECK(TextWidth("") == 0);
    CHECK(TextWidth("PATH") == 4);
    CHECK(TextWidth("h\xC3\xA9llo") == 5);            // precomposed e-acute
    CHECK(TextWidth("e\xCC\x81") == 1);               // e + combining acute accent
    CHECK(TextWidth("\xE6\x97\xA5\xE6\x9C\xAC") == 4); // two CJK ideographs
    CHECK(TextWidth("\xF0\x9F\x99\x82") == 2);         // emoji
    CHECK(TextWidth("a\tb") == 3);
    CHECK(TextWidth("\xFF" "a") == 2);
}

TEST_CASE("Text is cut at column boundaries", "[canvas]") {
    const Utf8Locale locale{};
    if (!locale.active) {
        WARN("C.UTF-8 locale is not available");
        return;
    }

    const std::string cjk = "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E"; // three ideographs, six columns
    int width = 0;

    CHECK(FitColumns(cjk, 6, width) == 9);
    CHECK(width == 6);

    // Wide characters never straddle the limit
    CHECK(FitColumns(cjk, 5, width) == 6);
    CHECK(width == 4);
    CHECK(FitColumns(cjk, 1, width) == 0);
    CHECK(width == 0);

    CHECK(FitColumns("ab\xE6\x97\xA5", 3, width) == 2);
    CHECK(width == 2);

    // Combining marks stay with their base character
    CHECK(FitColumns("e\xCC\x81x", 1, width) == 3);
    CHECK(width == 1);

    CHECK(FitColumns("abc", 10, width) == 3);
    CHECK(width == 3);
}

TEST_CASE("Rectangles split into non-overlapping parts", "[canvas]") {
    Rect area{.y = 2, .x = 4, .height = 10, .width = 20};

    SECTION("top") {
        const Rect top = area.TakeTop(3, area);
        CHECK(top.y == 2);
        CHECK(top.height == 3);
        CHECK(area.y == 5);
        CHECK(area.height == 7);
    }

    SECTION("bottom") {
        const Rect bottom = area.TakeBottom(4, area);
        CHECK(bottom.y == 8);
        CHECK(bottom.height == 4);
        CHECK(area.y == 2);
        CHECK(area.height == 6);
    }

    SECTION("more rows than available") {
        Rect rest{};
        const Rect top = area.TakeTop(15, rest);
        CHECK(top.height == 10);
        CHECK(rest.IsEmpty());
    }

    SECTION("centred") {
        const Rect modal = area.Centered(6, 36);
        CHECK(modal.width == 20);
        CHECK(modal.x == 4);
        CHECK(modal.height == 6);
        CHECK(modal.y == 4);
    }
}

} // namespace canvas_tests
