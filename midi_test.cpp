#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <climits>

#include "midi.hpp"

using namespace owah;

TEST_CASE("Pitch ratio follows equal temperament", "[midi]") {
    REQUIRE(pitchRatio(kBaseMidiNote) == 1.0);
    REQUIRE(pitchRatio(kBaseMidiNote + 12) == Catch::Approx(2.0));
    REQUIRE(pitchRatio(kBaseMidiNote - 12) == Catch::Approx(0.5));
    REQUIRE(pitchRatio(kBaseMidiNote + 7) == Catch::Approx(1.4983070768766815));
    REQUIRE(pitchRatio(kPianoEndMidi) == Catch::Approx(2.0));
    REQUIRE(pitchRatio(kPianoStartMidi) == Catch::Approx(0.5));
}

TEST_CASE("Pitch ratio honours a custom base note", "[midi]") {
    REQUIRE(pitchRatio(69, 69) == 1.0);
    REQUIRE(pitchRatio(81, 69) == Catch::Approx(2.0));
}

TEST_CASE("Pitch ratio stays defined for extreme notes", "[midi]") {
    REQUIRE(pitchRatio(INT_MIN + 40) == 0.0);
    REQUIRE(pitchRatio(INT_MIN + 40, INT_MAX) == 0.0);
    REQUIRE(isValidNote(0));
    REQUIRE(isValidNote(127));
    REQUIRE_FALSE(isValidNote(-1));
    REQUIRE_FALSE(isValidNote(128));
}

TEST_CASE("Note names", "[midi]") {
    REQUIRE(noteName(60) == "C4");
    REQUIRE(noteName(61) == "C#4");
    REQUIRE(noteName(48) == "C3");
    REQUIRE(noteName(69) == "A4");
    REQUIRE(noteName(71) == "B4");
    REQUIRE(noteName(72) == "C5");
}

TEST_CASE("Black keys", "[midi]") {
    int black = 0;
    for (int n = kPianoStartMidi; n <= kPianoEndMidi; ++n) {
        if (isBlackKey(n)) black++;
    }
    REQUIRE(black == 10);
    REQUIRE_FALSE(isBlackKey(60));
    REQUIRE(isBlackKey(66));
}

TEST_CASE("Computer keyboard row maps onto C4..C5", "[midi]") {
    REQUIRE(noteForKey('A') == 60);
    REQUIRE(noteForKey('a') == 60);
    REQUIRE(noteForKey('W') == 61);
    REQUIRE(noteForKey('H') == 69);
    REQUIRE(noteForKey('K') == 72);
    REQUIRE(noteForKey('Z') == -1);
    REQUIRE(noteForKey('1') == -1);
}
