#pragma once

#include <string>

namespace owah {

constexpr int kBaseMidiNote = 60;   // C4, the bite's natural pitch
constexpr int kPianoStartMidi = 48; // C3
constexpr int kPianoEndMidi = 72;   // C5
constexpr int kMinMidiNote = 0;
constexpr int kMaxMidiNote = 127;

inline bool isValidNote(int midi_note) {
    return midi_note >= kMinMidiNote && midi_note <= kMaxMidiNote;
}

// Playback speed multiplier for midi_note relative to base_note:
// 2^((midi_note - base_note) / 12).
double pitchRatio(int midi_note, int base_note = kBaseMidiNote);

// "C4", "F#3", ...
std::string noteName(int midi_note);

bool isBlackKey(int midi_note);

// Computer keyboard row A W S E D F T G Y H U J K mapped onto C4..C5.
// Returns -1 for keys outside the row.
int noteForKey(char key);

} // namespace owah
