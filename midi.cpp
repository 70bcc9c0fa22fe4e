#include "midi.hpp"

#include <cctype>
#include <cmath>

namespace owah {

double pitchRatio(int midi_note, int base_note) {
    return std::pow(2.0, ((double)midi_note - base_note) / 12.0);
}

static int semitoneOf(int midi_note) {
    int s = midi_note % 12;
    return s < 0 ? s + 12 : s;
}

std::string noteName(int midi_note) {
    static const char* kNames[] = {"C", "C#", "D", "D#", "E", "F",
                                   "F#", "G", "G#", "A", "A#", "B"};
    int octave = midi_note / 12 - 1;
    return std::string(kNames[semitoneOf(midi_note)]) + std::to_string(octave);
}

bool isBlackKey(int midi_note) {
    switch (semitoneOf(midi_note)) {
        case 1: case 3: case 6: case 8: case 10:
            return true;
        default:
            return false;
    }
}

int noteForKey(char key) {
    switch (std::toupper((unsigned char)key)) {
        case 'A': return 60;
        case 'W': return 61;
        case 'S': return 62;
        case 'E': return 63;
        case 'D': return 64;
        case 'F': return 65;
        case 'T': return 66;
        case 'G': return 67;
        case 'Y': return 68;
        case 'H': return 69;
        case 'U': return 70;
        case 'J': return 71;
        case 'K': return 72;
        default: return -1;
    }
}

} // namespace owah
