#pragma once
#include "sdl.hpp"

#include "common.hpp"

#include <cstdint>
#include <string>

// Built-in 5x7 bitmap font, so the window needs nothing beyond SDL2.
// Covers the characters the map and HUD print; lowercase is drawn as uppercase
// and anything else as '?'.

struct Glyph5x7 {
    // 7 rows, 5 bits used (bit 4 is leftmost).
    uint8_t rows[7];
};

static constexpr int FONT_W = 5;
static constexpr int FONT_H = 7;

inline Glyph5x7 glyph5x7(char c) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');

    switch (c) {
        case ' ': return {{0,0,0,0,0,0,0}};

        // Map symbols
        case '#': return {{0b01010,0b01010,0b11111,0b01010,0b11111,0b01010,0b01010}};
        case '@': return {{0b01110,0b10001,0b10111,0b10101,0b10111,0b10000,0b01110}};
        case '%': return {{0b11001,0b11010,0b00010,0b00100,0b01000,0b01011,0b10011}};

        case '0': return {{0b01110,0b10001,0b10011,0b10101,0b11001,0b10001,0b01110}};
        case '1': return {{0b00100,0b01100,0b00100,0b00100,0b00100,0b00100,0b01110}};
        case '2': return {{0b01110,0b10001,0b00001,0b00010,0b00100,0b01000,0b11111}};
        case '3': return {{0b11110,0b00001,0b00001,0b01110,0b00001,0b00001,0b11110}};
        case '4': return {{0b00010,0b00110,0b01010,0b10010,0b11111,0b00010,0b00010}};
        case '5': return {{0b11111,0b10000,0b10000,0b11110,0b00001,0b00001,0b11110}};
        case '6': return {{0b00110,0b01000,0b10000,0b11110,0b10001,0b10001,0b01110}};
        case '7': return {{0b11111,0b00001,0b00010,0b00100,0b01000,0b01000,0b01000}};
        case '8': return {{0b01110,0b10001,0b10001,0b01110,0b10001,0b10001,0b01110}};
        case '9': return {{0b01110,0b10001,0b10001,0b01111,0b00001,0b00010,0b01100}};
        case 'A': return {{0b01110,0b10001,0b10001,0b11111,0b10001,0b10001,0b10001}};
        case 'B': return {{0b11110,0b10001,0b10001,0b11110,0b10001,0b10001,0b11110}};
        case 'C': return {{0b01110,0b10001,0b10000,0b10000,0b10000,0b10001,0b01110}};
        case 'D': return {{0b11100,0b10010,0b10001,0b10001,0b10001,0b10010,0b11100}};
        case 'E': return {{0b11111,0b10000,0b10000,0b11110,0b10000,0b10000,0b11111}};
        case 'F': return {{0b11111,0b10000,0b10000,0b11110,0b10000,0b10000,0b10000}};
        case 'G': return {{0b01110,0b10001,0b10000,0b10000,0b10011,0b10001,0b01110}};
        case 'H': return {{0b10001,0b10001,0b10001,0b11111,0b10001,0b10001,0b10001}};
        case 'I': return {{0b01110,0b00100,0b00100,0b00100,0b00100,0b00100,0b01110}};
        case 'J': return {{0b00001,0b00001,0b00001,0b00001,0b10001,0b10001,0b01110}};
        case 'K': return {{0b10001,0b10010,0b10100,0b11000,0b10100,0b10010,0b10001}};
        case 'L': return {{0b10000,0b10000,0b10000,0b10000,0b10000,0b10000,0b11111}};
        case 'M': return {{0b10001,0b11011,0b10101,0b10101,0b10001,0b10001,0b10001}};
        case 'N': return {{0b10001,0b10001,0b11001,0b10101,0b10011,0b10001,0b10001}};
        case 'O': return {{0b01110,0b10001,0b10001,0b10001,0b10001,0b10001,0b01110}};
        case 'P': return {{0b11110,0b10001,0b10001,0b11110,0b10000,0b10000,0b10000}};
        case 'Q': return {{0b01110,0b10001,0b10001,0b10001,0b10101,0b10010,0b01101}};
        case 'R': return {{0b11110,0b10001,0b10001,0b11110,0b10100,0b10010,0b10001}};
        case 'S': return {{0b01111,0b10000,0b10000,0b01110,0b00001,0b00001,0b11110}};
        case 'T': return {{0b11111,0b00100,0b00100,0b00100,0b00100,0b00100,0b00100}};
        case 'U': return {{0b10001,0b10001,0b10001,0b10001,0b10001,0b10001,0b01110}};
        case 'V': return {{0b10001,0b10001,0b10001,0b10001,0b10001,0b01010,0b00100}};
        case 'W': return {{0b10001,0b10001,0b10001,0b10101,0b10101,0b10101,0b01010}};
        case 'X': return {{0b10001,0b10001,0b01010,0b00100,0b01010,0b10001,0b10001}};
        case 'Y': return {{0b10001,0b10001,0b01010,0b00100,0b00100,0b00100,0b00100}};
        case 'Z': return {{0b11111,0b00001,0b00010,0b00100,0b01000,0b10000,0b11111}};
        case '.': return {{0,0,0,0,0,0b01100,0b01100}};
        case ',': return {{0,0,0,0,0,0b01100,0b00100}};
        case '!': return {{0b00100,0b00100,0b00100,0b00100,0b00100,0,0b00100}};
        case '?': return {{0b01110,0b10001,0b00001,0b00010,0b00100,0,0b00100}};
        case ':': return {{0,0b01100,0b01100,0,0b01100,0b01100,0}};
        case '-': return {{0,0,0,0b11111,0,0,0}};
        case '/': return {{0b00001,0b00010,0b00100,0b01000,0b10000,0,0}};
        case '+': return {{0,0b00100,0b00100,0b11111,0b00100,0b00100,0}};
        case '(': return {{0b00100,0b01000,0b10000,0b10000,0b10000,0b01000,0b00100}};
        case ')': return {{0b00100,0b00010,0b00001,0b00001,0b00001,0b00010,0b00100}};

        default:
            return {{0b01110,0b10001,0b00010,0b00100,0b00100,0,0b00100}};
    }
}

// Pixel width of `text` at `scale` (one blank column between glyphs).
inline int textWidth5x7(const std::string& text, int scale) {
    return static_cast<int>(text.size()) * (FONT_W + 1) * scale;
}

inline void drawGlyph5x7(SDL_Renderer* r, int x, int y, int scale, const Glyph5x7& g) {
    for (int row = 0; row < FONT_H; ++row) {
        const uint8_t bits = g.rows[row];
        for (int col = 0; col < FONT_W; ++col) {
            if (bits & (1 << (FONT_W - 1 - col))) {
                SDL_Rect px{x + col * scale, y + row * scale, scale, scale};
                SDL_RenderFillRect(r, &px);
            }
        }
    }
}

inline void drawText5x7(SDL_Renderer* r, int x, int y, int scale, Color c, const std::string& text) {
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);

    int penX = x;
    for (char ch : text) {
        drawGlyph5x7(r, penX, y, scale, glyph5x7(ch));
        penX += (FONT_W + 1) * scale;
    }
}

// One map symbol centered in a square tile cell of `cell` pixels.
// Lowercase map glyphs (r, s) keep their meaning even though they render as capitals.
inline void drawCellGlyph(SDL_Renderer* r, int cellX, int cellY, int cell, Color c, char glyph) {
    const int scale = (cell >= FONT_H + 2) ? (cell - 2) / FONT_H : 1;
    const int gx = cellX + (cell - FONT_W * scale) / 2;
    const int gy = cellY + (cell - FONT_H * scale) / 2;

    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);
    drawGlyph5x7(r, gx, gy, scale, glyph5x7(glyph));
}
