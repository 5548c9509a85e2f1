#pragma once

#include "sdl.hpp"

#include <cstdint>
#include <string>

// Looping background track played on SDL's audio thread.
//
// Everything here is best effort: a missing file, a bad WAV or no audio
// device is logged to stderr and the game carries on in silence. The callback
// only reads the buffer this object owns; it never touches game state.
class MusicPlayer {
public:
    MusicPlayer() = default;
    ~MusicPlayer();

    MusicPlayer(const MusicPlayer&) = delete;
    MusicPlayer& operator=(const MusicPlayer&) = delete;

    // Returns false if nothing is playing afterwards.
    bool playLooped(const std::string& wavPath, int volume);
    void stop();

    bool isPlaying() const { return device != 0; }

private:
    static void audioCallback(void* userdata, Uint8* stream, int len);
    void fill(Uint8* stream, int len);

    SDL_AudioDeviceID device = 0;
    SDL_AudioSpec spec{};
    Uint8* wavBuf = nullptr;
    Uint32 wavLen = 0;
    Uint32 cursor = 0;
    int volume = SDL_MIX_MAXVOLUME;
    bool initializedAudio = false;
};
