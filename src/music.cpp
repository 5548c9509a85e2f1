#include "music.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>

MusicPlayer::~MusicPlayer() {
    stop();
}

bool MusicPlayer::playLooped(const std::string& wavPath, int vol) {
    stop();

    if (SDL_WasInit(SDL_INIT_AUDIO) == 0) {
        if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
            std::cerr << "SDL audio init failed: " << SDL_GetError() << " (music disabled)\n";
            return false;
        }
        initializedAudio = true;
    }

    SDL_AudioSpec fileSpec{};
    if (!SDL_LoadWAV(wavPath.c_str(), &fileSpec, &wavBuf, &wavLen)) {
        std::cerr << "Music not loaded (" << wavPath << "): " << SDL_GetError() << "\n";
        wavBuf = nullptr;
        wavLen = 0;
        stop();
        return false;
    }

    fileSpec.callback = &MusicPlayer::audioCallback;
    fileSpec.userdata = this;

    device = SDL_OpenAudioDevice(nullptr, 0, &fileSpec, &spec, 0);
    if (device == 0) {
        std::cerr << "SDL_OpenAudioDevice failed: " << SDL_GetError() << " (music disabled)\n";
        stop();
        return false;
    }

    volume = std::clamp(vol, 0, SDL_MIX_MAXVOLUME);
    cursor = 0;
    SDL_PauseAudioDevice(device, 0);
    std::cout << "Playing music: " << wavPath << "\n";
    return true;
}

void MusicPlayer::stop() {
    if (device != 0) {
        SDL_CloseAudioDevice(device);
        device = 0;
    }
    if (wavBuf) {
        SDL_FreeWAV(wavBuf);
        wavBuf = nullptr;
        wavLen = 0;
    }
    if (initializedAudio) {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        initializedAudio = false;
    }
}

void MusicPlayer::audioCallback(void* userdata, Uint8* stream, int len) {
    static_cast<MusicPlayer*>(userdata)->fill(stream, len);
}

void MusicPlayer::fill(Uint8* stream, int len) {
    // Device was opened without format changes, so silence is spec.silence
    // and the WAV bytes can be mixed straight in.
    std::memset(stream, spec.silence, static_cast<size_t>(len));
    if (!wavBuf || wavLen == 0) return;

    Uint32 remaining = static_cast<Uint32>(len);
    Uint8* out = stream;
    while (remaining > 0) {
        const Uint32 n = std::min(remaining, wavLen - cursor);
        SDL_MixAudioFormat(out, wavBuf + cursor, spec.format, n, volume);
        out += n;
        remaining -= n;
        cursor += n;
        if (cursor >= wavLen) cursor = 0; // loop
    }
}
