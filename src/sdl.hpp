#pragma once

// Single place where the front ends pull in SDL.
// SDL_MAIN_HANDLED keeps main() ours, so no SDLmain library is needed;
// main.cpp calls SDL_SetMainReady() before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
