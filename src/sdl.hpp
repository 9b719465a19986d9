#pragma once

// Single place the SDL header is pulled in (keybinds, main).
// SDL_MAIN_HANDLED keeps SDL from renaming main() to SDL_main, so no SDLmain
// library is needed; main() calls SDL_SetMainReady() before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
