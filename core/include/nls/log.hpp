//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include <SDL3/SDL_log.h>

namespace nls {

    // SDL log categories owned by the core library
    enum LogCategory {
        NLS_LOG_TEMPLATES = SDL_LOG_CATEGORY_CUSTOM,
        NLS_LOG_PARSE,
        NLS_LOG_TRANSFORM,
        NLS_LOG_BATCH
    };

    // Verbose enables debug output for the core categories, otherwise info and up.
    void SetLogVerbose(bool verbose);
}
