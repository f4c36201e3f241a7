// Copyright (c) Created by MWAC-dev on 2026.
// core/src/log.cpp
#include "nls/log.hpp"

namespace nls {

void SetLogVerbose(bool verbose) {
    const SDL_LogPriority priority = verbose ? SDL_LOG_PRIORITY_DEBUG : SDL_LOG_PRIORITY_INFO;
    SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, priority);
    for (int category : {NLS_LOG_TEMPLATES, NLS_LOG_PARSE, NLS_LOG_TRANSFORM, NLS_LOG_BATCH}) {
        SDL_SetLogPriority(category, priority);
    }
}

} // namespace nls
