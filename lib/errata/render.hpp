/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_RENDER_HPP
#define ERRATA_RENDER_HPP

#include <functional>
#include <string>

namespace errata {
    struct error;

    // The kind text, the contexts from the highest priority down, the causal chain bounded by
    // config::max_render_depth, and the backtrace last. Never throws except for std::bad_alloc.
    extern std::string render(const error &err);
    // the kind name and the context messages only
    extern std::string render_minimal(const error &err);
    // runs renderer and logs a warning and falls back to render_minimal when it fails; std::bad_alloc is rethrown
    extern std::string render_guarded(const error &err, const std::function<std::string(const error &)> &renderer);
}

#endif // !ERRATA_RENDER_HPP
