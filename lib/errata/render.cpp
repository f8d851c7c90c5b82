/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <algorithm>
#include <iterator>
#include <vector>
#include <errata/error.hpp>
#include <errata/logger.hpp>
#include <errata/render.hpp>
#include <errata/sanitize.hpp>

namespace errata {
    static std::string kind_text(const kind_type &k)
    {
        // io and foreign messages are sanitized when the kind is created
        if (std::holds_alternative<kind::io>(k) || std::holds_alternative<kind::foreign>(k))
            return describe(k);
        return sanitize(describe(k));
    }

    static void render_contexts(std::string &out, const error &err)
    {
        std::vector<const context *> ordered {};
        ordered.reserve(err.contexts().size());
        for (const auto &ctx: err.contexts())
            ordered.emplace_back(&ctx);
        std::stable_sort(ordered.begin(), ordered.end(), [](const auto *a, const auto *b) {
            return a->priority() > b->priority();
        });
        for (const auto *ctx: ordered) {
            if (ctx->empty())
                continue;
            if (ctx->message()) {
                fmt::format_to(std::back_inserter(out), "\nCaused by: {}", sanitize(*ctx->message()));
                if (ctx->location())
                    fmt::format_to(std::back_inserter(out), " (at {})", *ctx->location());
            }
            for (const auto &[k, v]: ctx->metadata())
                fmt::format_to(std::back_inserter(out), "\n    {}: {}", k, sanitize(v));
            if (ctx->suggestion())
                fmt::format_to(std::back_inserter(out), "\n    Suggestion: {}", sanitize(*ctx->suggestion()));
        }
    }

    static void render_level(std::string &out, const error &err, const size_t depth)
    {
        out += kind_text(err.kind());
        render_contexts(out, err);
        if (inlines_source(err.kind()))
            return;
        if (const auto *src = err.source(); src) {
            if (depth + 1 >= config::max_render_depth) {
                fmt::format_to(std::back_inserter(out), "\n... causal chain truncated at depth {}", config::max_render_depth);
                return;
            }
            out += "\n\nSource error: ";
            render_level(out, *src, depth + 1);
        }
    }

    std::string render_minimal(const error &err)
    {
        std::string res { kind_name(err.kind()) };
        for (const auto &ctx: err.contexts()) {
            if (ctx.message()) {
                res += "\nCaused by: ";
                res += ctx.message()->view();
            }
        }
        return res;
    }

    static std::string render_full(const error &err)
    {
        std::string out {};
        render_level(out, err, 0);
        if (err.backtrace()) {
            out += "\n\nBacktrace:\n";
            out += err.backtrace()->render();
        }
        return out;
    }

    std::string render_guarded(const error &err, const std::function<std::string(const error &)> &renderer)
    {
        try {
            return renderer(err);
        } catch (const std::bad_alloc &) {
            throw;
        } catch (const std::exception &ex) {
            logger::warn("falling back to the minimal rendering of error #{}: {}", err.instance_id(), ex.what());
            return render_minimal(err);
        }
    }

    std::string render(const error &err)
    {
        return render_guarded(err, render_full);
    }
}
