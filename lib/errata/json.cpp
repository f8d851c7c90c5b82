/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/json.hpp>
#include <errata/sanitize.hpp>

namespace errata::json {
    static boost::json::object context_to_json(const context &ctx)
    {
        boost::json::object res {};
        if (ctx.message())
            res.emplace("message", sanitize(*ctx.message()));
        if (!ctx.metadata().empty()) {
            boost::json::object meta {};
            for (const auto &[k, v]: ctx.metadata())
                meta.emplace(k.view(), sanitize(v));
            res.emplace("metadata", std::move(meta));
        }
        if (ctx.suggestion())
            res.emplace("suggestion", sanitize(*ctx.suggestion()));
        res.emplace("priority", static_cast<uint64_t>(ctx.priority()));
        if (ctx.location())
            res.emplace("location", fmt::format("{}", *ctx.location()));
        res.emplace("payloads", ctx.payloads().size());
        return res;
    }

    static boost::json::object level_to_json(const error &err, const size_t depth)
    {
        boost::json::object res {};
        res.emplace("kind", kind_name(err.kind()));
        res.emplace("text", sanitize(describe(err.kind())));
        res.emplace("severity", static_cast<uint64_t>(err.severity()));
        res.emplace("transient", err.is_transient());
        res.emplace("instance_id", err.instance_id());
        res.emplace("created_at_us", std::chrono::duration_cast<std::chrono::microseconds>(err.created_at().time_since_epoch()).count());
        boost::json::array contexts {};
        for (const auto &ctx: err.contexts())
            contexts.emplace_back(context_to_json(ctx));
        res.emplace("contexts", std::move(contexts));
        if (!inlines_source(err.kind())) {
            if (const auto *src = err.source(); src) {
                if (depth + 1 >= config::max_render_depth)
                    res.emplace("source_truncated", true);
                else
                    res.emplace("source", level_to_json(*src, depth + 1));
            }
        }
        return res;
    }

    boost::json::object to_json(const error &err)
    {
        return level_to_json(err, 0);
    }

    std::string serialize(const error &err)
    {
        return boost::json::serialize(to_json(err));
    }
}
