/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/context.hpp>

namespace errata {
    context::context(): _created_at { clock::now() }
    {
    }

    context::context(const std::string_view msg): _message { intern(msg) }, _created_at { clock::now() }
    {
    }

    context context::with_metadata(const std::string_view key, const std::string_view val) &&
    {
        _metadata.insert_or_assign(intern(key), intern(val));
        return std::move(*this);
    }

    context context::with_suggestion(const std::string_view text) &&
    {
        _suggestion.emplace(intern(text));
        return std::move(*this);
    }

    context context::with_priority(const uint8_t priority) &&
    {
        _priority = priority;
        return std::move(*this);
    }

    context context::with_location(const errata::location &loc) &&
    {
        _location.emplace(loc);
        return std::move(*this);
    }

    const istring *context::metadata(const std::string_view key) const
    {
        for (const auto &[k, v]: _metadata) {
            if (k == key)
                return &v;
        }
        return nullptr;
    }
}
