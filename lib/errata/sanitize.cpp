/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/config.hpp>
#include <errata/sanitize.hpp>

namespace errata {
    std::string redact(const std::string_view msg)
    {
        std::string res { msg };
        for (const auto word: config::sensitive_words) {
            for (size_t pos = res.find(word); pos != res.npos; pos = res.find(word, pos + config::redaction_marker.size())) {
                res.replace(pos, word.size(), config::redaction_marker);
            }
        }
        if (res.size() > config::max_message_size) {
            res.resize(config::max_message_size);
            res.append(config::truncation_marker);
        }
        return res;
    }

    std::string sanitize(const std::string_view msg)
    {
        if (config::production_mode())
            return redact(msg);
        return std::string { msg };
    }
}
