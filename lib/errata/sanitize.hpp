/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_SANITIZE_HPP
#define ERRATA_SANITIZE_HPP

#include <string>
#include <string_view>

namespace errata {
    // Replaces every occurrence of a sensitive word, including inside longer words,
    // and truncates the result to config::max_message_size followed by the truncation marker.
    extern std::string redact(std::string_view msg);

    // redact() when production mode is on, a plain copy otherwise
    extern std::string sanitize(std::string_view msg);
}

#endif // !ERRATA_SANITIZE_HPP
