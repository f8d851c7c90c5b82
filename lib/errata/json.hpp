/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_JSON_HPP
#define ERRATA_JSON_HPP

#include <string>
#include <boost/json.hpp>
#include <errata/error.hpp>

namespace errata::json {
    // The structured form of an error and its causal chain up to config::max_render_depth levels.
    // Text fields go through the same sanitization as the text rendering.
    extern boost::json::object to_json(const error &err);
    extern std::string serialize(const error &err);
}

#endif // !ERRATA_JSON_HPP
