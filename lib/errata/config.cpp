/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <cstdlib>
#include <errata/config.hpp>

namespace errata {
    std::optional<std::string> getenv_opt(const std::string_view name)
    {
        const std::string name_z { name };
        if (const char *val = std::getenv(name_z.c_str()); val != nullptr)
            return std::string { val };
        return {};
    }

    bool config::backtrace_enabled()
    {
        // the first alias that is set wins, even if its value disables the capture
        auto val = getenv_opt(backtrace_env);
        if (!val)
            val = getenv_opt(backtrace_env_alias);
        return val && (*val == "1" || *val == "full");
    }

    bool config::production_mode()
    {
        const auto val = getenv_opt(production_env);
        return val && (*val == "1" || *val == "true");
    }
}
