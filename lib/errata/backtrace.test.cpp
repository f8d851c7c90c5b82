/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/backtrace.hpp>
#include <errata/config.hpp>
#include <errata/test.hpp>

using namespace errata;

suite backtrace_suite = [] {
    "backtrace"_test = [] {
        "location"_test = [] {
            const auto loc = location::current();
            test_same(std::string_view { "backtrace.test.cpp" }, loc.filename());
            expect(loc.line > 0);
            test_same(fmt::format("backtrace.test.cpp:{}:{}", loc.line, loc.column), fmt::format("{}", loc));
            expect(loc == loc);
        };
        "disabled by default"_test = [] {
            scoped_env env1 { config::backtrace_env, {} };
            scoped_env env2 { config::backtrace_env_alias, {} };
            expect(!backtrace::capture().has_value());
        };
        "enabled"_test = [] {
            for (const auto val: { "1", "full" }) {
                scoped_env env1 { config::backtrace_env, val };
                const auto bt = backtrace::capture();
                expect(bt.has_value()) << val;
                if (bt) {
                    expect(bt->status() == backtrace::status_type::captured);
                    expect(bt->num_frames() > 0);
                    expect(bt->capture_cost_ns().has_value());
                    expect(bt->thread_id() == std::this_thread::get_id());
                }
            }
        };
        "alias"_test = [] {
            scoped_env env1 { config::backtrace_env, {} };
            scoped_env env2 { config::backtrace_env_alias, "full" };
            expect(backtrace::capture().has_value());
        };
        "primary alias wins"_test = [] {
            scoped_env env1 { config::backtrace_env, "0" };
            scoped_env env2 { config::backtrace_env_alias, "1" };
            expect(!backtrace::capture().has_value());
        };
        "reduced form"_test = [] {
            backtrace bt { location::current() };
            expect(bt.status() == backtrace::status_type::unsupported);
            test_same(uint32_t { 1 }, bt.call_depth());
            bt.add_location(location::current());
            test_same(uint32_t { 2 }, bt.call_depth());
            test_same(size_t { 2 }, bt.locations().size());
            scoped_env prod { config::production_env, {} };
            const auto text = bt.render();
            test_contains(text, "Minimal backtrace captured at");
            test_contains(text, "backtrace.test.cpp:");
        };
        "production redaction"_test = [] {
            scoped_env env1 { config::backtrace_env, "1" };
            scoped_env prod { config::production_env, "1" };
            const auto bt = backtrace::capture();
            expect(bt.has_value());
            if (bt)
                test_same(std::string { config::backtrace_redaction }, bt->render());
        };
        "truncation"_test = [] {
            scoped_env prod { config::production_env, {} };
            backtrace bt { location::current() };
            for (size_t i = 0; i < 1000; ++i)
                bt.add_location(location::current());
            expect(bt.to_string().size() > config::max_backtrace_size);
            const auto text = bt.render();
            test_same(config::max_backtrace_size + 1 + config::truncation_marker.size(), text.size());
            expect(text.ends_with(config::truncation_marker));
        };
    };
};
