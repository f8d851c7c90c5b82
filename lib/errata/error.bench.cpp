/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/benchmark.hpp>
#include <errata/error.hpp>
#include <errata/render.hpp>

using namespace errata;

suite error_bench_suite = [] {
    "error"_test = [] {
        scoped_env bt1 { config::backtrace_env, {} };
        scoped_env bt2 { config::backtrace_env_alias, {} };
        benchmark_r("construct", 100'000.0, 100'000,
            [] {
                const error err { kind::not_found { "User", "42" } };
                return err.instance_id() > 0 ? 1 : 0;
            }
        );
        benchmark_r("construct with contexts", 50'000.0, 100'000,
            [] {
                const auto err = error { kind::not_found { "User", "42" } }
                    .context("loading profile")
                    .with_metadata("user_id", "42")
                    .with_suggestion("check the id");
                return err.contexts().size();
            }
        );
        benchmark_r("construct, throw, and catch", 10'000.0, 10'000,
            [] {
                try {
                    throw error { kind::internal { "thrown" } }.context("while benchmarking");
                } catch (const error &) {
                }
            }
        );
        const auto err = error { kind::internal { "bug" } }
            .context("first").with_metadata("k1", "v1")
            .context("second").with_priority(200).with_suggestion("do something");
        benchmark_r("render", 10'000.0, 10'000,
            [&err] {
                return render(err).size() > 0 ? 1 : 0;
            }
        );
    };
};
