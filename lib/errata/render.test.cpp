/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <stdexcept>
#include <vector>
#include <errata/error.hpp>
#include <errata/render.hpp>
#include <errata/test.hpp>

using namespace errata;

namespace {
    size_t count_occurrences(const std::string_view text, const std::string_view needle)
    {
        size_t cnt = 0;
        for (auto pos = text.find(needle); pos != text.npos; pos = text.find(needle, pos + needle.size()))
            ++cnt;
        return cnt;
    }

    // every needle must be found after the previous one
    void expect_in_order(const std::string_view text, const std::vector<std::string_view> &needles,
        const std::source_location &loc=std::source_location::current())
    {
        size_t pos = 0;
        for (const auto needle: needles) {
            const auto next = text.find(needle, pos);
            expect(next != text.npos, loc) << fmt::format("'{}' not found in order in '{}'", needle, text);
            if (next == text.npos)
                return;
            pos = next + needle.size();
        }
    }

    struct plain_env {
        scoped_env bt1 { config::backtrace_env, {} };
        scoped_env bt2 { config::backtrace_env_alias, {} };
        scoped_env prod { config::production_env, {} };
    };
}

suite render_suite = [] {
    "render"_test = [] {
        "kind only"_test = [] {
            plain_env env {};
            test_same(std::string { "Configuration error: missing port" }, render(error { kind::config { "missing port" } }));
        };
        "end to end"_test = [] {
            plain_env env {};
            const auto err = error { kind::not_found { "User", "42" } }
                .context("loading profile")
                .with_metadata("user_id", "42")
                .with_suggestion("check the id");
            const auto text = render(err);
            expect(text.starts_with("User not found: 42"));
            expect_in_order(text, { "User not found: 42", "\nCaused by: loading profile (at render.test.cpp:", "\n    user_id: 42", "\n    Suggestion: check the id" });
            test_same(std::string { err.what() }, text);
        };
        "priority order"_test = [] {
            plain_env env {};
            const auto err = error { kind::internal { "bug" } }
                .context("priority 50").with_priority(50)
                .context("priority 250").with_priority(250)
                .context("priority 100").with_priority(100);
            expect_in_order(render(err), { "Caused by: priority 250", "Caused by: priority 100", "Caused by: priority 50" });
        };
        "equal priorities keep the append order"_test = [] {
            plain_env env {};
            const auto err = error { kind::internal { "bug" } }.context("first").context("second").context("third");
            expect_in_order(render(err), { "Caused by: first", "Caused by: second", "Caused by: third" });
        };
        "source chain"_test = [] {
            plain_env env {};
            auto inner = share(error { kind::io { kind::io_code::permission_denied } }.context("opening /etc/app.toml"));
            const auto err = error { kind::config { "unable to load", "/etc/app.toml", inner } }.context("starting up");
            expect_in_order(render(err), { "Configuration error in '/etc/app.toml': unable to load", "Caused by: starting up",
                "\n\nSource error: I/O error: permission denied", "Caused by: opening /etc/app.toml" });
        };
        "multiple renders its primary"_test = [] {
            plain_env env {};
            auto first = share(error { kind::validation { "age", "negative" } });
            auto second = share(error { kind::validation { "name", "empty" } });
            const auto text = render(error { kind::multiple { { first, second }, 1 } });
            expect_in_order(text, { "Multiple errors (2 total)", "Source error: Validation error for 'name': empty" });
            expect(text.find("'age'") == text.npos);
        };
        "deep chain"_test = [] {
            plain_env env {};
            error_ptr src {};
            for (size_t i = 0; i < 40; ++i)
                src = share(error { kind::internal { fmt::format("level {}", i), {}, src } });
            const auto text = render(*src);
            test_contains(text, "... causal chain truncated at depth 32");
            test_same(config::max_render_depth - 1, count_occurrences(text, "Source error: "));
        };
        "cyclic chain"_test = [] {
            plain_env env {};
            auto self = std::make_shared<error>(kind::internal { "self reference" });
            std::get<kind::internal>(self->kind()).source = self;
            const auto text = render(*self);
            // breaks the cycle so that the error is released
            std::get<kind::internal>(self->kind()).source.reset();
            test_contains(text, "... causal chain truncated at depth 32");
            test_same(config::max_render_depth, count_occurrences(text, "Internal error: self reference"));
        };
        "backtrace is rendered last"_test = [] {
            plain_env env {};
            scoped_env bt { config::backtrace_env, "1" };
            auto inner = share(error { kind::internal { "inner" } });
            const auto text = render(error { kind::internal { "outer", {}, inner } }.context("with a context"));
            expect_in_order(text, { "Internal error: outer", "Caused by: with a context", "Source error: Internal error: inner", "\n\nBacktrace:\n" });
            test_same(size_t { 1 }, count_occurrences(text, "\n\nBacktrace:\n"));
        };
        "production sanitization"_test = [] {
            plain_env env {};
            scoped_env prod { config::production_env, "1" };
            scoped_env bt { config::backtrace_env, "1" };
            const std::string long_msg(400, 'x');
            const auto err = error { kind::internal { "bug" } }
                .context("invalid password for admin")
                .with_metadata("api_secret", "my token")
                .with_suggestion("reset the password")
                .context(long_msg).with_priority(10);
            const auto text = render(err);
            test_contains(text, "Caused by: invalid [REDACTED] for admin");
            test_contains(text, "    api_secret: my [REDACTED]");
            test_contains(text, "    Suggestion: reset the [REDACTED]");
            test_contains(text, "Caused by: " + std::string(config::max_message_size, 'x') + std::string { config::truncation_marker });
            expect(text.find(std::string(config::max_message_size + 1, 'x')) == text.npos);
            expect(text.find("password") == text.npos);
            test_contains(text, config::backtrace_redaction);
        };
        "minimal"_test = [] {
            const auto err = error { kind::timeout { "query", std::chrono::milliseconds { 5 } } }.context("first").with_metadata("k", "v").context("second");
            test_same(std::string { "Timeout\nCaused by: first\nCaused by: second" }, render_minimal(err));
        };
        "failing renderer falls back"_test = [] {
            const auto err = error { kind::internal { "broken", "cache" } }.context("warming up");
            const auto res = render_guarded(err, [](const error &) -> std::string {
                throw std::runtime_error { "formatter failed" };
            });
            test_same(std::string { "Internal\nCaused by: warming up" }, res);
            expect(throws<std::bad_alloc>([&] {
                render_guarded(err, [](const error &) -> std::string { throw std::bad_alloc {}; });
            }));
            test_same(render(err), render_guarded(err, [](const error &e) { return render(e); }));
        };
    };
};
