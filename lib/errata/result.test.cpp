/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/result.hpp>
#include <errata/test.hpp>

using namespace errata;

namespace {
    result<int, std::string> parse_port(const std::string_view text)
    {
        if (text.empty())
            return std::string { "empty port" };
        int port = 0;
        for (const char c: text) {
            if (c < '0' || c > '9')
                return std::string { "not a number" };
            port = port * 10 + (c - '0');
        }
        return port;
    }
}

suite result_suite = [] {
    "result"_test = [] {
        "value"_test = [] {
            auto res = parse_port("8080");
            expect(res.ok());
            expect(static_cast<bool>(res));
            test_same(8080, res.value());
            expect(throws<error>([&] { static_cast<void>(res.error()); }));
        };
        "failure"_test = [] {
            const auto res = parse_port("80a");
            expect(!res.ok());
            test_same(std::string { "not a number" }, res.error());
            expect(throws<error>([&] { static_cast<void>(res.value()); }));
        };
        "adapters pass values through"_test = [] {
            const auto res = parse_port("443").context("reading the port").meta("source", "cli");
            expect(res.ok());
            test_same(443, res.value());
        };
        "adapters lift failures"_test = [] {
            const auto res = parse_port("")
                .context("reading the port")
                .meta("source", "cli")
                .with_suggestion("pass --port")
                .with_priority(200)
                .with_payload(std::string { "payload" });
            expect(!res.ok());
            const auto &err = res.error();
            test_same(std::string { "Internal error: empty port" }, describe(err.kind()));
            test_same(size_t { 1 }, err.contexts().size());
            const auto &ctx = err.contexts().front();
            expect(*ctx.message() == std::string_view { "reading the port" });
            test_same(std::string_view { "result.test.cpp" }, ctx.location()->filename());
            expect(ctx.metadata("source") != nullptr);
            expect(ctx.suggestion().has_value());
            test_same(uint8_t { 200 }, ctx.priority());
            expect(err.payload<std::string>() != nullptr);
        };
        "error results"_test = [] {
            result<int> res { error { kind::internal { "inner" } } };
            const auto id = res.error().instance_id();
            const auto res2 = std::move(res).context("outer");
            test_same(id, res2.error().instance_id());
        };
        "attempt"_test = [] {
            const auto ok = attempt([] { return 3; });
            test_same(3, ok.value());
            const auto failed = attempt([]() -> int { throw std::runtime_error { "failure" }; });
            expect(!failed.ok());
            expect(std::holds_alternative<kind::foreign>(failed.error().kind()));
            const auto void_res = attempt([] {});
            expect(void_res.ok());
        };
    };
};
