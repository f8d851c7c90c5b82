/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/json.hpp>
#include <errata/test.hpp>

using namespace errata;

suite json_suite = [] {
    "json"_test = [] {
        "structure"_test = [] {
            scoped_env prod { config::production_env, {} };
            auto inner = share(error { kind::timeout { "query", std::chrono::milliseconds { 1500 } } });
            const auto err = error { kind::network { "upstream failed", 502, inner } }
                .context("calling billing").with_metadata("attempt", "2").with_suggestion("retry later").with_payload(3);
            const auto obj = json::to_json(err);
            test_same(std::string_view { "Network" }, std::string_view { obj.at("kind").as_string() });
            test_same(std::string_view { "Network error (code 502): upstream failed" }, std::string_view { obj.at("text").as_string() });
            test_same(int64_t { 50 }, obj.at("severity").to_number<int64_t>());
            expect(obj.at("transient").as_bool());
            test_same(err.instance_id(), obj.at("instance_id").to_number<uint64_t>());
            const auto &contexts = obj.at("contexts").as_array();
            test_same(size_t { 1 }, contexts.size());
            const auto &ctx = contexts.at(0).as_object();
            test_same(std::string_view { "calling billing" }, std::string_view { ctx.at("message").as_string() });
            test_same(std::string_view { "2" }, std::string_view { ctx.at("metadata").as_object().at("attempt").as_string() });
            test_same(std::string_view { "retry later" }, std::string_view { ctx.at("suggestion").as_string() });
            test_same(uint64_t { 1 }, ctx.at("payloads").to_number<uint64_t>());
            const auto &src = obj.at("source").as_object();
            test_same(std::string_view { "Timeout" }, std::string_view { src.at("kind").as_string() });
            expect(!src.contains("source"));
        };
        "sanitized"_test = [] {
            scoped_env prod { config::production_env, "1" };
            const auto err = error { kind::internal { "leaked token" } }.context("bad password").with_metadata("user", "key holder");
            const auto text = json::serialize(err);
            expect(text.find("password") == text.npos);
            expect(text.find("token") == text.npos);
            test_contains(text, "[REDACTED] holder");
        };
        "cyclic chain"_test = [] {
            auto self = std::make_shared<error>(kind::internal { "self reference" });
            std::get<kind::internal>(self->kind()).source = self;
            const auto obj = json::to_json(*self);
            std::get<kind::internal>(self->kind()).source.reset();
            const boost::json::object *cur = &obj;
            size_t depth = 1;
            while (const auto *next = cur->if_contains("source")) {
                cur = &next->as_object();
                ++depth;
            }
            test_same(config::max_render_depth, depth);
            expect(cur->contains("source_truncated"));
        };
    };
};
