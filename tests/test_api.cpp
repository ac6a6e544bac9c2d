/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include "omp/server.hpp"
#include "test_support.hpp"

using namespace omp::test;

namespace {

bool has(const std::string& body, const std::string& needle) {
    return body.find(needle) != std::string::npos;
}

} // namespace

class ApiTest : public ::testing::Test {
protected:
    static omp::ServerConfig make_config() {
        omp::ServerConfig cfg;
        cfg.sig_mode = omp::SignatureMode::Strict;
        cfg.sig_default_keyid = "sig1";
        cfg.sig_default_pub = public_key_b64u(seed_from(1));
        cfg.max_body = 1024;
        return cfg;
    }

    omp::HttpResponse post_objects(const std::string& si, const std::string& sig,
                                   const std::string& path = "/objects",
                                   const std::string& host = "testserver") {
        auto R = make_request("POST", path, host);
        R.body = R"({"namespace":"ns","content":{"x":1}})";
        if (!si.empty())  R.headers["Signature-Input"] = si;
        if (!sig.empty()) R.headers["Signature"] = sig;
        return server.api().handle(R, "127.0.0.1");
    }

    std::string good_sig(const std::string& base = "POST http://testserver/objects") const {
        return sig_value("sig1", sign_b64u(seed_from(1), base));
    }

    omp::Server server{make_config()};
};

TEST_F(ApiTest, SignedPostReachesHandler) {
    auto resp = post_objects(R"(sig1=();created=1618884473;keyid="sig1")", good_sig());
    EXPECT_EQ(resp.status_code, 201);
    EXPECT_EQ(resp.status_text, "Created");
    EXPECT_EQ(resp.body, R"({"status":"created","received_bytes":36})");
}

TEST_F(ApiTest, NonNumericCreatedIsNotEnforced) {
    auto resp = post_objects(R"(sig1=();created="2021-04-20T00:00:00Z";keyid="sig1")", good_sig());
    EXPECT_EQ(resp.status_code, 201) << resp.body;
}

TEST_F(ApiTest, EmptySignatureValueFailsVerification) {
    auto resp = post_objects(sig_input("sig1", "sig1"), "sig1=:");
    EXPECT_EQ(resp.status_code, 401);
    EXPECT_TRUE(has(resp.body, "no valid signature")) << resp.body;
}

TEST_F(ApiTest, UnknownKeyidIsUnauthorized) {
    auto resp = post_objects(R"(sig1=();created=1618884473;keyid="unknown")", good_sig());
    EXPECT_EQ(resp.status_code, 401);
    EXPECT_TRUE(has(resp.body, R"("code":"unauthorized")")) << resp.body;
    EXPECT_TRUE(has(resp.body, R"("status":401)")) << resp.body;
    EXPECT_EQ(resp.content_type, "application/json");
}

TEST_F(ApiTest, MalformedInputIsBadRequestInStrictAndPermissive) {
    for (auto m : {omp::SignatureMode::Strict, omp::SignatureMode::Permissive}) {
        server.settings().set_mode(m);
        auto resp = post_objects("sig1=this is bad", "sig1=:AAAA:");
        EXPECT_EQ(resp.status_code, 400) << omp::to_string(m);
        EXPECT_TRUE(has(resp.body, R"("code":"bad_request")"));
    }
}

TEST_F(ApiTest, UnsignedRequestInStrictMode) {
    auto resp = post_objects("", "");
    EXPECT_EQ(resp.status_code, 401);
    EXPECT_EQ(resp.body,
              R"({"error":{"code":"unauthorized","message":"Missing required signature","status":401}})");
}

TEST_F(ApiTest, TrailingSlashAndDefaultPort) {
    const std::string si = sig_input("sig1", "sig1");
    EXPECT_EQ(post_objects(si, good_sig(), "/objects/").status_code, 201);
    EXPECT_EQ(post_objects(si, good_sig(), "/objects", "testserver:80").status_code, 201);
}

TEST_F(ApiTest, RuntimeRegisteredKey) {
    const std::string seed = seed_from(40);
    server.keys().register_key("device-7", public_key(seed));
    auto resp = post_objects(sig_input("d", "device-7"),
                             sig_value("d", sign_b64u(seed, "POST http://testserver/objects")));
    EXPECT_EQ(resp.status_code, 201);
}

TEST_F(ApiTest, OffModeLetsEverythingThrough) {
    server.settings().set_mode(omp::SignatureMode::Off);
    EXPECT_EQ(post_objects("", "").status_code, 201);
    EXPECT_EQ(post_objects("sig1=this is bad", "junk").status_code, 201);
}

TEST_F(ApiTest, ObjectsMethods) {
    server.settings().set_mode(omp::SignatureMode::Off);
    auto get = server.api().handle(make_request("GET", "/objects/abc"), "127.0.0.1");
    EXPECT_EQ(get.status_code, 200);
    EXPECT_EQ(get.body, R"({"status":"ok"})");

    auto del = server.api().handle(make_request("DELETE", "/objects/abc"), "127.0.0.1");
    EXPECT_EQ(del.status_code, 405);
    EXPECT_TRUE(has(del.body, R"("code":"method_not_allowed")"));
}

TEST_F(ApiTest, PolicyRunsBeforeMethodCheck) {
    auto del = server.api().handle(make_request("DELETE", "/objects/abc"), "127.0.0.1");
    EXPECT_EQ(del.status_code, 401);
}

TEST_F(ApiTest, HealthAndDiscoveryAreOpen) {
    auto health = server.api().handle(make_request("GET", "/health"), "127.0.0.1");
    EXPECT_EQ(health.status_code, 200);
    EXPECT_EQ(health.body, R"({"status":"ok"})");

    auto disc = server.api().handle(make_request("GET", "/.well-known/omp.json"), "127.0.0.1");
    EXPECT_EQ(disc.status_code, 200);
    EXPECT_TRUE(has(disc.body, R"("omp_version":"0.1")"));
    EXPECT_TRUE(has(disc.body, R"("mode":"strict")"));
    EXPECT_TRUE(has(disc.body, R"("algorithm":"ed25519")"));
    EXPECT_TRUE(has(disc.body, R"("rate_limit_per_min":60)"));

    EXPECT_EQ(server.api().handle(make_request("POST", "/health"), "127.0.0.1").status_code, 405);
}

TEST_F(ApiTest, UnknownRouteIs404) {
    auto resp = server.api().handle(make_request("GET", "/nope"), "127.0.0.1");
    EXPECT_EQ(resp.status_code, 404);
    EXPECT_TRUE(has(resp.body, R"("code":"not_found")"));
}

TEST_F(ApiTest, OversizedBodyIs413) {
    auto R = make_request("POST", "/objects");
    R.body.assign(2048, 'x');
    auto resp = server.api().handle(R, "127.0.0.1");
    EXPECT_EQ(resp.status_code, 413);
    EXPECT_TRUE(has(resp.body, R"("code":"payload_too_large")"));
}

TEST(ServerSetup, RejectsBadKeyConfiguration) {
    omp::ServerConfig cfg;
    cfg.sig_default_keyid = "sig1";
    cfg.sig_default_pub = "definitely-not-a-key";
    EXPECT_THROW(omp::Server s(cfg), std::runtime_error);

    omp::ServerConfig nokid;
    nokid.sig_default_pub = public_key_b64u(seed_from(1));
    EXPECT_THROW(omp::Server s(nokid), std::runtime_error);

    omp::ServerConfig missing_file;
    missing_file.sig_keys_file = ::testing::TempDir() + "omp_no_such_keys_file.txt";
    EXPECT_THROW(omp::Server s(missing_file), std::runtime_error);

    omp::ServerConfig bad_named;
    bad_named.sig_keys.emplace_back("k", "zz");
    EXPECT_THROW(omp::Server s(bad_named), std::runtime_error);
}

TEST(ServerSetup, NamedKeysFromConfig) {
    omp::ServerConfig cfg;
    cfg.sig_mode = omp::SignatureMode::Strict;
    cfg.sig_keys.emplace_back("edge-1", public_key_b64u(seed_from(5)));
    omp::Server s(cfg);
    EXPECT_EQ(s.keys().named_size(), 1u);

    auto R = make_request("POST", "/objects");
    R.headers["Signature-Input"] = sig_input("sig1", "edge-1");
    R.headers["Signature"] = sig_value("sig1", sign_b64u(seed_from(5), "POST http://testserver/objects"));
    EXPECT_EQ(s.api().handle(R, "127.0.0.1").status_code, 201);
}

TEST(ServerSetup, RemoteKeysAreLoadedOnceAtStartup) {
    omp::ServerConfig cfg;
    cfg.sig_mode = omp::SignatureMode::Strict;
    cfg.key_use_redis = true;
    int fetches = 0;
    omp::Server s(cfg, [&](omp::internal::KeyEntries& out) {
        ++fetches;
        out.emplace_back("device-9", public_key_b64u(seed_from(9)));
        return true;
    });
    EXPECT_EQ(fetches, 1);
    EXPECT_EQ(s.keys().named_size(), 1u);

    auto R = make_request("POST", "/objects");
    R.headers["Signature-Input"] = sig_input("sig1", "device-9");
    R.headers["Signature"] = sig_value("sig1", sign_b64u(seed_from(9), "POST http://testserver/objects"));
    EXPECT_EQ(s.api().handle(R, "127.0.0.1").status_code, 201);

    R.headers["Signature-Input"] = sig_input("sig1", "device-unknown");
    EXPECT_EQ(s.api().handle(R, "127.0.0.1").status_code, 401);
    EXPECT_EQ(fetches, 1);
}

TEST(ServerSetup, RemoteKeyFailureAbortsStartup) {
    omp::ServerConfig cfg;
    cfg.key_use_redis = true;
    EXPECT_THROW(omp::Server s(cfg, [](omp::internal::KeyEntries&) { return false; }),
                 std::runtime_error);
    EXPECT_THROW(omp::Server s(cfg, [](omp::internal::KeyEntries& out) {
                     out.emplace_back("k", "zz");
                     return true;
                 }),
                 std::runtime_error);
}
