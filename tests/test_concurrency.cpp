/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "omp/server.hpp"
#include "test_support.hpp"

using namespace omp::test;

namespace {

omp::HttpRequest signed_post(const std::string& keyid, const std::string& seed) {
    auto R = make_request("POST", "/objects");
    R.body = "{}";
    R.headers["Signature-Input"] = sig_input("sig1", keyid);
    R.headers["Signature"] = sig_value("sig1", sign_b64u(seed, "POST http://testserver/objects"));
    return R;
}

} // namespace

TEST(Concurrency, VerificationWhileKeysAndModeChange) {
    omp::ServerConfig cfg;
    cfg.sig_mode = omp::SignatureMode::Strict;
    cfg.sig_default_keyid = "sig1";
    cfg.sig_default_pub = public_key_b64u(seed_from(1));
    omp::Server server(cfg);

    const std::string dyn_seed = seed_from(60);
    const auto dyn_key = public_key(dyn_seed);
    const omp::HttpRequest stable = signed_post("sig1", seed_from(1));
    const omp::HttpRequest dynamic = signed_post("device-dyn", dyn_seed);
    const omp::HttpRequest forged = signed_post("sig1", seed_from(61));

    std::atomic<bool> done{false};
    std::atomic<int> stable_failures{0};
    std::atomic<int> unexpected{0};

    std::thread writer([&] {
        const omp::SignatureMode modes[] = {
            omp::SignatureMode::Strict, omp::SignatureMode::Permissive, omp::SignatureMode::Off
        };
        for (int i = 0; i < 2000; ++i) {
            server.keys().register_key("device-dyn", dyn_key);
            server.settings().set_mode(modes[i % 3]);
            server.keys().unregister_key("device-dyn");
            server.keys().register_key("churn-" + std::to_string(i % 8), dyn_key);
        }
        server.settings().set_mode(omp::SignatureMode::Strict);
        done.store(true);
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!done.load()) {
                if (server.api().handle(stable, "127.0.0.1").status_code != 201) ++stable_failures;

                const int dyn = server.api().handle(dynamic, "127.0.0.1").status_code;
                if (dyn != 201 && dyn != 401) ++unexpected;

                // Passes only while a mode that skips verification is set.
                const int f = server.api().handle(forged, "127.0.0.1").status_code;
                if (f != 201 && f != 401) ++unexpected;
            }
        });
    }

    writer.join();
    for (auto& t : readers) t.join();

    EXPECT_EQ(stable_failures.load(), 0);
    EXPECT_EQ(unexpected.load(), 0);
    EXPECT_EQ(server.settings().mode(), omp::SignatureMode::Strict);
    EXPECT_EQ(server.api().handle(forged, "127.0.0.1").status_code, 401);
    EXPECT_EQ(server.api().handle(dynamic, "127.0.0.1").status_code, 401);
    EXPECT_EQ(server.api().handle(stable, "127.0.0.1").status_code, 201);
    EXPECT_EQ(server.keys().registry_size(), 8u);
}

TEST(Concurrency, ResolveSeesWholeKeys) {
    omp::internal::KeyResolver keys;
    omp::internal::PublicKey a{}, b{};
    a.fill(0x11);
    b.fill(0x22);
    keys.register_key("k", a);

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::thread writer([&] {
        for (int i = 0; i < 5000; ++i) keys.register_key("k", (i % 2) ? a : b);
        done.store(true);
    });
    std::thread reader([&] {
        omp::internal::PublicKey k{};
        while (!done.load()) {
            if (!keys.resolve("k", k) || (k != a && k != b)) ++torn;
        }
    });
    writer.join();
    reader.join();
    EXPECT_EQ(torn.load(), 0);
}
