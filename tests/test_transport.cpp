/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "omp/server.hpp"
#include "omp/client.hpp"
#include "omp/internal/http_low.hpp"
#include "omp/internal/http_parser.hpp"
#include "test_support.hpp"

using namespace omp::test;

namespace {

bool has(const std::string& body, const std::string& needle) {
    return body.find(needle) != std::string::npos;
}

// Reads one Content-Length framed response off conn.
bool read_response(omp::internal::TcpConn& conn, omp::HttpResponse& out) {
    std::string buf;
    if (!conn.recv_until(buf, "\r\n\r\n")) return false;
    std::size_t body_off = 0;
    out.headers.clear();
    if (!omp::internal::parse_http_response(buf, body_off, out.status_code, out.status_text, out.headers)) {
        return false;
    }
    const std::size_t len = std::stoul(omp::internal::hdr_ci(out.headers, "Content-Length"));
    out.body = buf.substr(body_off);
    while (out.body.size() < len) {
        if (!conn.recv_some(out.body, len - out.body.size())) return false;
    }
    return out.body.size() == len;
}

} // namespace

class TransportTest : public ::testing::Test {
protected:
    static omp::ServerConfig make_config() {
        omp::ServerConfig cfg;
        cfg.host = "127.0.0.1";
        cfg.port = 0;
        cfg.sig_mode = omp::SignatureMode::Strict;
        cfg.sig_default_keyid = "sig1";
        cfg.sig_default_pub = public_key_b64u(seed_from(1));
        cfg.max_body = 1024;
        cfg.rate_limit_per_min = 0;
        cfg.ka_timeout_sec = 2;
        cfg.ka_max = 10;
        return cfg;
    }

    void SetUp() override {
        runner = std::thread([this] { server.run(); });
        for (int i = 0; i < 500 && server.port() == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_NE(server.port(), 0);
    }

    void TearDown() override {
        server.stop();
        if (runner.joinable()) runner.join();
    }

    omp::ClientConfig client_config() const {
        omp::ClientConfig c;
        c.host = "127.0.0.1";
        c.port = server.port();
        c.connect_timeout_sec = 2;
        c.io_timeout_sec = 5;
        return c;
    }

    bool open(omp::internal::TcpConn& conn) const {
        return conn.open(client_config());
    }

    std::string origin() const {
        return "http://127.0.0.1:" + std::to_string(server.port());
    }

    omp::Server server{make_config()};
    std::thread runner;
};

TEST_F(TransportTest, SignedClientRequestIsAccepted) {
    omp::ClientConfig c = client_config();
    c.seed_b64u = b64u(seed_from(1));
    omp::Client client(c);
    EXPECT_EQ(client.url_for("/objects"), origin() + "/objects");

    omp::HttpResponse resp;
    ASSERT_TRUE(client.request("POST", "/objects", R"({"namespace":"ns","content":1})", {}, resp));
    EXPECT_EQ(resp.status_code, 201) << resp.body;
    EXPECT_EQ(resp.body, R"({"status":"created","received_bytes":30})");
}

TEST_F(TransportTest, ListenerTupleIsACandidate) {
    // The Host header names something else; only the local address matches.
    const std::string body = "{}";
    auto wire = [&](const std::string& signed_url) {
        return "POST /objects HTTP/1.1\r\n"
               "Host: proxy.invalid\r\n"
               "Signature-Input: " + sig_input("sig1", "sig1") + "\r\n"
               "Signature: " + sig_value("sig1", sign_b64u(seed_from(1), "POST " + signed_url)) + "\r\n"
               "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    };

    omp::internal::TcpConn conn;
    ASSERT_TRUE(open(conn));
    const std::string good = wire(origin() + "/objects");
    ASSERT_TRUE(conn.send_all(good.data(), good.size()));
    omp::HttpResponse resp;
    ASSERT_TRUE(read_response(conn, resp));
    EXPECT_EQ(resp.status_code, 201) << resp.body;

    const std::string bad = wire("http://127.0.0.1:1/objects");
    ASSERT_TRUE(conn.send_all(bad.data(), bad.size()));
    ASSERT_TRUE(read_response(conn, resp));
    EXPECT_EQ(resp.status_code, 401);
    EXPECT_TRUE(has(resp.body, "no valid signature")) << resp.body;
}

TEST_F(TransportTest, KeepAliveUntilClientCloses) {
    omp::internal::TcpConn conn;
    ASSERT_TRUE(open(conn));
    const std::string health = "GET /health HTTP/1.1\r\nHost: x\r\n\r\n";
    omp::HttpResponse resp;
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(conn.send_all(health.data(), health.size()));
        ASSERT_TRUE(read_response(conn, resp)) << "request " << i;
        EXPECT_EQ(resp.status_code, 200);
        EXPECT_EQ(omp::internal::lower_copy(omp::internal::hdr_ci(resp.headers, "Connection")), "keep-alive");
    }

    const std::string last = "GET /health HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n";
    ASSERT_TRUE(conn.send_all(last.data(), last.size()));
    ASSERT_TRUE(read_response(conn, resp));
    EXPECT_EQ(omp::internal::lower_copy(omp::internal::hdr_ci(resp.headers, "Connection")), "close");
    std::string rest;
    EXPECT_FALSE(conn.recv_some(rest, 1));
}

TEST_F(TransportTest, DeclaredBodyOverLimitIs413) {
    omp::internal::TcpConn conn;
    ASSERT_TRUE(open(conn));
    const std::string req = "POST /objects HTTP/1.1\r\nHost: x\r\nContent-Length: 100000\r\n\r\n";
    ASSERT_TRUE(conn.send_all(req.data(), req.size()));
    omp::HttpResponse resp;
    ASSERT_TRUE(read_response(conn, resp));
    EXPECT_EQ(resp.status_code, 413);
    EXPECT_TRUE(has(resp.body, R"("code":"payload_too_large")")) << resp.body;
}

TEST_F(TransportTest, OversizedHeadersAre431) {
    omp::internal::TcpConn conn;
    ASSERT_TRUE(open(conn));
    const std::string req = "GET /health HTTP/1.1\r\nHost: x\r\nX-Pad: " +
                            std::string(70 * 1024, 'a') + "\r\n\r\n";
    ASSERT_TRUE(conn.send_all(req.data(), req.size()));
    omp::HttpResponse resp;
    ASSERT_TRUE(read_response(conn, resp));
    EXPECT_EQ(resp.status_code, 431);
    EXPECT_EQ(resp.status_text, "Request Header Fields Too Large");
}

TEST_F(TransportTest, GarbageRequestLineIs400) {
    omp::internal::TcpConn conn;
    ASSERT_TRUE(open(conn));
    const std::string req = "NONSENSE\r\n\r\n";
    ASSERT_TRUE(conn.send_all(req.data(), req.size()));
    omp::HttpResponse resp;
    ASSERT_TRUE(read_response(conn, resp));
    EXPECT_EQ(resp.status_code, 400);
}
