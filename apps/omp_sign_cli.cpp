// SPDX-License-Identifier: Apache-2.0
// Part of OMPGate project.
// apps/omp_sign_cli.cpp

#include "omp/client.hpp"
#include "omp/signer.hpp"
#include "omp/http_response.hpp"
#include "omp/internal/utils.hpp"

#include <iostream>
#include <string>
#include <cstdlib>
#include <cerrno>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --gen-key\n"
      "      print env exports for the server (public key) and client (seed)\n"
      "  " << argv0 << " [--host http://127.0.0.1:8080] [--path /objects]\n"
      "      [--seed-b64u SEED] [--keyid sig1] [--label sig1]\n"
      "      [--namespace ns] [--json '{\"x\":1}']\n"
      "\n"
      "The seed defaults to $SEED_B64U. Sends a signed POST and prints the status\n"
      "and body; exits 0 on 2xx.\n";
}

// "http://host[:port][/prefix]" -> cfg.host / cfg.port / cfg.base_path
static bool parse_http_url(const std::string& url, omp::ClientConfig& cfg) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) return false;
    std::string rest = url.substr(scheme.size());

    std::string authority = rest, prefix;
    std::size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        authority = rest.substr(0, slash);
        prefix = rest.substr(slash);
        while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    }
    if (authority.empty()) return false;

    std::string host = authority, port;
    if (authority.front() == '[') {
        std::size_t rb = authority.find(']');
        if (rb == std::string::npos) return false;
        host = authority.substr(1, rb - 1);
        if (rb + 1 < authority.size()) {
            if (authority[rb + 1] != ':') return false;
            port = authority.substr(rb + 2);
        }
    } else {
        std::size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }
    if (host.empty()) return false;

    cfg.host = host;
    cfg.port = 80;
    if (!port.empty()) {
        errno = 0;
        char* end = nullptr;
        long v = std::strtol(port.c_str(), &end, 10);
        if (errno != 0 || *end != '\0' || v < 1 || v > 65535) return false;
        cfg.port = static_cast<std::uint16_t>(v);
    }
    cfg.base_path = prefix;
    return true;
}

static int gen_key() {
    std::string seed;
    if (!omp::generate_seed(seed)) {
        std::cerr << "random generator failure\n";
        return 1;
    }
    omp::RequestSigner signer(seed, "sig1");
    const std::string seed_b64u = omp::internal::base64_encode(
        reinterpret_cast<const unsigned char*>(seed.data()), seed.size(), true, false);
    omp::internal::secure_wipe(seed);

    std::cout << "# Add these to your env (server needs the public key):\n"
              << "export OMP_SIG_MODE=strict\n"
              << "export OMP_SIG_KEYID=sig1\n"
              << "export OMP_SIG_ED25519_PUB=" << signer.public_key_b64u() << "\n"
              << "# Client seed (KEEP PRIVATE):\n"
              << "export SEED_B64U=" << seed_b64u << "\n";
    return 0;
}

int main(int argc, char** argv){
    std::string host = "http://127.0.0.1:8080";
    std::string path = "/objects";
    std::string keyid = "sig1";
    std::string label = "sig1";
    std::string ns = "ns";
    std::string json = "{\"x\":1}";
    std::string seed_b64u;
    if (const char* s = std::getenv("SEED_B64U")) seed_b64u = s;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--gen-key") return gen_key();
        else if (a == "--host" && i+1 < argc) host = argv[++i];
        else if (a == "--path" && i+1 < argc) path = argv[++i];
        else if (a == "--seed-b64u" && i+1 < argc) seed_b64u = argv[++i];
        else if (a == "--keyid" && i+1 < argc) keyid = argv[++i];
        else if (a == "--label" && i+1 < argc) label = argv[++i];
        else if (a == "--namespace" && i+1 < argc) ns = argv[++i];
        else if (a == "--json" && i+1 < argc) json = argv[++i];
        else { usage(argv[0]); return 2; }
    }

    if (seed_b64u.empty()) {
        std::cerr << "SEED_B64U is required (or pass --gen-key first).\n";
        return 2;
    }
    if (path.empty() || path.front() != '/') {
        std::cerr << "--path must start with '/'\n";
        return 2;
    }

    omp::ClientConfig cfg;
    if (!parse_http_url(host, cfg)) {
        std::cerr << "--host must look like http://host[:port]\n";
        return 2;
    }
    cfg.keyid = keyid;
    cfg.label = label;
    cfg.seed_b64u = seed_b64u;
    omp::internal::secure_wipe(seed_b64u);

    const std::string payload = "{\"namespace\":\"" + omp::internal::json_escape(ns) +
                                "\",\"content\":" + json + "}";

    omp::HttpResponse resp;
    try {
        omp::Client cli(cfg);
        if (!cli.request("POST", path, payload, {{"Content-Type", "application/json"}}, resp)) {
            std::cerr << "request to " << cli.url_for(path) << " failed\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    std::cout << "Status: " << resp.status_code << "\n" << resp.body << "\n";
    return (resp.status_code >= 200 && resp.status_code < 300) ? 0 : 1;
}
