// SPDX-License-Identifier: Apache-2.0
// Part of OMPGate project.
// apps/omp_server_basic.cpp

#include "omp/server.hpp"
#include "omp/server_config.hpp"

#include <iostream>
#include <string>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--host 0.0.0.0] [--port 8080] [--mode off|permissive|strict]\n"
         "  [--keyid <id> --pub <key>]         default key pair (hex/base64url/base64)\n"
         "  [--sig_key <id>=<key>]             extra named key, repeatable\n"
         "  [--sig_keys_file <path>]           \"keyid key\" per line\n"
         "  [--public_base_url <url>]          externally visible base URL\n"
         "  [--max_payload_mb <n>] [--rate_limit <per-min, 0=off>]\n"
         "  [--ka_timeout <sec>] [--ka_max <n>]\n"
         "  [--log_file <path>] [--quiet 0|1]\n"
         "  Redis key source (loaded once at startup):\n"
         "    --key_redis 1 "
         "[--redis_host 127.0.0.1] [--redis_port 6379] [--redis_db 0]\n"
         "    [--redis_password ****] [--redis_prefix omp:sigkey:] [--redis_timeout_ms 200]\n"
         "Environment (overridden by flags): OMP_SERVER_HOST OMP_SERVER_PORT OMP_SIG_MODE\n"
         "  OMP_SIG_KEYID OMP_SIG_ED25519_PUB OMP_SIG_KEYS_FILE OMP_PUBLIC_BASE_URL\n"
         "  OMP_MAX_PAYLOAD_MB OMP_RATE_LIMIT OMP_LOG_FILE\n";
}

int main(int argc, char** argv) {
    omp::ServerConfig cfg;
    std::string err;
    if (!omp::apply_env(cfg, err) || !omp::apply_args(cfg, argc, argv, err)) {
        std::cerr << err << "\n";
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (cfg.quiet) {
        make_process_quiet();
    }

    if (!cfg.sig_default_pub.empty() && cfg.sig_default_keyid.empty()) {
        std::cerr << "--pub requires --keyid\n";
        return 2;
    }

    try {
        omp::Server srv(cfg);
        srv.run();  // blocking
    } catch (const std::exception& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
