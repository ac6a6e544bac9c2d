/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/redis_keys.hpp"
#include "omp/log.hpp"

#include <memory>
#include <sys/time.h>

namespace omp::internal {

namespace {

struct ReplyFree { void operator()(redisReply* r) const { if (r) freeReplyObject(r); } };
struct ContextFree { void operator()(::redisContext* c) const { if (c) redisFree(c); } };

using ReplyPtr   = std::unique_ptr<redisReply, ReplyFree>;
using ContextPtr = std::unique_ptr<::redisContext, ContextFree>;

} // namespace

std::string redis_match_pattern(const std::string& prefix) {
    std::string p;
    p.reserve(prefix.size() + 2);
    for (char c : prefix) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') p.push_back('\\');
        p.push_back(c);
    }
    p.push_back('*');
    return p;
}

RedisKeySource::RedisKeySource(Options opt)
    : _opt(std::move(opt))
{}

::redisContext* RedisKeySource::connect() const {
    timeval tv{};
    tv.tv_sec  = _opt.timeout_ms / 1000;
    tv.tv_usec = (_opt.timeout_ms % 1000) * 1000;

    ::redisContext* ctx = redisConnectWithTimeout(_opt.host.c_str(), _opt.port, tv);
    if (!ctx || ctx->err) {
        if (ctx) {
            omp::log_line(std::string("[AUTH][redis] connect error: ") + ctx->errstr);
            redisFree(ctx);
        } else {
            omp::log_line("[AUTH][redis] connect error: NULL context");
        }
        return nullptr;
    }
    (void)redisSetTimeout(ctx, tv);
    if (!auth_and_select(ctx)) {
        redisFree(ctx);
        return nullptr;
    }
    return ctx;
}

bool RedisKeySource::auth_and_select(::redisContext* ctx) const {
    auto run = [&](redisReply* raw, const char* what) {
        ReplyPtr r(raw);
        if (!r) {
            omp::log_line(std::string("[AUTH][redis] ") + what + " failed: no reply");
            return false;
        }
        if (r->type == REDIS_REPLY_ERROR) {
            omp::log_line(std::string("[AUTH][redis] ") + what + " error: " + (r->str ? r->str : ""));
            return false;
        }
        return true;
    };
    if (!_opt.password.empty() &&
        !run(static_cast<redisReply*>(redisCommand(ctx, "AUTH %s", _opt.password.c_str())), "AUTH")) {
        return false;
    }
    if (_opt.db != 0 &&
        !run(static_cast<redisReply*>(redisCommand(ctx, "SELECT %d", _opt.db)), "SELECT")) {
        return false;
    }
    return true;
}

bool RedisKeySource::fetch_all(std::vector<std::pair<std::string, std::string>>& out) const {
    out.clear();
    ContextPtr ctx(connect());
    if (!ctx) return false;

    const std::string pattern = redis_match_pattern(_opt.key_prefix);
    std::vector<std::string> names;
    std::string cursor = "0";
    do {
        ReplyPtr r(static_cast<redisReply*>(redisCommand(ctx.get(), "SCAN %s MATCH %b COUNT 100",
                                                         cursor.c_str(), pattern.data(), pattern.size())));
        if (!r || r->type != REDIS_REPLY_ARRAY || r->elements != 2 ||
            r->element[0]->type != REDIS_REPLY_STRING || r->element[1]->type != REDIS_REPLY_ARRAY) {
            omp::log_line("[AUTH][redis] SCAN failed");
            return false;
        }
        cursor.assign(r->element[0]->str, r->element[0]->len);
        const redisReply* keys = r->element[1];
        for (size_t i = 0; i < keys->elements; ++i) {
            if (keys->element[i]->type == REDIS_REPLY_STRING) {
                names.emplace_back(keys->element[i]->str, keys->element[i]->len);
            }
        }
    } while (cursor != "0");

    std::vector<std::pair<std::string, std::string>> tmp;
    for (const std::string& name : names) {
        ReplyPtr r(static_cast<redisReply*>(redisCommand(ctx.get(), "GET %b", name.data(), name.size())));
        if (!r) {
            omp::log_line("[AUTH][redis] GET failed: no reply");
            return false;
        }
        if (r->type == REDIS_REPLY_STRING && r->str) {
            // SCAN may repeat a key; later duplicates are harmless.
            tmp.emplace_back(name.substr(_opt.key_prefix.size()), std::string(r->str, r->len));
        } else if (r->type == REDIS_REPLY_ERROR) {
            omp::log_line(std::string("[AUTH][redis] GET error: ") + (r->str ? r->str : ""));
            return false;
        }
        // Nil or another type: deleted or not a key, skip.
    }
    out = std::move(tmp);
    return true;
}

} // namespace omp::internal
