/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "omp/internal/sig_headers.hpp"

using namespace omp::internal;

TEST(SignatureInput, ParsesSingleEntry) {
    auto si = parse_signature_input(R"(sig1=();created=1618884473;keyid="sig1")");
    ASSERT_EQ(si.size(), 1u);
    const auto& e = si.at("sig1");
    EXPECT_EQ(e.label, "sig1");
    EXPECT_EQ(e.keyid, "sig1");
    EXPECT_TRUE(e.has_created);
    EXPECT_EQ(e.created, 1618884473);
    EXPECT_EQ(e.params.at("created"), "1618884473");
}

TEST(SignatureInput, ParsesSeveralEntries) {
    auto si = parse_signature_input(R"(a=();keyid="k,1", b=( );created=5;keyid=k2;alg="ed25519")");
    ASSERT_EQ(si.size(), 2u);
    EXPECT_EQ(si.at("a").keyid, "k,1");
    EXPECT_FALSE(si.at("a").has_created);
    EXPECT_EQ(si.at("b").keyid, "k2");
    EXPECT_EQ(si.at("b").params.at("alg"), "ed25519");
}

TEST(SignatureInput, KeyidMayBeAbsent) {
    auto si = parse_signature_input("sig1=();created=1");
    EXPECT_TRUE(si.at("sig1").keyid.empty());
}

TEST(SignatureInput, RejectsMalformed) {
    EXPECT_THROW(parse_signature_input("sig1=this is bad"), MalformedSignature);
    EXPECT_THROW(parse_signature_input("garbage"), MalformedSignature);
    EXPECT_THROW(parse_signature_input(""), MalformedSignature);
    EXPECT_THROW(parse_signature_input(R"(=();keyid="k")"), MalformedSignature);
    EXPECT_THROW(parse_signature_input(R"(sig1=("@method");keyid="k")"), MalformedSignature);
    EXPECT_THROW(parse_signature_input(R"(sig1=(;keyid="k")"), MalformedSignature);
    EXPECT_THROW(parse_signature_input(R"(sig1=();keyid)"), MalformedSignature);
}

TEST(SignatureInput, NonNumericCreatedIsKeptButNotLifted) {
    auto si = parse_signature_input(R"(sig1=();created="2021-04-20T00:00:00Z";keyid="sig1")");
    const auto& e = si.at("sig1");
    EXPECT_EQ(e.keyid, "sig1");
    EXPECT_FALSE(e.has_created);
    EXPECT_EQ(e.params.at("created"), "2021-04-20T00:00:00Z");

    auto soon = parse_signature_input(R"(sig1=();created=soon;keyid="k")");
    EXPECT_FALSE(soon.at("sig1").has_created);
    EXPECT_EQ(soon.at("sig1").keyid, "k");
}

TEST(SignatureInput, ErrorMessageNamesTheProblem) {
    try {
        parse_signature_input("sig1=this is bad");
        FAIL() << "expected MalformedSignature";
    } catch (const MalformedSignature& e) {
        EXPECT_STREQ(e.what(), "missing covered components");
    }
}

TEST(SignatureHeader, ParsesValues) {
    auto s = parse_signature("sig1=:AAAA:, sig2=:b-_c:");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s.at("sig1"), "AAAA");
    EXPECT_EQ(s.at("sig2"), "b-_c");
    EXPECT_EQ(parse_signature("sig1=::").at("sig1"), "");
}

TEST(SignatureHeader, LoneColonIsAnEmptyValue) {
    auto s = parse_signature("sig1=:");
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(s.at("sig1"), "");
}

TEST(SignatureHeader, RejectsMalformed) {
    EXPECT_THROW(parse_signature("sig1=abc"), MalformedSignature);
    EXPECT_THROW(parse_signature("sig1=:abc"), MalformedSignature);
    EXPECT_THROW(parse_signature("nothing"), MalformedSignature);
    EXPECT_THROW(parse_signature("=:abc:"), MalformedSignature);
}
