/*****************************************************************************
 * Licensed to Qualys, Inc. (QUALYS) under one or more
 * contributor license agreements.  See the NOTICE file distributed with
 * this work for additional information regarding copyright ownership.
 * QUALYS licenses this file to You under the Apache License, Version 2.0
 * (the "License"); you may not use this file except in compliance with
 * the License.  You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 ****************************************************************************/

/**
 * @file
 * @brief Biip --- Address validator test.
 **/

#include <biip/validators.hpp>

#include "gtest/gtest.h"

using namespace std;
using namespace Biip;

TEST(TestValidators, PublicIPv4)
{
    EXPECT_TRUE(is_public_ipv4("8.8.8.8"));
    EXPECT_TRUE(is_public_ipv4("1.1.1.1"));
    EXPECT_TRUE(is_public_ipv4("172.32.0.1"));
    EXPECT_TRUE(is_public_ipv4("192.169.0.1"));
}

TEST(TestValidators, ReservedIPv4)
{
    EXPECT_FALSE(is_public_ipv4("192.168.1.1"));
    EXPECT_FALSE(is_public_ipv4("10.0.0.1"));
    EXPECT_FALSE(is_public_ipv4("172.16.0.1"));
    EXPECT_FALSE(is_public_ipv4("172.31.255.255"));
    EXPECT_FALSE(is_public_ipv4("127.0.0.1"));
    EXPECT_FALSE(is_public_ipv4("169.254.10.10"));
    EXPECT_FALSE(is_public_ipv4("0.0.0.0"));
    EXPECT_FALSE(is_public_ipv4("224.0.0.1"));
    EXPECT_FALSE(is_public_ipv4("239.255.255.250"));
    EXPECT_FALSE(is_public_ipv4("255.255.255.255"));
}

TEST(TestValidators, InvalidIPv4)
{
    EXPECT_FALSE(is_public_ipv4(""));
    EXPECT_FALSE(is_public_ipv4("256.1.1.1"));
    EXPECT_FALSE(is_public_ipv4("999.999.999.999"));
    EXPECT_FALSE(is_public_ipv4("8.8.8"));
    EXPECT_FALSE(is_public_ipv4("not.an.ip.address"));
}

TEST(TestValidators, PublicIPv6)
{
    EXPECT_TRUE(is_public_ipv6("2001:0db8:85a3:0000:0000:8a2e:0370:7334"));
    EXPECT_TRUE(is_public_ipv6("2001:db8:85a3:1234::8a2e:370:7334"));
    EXPECT_TRUE(is_public_ipv6("2606:4700:4700::1111"));
}

TEST(TestValidators, ReservedIPv6)
{
    EXPECT_FALSE(is_public_ipv6("fe80::aaa:8888:ffff:9999"));
    EXPECT_FALSE(is_public_ipv6("febf::1"));
    EXPECT_FALSE(is_public_ipv6("::1"));
    EXPECT_FALSE(is_public_ipv6("::"));
    EXPECT_FALSE(is_public_ipv6("fc00::1"));
    EXPECT_FALSE(is_public_ipv6("fd12:3456:789a::1"));
    EXPECT_FALSE(is_public_ipv6("ff02::1"));
}

TEST(TestValidators, InvalidIPv6)
{
    EXPECT_FALSE(is_public_ipv6(""));
    EXPECT_FALSE(is_public_ipv6("00:1A:2B:3C:4D:5E"));
    EXPECT_FALSE(is_public_ipv6("a::b::c"));
    EXPECT_FALSE(is_public_ipv6("12:30:45"));
    EXPECT_FALSE(is_public_ipv6("2001:db8::g"));
    EXPECT_FALSE(is_public_ipv6("8.8.8.8"));
}
