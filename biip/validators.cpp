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
 * @brief Biip --- Address Validators Implementation
 */

#include <biip/validators.hpp>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <boost/system/error_code.hpp>

#include <stdint.h>

using namespace std;

namespace Biip {

namespace {

/**
 * Does @a address lie in @a network / @a prefix?
 **/
bool in_network(uint32_t address, uint32_t network, int prefix)
{
    uint32_t mask = prefix == 0 ? 0 : ~uint32_t(0) << (32 - prefix);
    return (address & mask) == network;
}

} // Anonymous

bool is_public_ipv4(const string& candidate)
{
    boost::system::error_code ec;
    boost::asio::ip::address_v4 address =
        boost::asio::ip::make_address_v4(candidate, ec);
    if (ec) {
        return false;
    }

    uint32_t a = address.to_uint();
    return ! (
        address.is_loopback()                    ||
        address.is_unspecified()                 ||
        address.is_multicast()                   ||
        address == boost::asio::ip::address_v4::broadcast() ||
        in_network(a, 0x0A000000, 8)             || // 10/8
        in_network(a, 0xAC100000, 12)            || // 172.16/12
        in_network(a, 0xC0A80000, 16)            || // 192.168/16
        in_network(a, 0xA9FE0000, 16)               // 169.254/16
    );
}

bool is_public_ipv6(const string& candidate)
{
    boost::system::error_code ec;
    boost::asio::ip::address_v6 address =
        boost::asio::ip::make_address_v6(candidate, ec);
    if (ec) {
        return false;
    }

    boost::asio::ip::address_v6::bytes_type bytes = address.to_bytes();
    bool unique_local = (bytes[0] & 0xfe) == 0xfc; // fc00::/7

    return ! (
        address.is_loopback()    ||
        address.is_link_local()  ||
        address.is_unspecified() ||
        address.is_multicast()   ||
        unique_local
    );
}

} // Biip
