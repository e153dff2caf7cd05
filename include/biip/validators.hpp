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
 * @brief Biip --- Address Validators
 *
 * Validators for Redactor::validated() that accept only public IP
 * addresses.  Addresses in reserved ranges are local network noise rather
 * than identifying information and are left alone.  Text that does not
 * parse as an address, e.g., a MAC address or a scoped identifier such as
 * @c a::b::c, is rejected as well.
 */

#ifndef __BIIP__VALIDATORS__
#define __BIIP__VALIDATORS__

#include <string>

namespace Biip {

/**
 * Is @a candidate a public IPv4 address?
 *
 * False if @a candidate is not a strict dotted quad or is loopback
 * (127/8), private (10/8, 172.16/12, 192.168/16), link-local (169.254/16),
 * unspecified, multicast (224/4) or broadcast.
 *
 * @param[in] candidate Text to check.
 * @return true iff @a candidate should be redacted.
 */
bool is_public_ipv4(const std::string& candidate);

/**
 * Is @a candidate a public IPv6 address?
 *
 * False if @a candidate does not parse as an IPv6 address or is loopback,
 * link-local (fe80::/10), unique local (fc00::/7), unspecified or
 * multicast (ff00::/8).
 *
 * @param[in] candidate Text to check.
 * @return true iff @a candidate should be redacted.
 */
bool is_public_ipv6(const std::string& candidate);

} // Biip

#endif
