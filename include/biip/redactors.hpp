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
 * @brief Biip --- Standard Redactors
 *
 * Factories for the standard rules.  Each factory returns boost::none when
 * its preconditions are not met, e.g., an unset variable.
 *
 * Factories that depend on the environment take it explicitly; the rest
 * only take a logger.  default_factories() binds them into a list in the
 * order the pipeline must apply them.
 */

#ifndef __BIIP__REDACTORS__
#define __BIIP__REDACTORS__

#include <biip/pipeline.hpp>
#include <biip/environment.hpp>
#include <biip/logger.hpp>
#include <biip/redactor.hpp>

#include <boost/optional.hpp>

#include <string>
#include <vector>

namespace Biip {
namespace Redactors {

//! Optional redactor, the result of a factory.
typedef boost::optional<Redactor> maybe_redactor_t;

//! List of patterns.
typedef std::vector<std::string> pattern_list_t;

/**
 * Variable holding newline separated user patterns.
 */
extern const char* c_patterns_variable;

/**
 * @name Tokens
 * Replacement tokens of the standard rules.
 *
 * None of them can be matched by any standard rule, so applying the
 * standard pipeline twice gives the same result as applying it once.
 */
///@{
extern const std::string c_home_token;
extern const std::string c_username_token;
extern const std::string c_secret_token;
extern const std::string c_user_pattern_token;
extern const std::string c_url_credentials_format;
extern const std::string c_email_token;
extern const std::string c_mac_address_token;
extern const std::string c_ipv4_token;
extern const std::string c_ipv6_token;
extern const std::string c_jwt_token;
extern const std::string c_cloud_keys_token;
extern const std::string c_uuid_token;
extern const std::string c_credit_card_token;
extern const std::string c_phone_number_token;
///@}

/**
 * @name Environment rules
 * Rules built from the environment.
 */
///@{

/**
 * Home directory: literal @c $HOME replaced by @c ~.
 *
 * Declines if @c HOME is unset, empty or @c /.
 */
maybe_redactor_t home(const Environment& environment, logger_t logger);

/**
 * Username: @c $USER replaced by @c user, ignoring case.
 *
 * Declines if @c USER is unset or empty.
 */
maybe_redactor_t username(const Environment& environment, logger_t logger);

/**
 * Secrets: values of sensitive variables.
 *
 * A variable is sensitive if its name, lowercased, contains one of
 * @c password, @c secret, @c token, @c key, @c username or @c email.
 * Values are trimmed; empty values are ignored.  Longer values are tried
 * first so that a value that is a prefix of another does not leave part
 * of the other behind.
 *
 * Declines if there are no sensitive values.
 */
maybe_redactor_t secrets(const Environment& environment, logger_t logger);

/**
 * User patterns: lines of @c BIIP_PATTERNS followed by @a extra.
 *
 * Each pattern is compiled on its own; patterns that do not compile are
 * logged and dropped.  The rest are combined into a single alternation.
 *
 * Declines if no pattern is valid.
 */
maybe_redactor_t user_patterns(
    const Environment&    environment,
    const pattern_list_t& extra,
    logger_t              logger
);
///@}

/**
 * @name Pattern rules
 * Rules that need no environment.
 */
///@{
//! Credentials in @c http, @c https and @c ftp URLs; scheme and host kept.
maybe_redactor_t url_credentials(logger_t logger);
//! Email addresses.
maybe_redactor_t email(logger_t logger);
//! MAC addresses, colon or dash separated.
maybe_redactor_t mac_address(logger_t logger);
//! Public IPv4 addresses; see is_public_ipv4().
maybe_redactor_t ipv4(logger_t logger);
//! Public IPv6 addresses; see is_public_ipv6().
maybe_redactor_t ipv6(logger_t logger);
//! JSON web tokens.
maybe_redactor_t jwt(logger_t logger);
//! Cloud provider API keys: AWS, OpenAI, Gemini, GCP, xAI, Cerebras.
maybe_redactor_t cloud_keys(logger_t logger);
//! UUIDs.
maybe_redactor_t uuid(logger_t logger);
//! Credit card numbers.  No Luhn check.
maybe_redactor_t credit_card(logger_t logger);
//! North American phone numbers.
maybe_redactor_t phone_number(logger_t logger);
///@}

/**
 * Standard factories in application order.
 *
 * The returned factories refer to @a environment, which must outlive them.
 * @a extra_patterns is copied.
 *
 * @param[in] environment    Environment.
 * @param[in] extra_patterns Additional user patterns.
 * @return Factory list, each named after the rule it builds.
 */
factory_list_t default_factories(
    const Environment&    environment,
    const pattern_list_t& extra_patterns = pattern_list_t()
);

/**
 * Build the standard pipeline.
 *
 * @param[in] environment    Environment.
 * @param[in] extra_patterns Additional user patterns.
 * @param[in] logger         Logger.
 * @return Pipeline.
 */
Pipeline build(
    const Environment&    environment,
    const pattern_list_t& extra_patterns = pattern_list_t(),
    logger_t              logger = nop_logger
);

} // Redactors
} // Biip

#endif
