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
 * @brief Biip --- Standard Redactors Implementation
 */

#include <biip/redactors.hpp>
#include <biip/exception.hpp>
#include <biip/validators.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/assign/list_of.hpp>
#include <boost/bind.hpp>
#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <set>

using namespace std;

namespace Biip {
namespace Redactors {

const char* c_patterns_variable = "BIIP_PATTERNS";

const string c_home_token("~");
const string c_username_token("user");
const string c_secret_token("••••••••");
const string c_user_pattern_token("••••••");
const string c_url_credentials_format("$+{protocol}://••••:••••@");
const string c_email_token("•••@•••");
const string c_mac_address_token("••:••:••:••:••:••");
const string c_ipv4_token("••.••.••.••");
const string c_ipv6_token("••:••:••:••:••:••:••:••");
const string c_jwt_token("••••🌐•");
const string c_cloud_keys_token("••••☁️•");
const string c_uuid_token("••••••••-••••-••••-••••-••••••••••••");
const string c_credit_card_token("•••• •••• •••• ••••");
const string c_phone_number_token("(•••) •••-••••");

namespace {

//! Substrings of variable names that mark their values as secret.
const char* c_secret_keywords[] = {
    "password",
    "secret",
    "token",
    "key",
    "username",
    "email"
};

//! Key shapes of cloud providers.
const char* c_cloud_key_patterns[] = {
    "\\b(AKIA|ASIA)[0-9A-Z]{16}\\b",     // AWS access key id
    "\\bsk-[a-zA-Z0-9]{32,48}\\b",       // OpenAI
    "\\bAI[a-zA-Z0-9_-]{30,40}\\b",      // Gemini
    "\\bgcp_[a-zA-Z0-9_-]{30,40}\\b",    // Google Cloud Platform
    "xai-[a-zA-Z0-9]{32,64}\\b",         // xAI
    "csk-[a-zA-Z0-9]{40,50}\\b"          // Cerebras
};

bool is_secret_name(const string& name)
{
    string lower = boost::algorithm::to_lower_copy(name);
    BOOST_FOREACH(const char* keyword, c_secret_keywords) {
        if (lower.find(keyword) != string::npos) {
            return true;
        }
    }
    return false;
}

//! Order by length, longest first, then lexicographically.
bool longer_first(const string& a, const string& b)
{
    if (a.length() != b.length()) {
        return a.length() > b.length();
    }
    return a < b;
}

} // Anonymous

maybe_redactor_t home(const Environment& environment, logger_t logger)
{
    boost::optional<string> value = environment.get("HOME");
    if (! value || value->empty()) {
        log_info(logger, "home", "HOME is not set.");
        return boost::none;
    }
    if (*value == "/") {
        log_info(logger, "home", "HOME is the root directory.");
        return boost::none;
    }

    return Redactor::literal("home", *value, c_home_token);
}

maybe_redactor_t username(const Environment& environment, logger_t logger)
{
    boost::optional<string> value = environment.get("USER");
    if (! value || value->empty()) {
        log_info(logger, "username", "USER is not set.");
        return boost::none;
    }

    return Redactor::pattern(
        "username",
        escape_regex(*value),
        c_username_token,
        boost::regex::perl | boost::regex::icase
    );
}

maybe_redactor_t secrets(const Environment& environment, logger_t logger)
{
    set<string> values;
    BOOST_FOREACH(
        const Environment::map_t::value_type& variable,
        environment.variables()
    ) {
        if (! is_secret_name(variable.first)) {
            continue;
        }
        string value = boost::algorithm::trim_copy(variable.second);
        if (! value.empty()) {
            values.insert(value);
        }
    }

    if (values.empty()) {
        log_info(logger, "secrets", "No sensitive variables.");
        return boost::none;
    }

    vector<string> alternatives(values.begin(), values.end());
    sort(alternatives.begin(), alternatives.end(), longer_first);
    BOOST_FOREACH(string& alternative, alternatives) {
        alternative = escape_regex(alternative);
    }

    log_info(
        logger, "secrets",
        boost::lexical_cast<string>(alternatives.size()) +
        " sensitive values."
    );

    return Redactor::pattern(
        "secrets",
        boost::algorithm::join(alternatives, "|"),
        c_secret_token
    );
}

maybe_redactor_t user_patterns(
    const Environment&    environment,
    const pattern_list_t& extra,
    logger_t              logger
)
{
    pattern_list_t candidates;
    boost::optional<string> variable = environment.get(c_patterns_variable);
    if (variable) {
        boost::algorithm::split(
            candidates, *variable,
            boost::algorithm::is_any_of("\n")
        );
    }
    candidates.insert(candidates.end(), extra.begin(), extra.end());

    vector<string> alternatives;
    BOOST_FOREACH(const string& candidate, candidates) {
        string pattern = boost::algorithm::trim_copy(candidate);
        if (pattern.empty()) {
            continue;
        }
        try {
            boost::regex check(pattern, boost::regex::perl);
        }
        catch (const boost::regex_error& e) {
            log_warning(
                logger, "user_patterns",
                "Dropping invalid pattern " + pattern + ": " + e.what()
            );
            continue;
        }
        alternatives.push_back("(?:" + pattern + ")");
    }

    if (alternatives.empty()) {
        log_info(logger, "user_patterns", "No valid user patterns.");
        return boost::none;
    }

    return Redactor::pattern(
        "user_patterns",
        boost::algorithm::join(alternatives, "|"),
        c_user_pattern_token
    );
}

maybe_redactor_t url_credentials(logger_t)
{
    return Redactor::capture(
        "url_credentials",
        "(?<protocol>https?|ftp)://([^:/@\\s]+):([^@/\\s]+)@",
        c_url_credentials_format
    );
}

maybe_redactor_t email(logger_t)
{
    return Redactor::pattern(
        "email",
        "\\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}\\b",
        c_email_token
    );
}

maybe_redactor_t mac_address(logger_t)
{
    return Redactor::pattern(
        "mac_address",
        "\\b(?:[0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2}\\b",
        c_mac_address_token
    );
}

maybe_redactor_t ipv4(logger_t)
{
    // Broad on purpose; is_public_ipv4() does the real work.
    return Redactor::validated(
        "ipv4",
        "\\b(?:\\d{1,3}\\.){3}\\d{1,3}\\b",
        is_public_ipv4,
        c_ipv4_token
    );
}

maybe_redactor_t ipv6(logger_t)
{
    // At least one colon and ends in a hex digit.  Excludes a bare :: and
    // most scoped names; the rest is rejected by is_public_ipv6().
    return Redactor::validated(
        "ipv6",
        "\\b[0-9a-fA-F:]+:[0-9a-fA-F:]*[0-9a-fA-F]\\b",
        is_public_ipv6,
        c_ipv6_token
    );
}

maybe_redactor_t jwt(logger_t)
{
    return Redactor::pattern(
        "jwt",
        "\\b(ey[a-zA-Z0-9_-]{10,})\\.(ey[a-zA-Z0-9_-]{10,})\\."
        "[a-zA-Z0-9_-]*\\b",
        c_jwt_token
    );
}

maybe_redactor_t cloud_keys(logger_t)
{
    vector<string> patterns(
        c_cloud_key_patterns,
        c_cloud_key_patterns +
            sizeof(c_cloud_key_patterns) / sizeof(*c_cloud_key_patterns)
    );

    return Redactor::pattern(
        "cloud_keys",
        boost::algorithm::join(patterns, "|"),
        c_cloud_keys_token
    );
}

maybe_redactor_t uuid(logger_t)
{
    return Redactor::pattern(
        "uuid",
        "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-"
        "[0-9a-fA-F]{12}",
        c_uuid_token
    );
}

maybe_redactor_t credit_card(logger_t)
{
    return Redactor::pattern(
        "credit_card",
        "\\b(?:\\d[ -]*?){13,16}\\b",
        c_credit_card_token
    );
}

maybe_redactor_t phone_number(logger_t)
{
    return Redactor::pattern(
        "phone_number",
        "\\(?\\d{3}\\)?[ -]?\\d{3}[ -]?\\d{4}",
        c_phone_number_token
    );
}

factory_list_t default_factories(
    const Environment&    environment,
    const pattern_list_t& extra_patterns
)
{
    using boost::cref;

    factory_list_t factories = boost::assign::list_of<named_factory_t>
        // User and environment specific.
        ("home",            boost::bind(home, cref(environment), _1))
        ("username",        boost::bind(username, cref(environment), _1))
        ("secrets",         boost::bind(secrets, cref(environment), _1))
        ("user_patterns",   boost::bind(
            user_patterns, cref(environment), extra_patterns, _1
        ))
        // Network and credentials.  MAC before IPv6.
        ("url_credentials", url_credentials)
        ("email",           email)
        ("mac_address",     mac_address)
        ("ipv4",            ipv4)
        ("ipv6",            ipv6)
        // Generic.  UUID before credit card and phone number.
        ("jwt",             jwt)
        ("cloud_keys",      cloud_keys)
        ("uuid",            uuid)
        ("credit_card",     credit_card)
        ("phone_number",    phone_number)
        ;

    return factories;
}

Pipeline build(
    const Environment&    environment,
    const pattern_list_t& extra_patterns,
    logger_t              logger
)
{
    return Pipeline(default_factories(environment, extra_patterns), logger);
}

} // Redactors
} // Biip
