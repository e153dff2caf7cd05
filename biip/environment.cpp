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
 * @brief Biip --- Environment Implementation
 */

#include <biip/environment.hpp>
#include <biip/exception.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include <fstream>

#include <unistd.h>

extern char **environ;

using namespace std;

namespace Biip {

namespace {

/**
 * Remove one pair of matching quotes surrounding @a value.
 **/
string unquote(const string& value)
{
    if (
        value.length() >= 2 &&
        (value[0] == '"' || value[0] == '\'') &&
        value[value.length() - 1] == value[0]
    ) {
        return value.substr(1, value.length() - 2);
    }
    return value;
}

} // Anonymous

Environment::Environment()
{
    // nop
}

Environment::Environment(const map_t& variables) :
    m_variables(variables)
{
    // nop
}

Environment Environment::from_process()
{
    Environment result;
    for (char** entry = environ; entry && *entry; ++entry) {
        string s(*entry);
        size_t eq = s.find('=');
        if (eq == string::npos) {
            continue;
        }
        result.m_variables[s.substr(0, eq)] = s.substr(eq + 1);
    }
    return result;
}

void Environment::set(const string& name, const string& value)
{
    m_variables[name] = value;
}

boost::optional<string> Environment::get(const string& name) const
{
    map_t::const_iterator i = m_variables.find(name);
    if (i == m_variables.end()) {
        return boost::none;
    }
    return i->second;
}

bool Environment::load_file(const string& path, logger_t logger)
{
    namespace po = boost::program_options;

    ifstream in(path.c_str());
    if (! in) {
        log_info(logger, "", "Could not open " + path + "; skipped.");
        return false;
    }

    po::parsed_options parsed(NULL);
    try {
        // Every variable is an unregistered option.
        parsed = po::parse_config_file(in, po::options_description(), true);
    }
    catch (const po::error& e) {
        BOOST_THROW_EXCEPTION(
            einval()
                << errinfo_what(
                    "Could not parse " + path + ": " + e.what()
                )
        );
    }

    size_t loaded = 0;
    BOOST_FOREACH(const po::option& option, parsed.options) {
        string name = option.string_key;
        if (boost::algorithm::starts_with(name, "export ")) {
            name = boost::algorithm::trim_copy(name.substr(7));
        }
        if (name.empty() || option.value.empty()) {
            continue;
        }
        if (m_variables.count(name)) {
            continue;
        }
        m_variables[name] = unquote(option.value.front());
        ++loaded;
    }

    log_info(
        logger, "",
        "Loaded " + boost::lexical_cast<string>(loaded) +
        " variables from " + path + "."
    );
    return true;
}

} // Biip
