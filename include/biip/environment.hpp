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
 * @brief Biip --- Environment
 *
 * Snapshot of environment variables used to build rules.
 *
 * Rule factories read an Environment rather than the process environment
 * so that they can be tested, and so that the engine never touches global
 * state.
 */

#ifndef __BIIP__ENVIRONMENT__
#define __BIIP__ENVIRONMENT__

#include <biip/logger.hpp>

#include <boost/optional.hpp>

#include <map>
#include <string>

namespace Biip {

/**
 * Environment snapshot: variable name to value.
 *
 * Names are case sensitive.
 */
class Environment
{
public:
    //! Underlying map.
    typedef std::map<std::string, std::string> map_t;

    //! Empty environment.
    Environment();

    /**
     * Environment with the given variables.
     *
     * @param[in] variables Variables.
     */
    explicit
    Environment(const map_t& variables);

    /**
     * Snapshot of the process environment.
     *
     * Entries without an @c = are ignored.
     *
     * @return Environment.
     */
    static Environment from_process();

    /**
     * Set @a name to @a value, replacing any existing value.
     *
     * @param[in] name  Name.
     * @param[in] value Value.
     */
    void set(const std::string& name, const std::string& value);

    /**
     * Value of @a name.
     *
     * @param[in] name Name.
     * @return Value or boost::none if unset.
     */
    boost::optional<std::string> get(const std::string& name) const;

    /**
     * Merge variables from a dotenv file.
     *
     * Each line is @c NAME=VALUE; blank lines and lines starting with @c #
     * are skipped.  Quotes surrounding a value are removed.  Variables
     * already present are not overridden.
     *
     * @param[in] path   Path to file.
     * @param[in] logger Logger.
     * @return false if the file could not be opened, true otherwise.
     * @throw einval if the file is malformed.
     */
    bool load_file(
        const std::string& path,
        logger_t           logger = nop_logger
    );

    //! Variables.
    const map_t& variables() const
    {
        return m_variables;
    }

private:
    map_t m_variables;
};

} // Biip

#endif
