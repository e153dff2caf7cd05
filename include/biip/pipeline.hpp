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
 * @brief Biip --- Pipeline
 *
 * A Pipeline applies an ordered list of Redactors to text.
 *
 * Order matters.  Rules specific to the user and environment (home
 * directory, username, secret values) must come before network and
 * credential rules, which must come before fully generic rules (tokens,
 * identifiers).  Otherwise a generic rule can consume part of a more
 * specific match, e.g., the email rule eating the password and host of a
 * URL with credentials.  See Redactors::default_factories() for the
 * standard order.
 */

#ifndef __BIIP__PIPELINE__
#define __BIIP__PIPELINE__

#include <biip/logger.hpp>
#include <biip/redactor.hpp>

#include <boost/function.hpp>
#include <boost/optional.hpp>

#include <list>
#include <utility>
#include <string>
#include <vector>

namespace Biip {

/**
 * Rule factory.
 *
 * Returns a Redactor or boost::none to decline, e.g., when a variable it
 * requires is unset.  May throw.  Factories are bound to their inputs
 * before being handed to a Pipeline.
 */
typedef boost::function<boost::optional<Redactor>(logger_t)> factory_t;

//! Factory and the name of the rule it builds.
typedef std::pair<std::string, factory_t> named_factory_t;

//! List of named factories.
typedef std::list<named_factory_t> factory_list_t;

/**
 * Redaction pipeline.
 *
 * Immutable after construction and safe to share between threads.
 */
class Pipeline
{
public:
    //! List of redactors.
    typedef std::vector<Redactor> redactor_list_t;

    //! Empty pipeline.  process() is the identity.
    Pipeline();

    /**
     * Construct from redactors.
     *
     * @param[in] redactors Redactors in application order.
     */
    explicit
    Pipeline(const redactor_list_t& redactors);

    /**
     * Construct from factories.
     *
     * Factories are run in order.  A factory that declines is omitted and
     * logged as info.  A factory that throws is omitted and logged as a
     * warning.  Neither affects the other factories.  Events are logged
     * under the factory's name.
     *
     * @param[in] factories Factories in application order.
     * @param[in] logger    Logger.
     */
    explicit
    Pipeline(
        const factory_list_t& factories,
        logger_t              logger = nop_logger
    );

    /**
     * Redact @a text.
     *
     * Each redactor is applied once, in order, to the output of the
     * previous one.  Redactors that make no change cost no copy.
     *
     * @param[in] text Text to redact.
     * @return Redacted text.
     * @throw eother if any redactor fails.  Nothing is returned in that
     *        case.
     */
    std::string process(const std::string& text) const;

    //! Redactors in order.
    const redactor_list_t& redactors() const
    {
        return m_redactors;
    }

    //! Names of redactors in order.
    std::vector<std::string> names() const;

    //! Number of redactors.
    size_t size() const
    {
        return m_redactors.size();
    }

    //! True iff there are no redactors.
    bool empty() const
    {
        return m_redactors.empty();
    }

private:
    redactor_list_t m_redactors;
};

} // Biip

#endif
