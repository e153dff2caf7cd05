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
 * @brief Biip --- Pipeline Implementation
 */

#include <biip/pipeline.hpp>
#include <biip/exception.hpp>

#include <boost/foreach.hpp>

using namespace std;

namespace Biip {

Pipeline::Pipeline()
{
    // nop
}

Pipeline::Pipeline(const redactor_list_t& redactors) :
    m_redactors(redactors)
{
    // nop
}

Pipeline::Pipeline(
    const factory_list_t& factories,
    logger_t              logger
)
{
    BOOST_FOREACH(const named_factory_t& factory, factories) {
        const string& name = factory.first;
        try {
            boost::optional<Redactor> redactor = factory.second(logger);
            if (! redactor) {
                log_info(logger, name, "Declined; rule omitted.");
                continue;
            }
            log_info(logger, name, "Rule added.");
            m_redactors.push_back(*redactor);
        }
        catch (const error& e) {
            log_warning(logger, name, "Rule omitted: " + describe(e));
        }
        catch (const exception& e) {
            log_warning(
                logger, name,
                string("Rule omitted: ") + e.what()
            );
        }
    }
}

string Pipeline::process(const string& text) const
{
    // Only allocate once some redactor changes the text.
    string current;
    bool owned = false;

    BOOST_FOREACH(const Redactor& redactor, m_redactors) {
        Redaction result = redactor.redact(owned ? current : text);
        if (result.changed()) {
            result.release(current);
            owned = true;
        }
    }

    return owned ? current : text;
}

vector<string> Pipeline::names() const
{
    vector<string> result;
    result.reserve(m_redactors.size());
    BOOST_FOREACH(const Redactor& redactor, m_redactors) {
        result.push_back(redactor.name());
    }
    return result;
}

} // Biip
