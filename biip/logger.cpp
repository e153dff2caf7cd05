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
 * @brief Biip --- Rule Construction Log Implementation
 */

#include <biip/logger.hpp>

using namespace std;

namespace Biip {

void nop_logger(const log_event_t&)
{
    // nop
}

void log_event(
    logger_t      logger,
    log_level_e   level,
    const string& rule,
    const string& message
)
{
    if (! logger) {
        return;
    }

    log_event_t event;
    event.level   = level;
    event.rule    = rule;
    event.message = message;
    logger(event);
}

void log_info(logger_t logger, const string& rule, const string& message)
{
    log_event(logger, BIIP_LOG_INFO, rule, message);
}

void log_warning(logger_t logger, const string& rule, const string& message)
{
    log_event(logger, BIIP_LOG_WARN, rule, message);
}

ostream_logger::ostream_logger(ostream& out) :
    m_out(out)
{
    // nop
}

void ostream_logger::operator()(const log_event_t& event) const
{
    m_out << (event.level == BIIP_LOG_WARN ? "warning: " : "info: ");
    if (! event.rule.empty()) {
        m_out << event.rule << ": ";
    }
    m_out << event.message << endl;
}

} // Biip
