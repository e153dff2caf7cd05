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
 * @brief Biip --- Rule Construction Log
 *
 * Rules are built by factories that may decline, or fail on bad input such
 * as an invalid user pattern.  Those decisions are reported as log events
 * naming the rule they concern.  Applying rules never logs.
 *
 * @sa logger_t
 */

#ifndef __BIIP__LOGGER__
#define __BIIP__LOGGER__

#include <boost/function.hpp>

#include <iostream>
#include <string>

namespace Biip {

//! Severity of a log event.
enum log_level_e
{
    //! A decision that is not a problem, e.g., a rule declined.
    BIIP_LOG_INFO,
    //! A recovered problem, e.g., a user pattern dropped.
    BIIP_LOG_WARN
};

/**
 * Log event.
 */
struct log_event_t
{
    //! Severity.
    log_level_e level;
    //! Rule the event concerns; empty if none, e.g., loading a dotenv file.
    std::string rule;
    //! Message.  A full sentence.
    std::string message;
};

/**
 * Logger callback.
 *
 * Factories, pipeline construction and dotenv loading deliver events to a
 * logger_t.  nop_logger is the default.
 */
typedef boost::function<void(const log_event_t&)> logger_t;

//! Discard @a event.
void nop_logger(const log_event_t& event);

/**
 * Deliver an event to @a logger.
 *
 * @param[in] logger  Logger.
 * @param[in] level   Severity.
 * @param[in] rule    Rule name; may be empty.
 * @param[in] message Message.
 */
void log_event(
    logger_t           logger,
    log_level_e        level,
    const std::string& rule,
    const std::string& message
);

//! log_event() at BIIP_LOG_INFO.
void log_info(
    logger_t           logger,
    const std::string& rule,
    const std::string& message
);

//! log_event() at BIIP_LOG_WARN.
void log_warning(
    logger_t           logger,
    const std::string& rule,
    const std::string& message
);

/**
 * Write events to an ostream, one per line.
 *
 * Lines read ``warning: user_patterns: Dropping ...'' or, without a rule,
 * ``info: Loaded 3 variables from .env.''
 */
class ostream_logger
{
public:
    explicit
    ostream_logger(std::ostream& out);

    void operator()(const log_event_t& event) const;

private:
    std::ostream& m_out;
};

} // Biip

#endif
