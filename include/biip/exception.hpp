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
 * @brief Biip --- Exceptions
 *
 * Defines the exception hierarchy used by Biip.
 *
 * All exceptions derive from Biip::error, which is both a boost::exception
 * and a std::exception.  Additional information is attached with
 * boost::error_info tags:
 *
 * @code
 * BOOST_THROW_EXCEPTION(
 *     Biip::einval()
 *         << errinfo_what("Could not compile pattern.")
 *         << errinfo_rule("email")
 * );
 * @endcode
 *
 * Construction of a rule is the only place an invalid argument can be
 * reported.  Applying a constructed rule can only fail if the regular
 * expression engine gives up, which is reported as eother.
 */

#ifndef __BIIP__EXCEPTION__
#define __BIIP__EXCEPTION__

#include <boost/exception/all.hpp>

#include <string>

namespace Biip {

/**
 * Base exception type for all Biip exceptions.  See exception.hpp
 *
 * You should never need to throw this directly.  Instead, prefer one of the
 * subclasses.
 **/
struct error : public boost::exception, public std::exception {};

//! Invalid argument, e.g., an invalid pattern.  See exception.hpp
struct einval : public error {};
//! Entity not found, e.g., a file that can not be opened.  See exception.hpp
struct enoent : public error {};
//! Other error, e.g., the regex engine gave up.  See exception.hpp
struct eother : public error {};

/**
 * String exception info explaining what happened.
 **/
typedef boost::error_info<struct tag_errinfo_what, std::string> errinfo_what;

/**
 * Name of the rule involved, if any.
 **/
typedef boost::error_info<struct tag_errinfo_rule, std::string> errinfo_rule;

/**
 * Return the errinfo_what of @a e or a generic message if absent.
 *
 * @param[in] e Exception to describe.
 * @return Human readable message.
 **/
std::string describe(const error& e);

} // Biip

#endif
