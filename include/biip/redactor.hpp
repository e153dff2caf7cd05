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
 * @brief Biip --- Redactor
 *
 * A Redactor is a single matching-and-replacement rule.  There are four
 * strategies with different cost/precision trade offs:
 *
 * - Literal: exact substring, unconditional replacement.
 * - Pattern: regular expression, every match replaced by a fixed token.
 * - Capture: regular expression, every match replaced by a format that may
 *   refer to capture groups of the match (Perl format syntax: @c $1,
 *   @c ${1}, @c $+{name}).
 * - Validated: broad regular expression that overmatches; each match is
 *   passed to a validator and only accepted matches are replaced.
 *
 * The set of strategies is closed.  All of them are dispatched by
 * Redactor::redact().
 *
 * Redactors are immutable and hold no references to global state, so a
 * constructed Redactor may be shared between threads.
 */

#ifndef __BIIP__REDACTOR__
#define __BIIP__REDACTOR__

#include <biip/redaction.hpp>

#include <boost/function.hpp>
#include <boost/regex.hpp>
#include <boost/variant.hpp>

#include <string>

namespace Biip {

/**
 * Validator of a candidate match.
 *
 * Must be pure: the result may depend only on the matched text.
 */
typedef boost::function<bool(const std::string&)> validator_t;

/**
 * A single redaction rule.
 *
 * Construct via the static literal(), pattern(), capture() and validated()
 * functions.  All validation happens at construction; redact() never throws
 * for invalid configuration.
 */
class Redactor
{
public:
    //! Strategy of a Redactor.
    enum kind_e {
        LITERAL,
        PATTERN,
        CAPTURE,
        VALIDATED
    };

    //! Token used when none is given.
    static const std::string DEFAULT_TOKEN;

    /**
     * Literal redactor.
     *
     * @param[in] name    Name of rule, used for logging.
     * @param[in] pattern Substring to replace.  Must not be empty.
     * @param[in] token   Replacement.
     * @return Redactor.
     * @throw einval if @a pattern is empty.
     */
    static Redactor literal(
        const std::string& name,
        const std::string& pattern,
        const std::string& token = DEFAULT_TOKEN
    );

    /**
     * Pattern redactor.
     *
     * @a token is inserted literally; @c $ has no special meaning.
     *
     * @param[in] name    Name of rule, used for logging.
     * @param[in] pattern Regular expression (Perl syntax).
     * @param[in] token   Replacement.
     * @param[in] flags   Regular expression flags, e.g., to add
     *                    @c boost::regex::icase.
     * @return Redactor.
     * @throw einval if @a pattern does not compile.
     */
    static Redactor pattern(
        const std::string&      name,
        const std::string&      pattern,
        const std::string&      token = DEFAULT_TOKEN,
        boost::regex::flag_type flags = boost::regex::perl
    );

    /**
     * Capture redactor.
     *
     * @param[in] name    Name of rule, used for logging.
     * @param[in] pattern Regular expression (Perl syntax).
     * @param[in] format  Replacement format (Perl format syntax).
     * @return Redactor.
     * @throw einval if @a pattern does not compile.
     */
    static Redactor capture(
        const std::string& name,
        const std::string& pattern,
        const std::string& format
    );

    /**
     * Validated redactor.
     *
     * @param[in] name      Name of rule, used for logging.
     * @param[in] pattern   Regular expression (Perl syntax).  Expected to
     *                      overmatch.
     * @param[in] validator Decides whether a match is redacted.
     * @param[in] token     Replacement for accepted matches.
     * @return Redactor.
     * @throw einval if @a pattern does not compile or @a validator is
     *        empty.
     */
    static Redactor validated(
        const std::string& name,
        const std::string& pattern,
        validator_t        validator,
        const std::string& token = DEFAULT_TOKEN
    );

    /**
     * Redact @a text.
     *
     * Matches are found left to right and do not overlap.  Replaced text is
     * not scanned again.  If nothing is replaced the result borrows
     * @a text; see Redaction.
     *
     * @param[in] text Text to redact.  Must outlive the result.
     * @return Redaction.
     * @throw eother if the regular expression engine fails, e.g., by
     *        exceeding its complexity limit.  No partial result is
     *        returned.
     */
    Redaction redact(const std::string& text) const;

    //! Name.
    const std::string& name() const
    {
        return m_name;
    }

    //! Strategy.
    kind_e kind() const;

    //! Pattern source as given at construction.
    const std::string& source() const
    {
        return m_source;
    }

    //! Replacement token or, for CAPTURE, format.
    const std::string& token() const
    {
        return m_token;
    }

    /**
     * Literal strategy data.
     */
    struct literal_t
    {
        std::string pattern;
        std::string token;
    };

    /**
     * Pattern strategy data.
     */
    struct pattern_t
    {
        boost::regex expression;
        std::string  token;
    };

    /**
     * Capture strategy data.
     */
    struct capture_t
    {
        boost::regex expression;
        std::string  format;
    };

    /**
     * Validated strategy data.
     */
    struct validated_t
    {
        boost::regex expression;
        validator_t  validator;
        std::string  token;
    };

    //! Strategy variant.
    typedef boost::variant<
        literal_t,
        pattern_t,
        capture_t,
        validated_t
    > strategy_t;

private:
    Redactor(
        const std::string& name,
        const std::string& source,
        const std::string& token,
        const strategy_t&  strategy
    );

    std::string m_name;
    std::string m_source;
    std::string m_token;
    strategy_t  m_strategy;
};

/**
 * Escape @a s so it matches itself as a regular expression.
 *
 * @param[in] s String to escape.
 * @return @a s with every Perl metacharacter escaped.
 */
std::string escape_regex(const std::string& s);

} // Biip

#endif
