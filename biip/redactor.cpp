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
 * @brief Biip --- Redactor Implementation
 */

#include <biip/redactor.hpp>
#include <biip/exception.hpp>

#include <iterator>
#include <stdexcept>

using namespace std;

namespace Biip {

const string Redactor::DEFAULT_TOKEN("*****");

namespace {

/**
 * Compile @a pattern or throw einval naming @a name.
 **/
boost::regex compile(
    const string&           name,
    const string&           pattern,
    boost::regex::flag_type flags
)
{
    try {
        return boost::regex(pattern, flags);
    }
    catch (const boost::regex_error& e) {
        BOOST_THROW_EXCEPTION(
            einval()
                << errinfo_what(
                    "Could not compile pattern: " + pattern +
                    " (" + e.what() + ")"
                )
                << errinfo_rule(name)
        );
    }
}

/**
 * @name Replacement policies for substitute().
 *
 * Each policy decides whether a match is replaced and, if so, appends its
 * replacement.
 */
///@{

//! Replace every match with a fixed token.
class FixedToken
{
public:
    explicit
    FixedToken(const string& token) :
        m_token(token)
    {
        // nop
    }

    bool accept(const boost::smatch&) const
    {
        return true;
    }

    void append(string& out, const boost::smatch&) const
    {
        out += m_token;
    }

private:
    const string& m_token;
};

//! Replace matches the validator accepts with a fixed token.
class ValidatedToken
{
public:
    ValidatedToken(const validator_t& validator, const string& token) :
        m_validator(validator),
        m_token(token)
    {
        // nop
    }

    bool accept(const boost::smatch& m) const
    {
        return m_validator(m.str());
    }

    void append(string& out, const boost::smatch&) const
    {
        out += m_token;
    }

private:
    const validator_t& m_validator;
    const string&      m_token;
};

//! Replace every match with a format expanded against it.
class CaptureFormat
{
public:
    explicit
    CaptureFormat(const string& format) :
        m_format(format)
    {
        // nop
    }

    bool accept(const boost::smatch&) const
    {
        return true;
    }

    void append(string& out, const boost::smatch& m) const
    {
        m.format(back_inserter(out), m_format, boost::format_perl);
    }

private:
    const string& m_format;
};

///@}

/**
 * Replace accepted matches of @a expression in @a text.
 *
 * The output buffer is only created once the first match is accepted.
 * Text of rejected matches is carried along with the text between matches.
 **/
template <typename Policy>
Redaction substitute(
    const string&       text,
    const boost::regex& expression,
    const Policy&       policy
)
{
    string out;
    bool changed = false;
    string::const_iterator last = text.begin();

    boost::sregex_iterator end;
    for (
        boost::sregex_iterator i(text.begin(), text.end(), expression);
        i != end;
        ++i
    ) {
        const boost::smatch& m = *i;
        if (! policy.accept(m)) {
            continue;
        }
        if (! changed) {
            out.reserve(text.size());
            changed = true;
        }
        out.append(last, m[0].first);
        policy.append(out, m);
        last = m[0].second;
    }

    if (! changed) {
        return Redaction::unchanged(text);
    }
    out.append(last, text.end());
    return Redaction::changed(out);
}

class RedactVisitor :
    public boost::static_visitor<Redaction>
{
public:
    explicit
    RedactVisitor(const string& text) :
        m_text(text)
    {
        // nop
    }

    Redaction operator()(const Redactor::literal_t& literal) const
    {
        size_t at = m_text.find(literal.pattern);
        if (at == string::npos) {
            return Redaction::unchanged(m_text);
        }

        string out;
        out.reserve(m_text.size());
        size_t last = 0;
        while (at != string::npos) {
            out.append(m_text, last, at - last);
            out += literal.token;
            last = at + literal.pattern.length();
            at = m_text.find(literal.pattern, last);
        }
        out.append(m_text, last, string::npos);

        return Redaction::changed(out);
    }

    Redaction operator()(const Redactor::pattern_t& pattern) const
    {
        return substitute(
            m_text,
            pattern.expression,
            FixedToken(pattern.token)
        );
    }

    Redaction operator()(const Redactor::capture_t& capture) const
    {
        return substitute(
            m_text,
            capture.expression,
            CaptureFormat(capture.format)
        );
    }

    Redaction operator()(const Redactor::validated_t& validated) const
    {
        return substitute(
            m_text,
            validated.expression,
            ValidatedToken(validated.validator, validated.token)
        );
    }

private:
    const string& m_text;
};

class KindVisitor :
    public boost::static_visitor<Redactor::kind_e>
{
public:
    Redactor::kind_e operator()(const Redactor::literal_t&) const
    {
        return Redactor::LITERAL;
    }

    Redactor::kind_e operator()(const Redactor::pattern_t&) const
    {
        return Redactor::PATTERN;
    }

    Redactor::kind_e operator()(const Redactor::capture_t&) const
    {
        return Redactor::CAPTURE;
    }

    Redactor::kind_e operator()(const Redactor::validated_t&) const
    {
        return Redactor::VALIDATED;
    }
};

} // Anonymous

Redactor::Redactor(
    const string&     name,
    const string&     source,
    const string&     token,
    const strategy_t& strategy
) :
    m_name(name),
    m_source(source),
    m_token(token),
    m_strategy(strategy)
{
    // nop
}

Redactor Redactor::literal(
    const string& name,
    const string& pattern,
    const string& token
)
{
    if (pattern.empty()) {
        BOOST_THROW_EXCEPTION(
            einval()
                << errinfo_what("Literal pattern must not be empty.")
                << errinfo_rule(name)
        );
    }

    literal_t literal;
    literal.pattern = pattern;
    literal.token   = token;

    return Redactor(name, pattern, token, literal);
}

Redactor Redactor::pattern(
    const string&           name,
    const string&           pattern,
    const string&           token,
    boost::regex::flag_type flags
)
{
    pattern_t data;
    data.expression = compile(name, pattern, flags);
    data.token      = token;

    return Redactor(name, pattern, token, data);
}

Redactor Redactor::capture(
    const string& name,
    const string& pattern,
    const string& format
)
{
    capture_t data;
    data.expression = compile(name, pattern, boost::regex::perl);
    data.format     = format;

    return Redactor(name, pattern, format, data);
}

Redactor Redactor::validated(
    const string& name,
    const string& pattern,
    validator_t   validator,
    const string& token
)
{
    if (validator.empty()) {
        BOOST_THROW_EXCEPTION(
            einval()
                << errinfo_what("Validator must not be empty.")
                << errinfo_rule(name)
        );
    }

    validated_t data;
    data.expression = compile(name, pattern, boost::regex::perl);
    data.validator  = validator;
    data.token      = token;

    return Redactor(name, pattern, token, data);
}

Redaction Redactor::redact(const string& text) const
{
    if (text.empty()) {
        return Redaction::unchanged(text);
    }

    try {
        return boost::apply_visitor(RedactVisitor(text), m_strategy);
    }
    catch (const runtime_error& e) {
        // Boost.Regex gives up on pathological input by throwing.
        BOOST_THROW_EXCEPTION(
            eother()
                << errinfo_what(string("Pattern matching failed: ") + e.what())
                << errinfo_rule(m_name)
        );
    }
}

Redactor::kind_e Redactor::kind() const
{
    return boost::apply_visitor(KindVisitor(), m_strategy);
}

string escape_regex(const string& s)
{
    static const string c_special("\\^$.|?*+()[]{}/-#");

    string result;
    result.reserve(s.length() * 2);
    for (string::const_iterator i = s.begin(); i != s.end(); ++i) {
        if (c_special.find(*i) != string::npos) {
            result += '\\';
        }
        result += *i;
    }
    return result;
}

} // Biip
