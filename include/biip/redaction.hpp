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
 * @brief Biip --- Redaction Result
 *
 * Result of applying a single rule to a text.
 */

#ifndef __BIIP__REDACTION__
#define __BIIP__REDACTION__

#include <string>

namespace Biip {

/**
 * Result of a redaction: either the unchanged input or a new buffer.
 *
 * An unchanged result borrows the input buffer and allocates nothing.  It
 * is only valid as long as the input it refers to.  A changed result owns
 * its text.
 *
 * Rules chain many redactions over possibly large inputs and most rules
 * match nothing, so the unchanged case must stay free.
 */
class Redaction
{
public:
    /**
     * Unchanged result borrowing @a text.
     *
     * @param[in] text Input text; must outlive the result.
     * @return Unchanged redaction.
     */
    static Redaction unchanged(const std::string& text);

    /**
     * Changed result taking the contents of @a text.
     *
     * @param[in, out] text New text.  Left empty.
     * @return Changed redaction.
     */
    static Redaction changed(std::string& text);

    //! True iff at least one replacement was made.
    bool changed() const
    {
        return m_borrowed == NULL;
    }

    //! Current text, borrowed or owned.
    const std::string& text() const
    {
        return m_borrowed ? *m_borrowed : m_owned;
    }

    //! Copy of current text.
    std::string str() const
    {
        return text();
    }

    /**
     * Move the text into @a to.
     *
     * Swaps if owned, copies if borrowed.  The redaction is unchanged and
     * borrows @a to afterwards.
     *
     * @param[out] to Where to store the text.
     */
    void release(std::string& to);

private:
    Redaction();

    //! Borrowed input; NULL if the text is owned.
    const std::string* m_borrowed;
    //! Owned text; empty when borrowed.
    std::string m_owned;
};

} // Biip

#endif
