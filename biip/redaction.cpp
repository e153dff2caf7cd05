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
 * @brief Biip --- Redaction Implementation
 */

#include <biip/redaction.hpp>

using namespace std;

namespace Biip {

Redaction::Redaction() :
    m_borrowed(NULL)
{
    // nop
}

Redaction Redaction::unchanged(const string& text)
{
    Redaction result;
    result.m_borrowed = &text;
    return result;
}

Redaction Redaction::changed(string& text)
{
    Redaction result;
    result.m_owned.swap(text);
    return result;
}

void Redaction::release(string& to)
{
    if (m_borrowed) {
        if (m_borrowed != &to) {
            to = *m_borrowed;
        }
    }
    else {
        to.swap(m_owned);
        m_owned.clear();
    }
    m_borrowed = &to;
}

} // Biip
