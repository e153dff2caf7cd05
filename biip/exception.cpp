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
 * @brief Biip --- Exception Implementation
 */

#include <biip/exception.hpp>

using namespace std;

namespace Biip {

string describe(const error& e)
{
    const string* what = boost::get_error_info<errinfo_what>(e);
    const string* rule = boost::get_error_info<errinfo_rule>(e);

    string result = what ? *what : "Unknown error.";
    if (rule) {
        result += " [" + *rule + "]";
    }
    return result;
}

} // Biip
