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
 * @brief Biip --- Input Handling Implementation
 */

#include <biip/input.hpp>
#include <biip/exception.hpp>

#include <utf8.h>

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <vector>

using namespace std;

namespace Biip {

const size_t c_binary_sniff_size = 8192;

namespace {

const char* c_separator = "──────────";

/**
 * Is [@a begin, @a end) the start of a valid multibyte sequence that is
 * missing its final bytes?
 **/
bool is_truncated_sequence(
    vector<char>::const_iterator begin,
    vector<char>::const_iterator end
)
{
    unsigned char lead = *begin;
    ptrdiff_t expected = 0;
    if (lead >= 0xc2 && lead <= 0xdf) {
        expected = 2;
    }
    else if (lead >= 0xe0 && lead <= 0xef) {
        expected = 3;
    }
    else if (lead >= 0xf0 && lead <= 0xf4) {
        expected = 4;
    }

    if (expected == 0 || end - begin >= expected) {
        return false;
    }
    for (++begin; begin != end; ++begin) {
        if ((static_cast<unsigned char>(*begin) & 0xc0) != 0x80) {
            return false;
        }
    }
    return true;
}

} // Anonymous

bool is_probably_binary(istream& in)
{
    vector<char> buffer(c_binary_sniff_size);
    in.read(&buffer[0], buffer.size());
    size_t n = in.gcount();
    in.clear();
    in.seekg(0);

    buffer.resize(n);
    if (find(buffer.begin(), buffer.end(), '\0') != buffer.end()) {
        return true;
    }

    const vector<char>& bytes = buffer;
    vector<char>::const_iterator end = bytes.end();
    vector<char>::const_iterator invalid =
        utf8::find_invalid(bytes.begin(), end);
    if (invalid == end) {
        return false;
    }

    // Only the sniff limit may cut a sequence; end of input may not.
    return ! (n == c_binary_sniff_size && is_truncated_sequence(invalid, end));
}

void redact_lines(istream& in, const Pipeline& pipeline, ostream& out)
{
    string line;
    while (getline(in, line)) {
        out << pipeline.process(line) << '\n';
    }
}

bool redact_file(
    const string&   path,
    const Pipeline& pipeline,
    ostream&        out,
    ostream&        err
)
{
    ifstream in(path.c_str(), ios::binary);
    if (! in) {
        BOOST_THROW_EXCEPTION(
            enoent() << errinfo_what("Could not open " + path + " for reading.")
        );
    }

    if (is_probably_binary(in)) {
        err << "warning: binary file skipped: " << path << endl;
        return false;
    }

    out << "─── " << path << " ───" << '\n';
    redact_lines(in, pipeline, out);
    return true;
}

void redact_paste(
    istream&        in,
    const Pipeline& pipeline,
    ostream&        out,
    ostream&        err
)
{
    err << "Paste content. Press Ctrl-D to finish:" << endl;
    err << c_separator << endl;
    ostringstream buffer;
    buffer << in.rdbuf();
    err << c_separator << endl;
    out << pipeline.process(buffer.str()) << endl;
}

} // Biip
