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
 * @brief Biip --- Input Handling
 *
 * Feeding files, piped input and pasted text through a Pipeline.  Text is
 * redacted line by line so the same rule never spans lines; pasted text is
 * redacted as a whole.
 */

#ifndef __BIIP__INPUT__
#define __BIIP__INPUT__

#include <biip/pipeline.hpp>

#include <iostream>
#include <string>

namespace Biip {

//! Bytes examined by is_probably_binary().
extern const size_t c_binary_sniff_size;

/**
 * Is @a in probably binary?
 *
 * Binary if the first c_binary_sniff_size bytes contain a NUL or are not
 * valid UTF-8.  A multibyte sequence cut off by the end of the sniffed
 * bytes does not count.  Rewinds @a in.
 *
 * @param[in] in Seekable stream.
 * @return true iff @a in should not be treated as text.
 */
bool is_probably_binary(std::istream& in);

/**
 * Redact each line of @a in to @a out.
 *
 * Every output line is terminated by a newline.
 *
 * @param[in]  in       Input.
 * @param[in]  pipeline Pipeline.
 * @param[out] out      Where to write.
 */
void redact_lines(std::istream& in, const Pipeline& pipeline, std::ostream& out);

/**
 * Redact the file at @a path.
 *
 * Text files are written to @a out preceded by a ``─── PATH ───'' header.
 * Binary files are skipped with a warning on @a err.
 *
 * @param[in]  path     Path to file.
 * @param[in]  pipeline Pipeline.
 * @param[out] out      Where to write redacted text.
 * @param[out] err      Where to write warnings.
 * @return false iff the file was skipped as binary.
 * @throw enoent if @a path can not be opened.
 */
bool redact_file(
    const std::string& path,
    const Pipeline&    pipeline,
    std::ostream&      out,
    std::ostream&      err
);

/**
 * Read pasted text from @a in until end of input and redact it as a whole.
 *
 * A prompt and separators are written to @a err.
 *
 * @param[in]  in       Input.
 * @param[in]  pipeline Pipeline.
 * @param[out] out      Where to write redacted text.
 * @param[out] err      Where to write the prompt.
 */
void redact_paste(
    std::istream&   in,
    const Pipeline& pipeline,
    std::ostream&   out,
    std::ostream&   err
);

} // Biip

#endif
