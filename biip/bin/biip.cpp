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
 * @brief Biip --- Command Line
 *
 * Redact files, piped input or pasted text.
 *
 * @code
 * cat file | biip
 * biip [FILE ...]   # read and redact one or more files
 * biip              # interactive paste; press Ctrl-D to finish
 * @endcode
 *
 * Rules are built from the process environment merged with a dotenv file
 * (default @c .env) and any @c --pattern options.
 */

#include <biip/exception.hpp>
#include <biip/input.hpp>
#include <biip/redactors.hpp>

#include <boost/foreach.hpp>
#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wunused-parameter"
#if __has_warning("-Wunused-local-typedef")
#pragma clang diagnostic ignored "-Wunused-local-typedef"
#endif
#endif
#include <boost/program_options.hpp>
#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include <iostream>
#include <vector>

#include <unistd.h>

using namespace std;
using namespace Biip;

int main(int argc, char **argv)
{
    namespace po = boost::program_options;

    vector<string> files;
    vector<string> patterns;
    string env_file;

    po::options_description desc("Options:");
    desc.add_options()
        ("help,h", "display help and exit")
        ("file", po::value<vector<string> >(&files),
            "file to redact; may be repeated; stdin if none"
        )
        ("pattern,p", po::value<vector<string> >(&patterns),
            "additional regular expression to redact; may be repeated"
        )
        ("env-file", po::value<string>(&env_file)->default_value(".env"),
            "dotenv file merged into the environment"
        )
        ("no-env-file", "do not read a dotenv file")
        ("list", "list rules in the order they are applied and exit")
        ("verbose,v", "log rule construction to stderr")
        ;

    po::positional_options_description pd;
    pd.add("file", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(pd)
                .run(),
            vm
        );
        po::notify(vm);
    }
    catch (const po::error& e) {
        cerr << "Error: " << e.what() << endl;
        cerr << desc << endl;
        return 1;
    }

    if (vm.count("help")) {
        cout << "Usage:" << endl
             << "  cat file | biip" << endl
             << "  biip [FILE ...]" << endl
             << "  biip            # interactive paste; Ctrl-D to finish"
             << endl << endl
             << desc << endl;
        return 0;
    }

    logger_t logger = nop_logger;
    if (vm.count("verbose")) {
        logger = ostream_logger(cerr);
    }

    try {
        Environment environment = Environment::from_process();
        if (
            ! vm.count("no-env-file") &&
            ! environment.load_file(env_file, logger) &&
            ! vm["env-file"].defaulted()
        ) {
            // Only a missing default .env is fine.
            cerr << "Error: Could not open " << env_file << " for reading."
                 << endl;
            return 1;
        }

        Pipeline pipeline = Redactors::build(environment, patterns, logger);

        if (vm.count("list")) {
            BOOST_FOREACH(const string& name, pipeline.names()) {
                cout << name << endl;
            }
            return 0;
        }

        if (! files.empty()) {
            bool success = true;
            BOOST_FOREACH(const string& path, files) {
                try {
                    redact_file(path, pipeline, cout, cerr);
                }
                catch (const enoent& e) {
                    cerr << "Error: " << describe(e) << endl;
                    success = false;
                }
            }
            return success ? 0 : 1;
        }

        if (! isatty(STDIN_FILENO)) {
            redact_lines(cin, pipeline, cout);
        }
        else {
            redact_paste(cin, pipeline, cout, cerr);
        }
    }
    catch (const Biip::error& e) {
        cerr << "Error: " << describe(e) << endl;
        return 1;
    }
    catch (const exception& e) {
        cerr << "Error: Exception:" << endl;
        cerr << e.what() << endl;
        return 1;
    }

    return cout ? 0 : 1;
}
