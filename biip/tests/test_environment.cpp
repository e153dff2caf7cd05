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
 * @brief Biip --- Environment test.
 **/

#include <biip/environment.hpp>
#include <biip/exception.hpp>

#include "gtest/gtest.h"

#include <boost/filesystem.hpp>

#include <cstdlib>
#include <fstream>

using namespace std;
using namespace Biip;

namespace {

//! Temporary file removed on destruction.
class TempFile
{
public:
    explicit
    TempFile(const string& content) :
        m_path(
            boost::filesystem::temp_directory_path() /
            boost::filesystem::unique_path("biip-test-%%%%-%%%%")
        )
    {
        ofstream out(m_path.string().c_str());
        out << content;
    }

    ~TempFile()
    {
        boost::system::error_code ec;
        boost::filesystem::remove(m_path, ec);
    }

    string path() const
    {
        return m_path.string();
    }

private:
    boost::filesystem::path m_path;
};

}

TEST(TestEnvironment, GetSet)
{
    Environment environment;

    EXPECT_FALSE(environment.get("FOO"));
    environment.set("FOO", "bar");
    ASSERT_TRUE(environment.get("FOO"));
    EXPECT_EQ("bar", *environment.get("FOO"));
    EXPECT_FALSE(environment.get("foo"));

    environment.set("FOO", "baz");
    EXPECT_EQ("baz", *environment.get("FOO"));
    EXPECT_EQ(1UL, environment.variables().size());
}

TEST(TestEnvironment, FromMap)
{
    Environment::map_t variables;
    variables["A"] = "1";
    Environment environment(variables);

    EXPECT_EQ("1", *environment.get("A"));
}

TEST(TestEnvironment, FromProcess)
{
    const char* path = getenv("PATH");
    Environment environment = Environment::from_process();

    if (path) {
        ASSERT_TRUE(environment.get("PATH"));
        EXPECT_EQ(string(path), *environment.get("PATH"));
    }
    else {
        EXPECT_FALSE(environment.get("PATH"));
    }
}

TEST(TestEnvironment, LoadFile)
{
    TempFile file(
        "# comment\n"
        "\n"
        "FOO=bar\n"
        "SPACED = value with spaces \n"
        "QUOTED=\"hello world\"\n"
        "SINGLE='x'\n"
        "export EXPORTED=yes\n"
        "EXISTING=new\n"
        "BASE64=YWJj==\n"
    );
    Environment environment;
    environment.set("EXISTING", "old");

    EXPECT_TRUE(environment.load_file(file.path()));

    EXPECT_EQ("bar", *environment.get("FOO"));
    EXPECT_EQ("value with spaces", *environment.get("SPACED"));
    EXPECT_EQ("hello world", *environment.get("QUOTED"));
    EXPECT_EQ("x", *environment.get("SINGLE"));
    EXPECT_EQ("yes", *environment.get("EXPORTED"));
    EXPECT_EQ("old", *environment.get("EXISTING"));
    EXPECT_EQ("YWJj==", *environment.get("BASE64"));
}

TEST(TestEnvironment, LoadMissingFile)
{
    Environment environment;

    EXPECT_FALSE(environment.load_file("/nonexistent/biip/.env"));
    EXPECT_TRUE(environment.variables().empty());
}

TEST(TestEnvironment, LoadMalformedFile)
{
    TempFile file("FOO=bar\nNOT A VARIABLE\n");
    Environment environment;

    EXPECT_THROW(environment.load_file(file.path()), einval);
}
