#include "engine/language.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;

TEST(LanguageTest, Table) {
    auto &languages = get_languages();
    ASSERT_EQ(languages.size(), 4u);
    for (size_t i = 0; i < languages.size(); ++i)
        EXPECT_EQ(static_cast<size_t>(languages[i].lang), i);

    EXPECT_EQ(get_language_info(language::python).name, "Python");
    EXPECT_EQ(get_language_info(language::c).extension, ".c");
    EXPECT_EQ(get_language_info(language::javascript).template_code, "console.log(\"Hello, World!\");");
    EXPECT_EQ(get_language_info(language::html).extension, ".html");
}

TEST(LanguageTest, Parse) {
    EXPECT_EQ(parse_language("python"), language::python);
    EXPECT_EQ(parse_language("c"), language::c);
    EXPECT_EQ(parse_language("javascript"), language::javascript);
    EXPECT_EQ(parse_language("html"), language::html);
    EXPECT_EQ(parse_language("cpp"), nullopt);
    EXPECT_EQ(parse_language(""), nullopt);
}

TEST(LanguageTest, FromFilename) {
    EXPECT_EQ(language_from_filename("hello.py"), language::python);
    EXPECT_EQ(language_from_filename("hello.c"), language::c);
    EXPECT_EQ(language_from_filename("dir/hello.js"), language::javascript);
    EXPECT_EQ(language_from_filename("index.HTML"), language::html);
    EXPECT_EQ(language_from_filename("index.htm"), language::html);
    EXPECT_EQ(language_from_filename("notes.txt"), language::python);
    EXPECT_EQ(language_from_filename("Makefile"), language::python);
}
