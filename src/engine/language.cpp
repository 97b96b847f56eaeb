#include "engine/language.hpp"
#include <boost/algorithm/string/case_conv.hpp>

namespace runner {
using namespace std;

const vector<language_info> &get_languages() {
    static const vector<language_info> languages = {
        {language::python, "python", "Python", ".py",
         "print(\"Hello, World!\")"},
        {language::c, "c", "C", ".c",
         "#include <stdio.h>\n\nint main() {\n    printf(\"Hello, World!\\n\");\n    return 0;\n}"},
        {language::javascript, "javascript", "JavaScript", ".js",
         "console.log(\"Hello, World!\");"},
        {language::html, "html", "HTML", ".html",
         "<!DOCTYPE html>\n<html>\n<head>\n    <title>Hello World</title>\n</head>\n<body>\n    <h1>Hello, World!</h1>\n</body>\n</html>"}};
    return languages;
}

const language_info &get_language_info(language lang) {
    return get_languages().at(static_cast<size_t>(lang));
}

optional<language> parse_language(const string &id) {
    for (auto &info : get_languages())
        if (info.id == id)
            return info.lang;
    return nullopt;
}

language language_from_filename(const filesystem::path &filename) {
    string ext = boost::algorithm::to_lower_copy(filename.extension().string());
    if (ext == ".c") return language::c;
    if (ext == ".js") return language::javascript;
    if (ext == ".html" || ext == ".htm") return language::html;
    return language::python;
}

}  // namespace runner
