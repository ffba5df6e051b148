#include "voice/text_sanitize.hpp"

#include <regex>
#include <sstream>

namespace Parley {

static const std::regex kHeaderRe(R"(^[ \t]*#{1,5}(?!#)[ \t]*(\S.*)$)");
static const std::regex kBoldRe(R"(\*\*([^*\n]+?)\*\*)");
// No lookbehind in ECMAScript: the preceding character is captured instead
static const std::regex kItalicRe(R"((^|[^*])\*([^*\n]+?)\*(?!\*))");

std::string sanitizeMarkdownForSpeech(const std::string& text) {
    if (text.empty()) return "";

    std::string out;
    out.reserve(text.size());

    std::istringstream iss(text);
    std::string line;
    bool first = true;
    while (std::getline(iss, line)) {
        if (!first) out.push_back('\n');
        first = false;

        std::smatch m;
        if (std::regex_match(line, m, kHeaderRe)) {
            line = m[1].str();
        }
        out += line;
    }
    if (!text.empty() && text.back() == '\n') out.push_back('\n');

    out = std::regex_replace(out, kBoldRe, "$1");
    out = std::regex_replace(out, kItalicRe, "$1$2");
    return out;
}

} // namespace Parley
