#pragma once
#include <string>

namespace Parley {

// Strips ATX headers ("#".."#####" at line start) and **bold** / *italic*
// markers so Markdown replies read naturally. Everything else is kept.
std::string sanitizeMarkdownForSpeech(const std::string& text);

} // namespace Parley
