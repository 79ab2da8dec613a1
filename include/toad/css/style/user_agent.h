#pragma once
#include <toad/css/parser/stylesheet.h>

#include <string_view>

namespace toad::css {

// Source text of the built-in default stylesheet.
std::string_view user_agent_css();

// Parsed once on first use and immutable afterwards. Pass it to
// StyleResolver explicitly; nothing reads it implicitly.
const StyleSheet& default_user_agent_stylesheet();

} // namespace toad::css
