#pragma once
#include <toad/url/url.h>

#include <string>

namespace toad::engine {

enum class InputType {
    Unknown,
    HttpUrl,
    FileUrl,
    LocalPath,
    DataUrl,
    AboutUrl,
    BareHost,
};

struct NavigationInput {
    std::string raw_input;
    url::URL url;
    InputType input_type = InputType::Unknown;
};

const char* input_type_name(InputType type);

InputType classify_input(const std::string& input);

// Turns address-bar text into a URL. "example.com" becomes
// https://example.com/, an existing local path becomes a file:// URL.
bool normalize_input(const std::string& raw_input,
                     NavigationInput& result,
                     std::string& err);

} // namespace toad::engine
