#pragma once

#include <string>
#include <vector>

namespace transpiler::languages {

struct SupportedLanguage {
    std::string code;
    std::string display_name;
    std::string file_extension;
};

// Fixed set of targets the transpiler accepts. Built on first use, never mutated.
const std::vector<SupportedLanguage>& supported_languages();

// nullptr when the code is not registered.
const SupportedLanguage* find_language(const std::string& code);

}  // namespace transpiler::languages
