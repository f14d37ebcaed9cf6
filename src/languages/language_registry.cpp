#include "languages/language_registry.hpp"

namespace transpiler::languages {

const std::vector<SupportedLanguage>& supported_languages() {
    static const std::vector<SupportedLanguage> registry = {
        {"cpp", "C++", ".cpp"},
        {"rust", "Rust", ".rs"},
        {"go", "Go", ".go"},
        {"kotlin", "Kotlin", ".kt"},
        {"dart", "Dart", ".dart"},
        {"julia", "Julia", ".jl"},
        {"nim", "Nim", ".nim"},
        {"vlang", "V", ".v"},
        {"mojo", "Mojo", ".mojo"},
        {"dlang", "D", ".d"},
        {"zig", "Zig", ".zig"}};
    return registry;
}

const SupportedLanguage* find_language(const std::string& code) {
    for (const auto& language : supported_languages()) {
        if (language.code == code) {
            return &language;
        }
    }
    return nullptr;
}

}  // namespace transpiler::languages
