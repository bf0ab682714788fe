#include "Patterns.hpp"

#include <cctype>
#include <filesystem>

namespace patterns {

namespace {
constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;
constexpr std::string_view kMetacharacters = "\\^$.|?*+()[]{}";

bool isWordByte(unsigned char ch) {
    return ch >= 0x80 || ch == '_' || std::isalnum(ch);
}
} // namespace

const std::regex& year() {
    static const std::regex rx(R"([^/]+\b(192[1-9]|19[3-9]\d|20\d\d|21[0-5]\d)\b)", std::regex::ECMAScript);
    return rx;
}

const std::regex& resolution() {
    static const std::regex rx(R"(\b((?:72|108|216)0p?|4K)\b)", kIcase);
    return rx;
}

const std::regex& media() {
    static const std::regex rx(
        R"(\b(?:(blu-?ray|bdremux|bdrip)|(web-?dl|webrip|amzn|nf|hulu|dsnp|atvp)|(hdtv)|(dvd)|(sdtv))\b)", kIcase);
    return rx;
}

const std::regex& proper() {
    static const std::regex rx(R"(\d{4}.*?\b(proper)\b)", kIcase);
    return rx;
}

const std::regex& hdr() {
    static const std::regex rx(R"(\b(hdr)\b)", kIcase);
    return rx;
}

const std::regex& part() {
    static const std::regex rx(
        R"(\bpart\W?(\d+|M{0,4}(?:CM|CD|D?C{0,3})(?:XC|XL|L?X{0,3})(?:IX|IV|V?I{0,3}))\b)", kIcase);
    return rx;
}

const std::regex& titleCharacters() {
    // The middle dot is two bytes in UTF-8, so it sits outside the bracket expression.
    static const std::regex rx(R"([._\[\]{}()]|·)", std::regex::ECMAScript);
    return rx;
}

const std::regex& articles() {
    static const std::regex rx(R"(^(?:the|a)\s|, the$)", kIcase);
    return rx;
}

std::string_view illegalCharacters() {
#ifdef _WIN32
    return "/?<>\\:*|\"";
#else
    return ":";
#endif
}

std::string stripTrailingNonWord(std::string text) {
    while (!text.empty() && !isWordByte(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return text;
}

std::string folderAndFile(const std::string& sourcePath) {
    const std::filesystem::path path(sourcePath);
    return path.parent_path().filename().string() + "/" + path.filename().string();
}

std::string escape(std::string_view literal) {
    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char ch : literal) {
        if (kMetacharacters.find(ch) != std::string_view::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

} // namespace patterns
