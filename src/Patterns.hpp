#ifndef PATTERNS_HPP
#define PATTERNS_HPP

#include <regex>
#include <string>
#include <string_view>

// Compiled expressions that pick film attributes out of file and folder names.
// Every expression is built once on first use and is safe to share between threads.
namespace patterns {

// A year between 1921 and 2159 that is neither at the start of the input nor right
// after a path separator. 1920 and 2160 are left out so 1920x1080 and 2160p never match.
// Capture group 1 is the year.
const std::regex& year();

// 720p, 1080p, 2160p (the trailing p is optional) or 4K. Capture group 1.
const std::regex& resolution();

// Capture groups 1..5 are bluray, webdl, hdtv, dvd and sdtv; exactly one is set per match.
const std::regex& media();

// "proper", only honored when a four digit run appears somewhere before it.
const std::regex& proper();

const std::regex& hdr();

// "Part" followed by an optional separator and an integer or a roman numeral. Capture group 1
// holds the number; it can be empty, callers treat that as no match.
const std::regex& part();

// Characters replaced by a space anywhere in a title: . _ · [ ] { } ( )
const std::regex& titleCharacters();

// A leading "The "/"A " or a trailing ", The".
const std::regex& articles();

// Characters the destination filesystem refuses in a file name.
std::string_view illegalCharacters();

// Drops the run of non-word characters and whitespace at the end of the text. Bytes of
// multi-byte UTF-8 sequences count as word characters.
std::string stripTrailingNonWord(std::string text);

// The text every pattern searches: the containing folder's name and the file name joined by '/'.
std::string folderAndFile(const std::string& sourcePath);

// Escapes every ECMAScript metacharacter so the text matches literally.
std::string escape(std::string_view literal);

} // namespace patterns

#endif
