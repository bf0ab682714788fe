#ifndef FILM_ATTRIBUTES_HPP
#define FILM_ATTRIBUTES_HPP

#include <optional>
#include <string>

// Original release media, in descending order of precedence.
enum class Media {
    Bluray,
    WebDl,
    Hdtv,
    Dvd,
    Sdtv,
    Unknown
};

enum class Resolution {
    R720p,
    R1080p,
    R2160p
};

// Everything the parser can tell about a film from its path alone.
struct FilmAttributes {
    std::string title;
    std::optional<int> year;
    std::optional<Resolution> resolution;
    Media media = Media::Unknown;
    std::optional<std::string> edition;
    std::optional<std::string> part;
    bool isHdr = false;
    bool isProper = false;
};

// "720p", "1080p" or "2160p".
std::string toString(Resolution resolution);
// Display label used in formatted names ("Bluray", "WEB-DL", ...); empty for Unknown.
std::string toString(Media media);

bool operator==(const FilmAttributes& lhs, const FilmAttributes& rhs);

#endif
