#include "FilmAttributes.hpp"

std::string toString(Resolution resolution) {
    switch (resolution) {
    case Resolution::R720p:
        return "720p";
    case Resolution::R1080p:
        return "1080p";
    case Resolution::R2160p:
        return "2160p";
    }
    return {};
}

std::string toString(Media media) {
    switch (media) {
    case Media::Bluray:
        return "Bluray";
    case Media::WebDl:
        return "WEB-DL";
    case Media::Hdtv:
        return "HDTV";
    case Media::Dvd:
        return "DVD";
    case Media::Sdtv:
        return "SDTV";
    case Media::Unknown:
        break;
    }
    return {};
}

bool operator==(const FilmAttributes& lhs, const FilmAttributes& rhs) {
    return lhs.title == rhs.title && lhs.year == rhs.year && lhs.resolution == rhs.resolution &&
           lhs.media == rhs.media && lhs.edition == rhs.edition && lhs.part == rhs.part &&
           lhs.isHdr == rhs.isHdr && lhs.isProper == rhs.isProper;
}
