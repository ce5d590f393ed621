#include "text.hpp"

namespace {

constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

// Length of the sequence introduced by lead, 0 when lead cannot start one.
// lower/upper narrow the range of the first continuation byte.
std::size_t sequence_length(const unsigned char lead, unsigned char& lower, unsigned char& upper)
{
    lower = 0x80;
    upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    }
    if (lead == 0xE0) {
        lower = 0xA0;
        return 3;
    }
    if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        return 3;
    }
    if (lead == 0xED) {
        upper = 0x9F;
        return 3;
    }
    if (lead == 0xF0) {
        lower = 0x90;
        return 4;
    }
    if (lead >= 0xF1 && lead <= 0xF3) {
        return 4;
    }
    if (lead == 0xF4) {
        upper = 0x8F;
        return 4;
    }
    return 0;
}

}

std::string decode_lossy(const std::string_view bytes)
{
    std::string text;
    text.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            text.push_back(bytes[i]);
            ++i;
            continue;
        }

        unsigned char lower;
        unsigned char upper;
        const std::size_t length = sequence_length(lead, lower, upper);
        if (length == 0) {
            text.append(replacement_character);
            ++i;
            continue;
        }

        std::size_t valid = 1;
        while (valid < length && i + valid < bytes.size()) {
            const auto next = static_cast<unsigned char>(bytes[i + valid]);
            if (next < lower || next > upper) {
                break;
            }
            lower = 0x80;
            upper = 0xBF;
            ++valid;
        }

        // A truncated or broken sequence is replaced as a whole (maximal subpart)
        if (valid == length) {
            text.append(bytes.substr(i, length));
        }
        else {
            text.append(replacement_character);
        }
        i += valid;
    }
    return text;
}

bool is_valid_utf8(const std::string_view text)
{
    // Decoding only changes ill-formed input
    return decode_lossy(text) == text;
}

bool is_c_string_safe(const std::string_view text)
{
    return text.find('\0') == std::string_view::npos;
}
