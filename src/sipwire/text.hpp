#pragma once

#include <string>
#include <string_view>

// Decodes bytes as UTF-8. Every ill-formed sequence becomes one U+FFFD, so the result is always valid text.
[[nodiscard]] std::string decode_lossy(std::string_view bytes);

[[nodiscard]] bool is_valid_utf8(std::string_view text);

[[nodiscard]] bool is_c_string_safe(std::string_view text);
