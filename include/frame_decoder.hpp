#pragma once
#include <string>
#include <string_view>

#include "types.hpp"

/**
 * @brief Inflates a zlib-wrapped deflate frame into its UTF-8 text payload.
 *
 * Pure and synchronous.
 * @throws DecodeError for an empty frame, a corrupt or truncated stream, or a payload that is not valid UTF-8.
 */
std::string decode_frame(const RawFrame& frame);

// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(std::string_view text);
