#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace wkd {

/**
 * Maps the local part of an email address to its WKD token.
 *
 * The local part is hashed with SHA-1 and the 160-bit digest is encoded with
 * Z-Base-32 (RFC 6189, section 5.1.6). The result is always 32 lowercase
 * characters and depends on nothing but the input bytes.
 */
std::string encode_local_part(const std::string& local_part);

// Z-Base-32 encodes the first `bits` bits of `data`, most significant bit first.
std::string zbase32_encode(const uint8_t* data, size_t bits);

}
