#include "local_part_encoder.hpp"
#include <openssl/sha.h>

namespace wkd {

namespace {
const char kZBase32Alphabet[] = "ybndrfg8ejkmcpqxot1uwisza345h769";
}

std::string zbase32_encode(const uint8_t* data, size_t bits) {
    std::string out;
    out.reserve((bits + 4) / 5);

    uint32_t buffer = 0;
    size_t buffered = 0;
    size_t consumed = 0;
    size_t byte_index = 0;

    while (consumed < bits) {
        if (buffered < 5 && byte_index * 8 < bits) {
            buffer = (buffer << 8) | data[byte_index++];
            buffered += 8;
        }
        // A trailing partial group is padded with zero bits on the right.
        size_t take = (bits - consumed < 5) ? bits - consumed : 5;
        uint32_t index = (buffer >> (buffered - take)) & ((1u << take) - 1);
        index <<= (5 - take);
        buffered -= take;
        consumed += take;
        out += kZBase32Alphabet[index];
    }
    return out;
}

std::string encode_local_part(const std::string& local_part) {
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(local_part.data()), local_part.size(), digest);
    // 160 bits encode to exactly 32 characters.
    return zbase32_encode(digest, SHA_DIGEST_LENGTH * 8);
}

}
