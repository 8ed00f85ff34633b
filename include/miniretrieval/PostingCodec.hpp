#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include "miniretrieval/Types.hpp"

namespace miniretrieval {

class PostingCodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class BlockEncoding : uint16_t { Raw = 0, Zstd = 1 };

// Posting block layout (little-endian):
//   "MRPB" | u16 version | u16 encoding | u32 count | u32 payloadLen | payload | u32 crc32(payload)
// The payload is the gap sequence as LEB128 varints, optionally zstd-compressed.
std::string encodePostingBlock(const PostingList& postings, bool compress);

// Throws PostingCodecError on any framing, checksum or decoding failure.
PostingList decodePostingBlock(std::string_view block);

BlockEncoding postingBlockEncoding(std::string_view block);

uint32_t crc32(std::string_view data);

} // namespace miniretrieval
