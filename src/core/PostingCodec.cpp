#include "miniretrieval/PostingCodec.hpp"

#include <zstd.h>
#include <algorithm>
#include <string>
#include <iostream>
#include "miniretrieval/algorithms/GapCodec.hpp"

namespace miniretrieval {

namespace {

constexpr char kMagic[4] = {'M', 'R', 'P', 'B'};
constexpr uint16_t kVersion = 1;
constexpr size_t kHeaderSize = 4 + 2 + 2 + 4 + 4;
constexpr uint32_t kMaxPayload = 256u * 1024u * 1024u;

template <typename T>
void writeLE(std::string& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFFu));
    }
}

template <typename T>
bool readLE(std::string_view data, size_t& offset, T& value) {
    if (offset + sizeof(T) > data.size()) return false;
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        v |= static_cast<uint64_t>(static_cast<unsigned char>(data[offset + i])) << (8 * i);
    }
    value = static_cast<T>(v);
    offset += sizeof(T);
    return true;
}

void writeVarint(std::string& out, uint32_t value) {
    while (value >= 0x80u) {
        out.push_back(static_cast<char>((value & 0x7Fu) | 0x80u));
        value >>= 7;
    }
    out.push_back(static_cast<char>(value));
}

bool readVarint(std::string_view data, size_t& offset, uint32_t& value) {
    uint64_t result = 0;
    for (int shift = 0; shift <= 28; shift += 7) {
        if (offset >= data.size()) return false;
        auto byte = static_cast<unsigned char>(data[offset++]);
        result |= static_cast<uint64_t>(byte & 0x7Fu) << shift;
        if ((byte & 0x80u) == 0) {
            if (result > 0xFFFFFFFFull) return false;
            value = static_cast<uint32_t>(result);
            return true;
        }
    }
    return false;
}

bool compressZstd(const std::string& in, std::string& out, int level = 3) {
    size_t maxSize = ZSTD_compressBound(in.size());
    out.resize(maxSize);
    size_t written = ZSTD_compress(out.data(), maxSize, in.data(), in.size(), level);
    if (ZSTD_isError(written)) {
        std::cerr << "PostingCodec: zstd compression failed: " << ZSTD_getErrorName(written) << "\n";
        return false;
    }
    out.resize(written);
    return true;
}

void decompressZstd(std::string_view in, std::string& out) {
    unsigned long long rawSize = ZSTD_getFrameContentSize(in.data(), in.size());
    if (rawSize == ZSTD_CONTENTSIZE_ERROR || rawSize == ZSTD_CONTENTSIZE_UNKNOWN || rawSize > kMaxPayload) {
        throw PostingCodecError("posting block: bad zstd frame");
    }
    out.resize(static_cast<size_t>(rawSize));
    size_t res = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(res)) {
        throw PostingCodecError(std::string("posting block: zstd error: ") + ZSTD_getErrorName(res));
    }
    out.resize(res);
}

} // namespace

uint32_t crc32(std::string_view data) {
    uint32_t crc = 0xFFFFFFFFu;
    for (unsigned char b : data) {
        crc ^= b;
        for (int i = 0; i < 8; ++i) {
            uint32_t mask = (crc & 1u) ? 0xFFFFFFFFu : 0u;
            crc = (crc >> 1) ^ (0xEDB88320u & mask);
        }
    }
    return ~crc;
}

std::string encodePostingBlock(const PostingList& postings, bool compress) {
    std::string payload;
    for (uint32_t gap : algo::valuesToGaps(postings)) {
        writeVarint(payload, gap);
    }

    auto encoding = BlockEncoding::Raw;
    if (compress && !payload.empty()) {
        std::string compressed;
        // Fall back to raw when compression fails or does not pay off
        if (compressZstd(payload, compressed) && compressed.size() < payload.size()) {
            payload.swap(compressed);
            encoding = BlockEncoding::Zstd;
        }
    }

    std::string block(kMagic, sizeof(kMagic));
    writeLE(block, kVersion);
    writeLE(block, static_cast<uint16_t>(encoding));
    writeLE(block, static_cast<uint32_t>(postings.size()));
    writeLE(block, static_cast<uint32_t>(payload.size()));
    block.append(payload);
    writeLE(block, crc32(payload));
    return block;
}

BlockEncoding postingBlockEncoding(std::string_view block) {
    if (block.size() < kHeaderSize || block.substr(0, 4) != std::string_view(kMagic, 4)) {
        throw PostingCodecError("posting block: bad magic");
    }
    size_t offset = 6;
    uint16_t encoding = 0;
    readLE(block, offset, encoding);
    if (encoding != static_cast<uint16_t>(BlockEncoding::Raw) &&
        encoding != static_cast<uint16_t>(BlockEncoding::Zstd)) {
        throw PostingCodecError("posting block: unsupported encoding " + std::to_string(encoding));
    }
    return static_cast<BlockEncoding>(encoding);
}

PostingList decodePostingBlock(std::string_view block) {
    auto encoding = postingBlockEncoding(block);

    size_t offset = 4;
    uint16_t version = 0;
    readLE(block, offset, version);
    if (version != kVersion) {
        throw PostingCodecError("posting block: unsupported version " + std::to_string(version));
    }
    offset += 2;
    uint32_t count = 0;
    uint32_t payloadLen = 0;
    readLE(block, offset, count);
    readLE(block, offset, payloadLen);
    if (payloadLen > kMaxPayload || offset + payloadLen + sizeof(uint32_t) != block.size()) {
        throw PostingCodecError("posting block: length mismatch");
    }

    std::string_view payload = block.substr(offset, payloadLen);
    offset += payloadLen;
    uint32_t storedCrc = 0;
    readLE(block, offset, storedCrc);
    if (crc32(payload) != storedCrc) {
        throw PostingCodecError("posting block: checksum mismatch");
    }

    std::string raw;
    if (encoding == BlockEncoding::Zstd) {
        decompressZstd(payload, raw);
    } else {
        raw.assign(payload.begin(), payload.end());
    }

    GapSequence gaps;
    gaps.reserve(std::min<size_t>(count, raw.size()));
    size_t pos = 0;
    while (pos < raw.size()) {
        uint32_t gap = 0;
        if (!readVarint(raw, pos, gap)) {
            throw PostingCodecError("posting block: truncated varint");
        }
        gaps.push_back(gap);
    }
    if (gaps.size() != count) {
        throw PostingCodecError("posting block: expected " + std::to_string(count) +
                                " postings, found " + std::to_string(gaps.size()));
    }

    try {
        return algo::gapsToValues(gaps);
    } catch (const std::invalid_argument& e) {
        throw PostingCodecError(std::string("posting block: ") + e.what());
    }
}

} // namespace miniretrieval
