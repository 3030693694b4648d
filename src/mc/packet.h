/* -*- Mode: C; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2026 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#ifndef KVC_MC_PACKET_H
#define KVC_MC_PACKET_H

#include "protocol.h"
#include <string>

namespace kvc {
namespace mc {

/**
 * @brief A single packet, request or response.
 *
 * Byte fields are owned by the frame; encoding and decoding never keep
 * pointers into caller buffers.
 */
struct Frame {
    Frame() : magic(MAGIC_REQ), opcode(0), datatype(0), vbucket(0), opaque(0), cas(0) {}

    bool is_response() const {
        return magic == MAGIC_RES || magic == MAGIC_ALT_RES;
    }

    /** Status of a response. Shares the header field with the vbucket id */
    uint16_t status() const {
        return vbucket;
    }

    uint8_t magic;
    uint8_t opcode;
    uint8_t datatype;

    /** Partition id for requests, status for responses */
    uint16_t vbucket;
    uint32_t opaque;
    uint64_t cas;
    std::string framing_extras;
    std::string extras;
    std::string key;
    std::string value;
};

enum DecodeResult {
    /** A frame was decoded */
    DECODE_OK,

    /** More bytes are needed */
    DECODE_INCOMPLETE,

    /** The bytes do not form a valid frame */
    DECODE_ERROR
};

/**
 * Append the wire representation of `frame` to `out`. Frames with framing
 * extras must use one of the alternative magics.
 * @return false if a length does not fit its header field
 */
bool encode_frame(const Frame &frame, std::string &out);

/**
 * Decode the first frame in `buf`.
 * @param[out] consumed number of bytes the frame occupied (DECODE_OK only)
 */
DecodeResult decode_frame(const char *buf, size_t nbuf, Frame &frame, size_t *consumed);

/** Append the unsigned LEB128 encoding of `value` */
void leb128_encode(uint32_t value, std::string &out);

/**
 * Decode an unsigned LEB128 value at the start of `buf`.
 * @return the number of bytes used, or 0 if the encoding is invalid
 */
size_t leb128_decode(const char *buf, size_t nbuf, uint32_t &value);

/** Byte order helpers. Buffers are big endian */
void put_u16(std::string &out, uint16_t val);
void put_u32(std::string &out, uint32_t val);
void put_u64(std::string &out, uint64_t val);
uint16_t get_u16(const char *buf);
uint32_t get_u32(const char *buf);
uint64_t get_u64(const char *buf);

} // namespace mc
} // namespace kvc

#endif
