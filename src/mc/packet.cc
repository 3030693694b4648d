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

#include "config_static.h"
#include "packet.h"
#include <arpa/inet.h>
#include <string.h>

using namespace kvc::mc;

void kvc::mc::put_u16(std::string &out, uint16_t val)
{
    val = htons(val);
    out.append(reinterpret_cast<const char *>(&val), sizeof(val));
}

void kvc::mc::put_u32(std::string &out, uint32_t val)
{
    val = htonl(val);
    out.append(reinterpret_cast<const char *>(&val), sizeof(val));
}

void kvc::mc::put_u64(std::string &out, uint64_t val)
{
    val = kvc_htonll(val);
    out.append(reinterpret_cast<const char *>(&val), sizeof(val));
}

uint16_t kvc::mc::get_u16(const char *buf)
{
    uint16_t val;
    memcpy(&val, buf, sizeof(val));
    return ntohs(val);
}

uint32_t kvc::mc::get_u32(const char *buf)
{
    uint32_t val;
    memcpy(&val, buf, sizeof(val));
    return ntohl(val);
}

uint64_t kvc::mc::get_u64(const char *buf)
{
    uint64_t val;
    memcpy(&val, buf, sizeof(val));
    return kvc_ntohll(val);
}

void kvc::mc::leb128_encode(uint32_t value, std::string &out)
{
    do {
        uint8_t byte = value & 0x7f;
        value >>= 7;
        if (value) {
            byte |= 0x80;
        }
        out.push_back(static_cast<char>(byte));
    } while (value);
}

size_t kvc::mc::leb128_decode(const char *buf, size_t nbuf, uint32_t &value)
{
    uint64_t result = 0;
    for (size_t ii = 0; ii < nbuf && ii < 5; ++ii) {
        uint8_t byte = static_cast<uint8_t>(buf[ii]);
        result |= static_cast<uint64_t>(byte & 0x7f) << (7 * ii);
        if ((byte & 0x80) == 0) {
            if (result > UINT32_MAX) {
                return 0;
            }
            value = static_cast<uint32_t>(result);
            return ii + 1;
        }
    }
    return 0;
}

static bool is_alt_magic(uint8_t magic)
{
    return magic == MAGIC_ALT_REQ || magic == MAGIC_ALT_RES;
}

static bool is_valid_magic(uint8_t magic)
{
    return magic == MAGIC_REQ || magic == MAGIC_RES || is_alt_magic(magic);
}

bool kvc::mc::encode_frame(const Frame &frame, std::string &out)
{
    bool alt = is_alt_magic(frame.magic);
    size_t bodylen = frame.framing_extras.size() + frame.extras.size() + frame.key.size() + frame.value.size();

    if (!is_valid_magic(frame.magic) || frame.extras.size() > 0xff || bodylen > UINT32_MAX) {
        return false;
    }
    if (alt) {
        if (frame.framing_extras.size() > 0xff || frame.key.size() > 0xff) {
            return false;
        }
    } else if (!frame.framing_extras.empty() || frame.key.size() > 0xffff) {
        return false;
    }

    out.reserve(out.size() + HEADER_SIZE + bodylen);
    out.push_back(static_cast<char>(frame.magic));
    out.push_back(static_cast<char>(frame.opcode));
    if (alt) {
        out.push_back(static_cast<char>(frame.framing_extras.size()));
        out.push_back(static_cast<char>(frame.key.size()));
    } else {
        put_u16(out, static_cast<uint16_t>(frame.key.size()));
    }
    out.push_back(static_cast<char>(frame.extras.size()));
    out.push_back(static_cast<char>(frame.datatype));
    put_u16(out, frame.vbucket);
    put_u32(out, static_cast<uint32_t>(bodylen));
    // The opaque is echoed back verbatim and is never byte swapped
    out.append(reinterpret_cast<const char *>(&frame.opaque), sizeof(frame.opaque));
    put_u64(out, frame.cas);
    out.append(frame.framing_extras);
    out.append(frame.extras);
    out.append(frame.key);
    out.append(frame.value);
    return true;
}

DecodeResult kvc::mc::decode_frame(const char *buf, size_t nbuf, Frame &frame, size_t *consumed)
{
    if (nbuf < HEADER_SIZE) {
        return DECODE_INCOMPLETE;
    }

    uint8_t magic = static_cast<uint8_t>(buf[0]);
    if (!is_valid_magic(magic)) {
        return DECODE_ERROR;
    }

    size_t ffextlen, keylen;
    if (is_alt_magic(magic)) {
        ffextlen = static_cast<uint8_t>(buf[2]);
        keylen = static_cast<uint8_t>(buf[3]);
    } else {
        ffextlen = 0;
        keylen = get_u16(buf + 2);
    }
    size_t extlen = static_cast<uint8_t>(buf[4]);
    size_t bodylen = get_u32(buf + 8);

    if (ffextlen + extlen + keylen > bodylen) {
        return DECODE_ERROR;
    }
    if (nbuf - HEADER_SIZE < bodylen) {
        return DECODE_INCOMPLETE;
    }

    frame.magic = magic;
    frame.opcode = static_cast<uint8_t>(buf[1]);
    frame.datatype = static_cast<uint8_t>(buf[5]);
    frame.vbucket = get_u16(buf + 6);
    memcpy(&frame.opaque, buf + 12, sizeof(frame.opaque));
    frame.cas = get_u64(buf + 16);

    const char *body = buf + HEADER_SIZE;
    frame.framing_extras.assign(body, ffextlen);
    body += ffextlen;
    frame.extras.assign(body, extlen);
    body += extlen;
    frame.key.assign(body, keylen);
    body += keylen;
    frame.value.assign(body, bodylen - ffextlen - extlen - keylen);

    if (consumed) {
        *consumed = HEADER_SIZE + bodylen;
    }
    return DECODE_OK;
}
