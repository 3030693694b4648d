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

#ifndef KVC_MC_PROTOCOL_H
#define KVC_MC_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

/**
 * @file
 * @brief Constants of the memcached binary protocol, as spoken by the
 * key/value service
 */

namespace kvc {
namespace mc {

/** Size of the fixed header preceding every packet */
static const size_t HEADER_SIZE = 24;

enum Magic {
    MAGIC_REQ = 0x80,
    MAGIC_RES = 0x81,

    /** Request carrying framing extras; key length is one byte */
    MAGIC_ALT_REQ = 0x08,
    MAGIC_ALT_RES = 0x18
};

enum Opcode {
    CMD_GET = 0x00,
    CMD_SET = 0x01,
    CMD_ADD = 0x02,
    CMD_REPLACE = 0x03,
    CMD_DELETE = 0x04,
    CMD_INCREMENT = 0x05,
    CMD_DECREMENT = 0x06,
    CMD_NOOP = 0x0a,
    CMD_HELLO = 0x1f,
    CMD_SELECT_BUCKET = 0x89,
    CMD_OBSERVE = 0x92,
    CMD_GET_META = 0xa0,
    CMD_SUBDOC_GET = 0xc5,
    CMD_SUBDOC_EXISTS = 0xc6,
    CMD_SUBDOC_DICT_ADD = 0xc7,
    CMD_SUBDOC_DICT_UPSERT = 0xc8,
    CMD_SUBDOC_DELETE = 0xc9,
    CMD_SUBDOC_REPLACE = 0xca,
    CMD_SUBDOC_ARRAY_PUSH_LAST = 0xcb,
    CMD_SUBDOC_ARRAY_PUSH_FIRST = 0xcc,
    CMD_SUBDOC_ARRAY_INSERT = 0xcd,
    CMD_SUBDOC_ARRAY_ADD_UNIQUE = 0xce,
    CMD_SUBDOC_COUNTER = 0xcf,
    CMD_SUBDOC_MULTI_LOOKUP = 0xd0,
    CMD_SUBDOC_MULTI_MUTATION = 0xd1,
    CMD_SUBDOC_GET_COUNT = 0xd2
};

enum Status {
    STATUS_SUCCESS = 0x00,
    STATUS_KEY_ENOENT = 0x01,
    STATUS_KEY_EEXISTS = 0x02,
    STATUS_E2BIG = 0x03,
    STATUS_EINVAL = 0x04,
    STATUS_NOT_STORED = 0x05,
    STATUS_DELTA_BADVAL = 0x06,
    STATUS_NOT_MY_VBUCKET = 0x07,
    STATUS_NO_BUCKET = 0x08,
    STATUS_LOCKED = 0x09,
    STATUS_AUTH_ERROR = 0x20,
    STATUS_UNKNOWN_COMMAND = 0x81,
    STATUS_ENOMEM = 0x82,
    STATUS_NOT_SUPPORTED = 0x83,
    STATUS_EINTERNAL = 0x84,
    STATUS_EBUSY = 0x85,
    STATUS_ETMPFAIL = 0x86,
    STATUS_UNKNOWN_COLLECTION = 0x88,
    STATUS_DURABILITY_INVALID_LEVEL = 0xa0,
    STATUS_DURABILITY_IMPOSSIBLE = 0xa1,
    STATUS_SYNC_WRITE_IN_PROGRESS = 0xa2,
    STATUS_SYNC_WRITE_AMBIGUOUS = 0xa3,
    STATUS_SUBDOC_PATH_ENOENT = 0xc0,
    STATUS_SUBDOC_PATH_MISMATCH = 0xc1,
    STATUS_SUBDOC_PATH_EINVAL = 0xc2,
    STATUS_SUBDOC_PATH_E2BIG = 0xc3,
    STATUS_SUBDOC_DOC_E2DEEP = 0xc4,
    STATUS_SUBDOC_VALUE_CANTINSERT = 0xc5,
    STATUS_SUBDOC_DOC_NOTJSON = 0xc6,
    STATUS_SUBDOC_NUM_ERANGE = 0xc7,
    STATUS_SUBDOC_DELTA_EINVAL = 0xc8,
    STATUS_SUBDOC_PATH_EEXISTS = 0xc9,
    STATUS_SUBDOC_VALUE_ETOODEEP = 0xca,
    STATUS_SUBDOC_INVALID_COMBO = 0xcb,
    STATUS_SUBDOC_MULTI_PATH_FAILURE = 0xcc,
    STATUS_SUBDOC_SUCCESS_DELETED = 0xcd,
    STATUS_SUBDOC_XATTR_INVALID_FLAG_COMBO = 0xce,
    STATUS_SUBDOC_XATTR_INVALID_KEY_COMBO = 0xcf,
    STATUS_SUBDOC_XATTR_UNKNOWN_MACRO = 0xd0,
    STATUS_SUBDOC_XATTR_UNKNOWN_VATTR = 0xd1,
    STATUS_SUBDOC_XATTR_CANT_MODIFY_VATTR = 0xd2,
    STATUS_SUBDOC_MULTI_PATH_FAILURE_DELETED = 0xd3,
    STATUS_SUBDOC_INVALID_XATTR_ORDER = 0xd4
};

enum Datatype {
    DATATYPE_RAW = 0x00,
    DATATYPE_JSON = 0x01,
    DATATYPE_SNAPPY = 0x02,
    DATATYPE_XATTR = 0x04
};

/** Framing extras object identifiers */
enum FrameInfoId {
    FRAMEINFO_DURABILITY_REQUIREMENT = 0x01
};

enum SubdocPathFlags {
    SUBDOC_FLAG_MKDIR_P = 0x01,
    SUBDOC_FLAG_XATTR_PATH = 0x04,
    SUBDOC_FLAG_EXPAND_MACROS = 0x10
};

enum SubdocDocFlags {
    SUBDOC_DOCFLAG_MKDOC = 0x01,
    SUBDOC_DOCFLAG_ADD = 0x02,
    SUBDOC_DOCFLAG_ACCESS_DELETED = 0x04
};

/**
 * Per key status in an observe response. A key which was removed reports
 * PERSISTED_DELETED once the removal is on disk and NOT_FOUND (logically
 * deleted) before that.
 */
enum ObserveStatus {
    OBSERVE_FOUND_NOT_PERSISTED = 0x00,
    OBSERVE_FOUND_PERSISTED = 0x01,
    OBSERVE_PERSISTED_DELETED = 0x80,
    OBSERVE_NOT_FOUND = 0x81
};

/** Expiry sent with counter operations which must not create the item */
static const uint32_t COUNTER_NOT_EXISTS_EXPIRY = 0xffffffff;

/** Maximum number of commands in one sub-document packet */
static const size_t SUBDOC_MAX_SPECS = 16;

static const size_t MAX_KEY_LENGTH = 250;

/** Version byte of GET_META requesting the datatype in the response */
static const uint8_t GET_META_VERSION_2 = 0x02;

} // namespace mc
} // namespace kvc

#endif
