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
#include "codec.h"

using namespace kvc;
using namespace kvc::mc;

namespace SubdocCmdTraits {
enum Options {
    EMPTY_PATH = 1 << 0,
    HAS_VALUE = 1 << 1,
    ALLOW_MKDIRP = 1 << 2,
    IS_LOOKUP = 1 << 3
};

struct Traits {
    const bool allow_empty_path;
    const bool has_value;
    const bool allow_mkdir_p;
    const bool is_lookup;
    const uint8_t opcode;

    inline bool valid() const {
        return opcode != 0;
    }

    inline Traits(uint8_t op, unsigned options)
        : allow_empty_path(options & EMPTY_PATH), has_value(options & HAS_VALUE),
          allow_mkdir_p(options & ALLOW_MKDIRP), is_lookup(options & IS_LOOKUP), opcode(op)
    {
    }
};

static const Traits Get(CMD_SUBDOC_GET, IS_LOOKUP | EMPTY_PATH);

static const Traits Exists(CMD_SUBDOC_EXISTS, IS_LOOKUP);

static const Traits GetCount(CMD_SUBDOC_GET_COUNT, IS_LOOKUP | EMPTY_PATH);

static const Traits DictAdd(CMD_SUBDOC_DICT_ADD, HAS_VALUE | ALLOW_MKDIRP);

static const Traits DictUpsert(CMD_SUBDOC_DICT_UPSERT, HAS_VALUE | ALLOW_MKDIRP);

static const Traits Remove(CMD_SUBDOC_DELETE, 0);

static const Traits Replace(CMD_SUBDOC_REPLACE, HAS_VALUE);

static const Traits ArrayInsert(CMD_SUBDOC_ARRAY_INSERT, HAS_VALUE);

static const Traits ArrayAddFirst(CMD_SUBDOC_ARRAY_PUSH_FIRST, HAS_VALUE | EMPTY_PATH | ALLOW_MKDIRP);

static const Traits ArrayAddLast(CMD_SUBDOC_ARRAY_PUSH_LAST, HAS_VALUE | EMPTY_PATH | ALLOW_MKDIRP);

static const Traits ArrayAddUnique(CMD_SUBDOC_ARRAY_ADD_UNIQUE, HAS_VALUE | EMPTY_PATH | ALLOW_MKDIRP);

static const Traits Counter(CMD_SUBDOC_COUNTER, HAS_VALUE | ALLOW_MKDIRP);

static const Traits Invalid(0, 0);

const Traits &find(SubdocOp mode)
{
    switch (mode) {
        case SUBDOC_GET:
            return Get;
        case SUBDOC_EXISTS:
            return Exists;
        case SUBDOC_GET_COUNT:
            return GetCount;
        case SUBDOC_DICT_ADD:
            return DictAdd;
        case SUBDOC_DICT_UPSERT:
            return DictUpsert;
        case SUBDOC_REPLACE:
            return Replace;
        case SUBDOC_REMOVE:
            return Remove;
        case SUBDOC_ARRAY_ADD_LAST:
            return ArrayAddLast;
        case SUBDOC_ARRAY_ADD_FIRST:
            return ArrayAddFirst;
        case SUBDOC_ARRAY_INSERT:
            return ArrayInsert;
        case SUBDOC_ARRAY_ADD_UNIQUE:
            return ArrayAddUnique;
        case SUBDOC_COUNTER:
            return Counter;
        default:
            return Invalid;
    }
}
} // namespace SubdocCmdTraits

kvc_STATUS kvc::mc::map_status(uint16_t status)
{
    switch (status) {
        case STATUS_SUCCESS:
        case STATUS_SUBDOC_SUCCESS_DELETED:
            return KVC_SUCCESS;
        case STATUS_KEY_ENOENT:
            return KVC_ERR_DOCUMENT_NOT_FOUND;
        case STATUS_KEY_EEXISTS:
            return KVC_ERR_DOCUMENT_EXISTS;
        case STATUS_E2BIG:
            return KVC_ERR_VALUE_TOO_LARGE;
        case STATUS_EINVAL:
            return KVC_ERR_INVALID_ARGUMENT;
        case STATUS_NOT_STORED:
            return KVC_ERR_NOT_STORED;
        case STATUS_DELTA_BADVAL:
            return KVC_ERR_DELTA_BADVAL;
        case STATUS_NOT_MY_VBUCKET:
            return KVC_ERR_NOT_MY_VBUCKET;
        case STATUS_LOCKED:
            return KVC_ERR_DOCUMENT_LOCKED;
        case STATUS_UNKNOWN_COMMAND:
        case STATUS_NOT_SUPPORTED:
            return KVC_ERR_UNSUPPORTED_OPERATION;
        case STATUS_ENOMEM:
        case STATUS_EBUSY:
        case STATUS_ETMPFAIL:
            return KVC_ERR_TEMPORARY_FAILURE;
        case STATUS_UNKNOWN_COLLECTION:
            return KVC_ERR_COLLECTION_NOT_FOUND;
        case STATUS_DURABILITY_INVALID_LEVEL:
            return KVC_ERR_DURABILITY_LEVEL_NOT_AVAILABLE;
        case STATUS_DURABILITY_IMPOSSIBLE:
            return KVC_ERR_DURABILITY_IMPOSSIBLE;
        case STATUS_SYNC_WRITE_IN_PROGRESS:
            return KVC_ERR_SYNC_WRITE_IN_PROGRESS;
        case STATUS_SYNC_WRITE_AMBIGUOUS:
            return KVC_ERR_DURABILITY_AMBIGUOUS;
        case STATUS_SUBDOC_PATH_ENOENT:
            return KVC_ERR_SUBDOC_PATH_NOT_FOUND;
        case STATUS_SUBDOC_PATH_MISMATCH:
            return KVC_ERR_SUBDOC_PATH_MISMATCH;
        case STATUS_SUBDOC_PATH_EINVAL:
        case STATUS_SUBDOC_XATTR_UNKNOWN_VATTR:
        case STATUS_SUBDOC_XATTR_CANT_MODIFY_VATTR:
            return KVC_ERR_SUBDOC_PATH_INVALID;
        case STATUS_SUBDOC_PATH_E2BIG:
            return KVC_ERR_SUBDOC_PATH_TOO_BIG;
        case STATUS_SUBDOC_DOC_E2DEEP:
            return KVC_ERR_SUBDOC_DOC_TOO_DEEP;
        case STATUS_SUBDOC_VALUE_CANTINSERT:
            return KVC_ERR_SUBDOC_VALUE_CANTINSERT;
        case STATUS_SUBDOC_DOC_NOTJSON:
            return KVC_ERR_SUBDOC_DOC_NOT_JSON;
        case STATUS_SUBDOC_NUM_ERANGE:
            return KVC_ERR_SUBDOC_NUM_RANGE;
        case STATUS_SUBDOC_DELTA_EINVAL:
            return KVC_ERR_SUBDOC_DELTA_INVALID;
        case STATUS_SUBDOC_PATH_EEXISTS:
            return KVC_ERR_SUBDOC_PATH_EXISTS;
        case STATUS_SUBDOC_VALUE_ETOODEEP:
            return KVC_ERR_SUBDOC_VALUE_TOO_DEEP;
        case STATUS_SUBDOC_INVALID_COMBO:
        case STATUS_SUBDOC_XATTR_INVALID_FLAG_COMBO:
        case STATUS_SUBDOC_XATTR_INVALID_KEY_COMBO:
        case STATUS_SUBDOC_INVALID_XATTR_ORDER:
            return KVC_ERR_SUBDOC_INVALID_COMBO;
        case STATUS_SUBDOC_XATTR_UNKNOWN_MACRO:
            return KVC_ERR_SUBDOC_XATTR_UNKNOWN_MACRO;
        case STATUS_SUBDOC_MULTI_PATH_FAILURE:
        case STATUS_SUBDOC_MULTI_PATH_FAILURE_DELETED:
            return KVC_ERR_SUBDOC_MULTI_FAILURE;
        default:
            return KVC_ERR_BAD_RESULT;
    }
}

kvc_STATUS kvc::mc::map_status(const Command &cmd, uint16_t status)
{
    if (status == STATUS_KEY_EEXISTS && cmd.cas != 0) {
        return KVC_ERR_CAS_MISMATCH;
    }
    if (status == STATUS_NOT_STORED && cmd.type == OP_STORE) {
        // Older servers answer a failed add/replace with NOT_STORED
        if (cmd.store.mode == STORE_INSERT) {
            return KVC_ERR_DOCUMENT_EXISTS;
        } else if (cmd.store.mode == STORE_REPLACE) {
            return KVC_ERR_DOCUMENT_NOT_FOUND;
        }
    }
    return map_status(status);
}

static std::string wire_key(const std::string &key, uint32_t collection_id, bool collections)
{
    std::string out;
    if (collections) {
        leb128_encode(collection_id, out);
    }
    out.append(key);
    return out;
}

static std::string strip_collection(const std::string &key, bool collections)
{
    if (!collections) {
        return key;
    }
    uint32_t cid;
    size_t nused = leb128_decode(key.data(), key.size(), cid);
    if (nused == 0) {
        return key;
    }
    return key.substr(nused);
}

/**
 * Order in which the commands go on the wire: extended attribute commands
 * first, otherwise as supplied. Returns the caller's index for every wire
 * position.
 */
static std::vector<size_t> wire_order(const std::vector<SubdocSpec> &specs)
{
    std::vector<size_t> order;
    order.reserve(specs.size());
    for (size_t ii = 0; ii < specs.size(); ++ii) {
        if (specs[ii].xattr) {
            order.push_back(ii);
        }
    }
    for (size_t ii = 0; ii < specs.size(); ++ii) {
        if (!specs[ii].xattr) {
            order.push_back(ii);
        }
    }
    return order;
}

static kvc_STATUS validate_subdoc(const Command &cmd)
{
    const std::vector<SubdocSpec> &specs = cmd.subdoc.specs;
    bool lookup = cmd.type == OP_SUBDOC_LOOKUP;

    if (specs.empty() || specs.size() > SUBDOC_MAX_SPECS) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    if (lookup && (cmd.cas || cmd.expiry || cmd.subdoc.semantics != SUBDOC_STORE_REPLACE)) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    if (cmd.subdoc.semantics == SUBDOC_STORE_INSERT && cmd.cas) {
        return KVC_ERR_INVALID_ARGUMENT;
    }

    for (size_t ii = 0; ii < specs.size(); ++ii) {
        const SubdocSpec &spec = specs[ii];
        const SubdocCmdTraits::Traits &traits = SubdocCmdTraits::find(spec.op);
        if (!traits.valid()) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
        if (traits.is_lookup != lookup) {
            return KVC_ERR_SUBDOC_INVALID_COMBO;
        }
        if (spec.path.empty() && !traits.allow_empty_path) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
        if (traits.has_value == spec.value.empty()) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
        if (spec.create_parents && !traits.allow_mkdir_p) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
        if (spec.expand_macros && !spec.xattr) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
        if (spec.path.size() > 0xffff) {
            return KVC_ERR_SUBDOC_PATH_TOO_BIG;
        }
    }
    return KVC_SUCCESS;
}

kvc_STATUS kvc::mc::validate_command(const Command &cmd)
{
    if (cmd.type == OP_OBSERVE) {
        if (cmd.observe.empty()) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
        for (size_t ii = 0; ii < cmd.observe.size(); ++ii) {
            if (cmd.observe[ii].key.empty()) {
                return KVC_ERR_EMPTY_KEY;
            } else if (cmd.observe[ii].key.size() > MAX_KEY_LENGTH) {
                return KVC_ERR_INVALID_ARGUMENT;
            }
        }
        return KVC_SUCCESS;
    }

    if (cmd.key.empty()) {
        return KVC_ERR_EMPTY_KEY;
    }
    if (cmd.key.size() > MAX_KEY_LENGTH) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    if (cmd.sync_level != DURABILITY_LEVEL_NONE && !cmd.is_mutation()) {
        return KVC_ERR_INVALID_ARGUMENT;
    }

    switch (cmd.type) {
        case OP_COUNTER:
            if (cmd.cas || (cmd.expiry && !cmd.counter.has_initial)) {
                return KVC_ERR_INVALID_ARGUMENT;
            }
            return KVC_SUCCESS;
        case OP_STORE:
            if (cmd.store.mode == STORE_INSERT && cmd.cas) {
                return KVC_ERR_INVALID_ARGUMENT;
            }
            return KVC_SUCCESS;
        case OP_GET_META:
        case OP_GET:
            if (cmd.cas || cmd.expiry) {
                return KVC_ERR_INVALID_ARGUMENT;
            }
            return KVC_SUCCESS;
        case OP_REMOVE:
            if (cmd.expiry) {
                return KVC_ERR_INVALID_ARGUMENT;
            }
            return KVC_SUCCESS;
        case OP_SUBDOC_MUTATE:
        case OP_SUBDOC_LOOKUP:
            return validate_subdoc(cmd);
        default:
            return KVC_ERR_INVALID_ARGUMENT;
    }
}

static void add_durability_frame(const Command &cmd, Frame &frame)
{
    if (cmd.sync_level == DURABILITY_LEVEL_NONE) {
        return;
    }
    uint8_t len = cmd.sync_timeout ? 3 : 1;
    frame.magic = MAGIC_ALT_REQ;
    frame.framing_extras.push_back(static_cast<char>((FRAMEINFO_DURABILITY_REQUIREMENT << 4) | len));
    frame.framing_extras.push_back(static_cast<char>(cmd.sync_level));
    if (cmd.sync_timeout) {
        put_u16(frame.framing_extras, cmd.sync_timeout);
    }
}

static void encode_counter(const Command &cmd, Frame &frame)
{
    frame.opcode = cmd.counter.decrement ? CMD_DECREMENT : CMD_INCREMENT;
    put_u64(frame.extras, cmd.counter.delta);
    if (cmd.counter.has_initial) {
        put_u64(frame.extras, cmd.counter.initial);
        put_u32(frame.extras, cmd.expiry);
    } else {
        put_u64(frame.extras, 0);
        put_u32(frame.extras, COUNTER_NOT_EXISTS_EXPIRY);
    }
}

static void encode_get_meta(const Command &, Frame &frame)
{
    frame.opcode = CMD_GET_META;
    frame.extras.push_back(static_cast<char>(GET_META_VERSION_2));
}

static void encode_get(const Command &, Frame &frame)
{
    frame.opcode = CMD_GET;
}

static void encode_store(const Command &cmd, Frame &frame)
{
    switch (cmd.store.mode) {
        case STORE_INSERT:
            frame.opcode = CMD_ADD;
            break;
        case STORE_REPLACE:
            frame.opcode = CMD_REPLACE;
            break;
        default:
            frame.opcode = CMD_SET;
            break;
    }
    frame.datatype = cmd.store.datatype;
    put_u32(frame.extras, cmd.store.flags);
    put_u32(frame.extras, cmd.expiry);
    frame.value = cmd.store.value;
}

static void encode_remove(const Command &, Frame &frame)
{
    frame.opcode = CMD_DELETE;
}

static uint8_t path_flags(const SubdocSpec &spec)
{
    uint8_t flags = 0;
    if (spec.create_parents) {
        flags |= SUBDOC_FLAG_MKDIR_P;
    }
    if (spec.xattr) {
        flags |= SUBDOC_FLAG_XATTR_PATH;
    }
    if (spec.expand_macros) {
        flags |= SUBDOC_FLAG_EXPAND_MACROS;
    }
    return flags;
}

static void encode_subdoc(const Command &cmd, Frame &frame)
{
    const std::vector<SubdocSpec> &specs = cmd.subdoc.specs;
    bool lookup = cmd.type == OP_SUBDOC_LOOKUP;
    uint8_t docflags = 0;

    frame.opcode = lookup ? CMD_SUBDOC_MULTI_LOOKUP : CMD_SUBDOC_MULTI_MUTATION;
    if (!lookup) {
        if (cmd.subdoc.semantics == SUBDOC_STORE_UPSERT) {
            docflags |= SUBDOC_DOCFLAG_MKDOC;
        } else if (cmd.subdoc.semantics == SUBDOC_STORE_INSERT) {
            docflags |= SUBDOC_DOCFLAG_ADD;
        }
        if (cmd.expiry) {
            put_u32(frame.extras, cmd.expiry);
        }
    }
    if (cmd.subdoc.access_deleted) {
        docflags |= SUBDOC_DOCFLAG_ACCESS_DELETED;
    }
    if (docflags) {
        frame.extras.push_back(static_cast<char>(docflags));
    }

    std::vector<size_t> order = wire_order(specs);
    for (size_t ii = 0; ii < order.size(); ++ii) {
        const SubdocSpec &spec = specs[order[ii]];
        uint8_t opcode = SubdocCmdTraits::find(spec.op).opcode;
        if (spec.op == SUBDOC_GET && spec.path.empty()) {
            opcode = CMD_GET;
        }
        frame.value.push_back(static_cast<char>(opcode));
        frame.value.push_back(static_cast<char>(path_flags(spec)));
        put_u16(frame.value, static_cast<uint16_t>(spec.path.size()));
        if (!lookup) {
            put_u32(frame.value, static_cast<uint32_t>(spec.value.size()));
        }
        frame.value.append(spec.path);
        if (!lookup) {
            frame.value.append(spec.value);
        }
    }
}

static void encode_observe(const Command &cmd, bool collections, Frame &frame)
{
    frame.opcode = CMD_OBSERVE;
    for (size_t ii = 0; ii < cmd.observe.size(); ++ii) {
        std::string key = wire_key(cmd.observe[ii].key, cmd.collection_id, collections);
        put_u16(frame.value, cmd.observe[ii].vbid);
        put_u16(frame.value, static_cast<uint16_t>(key.size()));
        frame.value.append(key);
    }
}

kvc_STATUS kvc::mc::encode_request(const Command &cmd, uint16_t vbid, bool collections, Frame &out)
{
    kvc_STATUS rc = validate_command(cmd);
    if (rc != KVC_SUCCESS) {
        return rc;
    }

    out = Frame();
    out.magic = MAGIC_REQ;
    if (cmd.type != OP_OBSERVE) {
        out.vbucket = vbid;
        out.key = wire_key(cmd.key, cmd.collection_id, collections);
    }
    if (cmd.is_mutation()) {
        out.cas = cmd.cas;
    }
    add_durability_frame(cmd, out);

    switch (cmd.type) {
        case OP_COUNTER:
            encode_counter(cmd, out);
            break;
        case OP_GET_META:
            encode_get_meta(cmd, out);
            break;
        case OP_STORE:
            encode_store(cmd, out);
            break;
        case OP_REMOVE:
            encode_remove(cmd, out);
            break;
        case OP_SUBDOC_MUTATE:
        case OP_SUBDOC_LOOKUP:
            encode_subdoc(cmd, out);
            break;
        case OP_OBSERVE:
            encode_observe(cmd, collections, out);
            break;
        case OP_GET:
            encode_get(cmd, out);
            break;
    }
    return KVC_SUCCESS;
}

static void decode_token(const Frame &frame, Response &out)
{
    if (frame.extras.size() == 16) {
        out.has_token = true;
        out.vbuuid = get_u64(frame.extras.data());
        out.seqno = get_u64(frame.extras.data() + 8);
    }
}

static void decode_counter(const Frame &frame, Response &out)
{
    if (out.rc != KVC_SUCCESS) {
        return;
    }
    decode_token(frame, out);
    if (frame.value.size() >= 8) {
        out.value = get_u64(frame.value.data());
    }
}

static void decode_get_meta(const Frame &frame, Response &out)
{
    if (out.status == STATUS_KEY_ENOENT) {
        // A missing document is an answer, not a failure
        out.rc = KVC_SUCCESS;
        out.exists = false;
        out.cas = 0;
        return;
    }
    if (out.rc != KVC_SUCCESS) {
        return;
    }
    if (frame.extras.size() < 20) {
        out.rc = KVC_ERR_PROTOCOL;
        return;
    }
    const char *ext = frame.extras.data();
    out.deleted = get_u32(ext) != 0;
    out.flags = get_u32(ext + 4);
    out.expiry = get_u32(ext + 8);
    out.seqno = get_u64(ext + 12);
    if (frame.extras.size() > 20) {
        out.datatype = static_cast<uint8_t>(ext[20]);
    }
    out.exists = !out.deleted;
}

static void decode_get(const Frame &frame, Response &out)
{
    if (out.rc != KVC_SUCCESS) {
        return;
    }
    if (frame.extras.size() < 4) {
        out.rc = KVC_ERR_PROTOCOL;
        return;
    }
    out.flags = get_u32(frame.extras.data());
    out.datatype = frame.datatype;
    out.body = frame.value;
    out.exists = true;
}

static void decode_mutation(const Frame &frame, Response &out)
{
    if (out.rc == KVC_SUCCESS) {
        decode_token(frame, out);
    }
}

static void decode_subdoc_mutation(const Command &cmd, const Frame &frame, Response &out)
{
    const std::vector<SubdocSpec> &specs = cmd.subdoc.specs;
    std::vector<size_t> order = wire_order(specs);
    const char *cur = frame.value.data();
    const char *end = cur + frame.value.size();

    if (out.status == STATUS_SUBDOC_MULTI_PATH_FAILURE || out.status == STATUS_SUBDOC_MULTI_PATH_FAILURE_DELETED) {
        if (end - cur < 3) {
            out.rc = KVC_ERR_PROTOCOL;
            return;
        }
        size_t index = static_cast<uint8_t>(cur[0]);
        uint16_t status = get_u16(cur + 1);
        if (index >= order.size()) {
            out.rc = KVC_ERR_PROTOCOL;
            return;
        }
        out.subdoc.assign(specs.size(), SubdocResult());
        for (size_t ii = 0; ii < out.subdoc.size(); ++ii) {
            out.subdoc[ii].rc = KVC_ERR_SUBDOC_MULTI_FAILURE;
        }
        SubdocResult &failed = out.subdoc[order[index]];
        failed.status = status;
        failed.rc = map_status(status);
        out.rc = failed.rc;
        out.deleted = out.status == STATUS_SUBDOC_MULTI_PATH_FAILURE_DELETED;
        return;
    }

    if (out.rc != KVC_SUCCESS) {
        return;
    }

    out.deleted = out.status == STATUS_SUBDOC_SUCCESS_DELETED;
    decode_token(frame, out);
    out.subdoc.assign(specs.size(), SubdocResult());
    while (cur < end) {
        if (end - cur < 7) {
            out.rc = KVC_ERR_PROTOCOL;
            return;
        }
        size_t index = static_cast<uint8_t>(cur[0]);
        uint16_t status = get_u16(cur + 1);
        uint32_t nvalue = get_u32(cur + 3);
        cur += 7;
        if (index >= order.size() || static_cast<size_t>(end - cur) < nvalue) {
            out.rc = KVC_ERR_PROTOCOL;
            return;
        }
        SubdocResult &result = out.subdoc[order[index]];
        result.status = status;
        result.rc = map_status(status);
        result.value.assign(cur, nvalue);
        cur += nvalue;
    }
}

static void decode_subdoc_lookup(const Command &cmd, const Frame &frame, Response &out)
{
    const std::vector<SubdocSpec> &specs = cmd.subdoc.specs;
    switch (out.status) {
        case STATUS_SUCCESS:
        case STATUS_SUBDOC_SUCCESS_DELETED:
        case STATUS_SUBDOC_MULTI_PATH_FAILURE:
        case STATUS_SUBDOC_MULTI_PATH_FAILURE_DELETED:
            break;
        default:
            return;
    }

    std::vector<size_t> order = wire_order(specs);
    const char *cur = frame.value.data();
    const char *end = cur + frame.value.size();
    out.subdoc.assign(specs.size(), SubdocResult());
    out.deleted =
        out.status == STATUS_SUBDOC_SUCCESS_DELETED || out.status == STATUS_SUBDOC_MULTI_PATH_FAILURE_DELETED;

    for (size_t ii = 0; ii < order.size(); ++ii) {
        if (end - cur < 6) {
            out.rc = KVC_ERR_PROTOCOL;
            return;
        }
        uint16_t status = get_u16(cur);
        uint32_t nvalue = get_u32(cur + 2);
        cur += 6;
        if (static_cast<size_t>(end - cur) < nvalue) {
            out.rc = KVC_ERR_PROTOCOL;
            return;
        }
        SubdocResult &result = out.subdoc[order[ii]];
        result.status = status;
        result.rc = map_status(status);
        result.value.assign(cur, nvalue);
        cur += nvalue;
    }
    if (cur != end) {
        out.rc = KVC_ERR_PROTOCOL;
    }
}

static void decode_observe(const Frame &frame, bool collections, Response &out)
{
    if (out.rc != KVC_SUCCESS) {
        return;
    }
    const char *cur = frame.value.data();
    const char *end = cur + frame.value.size();
    while (cur < end) {
        if (end - cur < 4) {
            out.rc = KVC_ERR_PROTOCOL;
            return;
        }
        ObserveEntry entry;
        entry.vbid = get_u16(cur);
        uint16_t nkey = get_u16(cur + 2);
        cur += 4;
        if (static_cast<size_t>(end - cur) < static_cast<size_t>(nkey) + 9) {
            out.rc = KVC_ERR_PROTOCOL;
            return;
        }
        entry.key = strip_collection(std::string(cur, nkey), collections);
        cur += nkey;
        entry.status = static_cast<uint8_t>(cur[0]);
        entry.cas = get_u64(cur + 1);
        cur += 9;
        out.observe.push_back(entry);
    }
}

void kvc::mc::decode_response(const Command &cmd, const Frame &frame, bool collections, Response &out)
{
    out.status = frame.status();
    out.opaque = frame.opaque;
    out.cas = frame.cas;
    out.rc = map_status(cmd, out.status);

    switch (cmd.type) {
        case OP_COUNTER:
            decode_counter(frame, out);
            break;
        case OP_GET_META:
            decode_get_meta(frame, out);
            break;
        case OP_STORE:
        case OP_REMOVE:
            decode_mutation(frame, out);
            break;
        case OP_SUBDOC_MUTATE:
            decode_subdoc_mutation(cmd, frame, out);
            break;
        case OP_SUBDOC_LOOKUP:
            decode_subdoc_lookup(cmd, frame, out);
            break;
        case OP_OBSERVE:
            decode_observe(frame, collections, out);
            break;
        case OP_GET:
            decode_get(frame, out);
            break;
    }
}
