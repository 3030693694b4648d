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

#ifndef KVC_MC_CODEC_H
#define KVC_MC_CODEC_H

#include <libkvcore/error.h>
#include <libkvcore/durability.h>
#include <libkvcore/subdoc.h>
#include "packet.h"
#include <string>
#include <vector>

/**
 * @file
 * @brief Per operation request encoding and response decoding
 *
 * A Command describes one logical key/value request. Only the member
 * structure matching Command::type is consulted; the others keep their
 * defaults. Encoding produces a self contained Frame and never keeps
 * references into the command.
 */

namespace kvc {
namespace mc {

enum OpType {
    OP_COUNTER,
    OP_GET_META,
    OP_STORE,
    OP_REMOVE,
    OP_SUBDOC_MUTATE,
    OP_SUBDOC_LOOKUP,
    OP_OBSERVE,
    OP_GET
};

enum StoreMode {
    STORE_UPSERT,
    STORE_INSERT,
    STORE_REPLACE
};

struct CounterFields {
    CounterFields() : delta(0), initial(0), has_initial(false), decrement(false) {}
    uint64_t delta;
    uint64_t initial;
    bool has_initial;
    bool decrement;
};

struct StoreFields {
    StoreFields() : mode(STORE_UPSERT), flags(0), datatype(0) {}
    StoreMode mode;
    std::string value;
    uint32_t flags;
    uint8_t datatype;
};

struct SubdocFields {
    SubdocFields() : semantics(SUBDOC_STORE_REPLACE), access_deleted(false) {}
    std::vector<SubdocSpec> specs;
    SubdocStoreSemantics semantics;
    bool access_deleted;
};

struct ObserveKey {
    ObserveKey() : vbid(0) {}
    ObserveKey(const std::string &key_, uint16_t vbid_) : key(key_), vbid(vbid_) {}
    std::string key;
    uint16_t vbid;
};

struct Command {
    Command() : type(OP_GET_META), collection_id(0), cas(0), expiry(0), sync_level(DURABILITY_LEVEL_NONE), sync_timeout(0)
    {
    }

    /** Whether the command changes the document */
    bool is_mutation() const {
        return type == OP_COUNTER || type == OP_STORE || type == OP_REMOVE || type == OP_SUBDOC_MUTATE;
    }

    /** Whether sending the command twice has the same effect as sending it once */
    bool is_idempotent() const {
        return !is_mutation();
    }

    OpType type;
    std::string key;
    uint32_t collection_id;
    uint64_t cas;
    uint32_t expiry;

    /** Level to send in the framing extras. NONE sends a plain request */
    DurabilityLevel sync_level;

    /** Server side timeout for the synchronous write in milliseconds. 0 omits it */
    uint16_t sync_timeout;

    CounterFields counter;
    StoreFields store;
    SubdocFields subdoc;

    /** Keys to observe. Each carries its own partition */
    std::vector<ObserveKey> observe;
};

/** One key of an observe response */
struct ObserveEntry {
    ObserveEntry() : vbid(0), status(0), cas(0) {}
    std::string key;
    uint16_t vbid;
    uint8_t status;
    uint64_t cas;
};

struct Response {
    Response()
        : rc(KVC_SUCCESS), status(0), opaque(0), cas(0), has_token(false), vbuuid(0), seqno(0), value(0),
          exists(false), deleted(false), flags(0), expiry(0), datatype(0)
    {
    }

    kvc_STATUS rc;
    uint16_t status;
    uint32_t opaque;
    uint64_t cas;

    /** Mutation token, if the server sent one */
    bool has_token;
    uint64_t vbuuid;
    uint64_t seqno;

    /** Counter value */
    uint64_t value;

    /** GET_META. `deleted` is also set for sub-document access to tombstones */
    bool exists;
    bool deleted;
    uint32_t flags;
    uint32_t expiry;
    uint8_t datatype;

    /** Document body of a GET */
    std::string body;

    /** Sub-document results at the index the caller supplied them */
    std::vector<SubdocResult> subdoc;

    std::vector<ObserveEntry> observe;
};

/**
 * Validate a command before it is scheduled.
 * @return KVC_SUCCESS or the input error to report to the caller
 */
kvc_STATUS validate_command(const Command &cmd);

/**
 * Build the request frame for `cmd`. The opaque is left at zero; it is
 * assigned by the connection the frame is written to.
 *
 * @param vbid partition of the key. Ignored for OP_OBSERVE whose keys carry
 *  their own partition
 * @param collections whether to prefix keys with their collection id
 */
kvc_STATUS encode_request(const Command &cmd, uint16_t vbid, bool collections, Frame &out);

/**
 * Decode the response to `cmd`. Status codes describing the document (not
 * found, exists, path errors) are reported in Response::rc; the function
 * itself never fails. A body which cannot be parsed yields KVC_ERR_PROTOCOL.
 */
void decode_response(const Command &cmd, const Frame &frame, bool collections, Response &out);

/** Map a server status which does not depend on the command */
kvc_STATUS map_status(uint16_t status);

/** Map a server status in the context of the command it answers */
kvc_STATUS map_status(const Command &cmd, uint16_t status);

} // namespace mc
} // namespace kvc

#endif
