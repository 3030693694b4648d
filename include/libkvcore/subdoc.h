/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
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

#ifndef LIBKVCORE_SUBDOC_H
#define LIBKVCORE_SUBDOC_H 1

#include <libkvcore/error.h>
#include <stdint.h>
#include <string>

/**
 * @file
 * @brief Sub-document command specifications
 *
 * A sub-document operation carries an ordered list of path level commands.
 * All commands in one operation are either lookups or mutations.
 */

namespace kvc {

enum SubdocOp {
    SUBDOC_GET = 1,
    SUBDOC_EXISTS,
    SUBDOC_GET_COUNT,
    SUBDOC_DICT_ADD,
    SUBDOC_DICT_UPSERT,
    SUBDOC_REPLACE,
    SUBDOC_REMOVE,
    SUBDOC_ARRAY_ADD_LAST,
    SUBDOC_ARRAY_ADD_FIRST,
    SUBDOC_ARRAY_INSERT,
    SUBDOC_ARRAY_ADD_UNIQUE,
    SUBDOC_COUNTER
};

/** How a multi mutation treats the enclosing document */
enum SubdocStoreSemantics {
    /** Document must exist */
    SUBDOC_STORE_REPLACE = 0,

    /** Create the document if it does not exist */
    SUBDOC_STORE_UPSERT,

    /** Document must not exist */
    SUBDOC_STORE_INSERT
};

struct SubdocSpec {
    SubdocSpec() : op(SUBDOC_GET), create_parents(false), xattr(false), expand_macros(false) {}
    SubdocSpec(SubdocOp op_, const std::string &path_, const std::string &value_ = std::string())
        : op(op_), path(path_), value(value_), create_parents(false), xattr(false), expand_macros(false)
    {
    }

    SubdocOp op;
    std::string path;

    /** JSON encoded value. Unused by lookups and removals */
    std::string value;

    /** Create intermediate path components (mkdir -p) */
    bool create_parents;

    /** Path refers to an extended attribute */
    bool xattr;

    /** Value contains server side macros; only valid with xattr */
    bool expand_macros;
};

/**
 * Result for a single command. Results are always reported at the index
 * the command had in the caller's list.
 */
struct SubdocResult {
    SubdocResult() : rc(KVC_SUCCESS), status(0) {}

    kvc_STATUS rc;

    /** Raw status from the server */
    uint16_t status;
    std::string value;
};

} // namespace kvc

#endif
