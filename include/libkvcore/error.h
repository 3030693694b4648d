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

#ifndef LIBKVCORE_ERROR_H
#define LIBKVCORE_ERROR_H 1

/**
 * @file
 * @brief Status codes returned by the library
 */

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Broad classification of an error
 */
typedef enum {
    KVC_ERRTYPE_SUCCESS = 0,
    KVC_ERRTYPE_SHARED,
    KVC_ERRTYPE_KEYVALUE,
    KVC_ERRTYPE_SUBDOC,
    KVC_ERRTYPE_DURABILITY,
    KVC_ERRTYPE_NETWORK,
    KVC_ERRTYPE_LIBRARY
} kvc_ERROR_TYPE;

/**
 * @brief Properties of an error, which may be combined
 */
typedef enum {
    /** Caller supplied invalid input */
    KVC_ERRFLAG_INPUT = 1 << 0,

    /** Error originated from the network layer */
    KVC_ERRFLAG_NETWORK = 1 << 1,

    /** Condition is temporary and may be retried */
    KVC_ERRFLAG_TRANSIENT = 1 << 2,

    /** Operation cannot proceed and will not be retried */
    KVC_ERRFLAG_FATAL = 1 << 3,

    /** Error relates to a single sub-document path */
    KVC_ERRFLAG_SUBDOC = 1 << 4,

    /** Error relates to a durability requirement */
    KVC_ERRFLAG_DURABILITY = 1 << 5,

    /** The effect of a mutation on the server is unknown */
    KVC_ERRFLAG_AMBIGUOUS = 1 << 6
} kvc_ERROR_FLAGS;

#define KVC_XERROR(X)                                                                                                  \
    X(KVC_SUCCESS, 0, KVC_ERRTYPE_SUCCESS, 0, "Success (Not an error)")                                               \
    X(KVC_ERR_GENERIC, 100, KVC_ERRTYPE_SHARED, KVC_ERRFLAG_FATAL, "Generic error")                                    \
    X(KVC_ERR_TIMEOUT, 201, KVC_ERRTYPE_SHARED, 0,                                                                     \
      "The operation did not complete before its deadline. It was never sent, or it was safe to send again")          \
    X(KVC_ERR_AMBIGUOUS_TIMEOUT, 202, KVC_ERRTYPE_SHARED, KVC_ERRFLAG_AMBIGUOUS,                                      \
      "The operation timed out while a mutation was on the wire. The mutation may or may not have been applied")      \
    X(KVC_ERR_REQUEST_CANCELED, 203, KVC_ERRTYPE_SHARED, 0,                                                            \
      "The operation was canceled. A request already written to the network may still take effect")                   \
    X(KVC_ERR_INVALID_ARGUMENT, 204, KVC_ERRTYPE_SHARED, KVC_ERRFLAG_INPUT, "Invalid argument")                       \
    X(KVC_ERR_EMPTY_KEY, 205, KVC_ERRTYPE_SHARED, KVC_ERRFLAG_INPUT, "Key must not be empty")                         \
    X(KVC_ERR_TEMPORARY_FAILURE, 206, KVC_ERRTYPE_SHARED, KVC_ERRFLAG_TRANSIENT,                                      \
      "The server is temporarily unable to service the request")                                                       \
    X(KVC_ERR_PROTOCOL, 207, KVC_ERRTYPE_LIBRARY, KVC_ERRFLAG_FATAL,                                                   \
      "A malformed or unexpected packet was received from the server")                                                 \
    X(KVC_ERR_BAD_RESULT, 208, KVC_ERRTYPE_LIBRARY, KVC_ERRFLAG_FATAL,                                                 \
      "The server returned a status which is not valid for this operation")                                            \
    X(KVC_ERR_UNSUPPORTED_OPERATION, 209, KVC_ERRTYPE_SHARED, KVC_ERRFLAG_FATAL,                                      \
      "The operation is not supported by the server or the current configuration")                                     \
    X(KVC_ERR_TOPOLOGY_NOT_READY, 210, KVC_ERRTYPE_SHARED, KVC_ERRFLAG_TRANSIENT,                                     \
      "No topology is available yet, or the partition for this key has no active node")                               \
    X(KVC_ERR_NOT_MY_VBUCKET, 211, KVC_ERRTYPE_SHARED, KVC_ERRFLAG_TRANSIENT,                                         \
      "The node does not own the partition for this key")                                                              \
    X(KVC_ERR_NO_MEMORY, 212, KVC_ERRTYPE_LIBRARY, KVC_ERRFLAG_FATAL, "Memory allocation failure")                     \
    X(KVC_ERR_NETWORK, 1001, KVC_ERRTYPE_NETWORK, KVC_ERRFLAG_NETWORK | KVC_ERRFLAG_TRANSIENT,                        \
      "The connection was closed or reset while the request was in flight")                                           \
    X(KVC_ERR_CONNECT, 1002, KVC_ERRTYPE_NETWORK, KVC_ERRFLAG_NETWORK | KVC_ERRFLAG_TRANSIENT,                        \
      "Could not establish a connection to the node")                                                                  \
    X(KVC_ERR_NETWORK_AMBIGUOUS, 1003, KVC_ERRTYPE_NETWORK, KVC_ERRFLAG_NETWORK | KVC_ERRFLAG_AMBIGUOUS,             \
      "The connection was lost after a mutation was written. The mutation may or may not have been applied")          \
    X(KVC_ERR_DOCUMENT_NOT_FOUND, 301, KVC_ERRTYPE_KEYVALUE, 0, "The document does not exist")                        \
    X(KVC_ERR_DOCUMENT_EXISTS, 302, KVC_ERRTYPE_KEYVALUE, 0, "The document already exists")                           \
    X(KVC_ERR_CAS_MISMATCH, 303, KVC_ERRTYPE_KEYVALUE, 0,                                                              \
      "The document was modified since the supplied CAS was obtained")                                                 \
    X(KVC_ERR_VALUE_TOO_LARGE, 304, KVC_ERRTYPE_KEYVALUE, KVC_ERRFLAG_INPUT, "The value is too large")                \
    X(KVC_ERR_DOCUMENT_LOCKED, 305, KVC_ERRTYPE_KEYVALUE, 0, "The document is locked")                                \
    X(KVC_ERR_DELTA_BADVAL, 306, KVC_ERRTYPE_KEYVALUE, KVC_ERRFLAG_INPUT,                                             \
      "The existing document value is not a number and cannot be used as a counter")                                  \
    X(KVC_ERR_NOT_STORED, 307, KVC_ERRTYPE_KEYVALUE, 0, "The server did not store the item")                         \
    X(KVC_ERR_COLLECTION_NOT_FOUND, 308, KVC_ERRTYPE_KEYVALUE, 0, "The collection is unknown to the server")         \
    X(KVC_ERR_SUBDOC_PATH_NOT_FOUND, 401, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC, "Path does not exist")              \
    X(KVC_ERR_SUBDOC_PATH_MISMATCH, 402, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC,                                      \
      "Path component does not match the document structure")                                                         \
    X(KVC_ERR_SUBDOC_PATH_INVALID, 403, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC | KVC_ERRFLAG_INPUT,                  \
      "Invalid path syntax")                                                                                           \
    X(KVC_ERR_SUBDOC_PATH_TOO_BIG, 404, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC | KVC_ERRFLAG_INPUT,                  \
      "Path is too long or has too many components")                                                                   \
    X(KVC_ERR_SUBDOC_DOC_TOO_DEEP, 405, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC, "Document is too deep to parse")     \
    X(KVC_ERR_SUBDOC_VALUE_CANTINSERT, 406, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC | KVC_ERRFLAG_INPUT,              \
      "Value cannot be inserted at the path")                                                                          \
    X(KVC_ERR_SUBDOC_DOC_NOT_JSON, 407, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC, "Existing document is not JSON")     \
    X(KVC_ERR_SUBDOC_NUM_RANGE, 408, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC,                                          \
      "Existing number is out of range for a counter")                                                                 \
    X(KVC_ERR_SUBDOC_DELTA_INVALID, 409, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC | KVC_ERRFLAG_INPUT,                 \
      "Counter delta is invalid")                                                                                      \
    X(KVC_ERR_SUBDOC_PATH_EXISTS, 410, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC, "Path already exists")                \
    X(KVC_ERR_SUBDOC_VALUE_TOO_DEEP, 411, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC | KVC_ERRFLAG_INPUT,                 \
      "Inserting the value would make the document too deep")                                                         \
    X(KVC_ERR_SUBDOC_INVALID_COMBO, 412, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_INPUT,                                       \
      "Invalid combination of sub-document commands or flags")                                                         \
    X(KVC_ERR_SUBDOC_XATTR_UNKNOWN_MACRO, 413, KVC_ERRTYPE_SUBDOC, KVC_ERRFLAG_SUBDOC | KVC_ERRFLAG_INPUT,           \
      "Unknown extended attribute macro")                                                                              \
    X(KVC_ERR_SUBDOC_MULTI_FAILURE, 414, KVC_ERRTYPE_SUBDOC, 0,                                                        \
      "One or more sub-document commands failed. Inspect the individual results")                                     \
    X(KVC_ERR_DURABILITY_TIMEOUT, 501, KVC_ERRTYPE_DURABILITY, KVC_ERRFLAG_DURABILITY,                                \
      "The mutation succeeded, but the durability requirement was not confirmed before the deadline")                \
    X(KVC_ERR_DURABILITY_CONFLICT, 502, KVC_ERRTYPE_DURABILITY, KVC_ERRFLAG_DURABILITY,                               \
      "A newer CAS was observed while polling for durability. The mutation has been superseded")                      \
    X(KVC_ERR_DURABILITY_IMPOSSIBLE, 503, KVC_ERRTYPE_DURABILITY, KVC_ERRFLAG_DURABILITY | KVC_ERRFLAG_INPUT,        \
      "The durability requirement cannot be satisfied by the current number of replicas")                            \
    X(KVC_ERR_DURABILITY_LEVEL_NOT_AVAILABLE, 504, KVC_ERRTYPE_DURABILITY, KVC_ERRFLAG_DURABILITY,                    \
      "The server does not support the requested durability level")                                                  \
    X(KVC_ERR_DURABILITY_AMBIGUOUS, 505, KVC_ERRTYPE_DURABILITY, KVC_ERRFLAG_DURABILITY | KVC_ERRFLAG_AMBIGUOUS,     \
      "The server could not confirm that the synchronous write met its durability level")                            \
    X(KVC_ERR_SYNC_WRITE_IN_PROGRESS, 506, KVC_ERRTYPE_DURABILITY, KVC_ERRFLAG_DURABILITY | KVC_ERRFLAG_TRANSIENT,   \
      "Another synchronous write is in progress on this document")

typedef enum {
#define X(n, v, cls, f, s) n = v,
    KVC_XERROR(X)
#undef X
    KVC_MAX_ERROR = 0x1000
} kvc_STATUS;

/** @brief Short symbolic name of the code, e.g. "DOCUMENT_NOT_FOUND" */
const char *kvc_strerror_short(kvc_STATUS rc);

/** @brief Human readable description of the code. Never returns NULL */
const char *kvc_strerror_long(kvc_STATUS rc);

/** @brief Classification of the code */
kvc_ERROR_TYPE kvc_errtype(kvc_STATUS rc);

/** @brief Flags (`KVC_ERRFLAG_*`) of the code */
int kvc_errflags(kvc_STATUS rc);

#define KVC_ERROR_IS_INPUT(rc) (kvc_errflags(rc) & KVC_ERRFLAG_INPUT)
#define KVC_ERROR_IS_NETWORK(rc) (kvc_errflags(rc) & KVC_ERRFLAG_NETWORK)
#define KVC_ERROR_IS_TRANSIENT(rc) (kvc_errflags(rc) & KVC_ERRFLAG_TRANSIENT)
#define KVC_ERROR_IS_FATAL(rc) (kvc_errflags(rc) & KVC_ERRFLAG_FATAL)
#define KVC_ERROR_IS_SUBDOC(rc) (kvc_errflags(rc) & KVC_ERRFLAG_SUBDOC)
#define KVC_ERROR_IS_DURABILITY(rc) (kvc_errflags(rc) & KVC_ERRFLAG_DURABILITY)
#define KVC_ERROR_IS_AMBIGUOUS(rc) (kvc_errflags(rc) & KVC_ERRFLAG_AMBIGUOUS)

#ifdef __cplusplus
}
#endif
#endif
