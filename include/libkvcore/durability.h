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

#ifndef LIBKVCORE_DURABILITY_H
#define LIBKVCORE_DURABILITY_H 1

/**
 * @file
 * @brief Durability requirements attached to mutations
 */

namespace kvc {

enum ReplicateTo {
    REPLICATE_TO_NONE = 0,
    REPLICATE_TO_ONE = 1,
    REPLICATE_TO_TWO = 2,
    REPLICATE_TO_THREE = 3
};

enum PersistTo {
    PERSIST_TO_NONE = 0,
    PERSIST_TO_ONE = 1,
    PERSIST_TO_TWO = 2,
    PERSIST_TO_THREE = 3
};

/** Durability levels. The values are the ones used on the wire */
enum DurabilityLevel {
    DURABILITY_LEVEL_NONE = 0,
    DURABILITY_LEVEL_MAJORITY = 1,
    DURABILITY_LEVEL_MAJORITY_AND_PERSIST_TO_ACTIVE = 2,
    DURABILITY_LEVEL_PERSIST_TO_MAJORITY = 3
};

/**
 * A requirement is exactly one of: nothing, a replicate/persist count pair
 * verified by observe polling, or a durability level.
 *
 * Instances are built with the static factories and never change.
 */
class DurabilityRequirement {
  public:
    enum Kind {
        KIND_NONE,
        KIND_OBSERVE,
        KIND_LEVEL
    };

    DurabilityRequirement() : kind_(KIND_NONE), persist_to_(0), replicate_to_(0), level_(DURABILITY_LEVEL_NONE) {}

    static DurabilityRequirement none() {
        return DurabilityRequirement();
    }

    static DurabilityRequirement replicate_to(ReplicateTo replicate) {
        return observe(PERSIST_TO_NONE, replicate);
    }

    static DurabilityRequirement persist_to(PersistTo persist) {
        return observe(persist, REPLICATE_TO_NONE);
    }

    static DurabilityRequirement observe(PersistTo persist, ReplicateTo replicate) {
        DurabilityRequirement req;
        if (persist != PERSIST_TO_NONE || replicate != REPLICATE_TO_NONE) {
            req.kind_ = KIND_OBSERVE;
            req.persist_to_ = count_of(persist);
            req.replicate_to_ = count_of(replicate);
        }
        return req;
    }

    static DurabilityRequirement level(DurabilityLevel lvl) {
        DurabilityRequirement req;
        if (lvl != DURABILITY_LEVEL_NONE) {
            req.kind_ = KIND_LEVEL;
            req.level_ = lvl;
        }
        return req;
    }

    Kind kind() const {
        return kind_;
    }
    bool is_none() const {
        return kind_ == KIND_NONE;
    }

    /** Number of nodes (the active included) which must persist the mutation */
    unsigned persist_to() const {
        return persist_to_;
    }

    /** Number of replica nodes which must hold the mutation */
    unsigned replicate_to() const {
        return replicate_to_;
    }

    DurabilityLevel level() const {
        return level_;
    }

    bool operator==(const DurabilityRequirement &other) const {
        return kind_ == other.kind_ && persist_to_ == other.persist_to_ && replicate_to_ == other.replicate_to_ &&
               level_ == other.level_;
    }

    static unsigned count_of(PersistTo persist) {
        switch (persist) {
            case PERSIST_TO_ONE:
                return 1;
            case PERSIST_TO_TWO:
                return 2;
            case PERSIST_TO_THREE:
                return 3;
            default:
                return 0;
        }
    }

    static unsigned count_of(ReplicateTo replicate) {
        switch (replicate) {
            case REPLICATE_TO_ONE:
                return 1;
            case REPLICATE_TO_TWO:
                return 2;
            case REPLICATE_TO_THREE:
                return 3;
            default:
                return 0;
        }
    }

  private:
    Kind kind_;
    unsigned persist_to_;
    unsigned replicate_to_;
    DurabilityLevel level_;
};

/** Outcome of observe based durability polling for one key */
struct DurabilityInfo {
    DurabilityInfo() : polled(false), npersisted(0), nreplicated(0), persisted_master(false), exists_master(false) {}

    /** Whether observe polling took place at all */
    bool polled;

    /** Nodes which reported the mutation as persisted in the last round */
    unsigned npersisted;

    /** Replica nodes which reported the mutation in the last round */
    unsigned nreplicated;
    bool persisted_master;
    bool exists_master;
};

} // namespace kvc

#endif
