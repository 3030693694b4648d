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
#include "mock-environment.h"
#include "vbucket/router.h"

#include <event2/event.h>
#include <stdlib.h>
#include <algorithm>

using namespace kvc;
using namespace kvc::mc;

static const uint16_t MOCK_BASE_PORT = 11210;

/**
 * One connection to a mock node. Replies and connection events are always
 * delivered from the event loop, never from within a call made by the
 * endpoint.
 */
class MockTransport : public io::Transport
{
public:
    MockTransport(MockCluster *cluster_, event_base *base, Handler *handler_)
        : cluster(cluster_), handler(handler_), node(-1), connected(false), closed(false), failed(false),
          pendingConnect(false), pendingError(false)
    {
        ev = evtimer_new(base, &MockTransport::dispatch, this);
        cluster->transports.insert(this);
    }

    ~MockTransport() {
        cluster->transports.erase(this);
        event_free(ev);
    }

    void connect(const std::string &host, uint16_t port) {
        node = cluster->nodeForPort(host, port);
        pendingConnect = true;
        schedule(0);
    }

    void write(const char *buf, size_t nbuf) {
        if (closed || failed) {
            return;
        }
        inbuf.append(buf, nbuf);
        for (;;) {
            Frame req;
            size_t consumed = 0;
            DecodeResult rv = decode_frame(inbuf.data(), inbuf.size(), req, &consumed);
            if (rv == DECODE_INCOMPLETE) {
                break;
            }
            if (rv == DECODE_ERROR) {
                ADD_FAILURE() << "Client sent a malformed packet";
                resetLater();
                return;
            }
            inbuf.erase(0, consumed);

            Frame res;
            MockCluster::Disposition disp = cluster->handleRequest(node, req, res);
            if (disp == MockCluster::RESET) {
                resetLater();
                return;
            } else if (disp == MockCluster::REPLY) {
                encode_frame(res, outbuf);
                schedule(cluster->behaviors[node].reply_delay);
            }
        }
    }

    void close() {
        closed = true;
        evtimer_del(ev);
    }

    void resetLater() {
        if (closed || failed) {
            return;
        }
        failed = true;
        pendingError = true;
        outbuf.clear();
        schedule(0);
    }

    bool isOpen() const {
        return connected && !closed && !failed;
    }

    MockCluster *cluster;
    Handler *handler;
    int node;

private:
    void schedule(uint32_t usec) {
        struct timeval tv;
        tv.tv_sec = usec / 1000000;
        tv.tv_usec = usec % 1000000;
        evtimer_add(ev, &tv);
    }

    static void dispatch(evutil_socket_t, short, void *arg) {
        reinterpret_cast<MockTransport *>(arg)->fire();
    }

    void fire() {
        if (closed) {
            return;
        }
        if (pendingConnect) {
            pendingConnect = false;
            if (node < 0 || cluster->behaviors[node].refuse_connections) {
                failed = true;
                handler->on_connected(KVC_ERR_CONNECT);
                return;
            }
            cluster->connections[node]++;
            connected = true;
            handler->on_connected(KVC_SUCCESS);
            return;
        }
        if (pendingError) {
            pendingError = false;
            handler->on_error(KVC_ERR_NETWORK);
            return;
        }
        if (!outbuf.empty()) {
            std::string tmp;
            tmp.swap(outbuf);
            handler->on_read(tmp.data(), tmp.size());
        }
    }

    struct event *ev;
    std::string inbuf;
    std::string outbuf;
    bool connected;
    bool closed;
    bool failed;
    bool pendingConnect;
    bool pendingError;
};

MockCluster::MockCluster(unsigned nnodes, unsigned nreplicas, unsigned nvbuckets)
    : collections(false), lastCollectionId(0),
      topology_(Topology::generate(nnodes, nreplicas, nvbuckets, 1, "localhost", MOCK_BASE_PORT)),
      behaviors(nnodes), injections(nnodes), opcodes(nnodes), connections(nnodes, 0), nextCas(0x1000),
      nextSeqno(1)
{
}

MockCluster::~MockCluster()
{
    EXPECT_TRUE(transports.empty()) << "Connections outlived the instance";
}

io::Transport *MockCluster::create(event_base *base, io::Transport::Handler *handler)
{
    return new MockTransport(this, base, handler);
}

std::shared_ptr<const Topology> MockCluster::rotatedTopology(uint64_t rev) const
{
    unsigned n = static_cast<unsigned>(topology_->num_nodes());
    unsigned nreplicas = topology_->num_replicas();
    std::vector<NodeInfo> nodes;
    for (unsigned ii = 0; ii < n; ++ii) {
        nodes.push_back(topology_->node(ii));
    }
    std::vector<std::vector<int> > vbmap(topology_->num_partitions());
    for (unsigned vb = 0; vb < vbmap.size(); ++vb) {
        int primary = (topology_->vbserver(vb, 0) + 1) % n;
        vbmap[vb].push_back(primary);
        for (unsigned jj = 0; jj < nreplicas; ++jj) {
            int replica = (primary + jj + 1) % n;
            vbmap[vb].push_back(replica == primary ? Topology::NO_NODE : replica);
        }
    }
    std::shared_ptr<const Topology> out;
    EXPECT_EQ(KVC_SUCCESS, Topology::create(rev, nodes, nreplicas, vbmap, out));
    return out;
}

void MockCluster::injectStatus(unsigned node, uint8_t opcode, uint16_t status, unsigned count)
{
    Injection inj;
    inj.opcode = opcode;
    inj.status = status;
    inj.count = count;
    injections[node].push_back(inj);
}

void MockCluster::resetConnections(unsigned node)
{
    for (std::set<MockTransport *>::iterator it = transports.begin(); it != transports.end(); ++it) {
        if ((*it)->node == static_cast<int>(node)) {
            (*it)->resetLater();
        }
    }
}

unsigned MockCluster::openConnections(unsigned node) const
{
    unsigned n = 0;
    for (std::set<MockTransport *>::const_iterator it = transports.begin(); it != transports.end(); ++it) {
        if ((*it)->node == static_cast<int>(node) && (*it)->isOpen()) {
            n++;
        }
    }
    return n;
}

unsigned MockCluster::opcodeCount(unsigned node, uint8_t opcode) const
{
    std::map<uint8_t, unsigned>::const_iterator it = opcodes[node].find(opcode);
    return it == opcodes[node].end() ? 0 : it->second;
}

unsigned MockCluster::opcodeCount(uint8_t opcode) const
{
    unsigned total = 0;
    for (unsigned ii = 0; ii < opcodes.size(); ++ii) {
        total += opcodeCount(ii, opcode);
    }
    return total;
}

int MockCluster::nodeForPort(const std::string &host, uint16_t port) const
{
    if (host != "localhost" || port < MOCK_BASE_PORT || port - MOCK_BASE_PORT >= behaviors.size()) {
        return -1;
    }
    return port - MOCK_BASE_PORT;
}

int MockCluster::primaryFor(const std::string &key) const
{
    return topology_->vbserver(vbucket_for_key(key, topology_->num_partitions()), 0);
}

std::string MockCluster::docKey(const std::string &key, uint32_t cid) const
{
    return std::to_string(cid) + "/" + key;
}

bool MockCluster::splitKey(const std::string &wire, uint32_t &cid, std::string &key) const
{
    cid = 0;
    if (!collections) {
        key = wire;
        return true;
    }
    size_t nused = leb128_decode(wire.data(), wire.size(), cid);
    if (nused == 0) {
        return false;
    }
    key = wire.substr(nused);
    return true;
}

MockCluster::Document *MockCluster::findDocument(const std::string &key, uint32_t collection_id)
{
    std::map<std::string, Document>::iterator it = documents.find(docKey(key, collection_id));
    return it == documents.end() ? NULL : &it->second;
}

void MockCluster::storeDocument(const std::string &key, const std::string &value, uint32_t collection_id)
{
    Document &doc = documents[docKey(key, collection_id)];
    doc.prev_exists = !doc.deleted && doc.cas != 0;
    doc.prev_cas = doc.cas;
    doc.value = value;
    doc.paths.clear();
    doc.deleted = false;
    doc.cas = nextCas++;
    doc.seqno = nextSeqno++;
}

void MockCluster::bumpCas(const std::string &key, uint32_t collection_id)
{
    Document *doc = findDocument(key, collection_id);
    ASSERT_TRUE(doc != NULL);
    doc->prev_exists = !doc->deleted;
    doc->prev_cas = doc->cas;
    doc->cas = nextCas++;
    doc->seqno = nextSeqno++;
}

void MockCluster::mutated(Document &doc, uint16_t vbid, Frame &res)
{
    doc.cas = nextCas++;
    doc.seqno = nextSeqno++;
    res.cas = doc.cas;
    put_u64(res.extras, 0xabcd0000ULL + vbid);
    put_u64(res.extras, doc.seqno);
}

MockCluster::Disposition MockCluster::handleRequest(int node, const Frame &req, Frame &res)
{
    res.magic = MAGIC_RES;
    res.opcode = req.opcode;
    res.opaque = req.opaque;
    res.vbucket = STATUS_SUCCESS;

    opcodes[node][req.opcode]++;
    if (!req.framing_extras.empty()) {
        lastFramingExtras = req.framing_extras;
    }

    if (req.opcode == CMD_SELECT_BUCKET) {
        if (!bucket.empty() && req.key != bucket) {
            res.vbucket = STATUS_KEY_ENOENT;
        }
        return REPLY;
    }

    NodeBehavior &beh = behaviors[node];
    if (beh.reset_on_request) {
        beh.reset_on_request--;
        return RESET;
    }
    if (beh.drop_replies) {
        return DROP;
    }

    std::vector<Injection> &injs = injections[node];
    for (size_t ii = 0; ii < injs.size(); ++ii) {
        if (injs[ii].opcode == req.opcode && injs[ii].count) {
            injs[ii].count--;
            res.vbucket = injs[ii].status;
            return REPLY;
        }
    }

    if (req.opcode == CMD_OBSERVE) {
        handleObserve(node, req, res);
        return REPLY;
    }

    uint32_t cid;
    std::string key;
    if (!splitKey(req.key, cid, key)) {
        res.vbucket = STATUS_EINVAL;
        return REPLY;
    }
    lastCollectionId = cid;
    if (topology_->vbserver(req.vbucket, 0) != node) {
        res.vbucket = STATUS_NOT_MY_VBUCKET;
        return REPLY;
    }

    std::string dkey = docKey(key, cid);
    switch (req.opcode) {
        case CMD_SET:
        case CMD_ADD:
        case CMD_REPLACE:
            handleStore(req, req.vbucket, dkey, res);
            break;
        case CMD_DELETE:
            handleDelete(req, req.vbucket, dkey, res);
            break;
        case CMD_INCREMENT:
        case CMD_DECREMENT:
            handleCounter(req, req.vbucket, dkey, res);
            break;
        case CMD_GET:
            handleGet(dkey, res);
            break;
        case CMD_GET_META:
            handleGetMeta(dkey, res);
            break;
        case CMD_SUBDOC_MULTI_LOOKUP:
            handleLookupIn(req, dkey, res);
            break;
        case CMD_SUBDOC_MULTI_MUTATION:
            handleMutateIn(req, req.vbucket, dkey, res);
            break;
        default:
            res.vbucket = STATUS_UNKNOWN_COMMAND;
            break;
    }
    return REPLY;
}

void MockCluster::handleStore(const Frame &req, uint16_t vbid, const std::string &key, Frame &res)
{
    std::map<std::string, Document>::iterator it = documents.find(key);
    bool exists = it != documents.end() && !it->second.deleted;
    if (req.opcode == CMD_ADD && exists) {
        res.vbucket = STATUS_KEY_EEXISTS;
        return;
    }
    if ((req.opcode == CMD_REPLACE || req.cas) && !exists) {
        res.vbucket = STATUS_KEY_ENOENT;
        return;
    }
    if (req.cas && req.cas != it->second.cas) {
        res.vbucket = STATUS_KEY_EEXISTS;
        return;
    }
    if (req.extras.size() != 8) {
        res.vbucket = STATUS_EINVAL;
        return;
    }
    Document &doc = documents[key];
    doc.prev_exists = exists;
    doc.prev_cas = doc.cas;
    doc.value = req.value;
    doc.paths.clear();
    doc.flags = get_u32(req.extras.data());
    doc.expiry = get_u32(req.extras.data() + 4);
    doc.datatype = req.datatype;
    doc.deleted = false;
    mutated(doc, vbid, res);
}

void MockCluster::handleDelete(const Frame &req, uint16_t vbid, const std::string &key, Frame &res)
{
    std::map<std::string, Document>::iterator it = documents.find(key);
    if (it == documents.end() || it->second.deleted) {
        res.vbucket = STATUS_KEY_ENOENT;
        return;
    }
    Document &doc = it->second;
    if (req.cas && req.cas != doc.cas) {
        res.vbucket = STATUS_KEY_EEXISTS;
        return;
    }
    doc.prev_exists = true;
    doc.prev_cas = doc.cas;
    doc.deleted = true;
    doc.value.clear();
    doc.paths.clear();
    mutated(doc, vbid, res);
}

void MockCluster::handleCounter(const Frame &req, uint16_t vbid, const std::string &key, Frame &res)
{
    if (req.extras.size() != 20) {
        res.vbucket = STATUS_EINVAL;
        return;
    }
    uint64_t delta = get_u64(req.extras.data());
    uint64_t initial = get_u64(req.extras.data() + 8);
    uint32_t expiry = get_u32(req.extras.data() + 16);

    std::map<std::string, Document>::iterator it = documents.find(key);
    bool exists = it != documents.end() && !it->second.deleted;
    uint64_t value;
    if (!exists) {
        if (expiry == COUNTER_NOT_EXISTS_EXPIRY) {
            res.vbucket = STATUS_KEY_ENOENT;
            return;
        }
        value = initial;
    } else {
        const std::string &cur = it->second.value;
        char *end = NULL;
        value = strtoull(cur.c_str(), &end, 10);
        if (cur.empty() || *end != '\0') {
            res.vbucket = STATUS_DELTA_BADVAL;
            return;
        }
        if (req.opcode == CMD_INCREMENT) {
            value += delta;
        } else {
            value = delta > value ? 0 : value - delta;
        }
    }

    Document &doc = documents[key];
    doc.prev_exists = exists;
    doc.prev_cas = doc.cas;
    doc.value = std::to_string(value);
    doc.deleted = false;
    if (!exists) {
        doc.expiry = expiry;
    }
    mutated(doc, vbid, res);
    put_u64(res.value, value);
}

void MockCluster::handleGet(const std::string &key, Frame &res)
{
    std::map<std::string, Document>::iterator it = documents.find(key);
    if (it == documents.end() || it->second.deleted) {
        res.vbucket = STATUS_KEY_ENOENT;
        return;
    }
    const Document &doc = it->second;
    res.cas = doc.cas;
    res.datatype = doc.datatype;
    put_u32(res.extras, doc.flags);
    res.value = doc.value;
}

void MockCluster::handleGetMeta(const std::string &key, Frame &res)
{
    std::map<std::string, Document>::iterator it = documents.find(key);
    if (it == documents.end()) {
        res.vbucket = STATUS_KEY_ENOENT;
        return;
    }
    const Document &doc = it->second;
    res.cas = doc.cas;
    put_u32(res.extras, doc.deleted ? 1 : 0);
    put_u32(res.extras, doc.flags);
    put_u32(res.extras, doc.expiry);
    put_u64(res.extras, doc.seqno);
    res.extras.push_back(static_cast<char>(doc.datatype));
}

uint8_t MockCluster::observeStatus(int node, uint16_t vbid, const Document *doc, uint64_t &cas)
{
    bool primary = topology_->vbserver(vbid, 0) == node;
    bool replica = false;
    for (unsigned ii = 1; ii <= topology_->num_replicas(); ++ii) {
        if (topology_->vbserver(vbid, ii) == node) {
            replica = true;
        }
    }

    cas = 0;
    if (doc == NULL || (!primary && !replica)) {
        return OBSERVE_NOT_FOUND;
    }

    NodeBehavior &beh = behaviors[node];
    bool persisted = beh.persists && beh.observes_before_persist == 0;
    if (replica && !beh.replicates) {
        if (!doc->prev_exists) {
            return OBSERVE_NOT_FOUND;
        }
        cas = doc->prev_cas;
        return OBSERVE_FOUND_NOT_PERSISTED;
    }

    cas = doc->cas;
    if (doc->deleted) {
        return persisted ? OBSERVE_PERSISTED_DELETED : OBSERVE_NOT_FOUND;
    }
    return persisted ? OBSERVE_FOUND_PERSISTED : OBSERVE_FOUND_NOT_PERSISTED;
}

void MockCluster::handleObserve(int node, const Frame &req, Frame &res)
{
    const char *cur = req.value.data();
    const char *end = cur + req.value.size();
    while (cur < end) {
        if (end - cur < 4) {
            res.vbucket = STATUS_EINVAL;
            res.value.clear();
            return;
        }
        uint16_t vbid = get_u16(cur);
        uint16_t nkey = get_u16(cur + 2);
        cur += 4;
        if (end - cur < nkey) {
            res.vbucket = STATUS_EINVAL;
            res.value.clear();
            return;
        }
        std::string wire(cur, nkey);
        cur += nkey;

        uint32_t cid;
        std::string key;
        const Document *doc = NULL;
        if (splitKey(wire, cid, key)) {
            doc = findDocument(key, cid);
        }
        uint64_t cas;
        uint8_t status = observeStatus(node, vbid, doc, cas);

        put_u16(res.value, vbid);
        put_u16(res.value, nkey);
        res.value.append(wire);
        res.value.push_back(static_cast<char>(status));
        put_u64(res.value, cas);
    }

    NodeBehavior &beh = behaviors[node];
    if (beh.observes_before_persist) {
        beh.observes_before_persist--;
    }
}

namespace {
struct SubdocCommand {
    uint8_t opcode;
    uint8_t flags;
    std::string path;
    std::string value;
};

bool parseSubdoc(const std::string &body, bool mutation, std::vector<SubdocCommand> &out)
{
    const char *cur = body.data();
    const char *end = cur + body.size();
    size_t hdrlen = mutation ? 8 : 4;
    while (cur < end) {
        if (static_cast<size_t>(end - cur) < hdrlen) {
            return false;
        }
        SubdocCommand cmd;
        cmd.opcode = static_cast<uint8_t>(cur[0]);
        cmd.flags = static_cast<uint8_t>(cur[1]);
        uint16_t npath = get_u16(cur + 2);
        uint32_t nvalue = mutation ? get_u32(cur + 4) : 0;
        cur += hdrlen;
        if (static_cast<size_t>(end - cur) < npath + nvalue) {
            return false;
        }
        cmd.path.assign(cur, npath);
        cur += npath;
        cmd.value.assign(cur, nvalue);
        cur += nvalue;
        out.push_back(cmd);
    }
    return true;
}

/** Insert `value` into the JSON array `array`, at the front or the back */
bool arrayPush(std::string &array, const std::string &value, bool front)
{
    if (array.size() < 2 || array[0] != '[' || array[array.size() - 1] != ']') {
        return false;
    }
    bool empty = array.size() == 2;
    if (front) {
        array.insert(1, empty ? value : value + ",");
    } else {
        array.insert(array.size() - 1, empty ? value : "," + value);
    }
    return true;
}

uint16_t applyMutation(std::map<std::string, std::string> &paths, const SubdocCommand &cmd, std::string &result)
{
    std::map<std::string, std::string>::iterator it = paths.find(cmd.path);
    bool found = it != paths.end();
    bool mkdir = (cmd.flags & SUBDOC_FLAG_MKDIR_P) != 0;

    switch (cmd.opcode) {
        case CMD_SUBDOC_DICT_ADD:
            if (found) {
                return STATUS_SUBDOC_PATH_EEXISTS;
            }
            paths[cmd.path] = cmd.value;
            return STATUS_SUCCESS;
        case CMD_SUBDOC_DICT_UPSERT:
            paths[cmd.path] = cmd.value;
            return STATUS_SUCCESS;
        case CMD_SUBDOC_REPLACE:
            if (!found) {
                return STATUS_SUBDOC_PATH_ENOENT;
            }
            it->second = cmd.value;
            return STATUS_SUCCESS;
        case CMD_SUBDOC_DELETE:
            if (!found) {
                return STATUS_SUBDOC_PATH_ENOENT;
            }
            paths.erase(it);
            return STATUS_SUCCESS;
        case CMD_SUBDOC_ARRAY_PUSH_LAST:
        case CMD_SUBDOC_ARRAY_PUSH_FIRST:
        case CMD_SUBDOC_ARRAY_ADD_UNIQUE:
            if (!found) {
                if (!mkdir) {
                    return STATUS_SUBDOC_PATH_ENOENT;
                }
                paths[cmd.path] = "[" + cmd.value + "]";
                return STATUS_SUCCESS;
            }
            if (cmd.opcode == CMD_SUBDOC_ARRAY_ADD_UNIQUE && it->second.find(cmd.value) != std::string::npos) {
                return STATUS_SUBDOC_PATH_EEXISTS;
            }
            if (!arrayPush(it->second, cmd.value, cmd.opcode == CMD_SUBDOC_ARRAY_PUSH_FIRST)) {
                return STATUS_SUBDOC_PATH_MISMATCH;
            }
            return STATUS_SUCCESS;
        case CMD_SUBDOC_COUNTER: {
            char *end = NULL;
            long long delta = strtoll(cmd.value.c_str(), &end, 10);
            if (*end != '\0' || delta == 0) {
                return STATUS_SUBDOC_DELTA_EINVAL;
            }
            long long current = 0;
            if (found) {
                current = strtoll(it->second.c_str(), &end, 10);
                if (it->second.empty() || *end != '\0') {
                    return STATUS_SUBDOC_PATH_MISMATCH;
                }
            }
            result = std::to_string(current + delta);
            paths[cmd.path] = result;
            return STATUS_SUCCESS;
        }
        default:
            return STATUS_SUBDOC_PATH_MISMATCH;
    }
}
} // namespace

void MockCluster::handleLookupIn(const Frame &req, const std::string &key, Frame &res)
{
    uint8_t docflags = req.extras.size() == 1 ? static_cast<uint8_t>(req.extras[0]) : 0;
    std::vector<SubdocCommand> cmds;
    if (!parseSubdoc(req.value, false, cmds) || cmds.empty()) {
        res.vbucket = STATUS_EINVAL;
        return;
    }

    std::map<std::string, Document>::iterator it = documents.find(key);
    if (it == documents.end() || (it->second.deleted && !(docflags & SUBDOC_DOCFLAG_ACCESS_DELETED))) {
        res.vbucket = STATUS_KEY_ENOENT;
        return;
    }
    const Document &doc = it->second;
    bool failed = false;
    for (size_t ii = 0; ii < cmds.size(); ++ii) {
        const SubdocCommand &cmd = cmds[ii];
        const std::map<std::string, std::string> &paths =
            (cmd.flags & SUBDOC_FLAG_XATTR_PATH) ? doc.xattrs : doc.paths;
        std::map<std::string, std::string>::const_iterator pit = paths.find(cmd.path);
        uint16_t status = STATUS_SUCCESS;
        std::string value;

        if (cmd.opcode == CMD_GET) {
            value = doc.value;
        } else if (pit == paths.end()) {
            status = STATUS_SUBDOC_PATH_ENOENT;
        } else if (cmd.opcode == CMD_SUBDOC_GET) {
            value = pit->second;
        } else if (cmd.opcode != CMD_SUBDOC_EXISTS) {
            status = STATUS_SUBDOC_PATH_MISMATCH;
        }
        failed = failed || status != STATUS_SUCCESS;
        put_u16(res.value, status);
        put_u32(res.value, static_cast<uint32_t>(value.size()));
        res.value.append(value);
    }
    res.cas = doc.cas;
    if (doc.deleted) {
        res.vbucket = failed ? STATUS_SUBDOC_MULTI_PATH_FAILURE_DELETED : STATUS_SUBDOC_SUCCESS_DELETED;
    } else {
        res.vbucket = failed ? STATUS_SUBDOC_MULTI_PATH_FAILURE : STATUS_SUCCESS;
    }
}

void MockCluster::handleMutateIn(const Frame &req, uint16_t vbid, const std::string &key, Frame &res)
{
    uint8_t docflags = 0;
    uint32_t expiry = 0;
    if (req.extras.size() == 1) {
        docflags = static_cast<uint8_t>(req.extras[0]);
    } else if (req.extras.size() >= 4) {
        expiry = get_u32(req.extras.data());
        if (req.extras.size() == 5) {
            docflags = static_cast<uint8_t>(req.extras[4]);
        }
    }
    std::vector<SubdocCommand> cmds;
    if (!parseSubdoc(req.value, true, cmds) || cmds.empty()) {
        res.vbucket = STATUS_EINVAL;
        return;
    }

    std::map<std::string, Document>::iterator it = documents.find(key);
    bool exists = it != documents.end() && !it->second.deleted;
    bool tombstone = it != documents.end() && it->second.deleted && (docflags & SUBDOC_DOCFLAG_ACCESS_DELETED);
    if (exists && (docflags & SUBDOC_DOCFLAG_ADD)) {
        res.vbucket = STATUS_KEY_EEXISTS;
        return;
    }
    if (!exists && !tombstone && !(docflags & (SUBDOC_DOCFLAG_MKDOC | SUBDOC_DOCFLAG_ADD))) {
        res.vbucket = STATUS_KEY_ENOENT;
        return;
    }
    if (req.cas && (it == documents.end() || req.cas != it->second.cas)) {
        res.vbucket = exists ? STATUS_KEY_EEXISTS : STATUS_KEY_ENOENT;
        return;
    }

    Document next = (exists || tombstone) ? it->second : Document();
    std::string body;
    for (size_t ii = 0; ii < cmds.size(); ++ii) {
        const SubdocCommand &cmd = cmds[ii];
        std::string result;
        std::map<std::string, std::string> &paths = (cmd.flags & SUBDOC_FLAG_XATTR_PATH) ? next.xattrs : next.paths;
        uint16_t status = applyMutation(paths, cmd, result);
        if (status != STATUS_SUCCESS) {
            res.vbucket = tombstone ? STATUS_SUBDOC_MULTI_PATH_FAILURE_DELETED : STATUS_SUBDOC_MULTI_PATH_FAILURE;
            res.value.push_back(static_cast<char>(ii));
            put_u16(res.value, status);
            return;
        }
        if (!result.empty()) {
            body.push_back(static_cast<char>(ii));
            put_u16(body, STATUS_SUCCESS);
            put_u32(body, static_cast<uint32_t>(result.size()));
            body.append(result);
        }
    }

    next.prev_exists = exists;
    next.prev_cas = exists ? it->second.cas : 0;
    if (expiry) {
        next.expiry = expiry;
    }
    if (!exists && !tombstone) {
        next.value = "{}";
    }
    Document &doc = documents[key];
    doc = next;
    mutated(doc, vbid, res);
    res.value = body;
    if (tombstone) {
        res.vbucket = STATUS_SUBDOC_SUCCESS_DELETED;
    }
}

MockEnvironment *MockEnvironment::instance = NULL;

MockEnvironment::MockEnvironment() : logLevel(0) {}

MockEnvironment *MockEnvironment::getInstance(void)
{
    if (instance == NULL) {
        instance = new MockEnvironment();
    }
    return instance;
}

void MockEnvironment::SetUp()
{
    const char *level = getenv("KVC_LOGLEVEL");
    if (level && *level) {
        logLevel = static_cast<unsigned>(atoi(level));
    }
}

void MockEnvironment::TearDown() {}
