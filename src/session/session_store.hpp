#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "session_types.hpp"

using namespace std;

struct SessionStoreParams
{
    string directory = "sessions"; // One <id>.jsonl file per session
    int max_sessions = 200;        // Oldest files beyond this are pruned, 0 = keep all
};

// Append-only session records.
// Line 1: header (metadata + profile), then one line per impact, last line: end marker.
class SessionStore
{
public:
    explicit SessionStore(const SessionStoreParams &params = SessionStoreParams());

    // Create the file and write the header line
    bool begin(const Session &session);

    // Append one impact line to an existing session file
    bool appendImpact(const string &session_id, const Impact &impact);

    // Append the end line (end time and fault)
    bool finalize(const Session &session);

    // Rebuild a session from its file; sessions without an end line load as interrupted
    bool load(const string &session_id, Session &session) const;

    // Newest first
    vector<SessionSummary> list() const;

    // Remove the oldest sessions beyond max_sessions, returns how many were removed
    int prune();

    string pathFor(const string &session_id) const;
    const string &directory() const { return params_.directory; }

private:
    bool appendLine(const string &session_id, const string &line);
    vector<string> sessionIds() const;

    SessionStoreParams params_;
    mutable mutex mutex_;
};
