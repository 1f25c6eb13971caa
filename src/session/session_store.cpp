#include "session_store.hpp"
#include "serialization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace std;
namespace fs = std::filesystem;

namespace
{
    // Session ids double as file names
    bool isSafeId(const string &id)
    {
        if (id.empty() || id.size() > 128)
            return false;
        for (char c : id)
        {
            if (!isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_')
                return false;
        }
        return true;
    }
}

SessionStore::SessionStore(const SessionStoreParams &params)
    : params_(params)
{
}

string SessionStore::pathFor(const string &session_id) const
{
    return (fs::path(params_.directory) / (session_id + ".jsonl")).string();
}

bool SessionStore::appendLine(const string &session_id, const string &line)
{
    if (!isSafeId(session_id))
    {
        log_error("Refusing to write session with invalid id: " + session_id);
        return false;
    }

    ofstream file(pathFor(session_id), ios::app);
    if (!file)
    {
        log_error("Failed to open session file for writing: " + pathFor(session_id));
        return false;
    }

    file << line << '\n';
    file.flush();

    if (!file.good())
    {
        log_error("Failed to write session file: " + pathFor(session_id));
        return false;
    }
    return true;
}

bool SessionStore::begin(const Session &session)
{
    lock_guard<mutex> lock(mutex_);

    error_code ec;
    fs::create_directories(params_.directory, ec);
    if (ec)
    {
        log_error("Failed to create session directory " + params_.directory + ": " + ec.message());
        return false;
    }

    if (!isSafeId(session.id))
    {
        log_error("Refusing to write session with invalid id: " + session.id);
        return false;
    }

    // A header always starts a fresh file
    {
        ofstream truncate(pathFor(session.id), ios::trunc);
        if (!truncate)
        {
            log_error("Failed to create session file: " + pathFor(session.id));
            return false;
        }
    }

    json header = serialization::sessionHeader(session);
    header["record"] = "session";
    return appendLine(session.id, header.dump());
}

bool SessionStore::appendImpact(const string &session_id, const Impact &impact)
{
    lock_guard<mutex> lock(mutex_);

    json line = impact;
    line["record"] = "impact";
    return appendLine(session_id, line.dump());
}

bool SessionStore::finalize(const Session &session)
{
    lock_guard<mutex> lock(mutex_);

    json line;
    line["record"] = "end";
    line["end_time"] = session.end_time;
    line["end_time_iso"] = timeutil::formatIso(session.end_time);
    line["arrows"] = session.impacts.size();
    line["fault"] = errors::errorKindName(session.fault);
    line["fault_message"] = session.fault_message;

    bool ok = appendLine(session.id, line.dump());
    if (ok)
        log_info("Session " + session.id + " stored with " + log_string(session.impacts.size()) + " impacts");
    return ok;
}

bool SessionStore::load(const string &session_id, Session &session) const
{
    lock_guard<mutex> lock(mutex_);

    if (!isSafeId(session_id))
        return false;

    ifstream file(pathFor(session_id));
    if (!file)
    {
        log_debug("No stored session " + session_id);
        return false;
    }

    Session loaded;
    bool has_header = false;
    bool has_end = false;
    string line;
    int line_number = 0;

    while (getline(file, line))
    {
        line_number++;
        if (line.empty())
            continue;

        try
        {
            json j = json::parse(line);
            string record = j.value("record", "");

            if (record == "session")
            {
                loaded.id = j.at("id").get<string>();
                loaded.start_time = j.at("start_time").get<uint64_t>();
                if (!target_geometry::parseTargetSize(j.at("target_size").get<string>(), loaded.target_size))
                    throw invalid_argument("unknown target size");
                loaded.profile = j.at("profile").get<CalibrationProfile>();
                has_header = true;
            }
            else if (record == "impact")
            {
                loaded.impacts.push_back(j.get<Impact>());
            }
            else if (record == "end")
            {
                loaded.end_time = j.at("end_time").get<uint64_t>();
                loaded.fault = errors::errorKindFromName(j.value("fault", "None"));
                loaded.fault_message = j.value("fault_message", "");
                has_end = true;
            }
        }
        catch (const exception &e)
        {
            // A torn last line after a power cut is expected, anything else is reported
            log_warning("Skipping unreadable line " + to_string(line_number) + " of session " + session_id + ": " + string(e.what()));
        }
    }

    if (!has_header)
    {
        log_error("Session file has no header: " + pathFor(session_id));
        return false;
    }

    loaded.active = false;
    if (!has_end)
    {
        loaded.fault = ErrorKind::DETECTION_FAULT;
        loaded.fault_message = "Session was not finalized";
        loaded.end_time = loaded.impacts.empty() ? loaded.start_time : loaded.impacts.back().timestamp;
    }

    session = loaded;
    return true;
}

vector<string> SessionStore::sessionIds() const
{
    vector<pair<fs::file_time_type, string>> entries;

    error_code ec;
    if (!fs::is_directory(params_.directory, ec))
        return {};

    for (const auto &entry : fs::directory_iterator(params_.directory, ec))
    {
        if (!entry.is_regular_file() || entry.path().extension() != ".jsonl")
            continue;

        error_code time_ec;
        auto written = fs::last_write_time(entry.path(), time_ec);
        entries.push_back({written, entry.path().stem().string()});
    }

    // Newest first, ids are time based so they break ties
    sort(entries.begin(), entries.end(), [](const auto &a, const auto &b)
         { return a.first != b.first ? a.first > b.first : a.second > b.second; });

    vector<string> ids;
    for (const auto &entry : entries)
        ids.push_back(entry.second);
    return ids;
}

vector<SessionSummary> SessionStore::list() const
{
    vector<string> ids;
    {
        lock_guard<mutex> lock(mutex_);
        ids = sessionIds();
    }

    vector<SessionSummary> summaries;
    for (const auto &id : ids)
    {
        Session session;
        if (!load(id, session))
            continue;

        SessionSummary summary;
        summary.id = session.id;
        summary.start_time = session.start_time;
        summary.end_time = session.end_time;
        summary.target_size = session.target_size;
        summary.fault = session.fault;
        SessionStatistics stats = session_state::computeStatistics(session);
        summary.arrows = stats.arrows;
        summary.total_score = stats.total_score;
        summaries.push_back(summary);
    }
    return summaries;
}

int SessionStore::prune()
{
    lock_guard<mutex> lock(mutex_);

    if (params_.max_sessions <= 0)
        return 0;

    vector<string> ids = sessionIds();
    int removed = 0;

    for (size_t i = params_.max_sessions; i < ids.size(); i++)
    {
        error_code ec;
        if (fs::remove(pathFor(ids[i]), ec))
        {
            removed++;
        }
        else if (ec)
        {
            log_warning("Failed to prune session " + ids[i] + ": " + ec.message());
        }
    }

    if (removed > 0)
        log_info("Pruned " + to_string(removed) + " old sessions from " + params_.directory);
    return removed;
}
