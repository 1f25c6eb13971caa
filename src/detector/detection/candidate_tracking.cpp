#include "candidate_tracking.hpp"
#include "utils.hpp"

#include <algorithm>

using namespace cv;
using namespace std;

namespace candidate_tracking
{
    CandidateTracker::CandidateTracker(const TrackingParams &params)
        : params_(params)
    {
    }

    void CandidateTracker::clear()
    {
        candidates_.clear();
    }

    vector<ConfirmedCandidate> CandidateTracker::update(const vector<blob_processing::Blob> &blobs)
    {
        vector<ConfirmedCandidate> confirmed;

        for (auto &candidate : candidates_)
            candidate.matched = false;

        // Greedy nearest-first matching between candidates and blobs
        struct Pairing
        {
            double distance;
            size_t candidate;
            size_t blob;
        };

        vector<Pairing> pairings;
        for (size_t c = 0; c < candidates_.size(); c++)
        {
            for (size_t b = 0; b < blobs.size(); b++)
            {
                double distance = math::distanceToPoint(candidates_[c].blob.centroid, blobs[b].centroid);
                if (distance <= params_.match_distance_px)
                    pairings.push_back({distance, c, b});
            }
        }
        sort(pairings.begin(), pairings.end(), [](const Pairing &a, const Pairing &b)
             { return a.distance < b.distance; });

        vector<bool> blob_used(blobs.size(), false);
        for (const auto &pairing : pairings)
        {
            Candidate &candidate = candidates_[pairing.candidate];
            if (candidate.matched || blob_used[pairing.blob])
                continue;

            const auto &blob = blobs[pairing.blob];
            blob_used[pairing.blob] = true;
            candidate.matched = true;
            candidate.misses = 0;
            candidate.blob = blob;

            if (math::distanceToPoint(candidate.anchor, blob.centroid) <= params_.stable_tolerance_px)
            {
                candidate.age++;
                candidate.hits++;
            }
            else
            {
                // Still moving, restart the window here
                candidate.anchor = blob.centroid;
                candidate.age = 1;
                candidate.hits = 1;
            }
        }

        // Unmatched candidates age with a miss
        for (auto &candidate : candidates_)
        {
            if (!candidate.matched)
            {
                candidate.age++;
                candidate.misses++;
            }
        }

        // New blobs start new candidates
        for (size_t b = 0; b < blobs.size(); b++)
        {
            if (blob_used[b])
                continue;

            Candidate candidate;
            candidate.id = next_id_++;
            candidate.anchor = blobs[b].centroid;
            candidate.blob = blobs[b];
            candidate.age = 1;
            candidate.hits = 1;
            candidate.matched = true;
            candidates_.push_back(candidate);
        }

        // Confirm or drop
        vector<Candidate> remaining;
        for (auto &candidate : candidates_)
        {
            if (candidate.misses > params_.max_missed_frames)
            {
                log_debug("Dropped candidate " + to_string(candidate.id) + " after " + to_string(candidate.misses) + " missed frames");
                continue;
            }

            if (candidate.age >= params_.confirmation_window)
            {
                if (candidate.hits < params_.min_confirmed_frames)
                {
                    log_debug("Dropped candidate " + to_string(candidate.id) + ": " + to_string(candidate.hits) + "/" + to_string(candidate.age) + " hits");
                    continue;
                }

                // Only confirm on a frame where the blob is actually visible
                if (candidate.matched)
                {
                    ConfirmedCandidate result;
                    result.blob = candidate.blob;
                    result.frames_tracked = candidate.age;
                    result.confidence = min(1.0, (double)candidate.hits / max(1, params_.confirmation_window));
                    confirmed.push_back(result);
                    continue;
                }
            }

            remaining.push_back(candidate);
        }
        candidates_.swap(remaining);

        return confirmed;
    }

} // namespace candidate_tracking
