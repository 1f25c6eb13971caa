#include "contour_processing.hpp"
#include "utils.hpp"

#include <filesystem>

using namespace cv;
using namespace std;

namespace contour_processing
{
    static bool touchesBorder(const Rect &box, const Size &frameSize, int margin)
    {
        return box.x <= margin || box.y <= margin ||
               box.x + box.width >= frameSize.width - margin ||
               box.y + box.height >= frameSize.height - margin;
    }

    // Smaller candidate lies completely inside the bigger one (concentric rings)
    static bool isNested(const TargetCandidate &inner, const TargetCandidate &outer, double tolerance)
    {
        double dist = norm(inner.enclosingCenter - outer.enclosingCenter);
        return inner.enclosingRadius < outer.enclosingRadius &&
               dist + inner.enclosingRadius <= outer.enclosingRadius * tolerance;
    }

    static void collectCandidates(
        const Mat &binary,
        bool darkOnLight,
        const Size &frameSize,
        const ContourParams &params,
        vector<TargetCandidate> &candidates,
        vector<vector<Point>> &rejected)
    {
        vector<vector<Point>> contours;
        findContours(binary.clone(), contours, RETR_EXTERNAL, CHAIN_APPROX_NONE);

        double frameArea = static_cast<double>(frameSize.area());

        for (auto &contour : contours)
        {
            if (contour.size() < 5)
                continue;

            double area = contourArea(contour);
            double areaFraction = area / frameArea;
            if (areaFraction < params.minAreaFraction)
                continue; // noise, not worth reporting

            Rect box = boundingRect(contour);
            double aspect = static_cast<double>(box.width) / max(box.height, 1);
            double circ = math::circularity(contour);

            if (areaFraction > params.maxAreaFraction ||
                touchesBorder(box, frameSize, params.borderMargin) ||
                aspect < params.minAspectRatio || aspect > params.maxAspectRatio ||
                circ < params.minCircularity)
            {
                rejected.push_back(contour);
                continue;
            }

            TargetCandidate candidate;
            candidate.area = area;
            candidate.circularity = circ;
            candidate.aspectRatio = aspect;
            candidate.darkOnLight = darkOnLight;
            candidate.strength = area * circ;
            minEnclosingCircle(contour, candidate.enclosingCenter, candidate.enclosingRadius);
            candidate.contour = std::move(contour);
            candidates.push_back(std::move(candidate));
        }
    }

    vector<TargetCandidate> processContours(const Mat &frame, bool debug_mode, const ContourParams &params)
    {
        vector<TargetCandidate> result;

        if (frame.empty())
        {
            log_error("Empty frame passed to contour processing");
            return result;
        }

        // [===STEP 1:===] Grayscale and smooth
        Mat gray;
        if (frame.channels() == 3)
            cvtColor(frame, gray, COLOR_BGR2GRAY);
        else
            gray = frame.clone();

        int k = params.blurKernelSize | 1;
        GaussianBlur(gray, gray, Size(k, k), 0);

        // [===STEP 2:===] Otsu binarisation in both polarities, the face can be darker or lighter than the boss
        Mat lightMask, darkMask;
        threshold(gray, lightMask, 0, 255, THRESH_BINARY | THRESH_OTSU);
        bitwise_not(lightMask, darkMask);

        // [===STEP 3:===] Shape filter
        vector<TargetCandidate> candidates;
        vector<vector<Point>> rejected;
        collectCandidates(darkMask, true, frame.size(), params, candidates, rejected);
        collectCandidates(lightMask, false, frame.size(), params, candidates, rejected);

        sort(candidates.begin(), candidates.end(), [](const TargetCandidate &a, const TargetCandidate &b)
             { return a.strength > b.strength; });

        // [===STEP 4:===] Fold ring contours into the face that contains them
        for (const auto &candidate : candidates)
        {
            bool nested = false;
            for (const auto &kept : result)
            {
                if (isNested(candidate, kept, params.nestingTolerance))
                {
                    nested = true;
                    break;
                }
            }
            if (!nested)
                result.push_back(candidate);
        }

        log_debug("Contour processing: " + log_string(candidates.size()) + " shape matches, " + log_string(result.size()) + " independent, " + log_string(rejected.size()) + " rejected");

        if (debug_mode)
        {
            error_code ec;
            filesystem::create_directories("debug_frames/calibration", ec);

            Mat visualization = frame.channels() == 3 ? frame.clone() : Mat();
            if (visualization.empty())
                cvtColor(frame, visualization, COLOR_GRAY2BGR);

            drawContours(visualization, rejected, -1, params.rejectedColor, 1);
            for (const auto &candidate : result)
            {
                drawContours(visualization, vector<vector<Point>>{candidate.contour}, -1, params.candidateColor, params.contourThickness);
            }

            imwrite("debug_frames/calibration/binary_dark.jpg", darkMask);
            imwrite("debug_frames/calibration/binary_light.jpg", lightMask);
            imwrite("debug_frames/calibration/candidates.jpg", visualization);
        }

        return result;
    }

} // namespace contour_processing
