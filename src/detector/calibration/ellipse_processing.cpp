#include "ellipse_processing.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

namespace ellipse_processing
{
    // Mean relative deviation of the contour from the fitted ellipse, measured along rays from its center
    static double fitResidual(const vector<Point> &contour, const RotatedRect &ellipse)
    {
        double a = ellipse.size.width / 2.0;
        double b = ellipse.size.height / 2.0;
        if (a <= 0.0 || b <= 0.0 || contour.empty())
            return 1.0;

        double theta = ellipse.angle * CV_PI / 180.0;
        double cosT = cos(theta);
        double sinT = sin(theta);

        double total = 0.0;
        for (const Point &p : contour)
        {
            // Rotate into the ellipse frame
            double dx = p.x - ellipse.center.x;
            double dy = p.y - ellipse.center.y;
            double x = dx * cosT + dy * sinT;
            double y = -dx * sinT + dy * cosT;

            // (x/a)^2 + (y/b)^2 = s^2, s == 1 on the boundary
            double s = sqrt((x * x) / (a * a) + (y * y) / (b * b));
            total += fabs(s - 1.0);
        }

        return total / static_cast<double>(contour.size());
    }

    EllipseFit processEllipse(const vector<Point> &contour, const EllipseParams &params)
    {
        EllipseFit fit;

        if (static_cast<int>(contour.size()) < params.minContourPoints)
        {
            log_debug("Too few boundary points for an ellipse fit: " + log_string(contour.size()));
            return fit;
        }

        fit.ellipse = fitEllipse(contour);
        fit.axisRatio = math::axisRatio(fit.ellipse);
        fit.tiltDegrees = math::tiltDegreesFromAxisRatio(fit.axisRatio);
        fit.meanRadius = (fit.ellipse.size.width + fit.ellipse.size.height) / 4.0;
        fit.fitResidual = fitResidual(contour, fit.ellipse);

        fit.valid = fit.meanRadius > 0.0 && std::isfinite(fit.meanRadius) &&
                    fit.fitResidual <= params.maxFitResidual;
        fit.perpendicular = fit.tiltDegrees <= params.maxTiltDegrees;

        log_debug("Ellipse fit: center=(" + to_string(fit.ellipse.center.x) + ", " + to_string(fit.ellipse.center.y) +
                  ") axes=" + to_string(fit.ellipse.size.width) + "x" + to_string(fit.ellipse.size.height) +
                  " ratio=" + to_string(fit.axisRatio) + " tilt=" + to_string(fit.tiltDegrees) +
                  " residual=" + to_string(fit.fitResidual));

        return fit;
    }

} // namespace ellipse_processing
