#include "gesture_classifier.hpp"
#include <vector>

namespace handpose
{

    GestureResult classify_gesture(const Contour &contour, const DetectorConfig &config)
    {
        GestureResult result;

        const std::vector<int> hull = geometry::convex_hull_indices(contour);
        if (hull.size() < 3)
            return result;

        const auto defects = geometry::convexity_defects(contour, hull, config.min_defect_depth);
        if (!defects)
            return result;

        const double area = geometry::contour_area(contour);
        const double h_area = geometry::hull_area(contour, hull);
        result.solidity = h_area > 0.0 ? area / h_area : 0.0;

        if (defects->empty())
        {
            result.gesture = Gesture::CLOSED_FIST;
            return result;
        }

        // A gap between two extended fingers has an acute far vertex
        int gaps = 0;
        for (const auto &d : *defects)
        {
            const double angle = geometry::far_angle(contour[d.start_index],
                                                     contour[d.end_index],
                                                     contour[d.far_index]);
            if (angle <= config.gesture_max_angle)
                gaps++;
        }
        result.finger_gaps = gaps;

        switch (gaps)
        {
        case 0:
            result.gesture = Gesture::CLOSED_FIST;
            break;
        case 1:
            result.gesture = Gesture::POINTING;
            break;
        case 2:
            result.gesture = Gesture::VICTORY;
            break;
        case 3:
            result.gesture = result.solidity > config.thumbs_up_solidity ? Gesture::THUMBS_UP
                                                                         : Gesture::UNKNOWN;
            break;
        default:
            result.gesture = Gesture::OPEN_PALM;
            break;
        }

        return result;
    }

    std::string gesture_to_string(Gesture g)
    {
        switch (g)
        {
        case Gesture::CLOSED_FIST:
            return "closed_fist";
        case Gesture::POINTING:
            return "pointing";
        case Gesture::VICTORY:
            return "victory";
        case Gesture::OPEN_PALM:
            return "open_palm";
        case Gesture::THUMBS_UP:
            return "thumbs_up";
        default:
            return "unknown";
        }
    }

    Gesture string_to_gesture(const std::string &s)
    {
        if (s == "closed_fist")
            return Gesture::CLOSED_FIST;
        if (s == "pointing")
            return Gesture::POINTING;
        if (s == "victory")
            return Gesture::VICTORY;
        if (s == "open_palm")
            return Gesture::OPEN_PALM;
        if (s == "thumbs_up")
            return Gesture::THUMBS_UP;
        return Gesture::UNKNOWN;
    }

} // namespace handpose
