/**
 * @file BoundingBox.hpp
 * Inclusive pixel box used both for the trimmed foreground extent and for
 * externally detected plate regions.
 */
#pragma once
#include <opencv2/core.hpp>

struct BoundingBox
{
    int xMin {0};
    int yMin {0};
    int xMax {0};   // inclusive
    int yMax {0};   // inclusive

    BoundingBox() = default;
    BoundingBox(int x0, int y0, int x1, int y1) : xMin(x0), yMin(y0), xMax(x1), yMax(y1) {}

    int width() const { return xMax - xMin + 1; }
    int height() const { return yMax - yMin + 1; }

    bool isOrdered() const { return xMin <= xMax && yMin <= yMax; }

    bool fitsWithin(int cols, int rows) const
    {
        return isOrdered() && xMin >= 0 && yMin >= 0 && xMax < cols && yMax < rows;
    }

    cv::Rect toRect() const { return cv::Rect(xMin, yMin, width(), height()); }

    static BoundingBox fromRect(const cv::Rect& r)
    {
        return BoundingBox(r.x, r.y, r.x + r.width - 1, r.y + r.height - 1);
    }

    bool operator==(const BoundingBox& o) const
    {
        return xMin == o.xMin && yMin == o.yMin && xMax == o.xMax && yMax == o.yMax;
    }
    bool operator!=(const BoundingBox& o) const { return !(*this == o); }
};
