#pragma once

#include <string>
#include <vector>

namespace chart {

// Chart space: origin top-left, y grows downward, units are points.
struct Point {
    double x = 0.0;
    double y = 0.0;
};

enum class PrimitiveKind {
    Line,
    Polyline,
    Polygon,
    Circle,
    Rect,
    Text
};

enum class TextAnchor {
    Start,
    Middle,
    End
};

// Empty colour string means "none".
struct Style {
    std::string stroke;
    std::string fill;
    double stroke_width = 0.0;
    double fill_opacity = 1.0;
};

struct Primitive {
    PrimitiveKind kind = PrimitiveKind::Line;
    Style style;

    std::vector<Point> points;       // Line (2), Polyline, Polygon (closed)

    Point center;                    // Circle
    double radius = 0.0;

    double x = 0.0;                  // Rect, and the Text baseline anchor
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    std::string text;
    double font_size = 8.0;
    bool bold = false;
    TextAnchor anchor = TextAnchor::Start;
};

// view_width/view_height is the coordinate box the primitives live in;
// width/height is the size the chart should occupy when placed.
struct Chart {
    double width = 0.0;
    double height = 0.0;
    double view_width = 0.0;
    double view_height = 0.0;
    std::vector<Primitive> primitives;

    bool empty() const { return primitives.empty(); }
    double scale() const { return view_width > 0.0 ? width / view_width : 1.0; }
};

Primitive make_line(Point a, Point b, const std::string& stroke, double stroke_width);
Primitive make_polyline(std::vector<Point> pts, const std::string& stroke, double stroke_width);
Primitive make_polygon(std::vector<Point> pts, const Style& style);
Primitive make_circle(Point c, double r, const Style& style);
Primitive make_rect(double x, double y, double w, double h, const std::string& fill);
Primitive make_text(double x, double y, const std::string& text, double font_size,
                    const std::string& color, TextAnchor anchor = TextAnchor::Start, bool bold = false);

// Point at `angle` radians from `c`; 0 is +x, positive angles turn clockwise
// on screen because y grows downward.
Point polar(Point c, double radius, double angle);

// Points along an arc from `start` to `end` radians, both included, at most
// `max_step` radians apart.
std::vector<Point> arc_points(Point c, double radius, double start, double end, double max_step);

constexpr double kPi = 3.14159265358979323846;

}  // namespace chart
