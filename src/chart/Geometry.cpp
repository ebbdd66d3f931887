#include "chart/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace chart {

Primitive make_line(Point a, Point b, const std::string& stroke, double stroke_width) {
    Primitive p;
    p.kind = PrimitiveKind::Line;
    p.points = {a, b};
    p.style.stroke = stroke;
    p.style.stroke_width = stroke_width;
    return p;
}

Primitive make_polyline(std::vector<Point> pts, const std::string& stroke, double stroke_width) {
    Primitive p;
    p.kind = PrimitiveKind::Polyline;
    p.points = std::move(pts);
    p.style.stroke = stroke;
    p.style.stroke_width = stroke_width;
    return p;
}

Primitive make_polygon(std::vector<Point> pts, const Style& style) {
    Primitive p;
    p.kind = PrimitiveKind::Polygon;
    p.points = std::move(pts);
    p.style = style;
    return p;
}

Primitive make_circle(Point c, double r, const Style& style) {
    Primitive p;
    p.kind = PrimitiveKind::Circle;
    p.center = c;
    p.radius = r;
    p.style = style;
    return p;
}

Primitive make_rect(double x, double y, double w, double h, const std::string& fill) {
    Primitive p;
    p.kind = PrimitiveKind::Rect;
    p.x = x;
    p.y = y;
    p.width = w;
    p.height = h;
    p.style.fill = fill;
    return p;
}

Primitive make_text(double x, double y, const std::string& text, double font_size,
                    const std::string& color, TextAnchor anchor, bool bold) {
    Primitive p;
    p.kind = PrimitiveKind::Text;
    p.x = x;
    p.y = y;
    p.text = text;
    p.font_size = font_size;
    p.style.fill = color;
    p.anchor = anchor;
    p.bold = bold;
    return p;
}

Point polar(Point c, double radius, double angle) {
    return {c.x + radius * std::cos(angle), c.y + radius * std::sin(angle)};
}

std::vector<Point> arc_points(Point c, double radius, double start, double end, double max_step) {
    std::vector<Point> out;
    const double span = end - start;
    int steps = 1;
    if (max_step > 0.0) steps = std::max(1, static_cast<int>(std::ceil(std::fabs(span) / max_step)));

    out.reserve(static_cast<size_t>(steps) + 1);
    for (int i = 0; i <= steps; ++i) {
        out.push_back(polar(c, radius, start + span * i / steps));
    }
    return out;
}

}  // namespace chart
