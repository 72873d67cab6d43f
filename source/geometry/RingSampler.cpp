#include <svfmesh/geometry/RingSampler.hpp>
#include <svfmesh/geometry/Errors.hpp>
#include <svfmesh/util/Log.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <list>
#include <queue>
#include <sstream>
#include <string>

namespace svfmesh {
namespace geometry {

namespace {

// Кандидат на вставку: середина интервала [left, right].
struct Candidate {
    SamplePoint mid;
    double score; // суммарный перепад наклона
    double span;  // длина интервала по x
};

Candidate evaluateCandidate(const Function& f, const SamplePoint& left, const SamplePoint& right) {
    double x = left.x + (right.x - left.x) / 2.0;
    SamplePoint mid = samplePoint(f, x);
    double score = std::abs(mid.slope - right.slope) + std::abs(mid.slope - left.slope);
    // NaN не сравним ни с чем: такой интервал уходит в конец очереди
    if (std::isnan(score)) {
        score = -std::numeric_limits<double>::infinity();
    }
    return {mid, score, right.x - left.x};
}

// Лучше ли a, чем текущий лучший b. Равенство по обоим ключам -> остается более ранний.
bool better(double scoreA, double spanA, double scoreB, double spanB) {
    return scoreA > scoreB || (scoreA == scoreB && spanA > spanB);
}

void checkRange(const char* where, double xStart, double xEnd) {
    if (!(xStart < xEnd)) {
        std::ostringstream ss;
        ss << where << ": x_start (" << xStart << ") must be lower than x_end (" << xEnd << ")";
        throw InvalidRangeError(ss.str());
    }
}

const GreedyRefiner& defaultRefiner() {
    static const GreedyRefiner refiner;
    return refiner;
}

} // namespace

SamplePoint samplePoint(const Function& f, double x) {
    double y = f(x);
    double slope = std::atan((f(x + kSlopeStep) - y) / kSlopeStep);
    return {x, y, slope};
}

double GreedyRefiner::refine(const Function& f, std::vector<SamplePoint>& points,
                             uint32_t targetCount) const {
    double maximum = 0.0;
    points.reserve(targetCount);
    while (points.size() < targetCount) {
        size_t index = 1;
        Candidate best = evaluateCandidate(f, points[0], points[1]);
        for (size_t j = 2; j < points.size(); ++j) {
            Candidate c = evaluateCandidate(f, points[j - 1], points[j]);
            if (better(c.score, c.span, best.score, best.span)) {
                index = j;
                best = c;
            }
        }
        points.insert(points.begin() + index, best.mid);
        maximum = std::max(maximum, best.mid.y);
    }
    return maximum;
}

double QueueRefiner::refine(const Function& f, std::vector<SamplePoint>& points,
                            uint32_t targetCount) const {
    using Node = std::list<SamplePoint>::iterator;

    struct Entry {
        Candidate candidate;
        Node left;
    };
    // Порядок как у полного перебора: больший перепад, затем больший интервал,
    // затем более левый интервал.
    auto lower = [](const Entry& a, const Entry& b) {
        if (better(b.candidate.score, b.candidate.span, a.candidate.score, a.candidate.span)) return true;
        if (better(a.candidate.score, a.candidate.span, b.candidate.score, b.candidate.span)) return false;
        return a.left->x > b.left->x;
    };

    std::list<SamplePoint> chain(points.begin(), points.end());
    std::priority_queue<Entry, std::vector<Entry>, decltype(lower)> queue(lower);
    for (Node it = chain.begin(); std::next(it) != chain.end(); ++it) {
        queue.push({evaluateCandidate(f, *it, *std::next(it)), it});
    }

    double maximum = 0.0;
    size_t count = chain.size();
    while (count < targetCount) {
        Entry top = queue.top();
        queue.pop();
        Node right = std::next(top.left);
        Node mid = chain.insert(right, top.candidate.mid);
        ++count;
        maximum = std::max(maximum, mid->y);

        queue.push({evaluateCandidate(f, *top.left, *mid), top.left});
        queue.push({evaluateCandidate(f, *mid, *right), mid});
    }

    points.assign(chain.begin(), chain.end());
    return maximum;
}

void mirrorRing(std::vector<SamplePoint>& upper) {
    std::vector<SamplePoint> lower(upper.begin(), upper.end());
    // Точка на оси отражения уже есть в верхней половине
    if (!lower.empty() && lower.front().y == 0.0) {
        lower.erase(lower.begin());
    }
    std::reverse(lower.begin(), lower.end());
    if (!lower.empty() && lower.front().y == 0.0) {
        lower.erase(lower.begin());
    }

    upper.reserve(upper.size() + lower.size());
    for (const SamplePoint& p : lower) {
        upper.push_back({p.x, -p.y, -p.slope});
    }
}

SampledRing sampleRing(const Function& f, double xStart, double xEnd,
                       uint32_t vertexCount, bool mirror) {
    return sampleRing(f, xStart, xEnd, vertexCount, mirror, defaultRefiner());
}

SampledRing sampleRing(const Function& f, double xStart, double xEnd,
                       uint32_t vertexCount, bool mirror, const Refiner& refiner) {
    checkRange("sampleRing", xStart, xEnd);
    if (vertexCount < 3) {
        throw InvalidParameterError("sampleRing: at least 3 vertices are required, got "
                                    + std::to_string(vertexCount));
    }
    SampledRing ring = sampleCurve(f, xStart, xEnd, vertexCount, refiner);
    if (mirror) {
        mirrorRing(ring.points);
    }
    return ring;
}

SampledRing sampleCurve(const Function& f, double xStart, double xEnd, uint32_t vertexCount) {
    return sampleCurve(f, xStart, xEnd, vertexCount, defaultRefiner());
}

SampledRing sampleCurve(const Function& f, double xStart, double xEnd,
                        uint32_t vertexCount, const Refiner& refiner) {
    checkRange("sampleCurve", xStart, xEnd);
    if (vertexCount < 2) {
        throw InvalidParameterError("sampleCurve: at least 2 vertices are required, got "
                                    + std::to_string(vertexCount));
    }

    SampledRing curve;
    SamplePoint start = samplePoint(f, xStart);
    // На правой границе - разность назад, чтобы не выходить за область
    double yEnd = f(xEnd);
    SamplePoint end{xEnd, yEnd, std::atan((yEnd - f(xEnd - kSlopeStep)) / kSlopeStep)};
    curve.points.push_back(start);
    curve.points.push_back(end);

    curve.maxY = refiner.refine(f, curve.points, vertexCount);
    curve.upperCount = curve.points.size();

    bool finite = std::all_of(curve.points.begin(), curve.points.end(), [](const SamplePoint& p) {
        return std::isfinite(p.y) && std::isfinite(p.slope);
    });
    if (!finite) {
        log::warn("sampleCurve: function is not finite at some sample points on ["
                  + std::to_string(xStart) + ", " + std::to_string(xEnd) + "]");
    }
    return curve;
}

} // namespace geometry
} // namespace svfmesh
