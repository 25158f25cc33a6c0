#pragma once

#include "RouteTypes.hpp"
#include <QString>

namespace fnav {
namespace nav {

// Text rendering for route steps. All functions are pure; missing step
// fields fall back to neutral wording instead of leaking empty values.

// Preview glyphs, prepended to the short label
inline const QString kGlyphLeft = QStringLiteral("↰");
inline const QString kGlyphRight = QStringLiteral("↱");
inline const QString kGlyphStraight = QStringLiteral("↑");
inline const QString kGlyphUTurn = QStringLiteral("↶");
inline const QString kGlyphRoundabout = QStringLiteral("↻");
inline const QString kGlyphArrive = QStringLiteral("◉");

inline const QString kArrivedText = QStringLiteral("You have arrived at your destination");

/// Full sentence for voice output and the instruction banner.
QString spokenInstruction(const Step& step);

/// Glyph + word pair for the "next maneuver" preview ("↰ Turn left").
QString shortLabel(const Step& step);

/// "350 m", "1.2 km"
QString formatDistance(double meters);

/// "12 min", "1 h 5 min"
QString formatDuration(double seconds);

} // namespace nav
} // namespace fnav
