#pragma once

#include "sim/Profile.h"

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <optional>

namespace io
{

// Plain comma-separated fields; quoting is not supported by the field exports.
[[nodiscard]] QStringList splitCsvLine(const QString& line);

// First header whose name contains needle, case-insensitively; -1 when none does.
[[nodiscard]] int findColumnContaining(const QStringList& header, const QString& needle);
// Header whose name equals name, case-insensitively; -1 when none does.
[[nodiscard]] int findColumn(const QStringList& header, const QString& name);

// Finite number in C locale notation; nothing for a missing column or bad text.
[[nodiscard]] std::optional<double> fieldDouble(const QStringList& fields, int column);
[[nodiscard]] std::optional<int> fieldInt(const QStringList& fields, int column);

// "distance=depth;distance=depth". Malformed pairs are skipped; nothing when no pair parses.
[[nodiscard]] std::optional<sim::Profile> parseProfile(const QString& text);

} // namespace io
