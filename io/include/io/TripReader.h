#pragma once

#include "sim/TripRecord.h"

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <cstddef>
#include <vector>

namespace io
{

// Haul log: trip_index, start/end coordinates and BCY per row, optionally with
// explicit cut/fill segments, cut length, heading and depth profiles.
class TripReader
{
public:
    bool loadFromText(const QString& text, QStringList& warnings);
    bool loadFromFile(const QString& filePath, QStringList& warnings);

    // Sorted by trip index.
    [[nodiscard]] const std::vector<sim::TripRecord>& trips() const noexcept { return m_trips; }
    [[nodiscard]] std::size_t droppedRows() const noexcept { return m_droppedRows; }

private:
    std::vector<sim::TripRecord> m_trips;
    std::size_t m_droppedRows{0};
};

} // namespace io
