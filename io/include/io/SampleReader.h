#pragma once

#include "grid/Sample.h"

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <cstddef>
#include <vector>

namespace io
{

// Survey export: a header row naming Latitude, Longitude, Existing and
// Proposed columns (matched by substring), then one point per line.
class SampleReader
{
public:
    bool loadFromText(const QString& text, QStringList& warnings);
    bool loadFromFile(const QString& filePath, QStringList& warnings);

    [[nodiscard]] const std::vector<grid::Sample>& samples() const noexcept { return m_samples; }
    [[nodiscard]] std::size_t droppedRows() const noexcept { return m_droppedRows; }

private:
    std::vector<grid::Sample> m_samples;
    std::size_t m_droppedRows{0};
};

} // namespace io
