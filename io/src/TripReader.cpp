#include "io/TripReader.h"

#include "io/CsvFields.h"

#include "common/log.h"

#include <QtCore/QFile>
#include <QtCore/QTextStream>

#include <optional>
#include <utility>

namespace io
{

namespace
{

struct TripColumns
{
    int index{-1};
    int startLat{-1};
    int startLon{-1};
    int endLat{-1};
    int endLon{-1};
    int bcy{-1};

    int cutStartLat{-1};
    int cutStartLon{-1};
    int cutStopLat{-1};
    int cutStopLon{-1};
    int fillStartLat{-1};
    int fillStartLon{-1};
    int fillStopLat{-1};
    int fillStopLon{-1};
    int cutLength{-1};
    int heading{-1};
    int cutProfile{-1};
    int fillProfile{-1};

    [[nodiscard]] QStringList missingRequired() const
    {
        QStringList missing;
        if (index < 0) missing << QStringLiteral("trip_index");
        if (startLat < 0) missing << QStringLiteral("start_lat");
        if (startLon < 0) missing << QStringLiteral("start_lon");
        if (endLat < 0) missing << QStringLiteral("end_lat");
        if (endLon < 0) missing << QStringLiteral("end_lon");
        if (bcy < 0) missing << QStringLiteral("BCY");
        return missing;
    }
};

TripColumns locateColumns(const QStringList& header)
{
    TripColumns c;
    c.index = findColumn(header, QStringLiteral("trip_index"));
    c.startLat = findColumn(header, QStringLiteral("start_lat"));
    c.startLon = findColumn(header, QStringLiteral("start_lon"));
    c.endLat = findColumn(header, QStringLiteral("end_lat"));
    c.endLon = findColumn(header, QStringLiteral("end_lon"));
    c.bcy = findColumn(header, QStringLiteral("BCY"));

    c.cutStartLat = findColumn(header, QStringLiteral("cut_start_lat"));
    c.cutStartLon = findColumn(header, QStringLiteral("cut_start_lon"));
    c.cutStopLat = findColumn(header, QStringLiteral("cut_stop_lat"));
    c.cutStopLon = findColumn(header, QStringLiteral("cut_stop_lon"));
    c.fillStartLat = findColumn(header, QStringLiteral("fill_start_lat"));
    c.fillStartLon = findColumn(header, QStringLiteral("fill_start_lon"));
    c.fillStopLat = findColumn(header, QStringLiteral("fill_stop_lat"));
    c.fillStopLon = findColumn(header, QStringLiteral("fill_stop_lon"));
    c.cutLength = findColumn(header, QStringLiteral("cut_length_m"));
    c.heading = findColumn(header, QStringLiteral("heading_deg"));
    c.cutProfile = findColumn(header, QStringLiteral("cut_profile"));
    c.fillProfile = findColumn(header, QStringLiteral("fill_profile"));
    return c;
}

// A segment needs all four coordinates.
std::optional<sim::GeoSegment> segmentFrom(const QStringList& fields, int startLat, int startLon, int stopLat, int stopLon)
{
    const auto aLat = fieldDouble(fields, startLat);
    const auto aLon = fieldDouble(fields, startLon);
    const auto bLat = fieldDouble(fields, stopLat);
    const auto bLon = fieldDouble(fields, stopLon);
    if (!aLat || !aLon || !bLat || !bLon)
    {
        return std::nullopt;
    }
    return sim::GeoSegment{{*aLat, *aLon}, {*bLat, *bLon}};
}

std::optional<sim::Profile> profileFrom(const QStringList& fields, int column)
{
    if (column < 0 || column >= fields.size())
    {
        return std::nullopt;
    }
    return parseProfile(fields.at(column));
}

} // namespace

bool TripReader::loadFromText(const QString& text, QStringList& warnings)
{
    warnings.clear();
    m_trips.clear();
    m_droppedRows = 0;

    QString content = text;
    QTextStream stream(&content, QIODevice::ReadOnly);

    QString headerLine;
    while (!stream.atEnd() && headerLine.trimmed().isEmpty())
    {
        headerLine = stream.readLine();
    }
    if (headerLine.trimmed().isEmpty())
    {
        warnings.push_back(QStringLiteral("Trip file has no header row."));
        return false;
    }

    const TripColumns columns = locateColumns(splitCsvLine(headerLine));
    const QStringList missing = columns.missingRequired();
    if (!missing.isEmpty())
    {
        warnings.push_back(QStringLiteral("Trip header lacks required columns: %1").arg(missing.join(QStringLiteral(", "))));
        return false;
    }

    while (!stream.atEnd())
    {
        const QString line = stream.readLine();
        if (line.trimmed().isEmpty())
        {
            continue;
        }

        const QStringList fields = splitCsvLine(line);
        const auto index = fieldInt(fields, columns.index);
        const auto startLat = fieldDouble(fields, columns.startLat);
        const auto startLon = fieldDouble(fields, columns.startLon);
        const auto endLat = fieldDouble(fields, columns.endLat);
        const auto endLon = fieldDouble(fields, columns.endLon);
        const auto bcy = fieldDouble(fields, columns.bcy);
        if (!index || !startLat || !startLon || !endLat || !endLon || !bcy)
        {
            ++m_droppedRows;
            continue;
        }

        sim::TripRecord trip;
        trip.tripIndex = *index;
        trip.bankCubicYards = *bcy;
        trip.start = {*startLat, *startLon};
        trip.end = {*endLat, *endLon};
        trip.cutSegment = segmentFrom(fields, columns.cutStartLat, columns.cutStartLon, columns.cutStopLat, columns.cutStopLon);
        trip.fillSegment = segmentFrom(fields, columns.fillStartLat, columns.fillStartLon, columns.fillStopLat, columns.fillStopLon);
        trip.cutLength_m = fieldDouble(fields, columns.cutLength);
        trip.headingDeg = fieldDouble(fields, columns.heading);
        trip.cutProfile = profileFrom(fields, columns.cutProfile);
        trip.fillProfile = profileFrom(fields, columns.fillProfile);
        m_trips.push_back(std::move(trip));
    }

    sim::sortByTripIndex(m_trips);

    if (m_droppedRows > 0)
    {
        warnings.push_back(QStringLiteral("Dropped %1 trip rows with unreadable required fields.")
                               .arg(static_cast<qulonglong>(m_droppedRows)));
    }

    LOG_INFO(Io, QStringLiteral("Loaded %1 trips (%2 rows dropped)")
                     .arg(static_cast<qulonglong>(m_trips.size()))
                     .arg(static_cast<qulonglong>(m_droppedRows)));
    return true;
}

bool TripReader::loadFromFile(const QString& filePath, QStringList& warnings)
{
    QFile file(filePath);
    if (!file.exists())
    {
        warnings.clear();
        warnings.push_back(QStringLiteral("Trip file not found: %1").arg(filePath));
        return false;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        warnings.clear();
        warnings.push_back(QStringLiteral("Unable to open trip file: %1").arg(filePath));
        return false;
    }

    QTextStream stream(&file);
    return loadFromText(stream.readAll(), warnings);
}

} // namespace io
