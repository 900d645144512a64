#include "io/SampleReader.h"

#include "io/CsvFields.h"

#include "common/log.h"

#include <QtCore/QFile>
#include <QtCore/QTextStream>

namespace io
{

bool SampleReader::loadFromText(const QString& text, QStringList& warnings)
{
    warnings.clear();
    m_samples.clear();
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
        warnings.push_back(QStringLiteral("Sample file has no header row."));
        return false;
    }

    const QStringList header = splitCsvLine(headerLine);
    const int latColumn = findColumnContaining(header, QStringLiteral("Latitude"));
    const int lonColumn = findColumnContaining(header, QStringLiteral("Longitude"));
    const int existColumn = findColumnContaining(header, QStringLiteral("Existing"));
    const int propColumn = findColumnContaining(header, QStringLiteral("Proposed"));

    if (latColumn < 0 || lonColumn < 0)
    {
        warnings.push_back(QStringLiteral("Sample header lacks Latitude/Longitude columns: %1").arg(headerLine));
        return false;
    }
    if (existColumn < 0 || propColumn < 0)
    {
        warnings.push_back(QStringLiteral("Sample header lacks %1 column; no bin can be simulated without both elevations.")
                               .arg(existColumn < 0 ? QStringLiteral("Existing") : QStringLiteral("Proposed")));
    }

    while (!stream.atEnd())
    {
        const QString line = stream.readLine();
        if (line.trimmed().isEmpty())
        {
            continue;
        }

        const QStringList fields = splitCsvLine(line);
        const auto lat = fieldDouble(fields, latColumn);
        const auto lon = fieldDouble(fields, lonColumn);
        if (!lat || !lon)
        {
            ++m_droppedRows;
            continue;
        }

        grid::Sample sample;
        sample.position = {*lat, *lon};
        sample.zExist = fieldDouble(fields, existColumn);
        sample.zProp = fieldDouble(fields, propColumn);
        if (!sample.zExist && !sample.zProp)
        {
            ++m_droppedRows;
            continue;
        }
        m_samples.push_back(sample);
    }

    if (m_droppedRows > 0)
    {
        warnings.push_back(QStringLiteral("Dropped %1 sample rows without coordinates or elevations.")
                               .arg(static_cast<qulonglong>(m_droppedRows)));
    }

    LOG_INFO(Io, QStringLiteral("Loaded %1 samples (%2 rows dropped)")
                     .arg(static_cast<qulonglong>(m_samples.size()))
                     .arg(static_cast<qulonglong>(m_droppedRows)));
    return true;
}

bool SampleReader::loadFromFile(const QString& filePath, QStringList& warnings)
{
    QFile file(filePath);
    if (!file.exists())
    {
        warnings.clear();
        warnings.push_back(QStringLiteral("Sample file not found: %1").arg(filePath));
        return false;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        warnings.clear();
        warnings.push_back(QStringLiteral("Unable to open sample file: %1").arg(filePath));
        return false;
    }

    QTextStream stream(&file);
    return loadFromText(stream.readAll(), warnings);
}

} // namespace io
