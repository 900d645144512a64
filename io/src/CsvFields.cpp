#include "io/CsvFields.h"

#include <cmath>
#include <utility>
#include <vector>

namespace io
{

QStringList splitCsvLine(const QString& line)
{
    QStringList fields = line.split(QLatin1Char(','));
    for (QString& field : fields)
    {
        field = field.trimmed();
    }
    return fields;
}

int findColumnContaining(const QStringList& header, const QString& needle)
{
    for (int i = 0; i < header.size(); ++i)
    {
        if (header.at(i).contains(needle, Qt::CaseInsensitive))
        {
            return i;
        }
    }
    return -1;
}

int findColumn(const QStringList& header, const QString& name)
{
    for (int i = 0; i < header.size(); ++i)
    {
        if (header.at(i).compare(name, Qt::CaseInsensitive) == 0)
        {
            return i;
        }
    }
    return -1;
}

std::optional<double> fieldDouble(const QStringList& fields, int column)
{
    if (column < 0 || column >= fields.size())
    {
        return std::nullopt;
    }

    bool ok = false;
    const double value = fields.at(column).toDouble(&ok);
    if (!ok || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

std::optional<int> fieldInt(const QStringList& fields, int column)
{
    if (column < 0 || column >= fields.size())
    {
        return std::nullopt;
    }

    bool ok = false;
    const int value = fields.at(column).toInt(&ok);
    if (!ok)
    {
        return std::nullopt;
    }
    return value;
}

std::optional<sim::Profile> parseProfile(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty())
    {
        return std::nullopt;
    }

    std::vector<sim::ProfilePoint> points;
    const QStringList pairs = trimmed.split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString& pair : pairs)
    {
        const int eq = pair.indexOf(QLatin1Char('='));
        if (eq < 0)
        {
            continue;
        }

        bool distanceOk = false;
        bool depthOk = false;
        const double distance = pair.left(eq).trimmed().toDouble(&distanceOk);
        const double depth = pair.mid(eq + 1).trimmed().toDouble(&depthOk);
        if (!distanceOk || !depthOk || !std::isfinite(distance) || !std::isfinite(depth))
        {
            continue;
        }
        points.push_back({distance, depth});
    }

    return sim::Profile::fromPoints(std::move(points));
}

} // namespace io
