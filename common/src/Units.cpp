#include "common/Units.h"

#include <QtCore/QLocale>

namespace common
{

double convertLength(double value, LengthUnit from, LengthUnit to)
{
    if (from == to)
    {
        return value;
    }
    if (from == LengthUnit::Feet && to == kInternalLengthUnit)
    {
        return value * kMetersPerFoot;
    }
    if (from == kInternalLengthUnit && to == LengthUnit::Feet)
    {
        return value / kMetersPerFoot;
    }
    return value;
}

double toMeters(double value, LengthUnit from)
{
    return convertLength(value, from, kInternalLengthUnit);
}

double fromMeters(double valueM, LengthUnit to)
{
    return convertLength(valueM, kInternalLengthUnit, to);
}

double convertVolume(double value, VolumeUnit from, VolumeUnit to)
{
    if (from == to)
    {
        return value;
    }
    if (from == VolumeUnit::CubicYards && to == kInternalVolumeUnit)
    {
        return value / kCubicYardsPerCubicMeter;
    }
    if (from == kInternalVolumeUnit && to == VolumeUnit::CubicYards)
    {
        return value * kCubicYardsPerCubicMeter;
    }
    return value;
}

double toCubicMeters(double value, VolumeUnit from)
{
    return convertVolume(value, from, kInternalVolumeUnit);
}

double fromCubicMeters(double valueM3, VolumeUnit to)
{
    return convertVolume(valueM3, kInternalVolumeUnit, to);
}

QString unitSuffix(LengthUnit unit)
{
    switch (unit)
    {
    case kInternalLengthUnit: return QStringLiteral("m");
    case LengthUnit::Feet: return QStringLiteral("ft");
    }
    return QStringLiteral("m");
}

QString unitSuffix(VolumeUnit unit)
{
    switch (unit)
    {
    case kInternalVolumeUnit: return QStringLiteral("m3");
    case VolumeUnit::CubicYards: return QStringLiteral("yd3");
    }
    return QStringLiteral("m3");
}

LengthUnit lengthUnitFromString(const QString& text, LengthUnit fallback)
{
    const QString lower = text.trimmed().toLower();
    if (lower == QStringLiteral("m") || lower == QStringLiteral("meters") || lower == QStringLiteral("metres"))
    {
        return kInternalLengthUnit;
    }
    if (lower == QStringLiteral("ft") || lower == QStringLiteral("feet") || lower == QStringLiteral("foot"))
    {
        return LengthUnit::Feet;
    }
    return fallback;
}

QString formatLength(double valueM, LengthUnit unit, int precision)
{
    const double displayValue = fromMeters(valueM, unit);
    return QStringLiteral("%1 %2")
        .arg(QLocale::c().toString(displayValue, 'f', precision))
        .arg(unitSuffix(unit));
}

QString formatVolume(double valueM3, VolumeUnit unit, int precision)
{
    const double displayValue = fromCubicMeters(valueM3, unit);
    return QStringLiteral("%1 %2")
        .arg(QLocale::c().toString(displayValue, 'f', precision))
        .arg(unitSuffix(unit));
}

} // namespace common
