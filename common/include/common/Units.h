#pragma once

#include <QString>

namespace common
{

enum class LengthUnit
{
    Meters,
    Feet
};

enum class VolumeUnit
{
    CubicMeters,
    CubicYards
};

constexpr LengthUnit kInternalLengthUnit = LengthUnit::Meters;
constexpr VolumeUnit kInternalVolumeUnit = VolumeUnit::CubicMeters;

constexpr double kMetersPerFoot = 0.3048;
constexpr double kCubicYardsPerCubicMeter = 1.30795061931439;

double convertLength(double value, LengthUnit from, LengthUnit to);
double toMeters(double value, LengthUnit from);
double fromMeters(double valueM, LengthUnit to);

double convertVolume(double value, VolumeUnit from, VolumeUnit to);
double toCubicMeters(double value, VolumeUnit from);
double fromCubicMeters(double valueM3, VolumeUnit to);

QString unitSuffix(LengthUnit unit);
QString unitSuffix(VolumeUnit unit);

LengthUnit lengthUnitFromString(const QString& text, LengthUnit fallback = LengthUnit::Meters);
QString formatLength(double valueM, LengthUnit unit, int precision = 3);
QString formatVolume(double valueM3, VolumeUnit unit, int precision = 2);

} // namespace common
