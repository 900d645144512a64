#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

#include <sstream>
#include <string>
#include <utility>

namespace common::log
{

enum class Level
{
    Info,
    Warning,
    Error
};

enum class Category
{
    Io,
    Grid,
    Sim,
    App
};

constexpr const char* categoryName(Category category)
{
    switch (category)
    {
    case Category::Io: return "haulgrade.io";
    case Category::Grid: return "haulgrade.grid";
    case Category::Sim: return "haulgrade.sim";
    case Category::App: return "haulgrade.app";
    }
    return "haulgrade.unknown";
}

namespace detail
{

using Message = QString;

inline QLoggingCategory& categoryHandle(Category category)
{
    static QLoggingCategory io(categoryName(Category::Io));
    static QLoggingCategory grid(categoryName(Category::Grid));
    static QLoggingCategory sim(categoryName(Category::Sim));
    static QLoggingCategory app(categoryName(Category::App));
    switch (category)
    {
    case Category::Io: return io;
    case Category::Grid: return grid;
    case Category::Sim: return sim;
    case Category::App: break;
    }
    return app;
}

inline Message toMessage(const QString& message)
{
    return message;
}

inline Message toMessage(const char* message)
{
    return message ? QString::fromUtf8(message) : QString();
}

inline Message toMessage(const std::string& message)
{
    return QString::fromStdString(message);
}

template <typename T>
Message toMessage(const T& value)
{
    std::ostringstream stream;
    stream << value;
    return QString::fromStdString(stream.str());
}

} // namespace detail

inline void write(Level level, Category category, const detail::Message& message)
{
    QLoggingCategory& qtCategory = detail::categoryHandle(category);
    switch (level)
    {
    case Level::Info:
        qCInfo(qtCategory).noquote() << message;
        break;
    case Level::Warning:
        qCWarning(qtCategory).noquote() << message;
        break;
    case Level::Error:
        qCCritical(qtCategory).noquote() << message;
        break;
    }
}

template <typename Message>
void log(Level level, Category category, Message&& message)
{
    write(level, category, detail::toMessage(std::forward<Message>(message)));
}

} // namespace common::log

#define LOG_INFO(category, message)                                                           \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Info, ::common::log::Category::category,     \
                           (message));                                                        \
    } while (false)

#define LOG_WARN(category, message)                                                           \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Warning, ::common::log::Category::category,  \
                           (message));                                                        \
    } while (false)

#define LOG_ERR(category, message)                                                            \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Error, ::common::log::Category::category,    \
                           (message));                                                        \
    } while (false)
