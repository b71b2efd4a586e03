/**
 * @file TestHelpers.hpp
 * @brief Shared helpers for the converter tests
 */

#pragma once

#include <ostream>
#include <QByteArray>
#include <QFile>
#include <QString>

// Lets gtest print QString values in failure messages.
inline void PrintTo(const QString& s, std::ostream* os) {
    *os << '"' << s.toStdString() << '"';
}

inline bool writeTestFile(const QString& path, const QByteArray& contents) {
    QFile file(path);
    if (!file.open(QFile::WriteOnly | QFile::Truncate)) return false;
    return file.write(contents) == contents.size();
}

inline QByteArray readTestFile(const QString& path) {
    QFile file(path);
    if (!file.open(QFile::ReadOnly)) return QByteArray();
    return file.readAll();
}
