/*
 * Lang/JSON Converter
 * Copyright (C) 2025 The Lang/JSON Converter authors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Suite 500, Boston, MA  02110-1335, USA.
 */

#include "LangJsonConverter.hpp"
#include "LangCodec.hpp"
#include "JsonCodec.hpp"
#include "RecordStore.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMetaEnum>
#include <iostream>

namespace
{

using ReadFunction = bool (*)(const QString &, RecordStore &, QString &);
using WriteFunction = bool (*)(const QString &, const RecordStore &, QString &);

struct Route
{
    QString targetExtension;
    ReadFunction read;
    WriteFunction write;
};

bool selectRoute(const QString &suffix, LangJsonConverter::Mode mode, Route &route)
{
    using LangJsonConverter::Mode;
    if (suffix == "lang" && mode != Mode::JsonToLang)
    {
        route = {"json", &LangCodec::read, &JsonCodec::write};
        return true;
    }
    if (suffix == "json" && mode != Mode::LangToJson)
    {
        route = {"lang", &JsonCodec::read, &LangCodec::write};
        return true;
    }
    return false;
}

bool ensureDirectory(const QString &path)
{
    if (QFileInfo(path).isDir())
        return true;
    if (!QDir().mkpath(path))
    {
        qCritical().noquote() << "LangJsonConverter::\tFailed to create directory" << QDir::toNativeSeparators(path);
        return false;
    }
    std::cout << "Created directory " << QDir::toNativeSeparators(path).toStdString() << "\n";
    return true;
}

}

namespace LangJsonConverter
{

void printProgress(const QString &inputPath, const QString &outputPath)
{
    std::cout << inputPath.toStdString() << " => " << outputPath.toStdString() << "\n";
}

QString modeName(Mode mode)
{
    return QString::fromLatin1(QMetaEnum::fromType<Mode>().valueToKey(static_cast<int>(mode)));
}

ReturnValue prepareDirectories(const QString &inputDir, const QString &outputDir)
{
    if (!ensureDirectory(inputDir) || !ensureDirectory(outputDir))
        return ReturnValue::ERR_DIR_CREATION_FAILED;
    return ReturnValue::CONVERT_SUCCESS;
}

ReturnValue convert(
    const QString &inputDir,
    const QString &outputDir,
    Mode mode,
    BatchResult &result,
    const ProgressCallback &progress)
{
    result = BatchResult();

    const QFileInfo inputInfo(inputDir);
    if (!inputInfo.isDir())
    {
        qCritical().noquote() << "LangJsonConverter::\tInput directory" << QDir::toNativeSeparators(inputDir) << "doesn't exist";
        return ReturnValue::ERR_INPUT_DIR_NOT_FOUND;
    }
    if (!inputInfo.isReadable() || !inputInfo.isExecutable())
    {
        qCritical().noquote() << "LangJsonConverter::\tInput directory" << QDir::toNativeSeparators(inputDir) << "can't be listed";
        return ReturnValue::ERR_INPUT_DIR_UNREADABLE;
    }

    qDebug().noquote() << "Converting" << QDir::toNativeSeparators(inputDir) << "to"
                       << QDir::toNativeSeparators(outputDir) << "in mode" << modeName(mode);

    const QDir outDir(outputDir);
    // The listing is taken once; files appearing later are not picked up.
    const auto entries = QDir(inputDir).entryInfoList(QDir::Files | QDir::Hidden, QDir::Unsorted);
    for (const auto &entry : entries)
    {
        const auto stem = entry.completeBaseName();
        if (stem.isEmpty())
            continue;
        Route route;
        if (!selectRoute(entry.suffix(), mode, route))
            continue;

        const auto inputPath = entry.filePath();
        const auto outputPath = outDir.filePath(stem + "." + route.targetExtension);

        RecordStore records;
        QString error;
        if (!route.read(inputPath, records, error))
        {
            qWarning().noquote() << "LangJsonConverter::\t" << error;
            result.failedReads.push_back({stem, error});
            continue;
        }
        if (!route.write(outputPath, records, error))
        {
            qWarning().noquote() << "LangJsonConverter::\t" << error;
            result.failedWrites.push_back({stem, error});
            continue;
        }

        result.converted.push_back({inputPath, outputPath});
        if (progress)
            progress(inputPath, outputPath);
    }

    return ReturnValue::CONVERT_SUCCESS;
}

}
