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

#include "Utils.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#if (QT_VERSION>=QT_VERSION_CHECK(6, 0, 0))
# include <QStringDecoder>
#else
# include <QTextCodec>
#endif

bool decodeUtf8(const QByteArray& bytes, QString& out)
{
#if (QT_VERSION>=QT_VERSION_CHECK(6, 0, 0))
	QStringDecoder decoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
	const QString text = decoder(bytes);
	if(decoder.hasError())
		return false;
#else
	const auto codec = QTextCodec::codecForName("UTF-8");
	QTextCodec::ConverterState state(QTextCodec::DefaultConversion);
	const QString text = codec->toUnicode(bytes.constData(), bytes.size(), &state);
	if(state.invalidChars > 0 || state.remainingChars > 0)
		return false;
#endif
	out = text;
	return true;
}

bool readFile(const QString& path, QByteArray& contents, QString& error)
{
	QFile file(path);
	if(!file.open(QIODevice::ReadOnly))
	{
		error = QString("Failed to open %1: %2").arg(QDir::toNativeSeparators(path), file.errorString());
		return false;
	}
	contents = file.readAll();
	if(file.error() != QFileDevice::NoError)
	{
		error = QString("Failed to read %1: %2").arg(QDir::toNativeSeparators(path), file.errorString());
		return false;
	}
	return true;
}

bool readUtf8File(const QString& path, QString& contents, QString& error)
{
	QByteArray bytes;
	if(!readFile(path, bytes, error))
		return false;
	if(!decodeUtf8(bytes, contents))
	{
		error = QString("%1 is not valid UTF-8").arg(QDir::toNativeSeparators(path));
		return false;
	}
	return true;
}

bool writeFile(const QString& path, const QByteArray& contents, QString& error)
{
	const auto dir = QFileInfo(path).absolutePath();
	if(!QDir().mkpath(dir))
	{
		error = QString("Failed to create output directory %1").arg(QDir::toNativeSeparators(dir));
		return false;
	}

	QFile file(path);
	if(!file.open(QFile::WriteOnly | QFile::Truncate))
	{
		error = QString("Failed to create %1: %2").arg(QDir::toNativeSeparators(path), file.errorString());
		return false;
	}
	if(file.write(contents) != contents.size() || !file.flush())
	{
		error = QString("Failed to write %1: %2").arg(QDir::toNativeSeparators(path), file.errorString());
		return false;
	}
	return true;
}
