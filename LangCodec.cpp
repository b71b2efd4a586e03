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

#include "LangCodec.hpp"

#include <QDebug>
#include "Utils.hpp"

RecordStore LangCodec::parse(const QString& text)
{
	RecordStore records;
	const auto lines = text.split('\n');
	int lineNumber = 0;
	for(auto line : lines)
	{
		++lineNumber;
		if(line.endsWith('\r'))
			line.chop(1);

		const auto trimmed = line.trimmed();
		if(trimmed.isEmpty() || trimmed.startsWith('#'))
			continue;

		const auto sep = line.indexOf('=');
		if(sep < 0)
		{
			qDebug().noquote() << "Skipping line" << lineNumber << "without a key/value separator:" << trimmed;
			continue;
		}
		records.insert(line.left(sep).trimmed(), line.mid(sep + 1).trimmed());
	}
	return records;
}

QString LangCodec::serialize(const RecordStore& records)
{
	QString out;
	for(const auto& entry : records)
		out += entry.key + '=' + entry.value + '\n';
	return out;
}

bool LangCodec::read(const QString& path, RecordStore& records, QString& error)
{
	QString text;
	if(!readUtf8File(path, text, error))
		return false;
	records = parse(text);
	return true;
}

bool LangCodec::write(const QString& path, const RecordStore& records, QString& error)
{
	return writeFile(path, serialize(records).toUtf8(), error);
}
