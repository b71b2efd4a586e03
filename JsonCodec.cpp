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

#include "JsonCodec.hpp"

#include <string>
#include <QDir>
#include <QDebug>
#include <nlohmann/json.hpp>
#include "Utils.hpp"

bool JsonCodec::parse(const QByteArray& text, RecordStore& records, QString& error)
{
	records.clear();
	nlohmann::ordered_json document;
	try
	{
		document = nlohmann::ordered_json::parse(text.constData(), text.constData() + text.size());
	}
	catch(const nlohmann::json::exception& e)
	{
		error = QString::fromUtf8(e.what());
		return false;
	}

	if(!document.is_object())
	{
		qDebug() << "Top-level JSON value is not an object, nothing to load";
		return true;
	}

	for(const auto& member : document.items())
	{
		const auto& value = member.value();
		if(!value.is_string())
		{
			qDebug().noquote() << "Skipping non-string member" << QString::fromStdString(member.key());
			continue;
		}
		records.insert(QString::fromStdString(member.key()),
		               QString::fromStdString(value.get<std::string>()));
	}
	return true;
}

QByteArray JsonCodec::serialize(const RecordStore& records)
{
	auto document = nlohmann::ordered_json::object();
	for(const auto& entry : records)
		document[entry.key.toStdString()] = entry.value.toStdString();
	const auto text = document.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
	return QByteArray::fromStdString(text + "\n");
}

bool JsonCodec::read(const QString& path, RecordStore& records, QString& error)
{
	QByteArray text;
	if(!readFile(path, text, error))
		return false;
	QString parseError;
	if(!parse(text, records, parseError))
	{
		error = QString("Failed to parse JSON in %1: %2").arg(QDir::toNativeSeparators(path), parseError);
		return false;
	}
	return true;
}

bool JsonCodec::write(const QString& path, const RecordStore& records, QString& error)
{
	return writeFile(path, serialize(records), error);
}
