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

#pragma once

#include <QByteArray>
#include <QString>
#include "RecordStore.hpp"

//! Reader and writer for flat JSON objects with string members.
class JsonCodec
{
public:
	/**
	 * @brief Load the string members of a JSON object into records.
	 *
	 * Members are taken in the order they appear in the text. Members whose
	 * value is not a string are skipped, and a top-level value that is not an
	 * object produces no records. Neither case is an error.
	 *
	 * @param text UTF-8 encoded JSON text.
	 * @param records Receives the members; cleared first.
	 * @param error Set to the parser's message when false is returned.
	 * @return false if text is not valid JSON.
	 */
	static bool parse(const QByteArray& text, RecordStore& records, QString& error);
	//! Pretty-printed object with two-space indentation and a trailing newline.
	static QByteArray serialize(const RecordStore& records);

	static bool read(const QString& path, RecordStore& records, QString& error);
	static bool write(const QString& path, const RecordStore& records, QString& error);
};
