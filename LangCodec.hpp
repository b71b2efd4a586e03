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

#include <QString>
#include "RecordStore.hpp"

//! Reader and writer for the line-oriented .lang format:
//! one key=value pair per line, '#' starts a comment line.
class LangCodec
{
public:
	//! Lines that are blank, commented out or lack '=' contribute nothing.
	//! Key and value are split at the first '=' and trimmed.
	static RecordStore parse(const QString& text);
	static QString serialize(const RecordStore& records);

	static bool read(const QString& path, RecordStore& records, QString& error);
	static bool write(const QString& path, const RecordStore& records, QString& error);
};
