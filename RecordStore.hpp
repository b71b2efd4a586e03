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

#include <vector>
#include <QHash>
#include <QString>
#include <QStringList>

//! Key/value table shared by the .lang and JSON codecs.
//! Entries are iterated in insertion order. Inserting a key that is already
//! present replaces its value and keeps its original position.
class RecordStore
{
public:
	struct Entry
	{
		QString key;
		QString value;
		bool operator==(const Entry& rhs) const { return key == rhs.key && value == rhs.value; }
	};

	void insert(const QString& key, const QString& value);
	bool contains(const QString& key) const { return index.contains(key); }
	QString value(const QString& key, const QString& defaultValue = QString()) const;
	QStringList keys() const;
	int size() const { return static_cast<int>(entries.size()); }
	bool isEmpty() const { return entries.empty(); }
	void clear();
	auto begin() const { return entries.cbegin(); }
	auto end() const { return entries.cend(); }
	bool operator==(const RecordStore& rhs) const { return entries == rhs.entries; }
	bool operator!=(const RecordStore& rhs) const { return !(*this == rhs); }

private:
	std::vector<Entry> entries;
	//! Position of each key in entries
	QHash<QString, int> index;
};
