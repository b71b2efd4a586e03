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

#include "RecordStore.hpp"

void RecordStore::insert(const QString& key, const QString& value)
{
	const auto it = index.constFind(key);
	if(it != index.cend())
	{
		entries[it.value()].value = value;
		return;
	}
	index.insert(key, static_cast<int>(entries.size()));
	entries.push_back({key, value});
}

QString RecordStore::value(const QString& key, const QString& defaultValue) const
{
	const auto it = index.constFind(key);
	if(it == index.cend())
		return defaultValue;
	return entries[it.value()].value;
}

QStringList RecordStore::keys() const
{
	QStringList out;
	out.reserve(size());
	for(const auto& entry : entries)
		out << entry.key;
	return out;
}

void RecordStore::clear()
{
	entries.clear();
	index.clear();
}
