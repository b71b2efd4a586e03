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

//! Reads the whole file into contents.
bool readFile(const QString& path, QByteArray& contents, QString& error);
//! Reads the whole file and decodes it as UTF-8, rejecting malformed input.
bool readUtf8File(const QString& path, QString& contents, QString& error);
//! Writes contents to path, creating the parent directory first if needed.
bool writeFile(const QString& path, const QByteArray& contents, QString& error);
bool decodeUtf8(const QByteArray& bytes, QString& out);
