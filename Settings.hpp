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
#include <QString>
#include "LangJsonConverter.hpp"

//! Name of the configuration file picked up from the working directory when present
inline const QString defaultConfigFile = "lang-json-converter.ini";

struct Settings
{
	QString inputDir = "./input";
	QString outputDir = "./output";
	//! Set by --mode: convert once and exit instead of showing the menu
	bool runOnce = false;
	LangJsonConverter::Mode mode = LangJsonConverter::Mode::Both;
	bool showHelp = false;
};

//! Options as given on the command line, before the configuration file is applied.
struct CommandLine
{
	QString inputDir;
	QString outputDir;
	QString configFile;
	bool hasMode = false;
	LangJsonConverter::Mode mode = LangJsonConverter::Mode::Both;
	bool showHelp = false;
};

bool parseMode(const QString& name, LangJsonConverter::Mode& mode);
bool parseCommandLine(const std::vector<QString>& args, CommandLine& commandLine, QString& error);
//! Reads paths/input and paths/output from an INI file.
bool loadConfigFile(const QString& path, Settings& settings, QString& error);
//! Defaults, then the configuration file, then command line options.
bool resolveSettings(const CommandLine& commandLine, Settings& settings, QString& error);
