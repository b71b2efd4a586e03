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

#include "Settings.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

bool parseMode(const QString& name, LangJsonConverter::Mode& mode)
{
	using LangJsonConverter::Mode;
	if(name == "lang2json")
		mode = Mode::LangToJson;
	else if(name == "json2lang")
		mode = Mode::JsonToLang;
	else if(name == "both")
		mode = Mode::Both;
	else
		return false;
	return true;
}

bool parseCommandLine(const std::vector<QString>& args, CommandLine& commandLine, QString& error)
{
	for(size_t n = 0; n < args.size(); ++n)
	{
		const auto& arg = args[n];
		if(arg == "--help" || arg == "-h")
		{
			commandLine.showHelp = true;
			continue;
		}
		if(arg != "--input" && arg != "--output" && arg != "--config" && arg != "--mode")
		{
			error = QString("Unknown argument: %1").arg(arg);
			return false;
		}
		if(n + 1 == args.size())
		{
			error = QString("Option %1 requires a value").arg(arg);
			return false;
		}
		const auto& value = args[++n];
		if(arg == "--input")
			commandLine.inputDir = value;
		else if(arg == "--output")
			commandLine.outputDir = value;
		else if(arg == "--config")
			commandLine.configFile = value;
		else
		{
			if(!parseMode(value, commandLine.mode))
			{
				error = QString("Unknown mode \"%1\", expected lang2json, json2lang or both").arg(value);
				return false;
			}
			commandLine.hasMode = true;
		}
	}
	return true;
}

bool loadConfigFile(const QString& path, Settings& settings, QString& error)
{
	if(!QFileInfo(path).isFile())
	{
		error = QString("Configuration file %1 not found").arg(QDir::toNativeSeparators(path));
		return false;
	}
	QSettings ini(path, QSettings::IniFormat);
	if(ini.status() != QSettings::NoError)
	{
		error = QString("Failed to parse configuration file %1").arg(QDir::toNativeSeparators(path));
		return false;
	}
	settings.inputDir = ini.value("paths/input", settings.inputDir).toString();
	settings.outputDir = ini.value("paths/output", settings.outputDir).toString();
	return true;
}

bool resolveSettings(const CommandLine& commandLine, Settings& settings, QString& error)
{
	if(!commandLine.configFile.isEmpty())
	{
		if(!loadConfigFile(commandLine.configFile, settings, error))
			return false;
	}
	else if(QFileInfo(defaultConfigFile).isFile())
	{
		if(!loadConfigFile(defaultConfigFile, settings, error))
			return false;
	}

	if(!commandLine.inputDir.isEmpty())
		settings.inputDir = commandLine.inputDir;
	if(!commandLine.outputDir.isEmpty())
		settings.outputDir = commandLine.outputDir;
	settings.runOnce = commandLine.hasMode;
	settings.mode = commandLine.mode;
	settings.showHelp = commandLine.showHelp;
	return true;
}
