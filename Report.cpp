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

#include "Report.hpp"
#include <QDir>

namespace
{

void printFailures(const char* label, const std::vector<LangJsonConverter::FailureRecord>& failures, std::ostream& out)
{
	if(failures.empty()) return;
	out << "\n" << label << "\n";
	for(const auto& failure : failures)
		out << "- " << failure.stem.toStdString() << ": " << failure.message.toStdString() << "\n";
}

}

namespace LangJsonConverter
{

void printSummary(const BatchResult& result, std::ostream& out)
{
	out << "\nProcessing complete:\n";
	if(!result.hasFailures())
	{
		out << "All files were processed successfully.\n";
		return;
	}
	printFailures("Files that could not be read:", result.failedReads, out);
	printFailures("Files that could not be written:", result.failedWrites, out);
}

void printAborted(const ReturnValue code, const QString& inputDir, std::ostream& out)
{
	const auto dir = QDir::toNativeSeparators(inputDir).toStdString();
	switch(code)
	{
	case ReturnValue::ERR_INPUT_DIR_NOT_FOUND:
		out << "\nInput directory " << dir << " does not exist, nothing was converted.\n";
		break;
	case ReturnValue::ERR_INPUT_DIR_UNREADABLE:
		out << "\nInput directory " << dir << " cannot be read, nothing was converted.\n";
		break;
	case ReturnValue::ERR_DIR_CREATION_FAILED:
		out << "\nFailed to create the working directories.\n";
		break;
	case ReturnValue::CONVERT_SUCCESS:
		break;
	}
}

}
