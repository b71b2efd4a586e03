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

#include "Menu.hpp"

#include <string>
#include <QString>

bool promptForMode(std::istream& in, std::ostream& out, LangJsonConverter::Mode& mode)
{
	using LangJsonConverter::Mode;
	for(;;)
	{
		out << "\n1: lang=>json\n2: json=>lang\n3: convert both\n0: exit\n"
		    << "Select an option: " << std::flush;

		std::string line;
		if(!std::getline(in, line))
		{
			out << "\n";
			return false;
		}

		bool ok = false;
		const auto choice = QString::fromStdString(line).trimmed().toInt(&ok);
		if(ok && choice == 0)
		{
			out << "Exiting.\n";
			return false;
		}
		if(ok && choice == 1)
			mode = Mode::LangToJson;
		else if(ok && choice == 2)
			mode = Mode::JsonToLang;
		else if(ok && choice == 3)
			mode = Mode::Both;
		else
		{
			out << "Invalid choice. Enter 0 (exit), 1 (convert lang=>json), 2 (convert json=>lang) or 3 (convert both).\n";
			continue;
		}
		return true;
	}
}
