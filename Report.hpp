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

#include <ostream>
#include "LangJsonConverter.hpp"

namespace LangJsonConverter
{

//! Print the outcome of a finished batch: a success line, or every failure grouped by kind.
void printSummary(const BatchResult& result, std::ostream& out);
//! Print why a batch could not run at all.
void printAborted(ReturnValue code, const QString& inputDir, std::ostream& out);

}
