// IniFile
// Taken from Dolphin but relicensed by me, Henrik Rydgard, under the MIT
// license as I wrote the whole thing originally and it has barely changed.

#include <cstdlib>
#include <cstdio>

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

#include "Common/Data/Format/IniFile.h"
#include "Common/Log.h"
#include "Common/StringUtils.h"

// Ugh, this is ugly.
static bool ParseLine(std::string_view line, std::string *keyOut, std::string *valueOut, std::string *commentOut) {
	if (line.empty() || line[0] == '#' || line[0] == ';')
		return false;

	size_t firstEquals = line.find('=');
	// Comments
	size_t firstCommentChar = line.find('#', firstEquals != std::string_view::npos ? firstEquals : 0);

	// Allow preservation of spacing before comment
	if (firstCommentChar != std::string_view::npos && firstCommentChar > 0) {
		while (firstCommentChar > 0 && (line[firstCommentChar - 1] == ' ' || line[firstCommentChar - 1] == '\t')) {
			firstCommentChar--;
		}
	}

	if (firstEquals != std::string_view::npos && (firstCommentChar == std::string_view::npos || firstEquals < firstCommentChar)) {
		// Yes, a valid key/value line!
		*keyOut = std::string(StripSpaces(line.substr(0, firstEquals)));
		if (commentOut)
			*commentOut = firstCommentChar != std::string_view::npos ? std::string(line.substr(firstCommentChar)) : std::string();
		if (valueOut) {
			size_t valueLen = firstCommentChar == std::string_view::npos ? std::string_view::npos : firstCommentChar - firstEquals - 1;
			*valueOut = std::string(StripQuotes(StripSpaces(line.substr(firstEquals + 1, valueLen))));
		}
		return true;
	}
	return false;
}

const std::string *Section::GetLine(std::string_view key, std::string *valueOut, std::string *commentOut) const {
	for (const std::string &line : lines_) {
		std::string lineKey;
		if (ParseLine(line, &lineKey, valueOut, commentOut) && equalsNoCase(lineKey, key))
			return &line;
	}
	return nullptr;
}

std::string *Section::GetLine(std::string_view key, std::string *valueOut, std::string *commentOut) {
	for (std::string &line : lines_) {
		std::string lineKey;
		if (ParseLine(line, &lineKey, valueOut, commentOut) && equalsNoCase(lineKey, key))
			return &line;
	}
	return nullptr;
}

void Section::Set(std::string_view key, std::string_view newValue) {
	std::string value, commented;
	std::string *line = GetLine(key, &value, &commented);
	if (line) {
		// Change the value - keep the key and comment
		*line = std::string(StripSpaces(key)) + " = " + std::string(newValue) + commented;
	} else {
		// The key did not already exist in this section - let's add it.
		lines_.push_back(std::string(key) + " = " + std::string(newValue));
	}
}

bool Section::Get(std::string_view key, std::string *value, const char *defaultValue) const {
	const std::string *line = GetLine(key, value, nullptr);
	if (!line) {
		if (defaultValue) {
			*value = defaultValue;
		}
		return false;
	}
	return true;
}

bool Section::Get(std::string_view key, std::vector<std::string> *values) const {
	std::string temp;
	bool retval = Get(key, &temp, nullptr);
	if (!retval || temp.empty()) {
		return false;
	}
	// ignore starting , if any
	size_t subStart = temp.find_first_not_of(',');
	size_t subEnd;

	// split by ,
	while (subStart != std::string::npos) {
		// Find next ,
		subEnd = temp.find_first_of(',', subStart);
		if (subStart != subEnd)
			// take from first char until next ,
			values->push_back(StripSpaces(temp.substr(subStart, subEnd - subStart)));

		// Find the next non , char
		subStart = temp.find_first_not_of(',', subEnd);
	}

	return true;
}

bool Section::Get(std::string_view key, int *value, int defaultValue) const {
	std::string temp;
	bool retval = Get(key, &temp, nullptr);
	if (retval && TryParse(temp, value))
		return true;
	*value = defaultValue;
	return false;
}

bool Section::Get(std::string_view key, bool *value, bool defaultValue) const {
	std::string temp;
	bool retval = Get(key, &temp, nullptr);
	if (retval && TryParse(temp, value))
		return true;
	*value = defaultValue;
	return false;
}

// IniFile

const Section *IniFile::GetSection(const char *sectionName) const {
	for (const Section &section : sections_) {
		if (equalsNoCase(section.name(), sectionName))
			return &section;
	}
	return nullptr;
}

Section *IniFile::GetSection(const char *sectionName) {
	for (Section &section : sections_) {
		if (equalsNoCase(section.name(), sectionName))
			return &section;
	}
	return nullptr;
}

Section *IniFile::GetOrCreateSection(const char *sectionName) {
	Section *section = GetSection(sectionName);
	if (!section) {
		sections_.push_back(Section(sectionName));
		section = &sections_.back();
	}
	return section;
}

bool IniFile::Load(const std::string &filename) {
	sections_.clear();

	std::ifstream in(filename, std::ios::in | std::ios::binary);
	if (in.fail()) {
		WARN_LOG(Log::Config, "Failed to open ini file '%s'", filename.c_str());
		return false;
	}
	return Load(in);
}

bool IniFile::Load(std::istream &in) {
	std::string line;
	bool first = true;
	while (std::getline(in, line)) {
		// Remove UTF-8 byte order marks.
		if (first && line.substr(0, 3) == "\xEF\xBB\xBF")
			line = line.substr(3);
		first = false;

		// Check for CRLF eol and convert it to LF
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}

		if (line.empty())
			continue;

		if (line[0] == '[') {
			size_t endpos = line.find(']');
			if (endpos != std::string::npos) {
				// New section!
				sections_.push_back(Section(line.substr(1, endpos - 1)));
				if (endpos + 1 < line.size()) {
					sections_.back().comment_ = line.substr(endpos + 1);
				}
			}
		} else if (!sections_.empty()) {
			sections_.back().lines_.push_back(line);
		}
	}

	return !in.bad();
}

void IniFile::Save(std::ostream &out) const {
	for (const Section &section : sections_) {
		if (!section.name().empty()) {
			out << "[" << section.name() << "]" << section.comment_ << "\n";
		}
		for (const std::string &line : section.lines_) {
			out << line << "\n";
		}
	}
}

bool IniFile::Save(const std::string &filename) const {
	std::ofstream out(filename, std::ios::out | std::ios::binary);
	if (out.fail()) {
		ERROR_LOG(Log::Config, "Failed to write ini file '%s'", filename.c_str());
		return false;
	}

	// UTF-8 byte order mark. To make sure notepad doesn't go nuts.
	out << "\xEF\xBB\xBF";
	Save(out);
	out.close();
	return !out.fail();
}
