// IniFile
// Taken from Dolphin but relicensed by me, Henrik Rydgard, under the MIT
// license as I wrote the whole thing originally and it has barely changed.

#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "Common/StringUtils.h"

class Section {
	friend class IniFile;

public:
	Section() {}
	Section(std::string_view name) : name_(name) {}

	void Set(std::string_view key, std::string_view newValue);
	void Set(std::string_view key, const char *newValue) {
		Set(key, std::string_view(newValue));
	}
	void Set(std::string_view key, const std::string &newValue) {
		Set(key, std::string_view(newValue));
	}
	void Set(std::string_view key, int newValue) {
		Set(key, StringFromInt(newValue));
	}
	void Set(std::string_view key, bool newValue) {
		Set(key, StringFromBool(newValue));
	}

	bool Get(std::string_view key, std::string *value, const char *defaultValue) const;
	bool Get(std::string_view key, int *value, int defaultValue = 0) const;
	bool Get(std::string_view key, bool *value, bool defaultValue = false) const;
	bool Get(std::string_view key, std::vector<std::string> *values) const;

	const std::string &name() const {
		return name_;
	}

protected:
	const std::string *GetLine(std::string_view key, std::string *valueOut, std::string *commentOut) const;
	std::string *GetLine(std::string_view key, std::string *valueOut, std::string *commentOut);

	std::vector<std::string> lines_;
	std::string name_;
	std::string comment_;
};

class IniFile {
public:
	bool Load(const std::string &filename);
	bool Load(std::istream &istream);

	bool Save(const std::string &filename) const;
	void Save(std::ostream &out) const;

	const Section *GetSection(const char *section) const;
	Section *GetSection(const char *section);
	Section *GetOrCreateSection(const char *section);

private:
	std::vector<Section> sections_;
};
