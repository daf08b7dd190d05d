/*
    upsloadconf.cpp - upsload configuration file parsing

    Copyright (C) 2026  upsload developers

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
*/

#include "upsload/upsloadconf.hpp"
#include "upsload/common.h"

#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <fstream>
#include <sstream>


namespace upsload {

//
// ConfParser
//

ConfParser::ConfParser(const std::string& buffer) :
_buffer(buffer),
_pos(0)
{
}

ConfParser::~ConfParser() {}

char ConfParser::get()
{
	if (_pos >= _buffer.size())
		return 0;
	else
		return _buffer[_pos++];
}

void ConfParser::back()
{
	if (_pos > 0)
		--_pos;
}

/** Parse a string source for getting the next token, ignoring spaces.
 * \return Token type.
 */
ConfParser::Token ConfParser::parseToken()
{
	/** Lexical parsing machine state enumeration.*/
	typedef enum {
		LEXPARSING_STATE_DEFAULT,
		LEXPARSING_STATE_QUOTED_STRING,
		LEXPARSING_STATE_STRING,
		LEXPARSING_STATE_COMMENT
	} LEXPARSING_STATE_e;
	LEXPARSING_STATE_e state = LEXPARSING_STATE_DEFAULT;

	Token token;
	bool escaped = false;

	for (char c = get(); c != 0 /*EOF*/; c = get()) {
		switch (state) {
			case LEXPARSING_STATE_DEFAULT: /* Wait for a non-space char */
				if (c == ' ' || c == '\t') {
					/* Space : do nothing */
				} else if (c == '[') {
					return Token(Token::TOKEN_BRACKET_OPEN, c);
				} else if (c == ']') {
					return Token(Token::TOKEN_BRACKET_CLOSE, c);
				} else if (c == '=') {
					return Token(Token::TOKEN_EQUAL, c);
				} else if (c == '\r' || c == '\n') {
					return Token(Token::TOKEN_EOL, c);
				} else if (c == '#') {
					token.type = Token::TOKEN_COMMENT;
					state = LEXPARSING_STATE_COMMENT;
				} else if (c == '"') {
					token.type = Token::TOKEN_QUOTED_STRING;
					state = LEXPARSING_STATE_QUOTED_STRING;
				} else if (c == '\\') {
					token.type = Token::TOKEN_STRING;
					state = LEXPARSING_STATE_STRING;
					escaped = true;
				} else if (isgraph(static_cast<unsigned char>(c))) {
					token.type = Token::TOKEN_STRING;
					state = LEXPARSING_STATE_STRING;
					token.str += c;
				} else {
					return Token(Token::TOKEN_UNKNOWN, c);
				}
				break;

			case LEXPARSING_STATE_QUOTED_STRING:
				if (escaped) {
					escaped = false;
					token.str += c;
				} else if (c == '\\') {
					escaped = true;
				} else if (c == '"') {
					return token;
				} else if (c == '\r' || c == '\n') {
					/* Unterminated quote ends with the line */
					back();
					return token;
				} else {
					token.str += c;
				}
				break;

			case LEXPARSING_STATE_STRING:
				if (escaped) {
					escaped = false;
					token.str += c;
				} else if (c == '\\') {
					escaped = true;
				} else if (c == ' ' || c == '\t' || c == '"' || c == '#'
				|| c == '[' || c == ']' || c == '='
				|| c == '\r' || c == '\n'
				) {
					back();
					return token;
				} else if (isgraph(static_cast<unsigned char>(c))) {
					token.str += c;
				}
				break;

			case LEXPARSING_STATE_COMMENT:
				if (c == '\r' || c == '\n') {
					back();
					return token;
				}
				token.str += c;
				break;
		}
	}

	return token;
}

void ConfParser::parseConfig()
{
	enum ConfigParserState {
		CPS_DEFAULT,
		CPS_SECTION_OPENED,
		CPS_SECTION_HAVE_NAME,
		CPS_SECTION_CLOSED,
		CPS_DIRECTIVE_HAVE_NAME,
		CPS_DIRECTIVE_VALUES
	} state = CPS_DEFAULT;

	Token tok;
	std::string name;
	ConfigParamList values;

	while (true) {
		tok = parseToken();
		if (tok.is(Token::TOKEN_NONE))
			break;
		if (tok.is(Token::TOKEN_COMMENT) || tok.is(Token::TOKEN_UNKNOWN))
			continue;

		switch (state) {
			case CPS_DEFAULT:
				if (tok.is(Token::TOKEN_BRACKET_OPEN)) {
					state = CPS_SECTION_OPENED;
				} else if (tok.is(Token::TOKEN_STRING) || tok.is(Token::TOKEN_QUOTED_STRING)) {
					name = tok.str;
					state = CPS_DIRECTIVE_HAVE_NAME;
				}
				break;

			case CPS_SECTION_OPENED:
				if (tok.is(Token::TOKEN_STRING) || tok.is(Token::TOKEN_QUOTED_STRING)) {
					name = tok.str;
					state = CPS_SECTION_HAVE_NAME;
				} else if (tok.is(Token::TOKEN_BRACKET_CLOSE)) {
					/* Empty section name: back to global scope */
					onParseSectionName("");
					state = CPS_SECTION_CLOSED;
				} else if (tok.is(Token::TOKEN_EOL)) {
					state = CPS_DEFAULT;
				}
				break;

			case CPS_SECTION_HAVE_NAME:
				if (tok.is(Token::TOKEN_BRACKET_CLOSE)) {
					onParseSectionName(name);
					name.clear();
					state = CPS_SECTION_CLOSED;
				} else if (tok.is(Token::TOKEN_EOL)) {
					/* Lack of closing bracket */
					onParseSectionName(name);
					name.clear();
					state = CPS_DEFAULT;
				}
				break;

			case CPS_SECTION_CLOSED:
				if (tok.is(Token::TOKEN_EOL))
					state = CPS_DEFAULT;
				break;

			case CPS_DIRECTIVE_HAVE_NAME:
			case CPS_DIRECTIVE_VALUES:
				if (tok.is(Token::TOKEN_EOL)) {
					onParseDirective(name, values);
					name.clear();
					values.clear();
					state = CPS_DEFAULT;
				} else if (tok.is(Token::TOKEN_EQUAL) && state == CPS_DIRECTIVE_HAVE_NAME) {
					state = CPS_DIRECTIVE_VALUES;
				} else if (tok.is(Token::TOKEN_STRING) || tok.is(Token::TOKEN_QUOTED_STRING)) {
					values.push_back(tok.str);
					state = CPS_DIRECTIVE_VALUES;
				}
				break;
		}
	}

	switch (state) {
		case CPS_SECTION_HAVE_NAME:
			onParseSectionName(name);
			break;
		case CPS_DIRECTIVE_HAVE_NAME:
		case CPS_DIRECTIVE_VALUES:
			onParseDirective(name, values);
			break;
		case CPS_DEFAULT:
		case CPS_SECTION_OPENED:
		case CPS_SECTION_CLOSED:
			break;
	}
}


//
// UpsloadConfigParser
//

class UpsloadConfigParser : public ConfParser
{
public:
	UpsloadConfigParser(const std::string& buffer, UpsloadConfiguration& config):
		ConfParser(buffer), _config(config), _section() {}
	virtual ~UpsloadConfigParser() override;

protected:
	virtual void onParseSectionName(const std::string& sectionName) override
	{
		_section = sectionName;
	}

	virtual void onParseDirective(const std::string& directiveName, const ConfigParamList& values) override
	{
		_config.addDirective(_section, directiveName, values);
	}

private:
	UpsloadConfiguration& _config;
	std::string _section;
};

UpsloadConfigParser::~UpsloadConfigParser() {}


//
// UpsloadConfiguration
//

UpsloadConfiguration::UpsloadConfiguration() :
_sections()
{
}

UpsloadConfiguration::~UpsloadConfiguration() {}

void UpsloadConfiguration::parseFromString(const std::string& str)
{
	UpsloadConfigParser parser(str, *this);
	parser.parseConfig();
}

void UpsloadConfiguration::parseFromFile(const std::string& path)
{
	std::ifstream file(path.c_str());
	if (!file.is_open()) {
		throw std::runtime_error("Can not open configuration file " + path + ": " + strerror(errno));
	}

	std::stringstream content;
	content << file.rdbuf();
	if (file.bad()) {
		throw std::runtime_error("Can not read configuration file " + path);
	}

	upsdebugx(2, "%s: parsing %s", __func__, path.c_str());
	parseFromString(content.str());
}

void UpsloadConfiguration::addDirective(const std::string& section, const std::string& entry, const ConfigParamList& values)
{
	ConfigSection& sec = _sections[section];
	sec.name = section;
	/* Last occurrence wins */
	sec.entries[entry] = values;
}

Settable<std::string> UpsloadConfiguration::getStr(const std::string& ups, const std::string& entry)const
{
	SectionMap::const_iterator it;
	ConfigSection::EntryMap::const_iterator eit;

	if (!ups.empty()) {
		it = _sections.find(ups);
		if (it != _sections.end() && (eit = it->second.entries.find(entry)) != it->second.entries.end()) {
			goto found;
		}
	}

	it = _sections.find("");
	if (it == _sections.end() || (eit = it->second.entries.find(entry)) == it->second.entries.end()) {
		return Settable<std::string>();
	}

found:
	std::string res;
	for (ConfigParamList::const_iterator vit = eit->second.begin(); vit != eit->second.end(); ++vit) {
		if (vit != eit->second.begin())
			res += ' ';
		res += *vit;
	}
	return Settable<std::string>(res);
}

long UpsloadConfiguration::toNumber(const std::string& entry, const std::string& value)
{
	char *end = nullptr;

	errno = 0;
	long res = strtol(value.c_str(), &end, 10);
	if (value.empty() || errno != 0 || end == nullptr || *end != '\0') {
		throw std::invalid_argument("Invalid value '" + value + "' for '" + entry + "'");
	}
	return res;
}

uint16_t UpsloadConfiguration::parsePort(const std::string& value)
{
	long port = toNumber("port", value);
	if (port < 1 || port > 65535) {
		throw std::invalid_argument("Port " + value + " out of range");
	}
	return static_cast<uint16_t>(port);
}

time_t UpsloadConfiguration::parseTimeout(const std::string& value)
{
	return static_cast<time_t>(toNumber("timeout", value));
}

Settable<std::string> UpsloadConfiguration::getUpsName()const
{
	return getStr("", "ups");
}

Settable<std::string> UpsloadConfiguration::getServer(const std::string& ups)const
{
	return getStr(ups, "server");
}

Settable<uint16_t> UpsloadConfiguration::getPort(const std::string& ups)const
{
	Settable<std::string> str = getStr(ups, "port");
	if (!str.set())
		return Settable<uint16_t>();

	return Settable<uint16_t>(parsePort(*str));
}

Settable<time_t> UpsloadConfiguration::getTimeout(const std::string& ups)const
{
	Settable<std::string> str = getStr(ups, "timeout");
	if (!str.set())
		return Settable<time_t>();
	return Settable<time_t>(parseTimeout(*str));
}

Settable<std::string> UpsloadConfiguration::getUsername(const std::string& ups)const
{
	return getStr(ups, "username");
}

Settable<std::string> UpsloadConfiguration::getPassword(const std::string& ups)const
{
	return getStr(ups, "password");
}

Settable<int> UpsloadConfiguration::getDebugLevel()const
{
	Settable<std::string> str = getStr("", "debug");
	if (!str.set())
		return Settable<int>();
	return Settable<int>(static_cast<int>(toNumber("debug", *str)));
}

} /* namespace upsload */
