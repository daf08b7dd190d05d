/*
    upsloadconf.hpp - upsload configuration file parsing

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

#ifndef UPSLOAD_UPSLOADCONF_HPP_SEEN
#define UPSLOAD_UPSLOADCONF_HPP_SEEN 1

#include <string>
#include <list>
#include <map>
#include <stdexcept>
#include <cstdint>
#include <ctime>

namespace upsload
{

/**
 * Helper to specify if a configuration variable is set or not.
 * In addition of its value.
 */
template<typename Type>
class Settable
{
protected:
	Type _value;
	bool _set;

public:
	Settable():_value(),_set(false){}
	Settable(const Type& val):_value(val), _set(true){}
	Settable(const Settable&) = default;
	Settable& operator=(const Settable&) = default;

	bool set()const{return _set;}
	void clear(){_set = false;}

	const Type& operator *()const
	{
		if (!set())
			throw std::invalid_argument("Settable value is not set");
		return _value;
	}

	/** Value if set, \a dflt otherwise. */
	Type value_or(const Type& dflt)const{return _set ? _value : dflt;}

	Settable<Type>& operator=(const Type& val){_value = val; _set = true; return *this;}
};


typedef std::list<std::string> ConfigParamList;

/**
 * Tokenizer and parser of the NUT configuration file syntax:
 * '#' comments, '[section]' headers and 'name [=] value...' directives
 * with quoted strings and '\' escapes.
 */
class ConfParser
{
public:
	struct Token
	{
		enum TokenType {
			TOKEN_UNKNOWN = -1,
			TOKEN_NONE    = 0,
			TOKEN_STRING  = 1,
			TOKEN_QUOTED_STRING,
			TOKEN_COMMENT,
			TOKEN_BRACKET_OPEN,
			TOKEN_BRACKET_CLOSE,
			TOKEN_EQUAL,
			TOKEN_EOL
		} type;
		std::string str;

		Token():type(TOKEN_NONE),str(){}
		Token(TokenType type_arg, const std::string& str_arg=""):type(type_arg),str(str_arg){}
		Token(TokenType type_arg, char c):type(type_arg),str(1, c){}

		bool is(TokenType type_arg)const{return this->type==type_arg;}
		bool operator==(const Token& tok)const{return tok.type==type && tok.str==str;}
		operator bool()const{return type!=TOKEN_UNKNOWN && type!=TOKEN_NONE;}
	};

	ConfParser(const std::string& buffer);
	virtual ~ConfParser();

	/** Next token, spaces skipped. */
	Token parseToken();

	/** Run the whole buffer through the on*() callbacks. */
	void parseConfig();

protected:
	virtual void onParseSectionName(const std::string& sectionName) = 0;
	virtual void onParseDirective(const std::string& directiveName, const ConfigParamList& values) = 0;

	char get();
	void back();

private:
	std::string _buffer;
	size_t _pos;
};


struct ConfigSection
{
	typedef std::map<std::string, ConfigParamList> EntryMap;

	std::string name;
	EntryMap entries;

	bool has(const std::string& entry)const{return entries.find(entry) != entries.end();}
};

/**
 * upsload settings file.
 *
 * Directives outside any section are global, a section named after a UPS
 * overrides them for that UPS.
 */
class UpsloadConfiguration
{
public:
	typedef std::map<std::string, ConfigSection> SectionMap;

	UpsloadConfiguration();
	~UpsloadConfiguration();

	void parseFromString(const std::string& str);
	/**
	 * \throw std::runtime_error if the file can not be read.
	 */
	void parseFromFile(const std::string& path);

	/**
	 * Raw value of an entry, looked up in the UPS section then globally.
	 * \param ups UPS (section) name, empty for global scope only.
	 * \param entry Entry name.
	 */
	Settable<std::string> getStr(const std::string& ups, const std::string& entry)const;

	/** Global "ups" directive. */
	Settable<std::string> getUpsName()const;

	Settable<std::string> getServer(const std::string& ups)const;
	/**
	 * \throw std::invalid_argument on a value out of 1..65535.
	 */
	Settable<uint16_t> getPort(const std::string& ups)const;
	/**
	 * \throw std::invalid_argument on a non numeric value.
	 */
	Settable<time_t> getTimeout(const std::string& ups)const;
	Settable<std::string> getUsername(const std::string& ups)const;
	Settable<std::string> getPassword(const std::string& ups)const;
	Settable<int> getDebugLevel()const;

	const SectionMap& getSections()const{return _sections;}

	/**
	 * Validate a port number given as text.
	 * \throw std::invalid_argument if not a number in 1..65535.
	 */
	static uint16_t parsePort(const std::string& value);
	/**
	 * Validate a timeout given as text, in seconds.
	 * \throw std::invalid_argument if not a number.
	 */
	static time_t parseTimeout(const std::string& value);

protected:
	friend class UpsloadConfigParser;

	void addDirective(const std::string& section, const std::string& entry, const ConfigParamList& values);

	static long toNumber(const std::string& entry, const std::string& value);

private:
	SectionMap _sections;
};

} /* namespace upsload */

#endif	/* UPSLOAD_UPSLOADCONF_HPP_SEEN */
