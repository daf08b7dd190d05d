/*
    upsloadconf_ut.cpp - configuration parser unit tests

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
using namespace upsload;

#include <string>
#include <cstdio>
#include <unistd.h>
using namespace std;

/* Current CPPUnit offends the honor of C++11 */
#ifdef __clang__
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wglobal-constructors"
# pragma clang diagnostic ignored "-Wexit-time-destructors"
#endif

#include <cppunit/extensions/HelperMacros.h>

/* Parser collecting what it sees */
class RecordingParser : public ConfParser
{
public:
	RecordingParser(const std::string& buffer):ConfParser(buffer),events(){}
	virtual ~RecordingParser() override;

	std::list<std::string> events;

protected:
	virtual void onParseSectionName(const std::string& sectionName) override
	{
		events.push_back("[" + sectionName + "]");
	}

	virtual void onParseDirective(const std::string& directiveName, const ConfigParamList& values) override
	{
		std::string ev = directiveName;
		for (ConfigParamList::const_iterator it = values.begin(); it != values.end(); ++it)
			ev += "|" + *it;
		events.push_back(ev);
	}
};

RecordingParser::~RecordingParser() {}


class UpsloadConfTest : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE( UpsloadConfTest );
		CPPUNIT_TEST( testParseToken );
		CPPUNIT_TEST( testParseTokenEscapes );
		CPPUNIT_TEST( testParseConfig );
		CPPUNIT_TEST( testSectionOverride );
		CPPUNIT_TEST( testNumbers );
		CPPUNIT_TEST( testSettable );
		CPPUNIT_TEST( testParseFromFile );
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() override {}
	void tearDown() override {}

	void testParseToken();
	void testParseTokenEscapes();
	void testParseConfig();
	void testSectionOverride();
	void testNumbers();
	void testSettable();
	void testParseFromFile();
};

// Registers the fixture into the 'registry'
CPPUNIT_TEST_SUITE_REGISTRATION( UpsloadConfTest );


void UpsloadConfTest::testParseToken()
{
	static const char src[] =
		"Bonjour monde\n"
		"[ceci]# Plouf\n"
		"\n"
		"titi = \"tata toto\"";
	RecordingParser parse(src);

	CPPUNIT_ASSERT_MESSAGE("Cannot find 1st token 'Bonjour'",
		parse.parseToken() == ConfParser::Token(ConfParser::Token::TOKEN_STRING, "Bonjour"));
	CPPUNIT_ASSERT_MESSAGE("Cannot find 2nd token 'monde'",
		parse.parseToken() == ConfParser::Token(ConfParser::Token::TOKEN_STRING, "monde"));
	CPPUNIT_ASSERT_MESSAGE("Cannot find 1st EOL",
		parse.parseToken().is(ConfParser::Token::TOKEN_EOL));
	CPPUNIT_ASSERT_MESSAGE("Cannot find '['",
		parse.parseToken().is(ConfParser::Token::TOKEN_BRACKET_OPEN));
	CPPUNIT_ASSERT_MESSAGE("Cannot find 'ceci'",
		parse.parseToken() == ConfParser::Token(ConfParser::Token::TOKEN_STRING, "ceci"));
	CPPUNIT_ASSERT_MESSAGE("Cannot find ']'",
		parse.parseToken().is(ConfParser::Token::TOKEN_BRACKET_CLOSE));
	CPPUNIT_ASSERT_MESSAGE("Cannot find comment 'Plouf'",
		parse.parseToken() == ConfParser::Token(ConfParser::Token::TOKEN_COMMENT, " Plouf"));
	CPPUNIT_ASSERT_MESSAGE("Cannot find 2nd EOL",
		parse.parseToken().is(ConfParser::Token::TOKEN_EOL));
	CPPUNIT_ASSERT_MESSAGE("Cannot find 3rd EOL",
		parse.parseToken().is(ConfParser::Token::TOKEN_EOL));
	CPPUNIT_ASSERT_MESSAGE("Cannot find 'titi'",
		parse.parseToken() == ConfParser::Token(ConfParser::Token::TOKEN_STRING, "titi"));
	CPPUNIT_ASSERT_MESSAGE("Cannot find '='",
		parse.parseToken().is(ConfParser::Token::TOKEN_EQUAL));
	CPPUNIT_ASSERT_MESSAGE("Cannot find '\"tata toto\"'",
		parse.parseToken() == ConfParser::Token(ConfParser::Token::TOKEN_QUOTED_STRING, "tata toto"));
	CPPUNIT_ASSERT_MESSAGE("Cannot find end of input",
		!parse.parseToken());
}

void UpsloadConfTest::testParseTokenEscapes()
{
	RecordingParser parse("pass\\ word \"say \\\"hi\\\"\" back\\\\slash");

	CPPUNIT_ASSERT(parse.parseToken() == ConfParser::Token(ConfParser::Token::TOKEN_STRING, "pass word"));
	CPPUNIT_ASSERT(parse.parseToken() == ConfParser::Token(ConfParser::Token::TOKEN_QUOTED_STRING, "say \"hi\""));
	CPPUNIT_ASSERT(parse.parseToken() == ConfParser::Token(ConfParser::Token::TOKEN_STRING, "back\\slash"));
}

void UpsloadConfTest::testParseConfig()
{
	RecordingParser parse(
		"# upsload settings\n"
		"server = localhost\n"
		"ups=myups\n"
		"password = \"sec ret\"  # trailing comment\n"
		"\n"
		"[otherups]\n"
		"server 10.0.0.2\n"
		"[broken\n"
		"port = 3494");
	parse.parseConfig();

	std::list<std::string>::const_iterator it = parse.events.begin();
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(7), parse.events.size());
	CPPUNIT_ASSERT_EQUAL(std::string("server|localhost"), *it++);
	CPPUNIT_ASSERT_EQUAL(std::string("ups|myups"), *it++);
	CPPUNIT_ASSERT_EQUAL(std::string("password|sec ret"), *it++);
	CPPUNIT_ASSERT_EQUAL(std::string("[otherups]"), *it++);
	CPPUNIT_ASSERT_EQUAL(std::string("server|10.0.0.2"), *it++);
	CPPUNIT_ASSERT_EQUAL(std::string("[broken]"), *it++);
	CPPUNIT_ASSERT_EQUAL(std::string("port|3494"), *it++);
}

void UpsloadConfTest::testSectionOverride()
{
	UpsloadConfiguration conf;
	conf.parseFromString(
		"server = nut.example.org\n"
		"port = 3493\n"
		"ups = myups\n"
		"username = monuser\n"
		"password = \"sec ret\"\n"
		"\n"
		"[otherups]\n"
		"server = 10.0.0.2\n"
		"port = 3494\n"
		"username = admin\n");

	CPPUNIT_ASSERT_EQUAL(std::string("myups"), *conf.getUpsName());

	CPPUNIT_ASSERT_EQUAL(std::string("nut.example.org"), *conf.getServer("myups"));
	CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(3493), *conf.getPort("myups"));
	CPPUNIT_ASSERT_EQUAL(std::string("monuser"), *conf.getUsername("myups"));

	CPPUNIT_ASSERT_EQUAL(std::string("10.0.0.2"), *conf.getServer("otherups"));
	CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(3494), *conf.getPort("otherups"));
	CPPUNIT_ASSERT_EQUAL(std::string("admin"), *conf.getUsername("otherups"));
	/* Not overridden: global one */
	CPPUNIT_ASSERT_EQUAL(std::string("sec ret"), *conf.getPassword("otherups"));

	CPPUNIT_ASSERT(!conf.getTimeout("myups").set());
	CPPUNIT_ASSERT(!conf.getDebugLevel().set());

	/* Section directives stay out of the global scope */
	CPPUNIT_ASSERT_EQUAL(std::string("nut.example.org"), *conf.getServer(""));
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), conf.getSections().size());
}

void UpsloadConfTest::testNumbers()
{
	UpsloadConfiguration conf;
	conf.parseFromString(
		"timeout = -1\n"
		"debug = 2\n"
		"[bad]\n"
		"port = 70000\n"
		"timeout = soon\n"
		"[worse]\n"
		"port = 34x\n");

	CPPUNIT_ASSERT_EQUAL(static_cast<time_t>(-1), *conf.getTimeout("myups"));
	CPPUNIT_ASSERT_EQUAL(2, *conf.getDebugLevel());

	CPPUNIT_ASSERT_THROW(conf.getPort("bad"), std::invalid_argument);
	CPPUNIT_ASSERT_THROW(conf.getTimeout("bad"), std::invalid_argument);
	CPPUNIT_ASSERT_THROW(conf.getPort("worse"), std::invalid_argument);

	CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(3493), UpsloadConfiguration::parsePort("3493"));
	CPPUNIT_ASSERT_THROW(UpsloadConfiguration::parsePort("0"), std::invalid_argument);
	CPPUNIT_ASSERT_THROW(UpsloadConfiguration::parsePort(""), std::invalid_argument);
	CPPUNIT_ASSERT_EQUAL(static_cast<time_t>(10), UpsloadConfiguration::parseTimeout("10"));
	CPPUNIT_ASSERT_THROW(UpsloadConfiguration::parseTimeout("10s"), std::invalid_argument);
}

void UpsloadConfTest::testSettable()
{
	Settable<int> val;

	CPPUNIT_ASSERT(!val.set());
	CPPUNIT_ASSERT_THROW(*val, std::invalid_argument);
	CPPUNIT_ASSERT_EQUAL(5, val.value_or(5));

	val = 3;
	CPPUNIT_ASSERT(val.set());
	CPPUNIT_ASSERT_EQUAL(3, *val);
	CPPUNIT_ASSERT_EQUAL(3, val.value_or(5));

	val.clear();
	CPPUNIT_ASSERT(!val.set());
}

void UpsloadConfTest::testParseFromFile()
{
	char path[] = "/tmp/upsloadconf_ut.XXXXXX";
	int fd = mkstemp(path);
	CPPUNIT_ASSERT_MESSAGE("Cannot create temporary file", fd >= 0);

	static const char content[] = "ups = fileups\n[fileups]\ntimeout = 7\n";
	ssize_t written = write(fd, content, sizeof(content) - 1);
	close(fd);
	CPPUNIT_ASSERT_EQUAL(static_cast<ssize_t>(sizeof(content) - 1), written);

	UpsloadConfiguration conf;
	conf.parseFromFile(path);
	unlink(path);

	CPPUNIT_ASSERT_EQUAL(std::string("fileups"), *conf.getUpsName());
	CPPUNIT_ASSERT_EQUAL(static_cast<time_t>(7), *conf.getTimeout("fileups"));

	UpsloadConfiguration missing;
	CPPUNIT_ASSERT_THROW(missing.parseFromFile(path), std::runtime_error);
}

#ifdef __clang__
# pragma clang diagnostic pop
#endif
