/*
    upsloadtransport_ut.cpp - TCP transport and end-to-end client tests

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

#include "upsload/common.h"
#include "../clients/upsloadclient.h"
#include "mockupsd.h"

#include <chrono>
#include <iostream>
#include <thread>

#include <errno.h>
#include <string.h>

extern bool verbose;

/* Current CPPUnit offends the honor of C++11 */
#ifdef __clang__
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wglobal-constructors"
# pragma clang diagnostic ignored "-Wexit-time-destructors"
#endif

#include <cppunit/extensions/HelperMacros.h>

using upsload::test::MockUpsd;


/* Exposes how a connection no address accepted is reported */
class ReportingTransport : public upsload::TcpTransport {
	public:
	using upsload::TcpTransport::connectFailure;
};


/**
 *  \brief  TCP transport test
 */
class UpsloadTransportTest: public CppUnit::TestFixture {
	private:

	CPPUNIT_TEST_SUITE(UpsloadTransportTest);
		CPPUNIT_TEST(testGetVariable);
		CPPUNIT_TEST(testCrLfReplies);
		CPPUNIT_TEST(testPowerFallback);
		CPPUNIT_TEST(testInstCmdAccessDenied);
		CPPUNIT_TEST(testReadTimeout);
		CPPUNIT_TEST(testTrickledReply);
		CPPUNIT_TEST(testTrickledReplyTimeout);
		CPPUNIT_TEST(testConnectionRefused);
		CPPUNIT_TEST(testConnectFailureLastAddress);
		CPPUNIT_TEST(testUnknownHost);
		CPPUNIT_TEST(testLogout);
	CPPUNIT_TEST_SUITE_END();

	/** Client of \a server with a short timeout */
	static upsload::ClientConfig config(const MockUpsd & server, time_t timeout = 2);

	/** Wait (a bit) for the server to see \a count requests */
	static void waitReceived(const MockUpsd & server, size_t count);

	public:

	inline void setUp() override {}
	inline void tearDown() override {}

	void testGetVariable();
	void testCrLfReplies();
	void testPowerFallback();
	void testInstCmdAccessDenied();
	void testReadTimeout();
	void testTrickledReply();
	void testTrickledReplyTimeout();
	void testConnectionRefused();
	void testConnectFailureLastAddress();
	void testUnknownHost();
	void testLogout();

};  // end of class UpsloadTransportTest


// Register the test suite
CPPUNIT_TEST_SUITE_REGISTRATION(UpsloadTransportTest);


upsload::ClientConfig UpsloadTransportTest::config(const MockUpsd & server, time_t timeout) {
	return upsload::ClientConfig(upsload::Endpoint("127.0.0.1", server.getPort(), timeout));
}


void UpsloadTransportTest::waitReceived(const MockUpsd & server, size_t count) {
	for (int i = 0; i < 100 && server.getReceived().size() < count; ++i)
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
}


void UpsloadTransportTest::testGetVariable() {
	MockUpsd server;
	server.reply("GET VAR myups input.voltage", "VAR myups input.voltage \"230.1\"");
	server.start();

	upsload::Client client(config(server));
	client.connect();

	CPPUNIT_ASSERT(client.isConnected());
	CPPUNIT_ASSERT_EQUAL(std::string("230.1"), client.getVariable("myups", "input.voltage"));

	std::vector<std::string> received = server.getReceived();
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), received.size());
	CPPUNIT_ASSERT_EQUAL(std::string("GET VAR myups input.voltage"), received[0]);
}


void UpsloadTransportTest::testCrLfReplies() {
	MockUpsd server;
	server.setLineEnding("\r\n");
	server.reply("GET VAR myups ups.status", "VAR myups ups.status \"OL CHRG\"");
	server.reply("GET VAR myups ups.load", "VAR myups ups.load \"23\"");
	server.start();

	upsload::Client client(config(server));
	client.connect();

	CPPUNIT_ASSERT_EQUAL(std::string("OL CHRG"), client.getVariable("myups", "ups.status"));
	CPPUNIT_ASSERT_EQUAL(std::string("23"), client.getVariable("myups", "ups.load"));
}


void UpsloadTransportTest::testPowerFallback() {
	MockUpsd server;
	server.reply("GET VAR myups ups.realpower", "ERR VAR-NOT-SUPPORTED");
	server.reply("GET VAR myups output.voltage", "VAR myups output.voltage \"230.0\"");
	server.start();

	upsload::Client client(config(server));
	client.connect();

	try {
		client.getVariable("myups", "ups.realpower");
		CPPUNIT_FAIL("ERR reply not reported");
	}
	catch (upsload::ProtocolException & e) {
		CPPUNIT_ASSERT_EQUAL(upsload::ServerError::VAR_NOT_SUPPORTED, e.getCode());
	}

	CPPUNIT_ASSERT_EQUAL(std::string("230.0"), client.getVariable("myups", "output.voltage"));
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), server.getConnections());
}


void UpsloadTransportTest::testInstCmdAccessDenied() {
	MockUpsd server;
	server.reply("INSTCMD myups load.off", "ERR ACCESS-DENIED");
	server.start();

	upsload::Client client(config(server));
	client.connect();

	try {
		client.executeCommand("myups", upsload::LOAD_OFF);
		CPPUNIT_FAIL("ACCESS-DENIED not reported");
	}
	catch (upsload::AuthenticationException & e) {
		CPPUNIT_ASSERT_EQUAL(upsload::ServerError::ACCESS_DENIED, e.getCode());
	}

	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), server.getReceived().size());
}


void UpsloadTransportTest::testReadTimeout() {
	MockUpsd server;
	server.hang("GET VAR myups ups.load");
	server.start();

	upsload::Client client(config(server, 1));
	client.connect();

	std::chrono::steady_clock::time_point begin = std::chrono::steady_clock::now();
	CPPUNIT_ASSERT_THROW(client.getVariable("myups", "ups.load"), upsload::TimeoutException);
	std::chrono::steady_clock::duration spent = std::chrono::steady_clock::now() - begin;

	if (verbose)
		std::cerr << "timed out after "
			<< std::chrono::duration_cast<std::chrono::milliseconds>(spent).count()
			<< " ms" << std::endl;

	CPPUNIT_ASSERT(spent >= std::chrono::milliseconds(900));
	CPPUNIT_ASSERT(!client.isConnected());
	CPPUNIT_ASSERT_EQUAL(upsload::Client::DISCONNECTED, client.getState());

	/* The server sees the connection go, and no LOGOUT on it */
	for (int i = 0; i < 100 && server.getPeerCloses() < 1; ++i)
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), server.getPeerCloses());

	client.disconnect();
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), server.getReceived().size());
}


void UpsloadTransportTest::testTrickledReply() {
	MockUpsd server;
	server.setTrickle(10);
	server.reply("GET VAR myups input.voltage", "VAR myups input.voltage \"230.1\"");
	server.start();

	upsload::Client client(config(server, 2));
	client.connect();

	CPPUNIT_ASSERT_EQUAL(std::string("230.1"), client.getVariable("myups", "input.voltage"));
	CPPUNIT_ASSERT(client.isConnected());
}


void UpsloadTransportTest::testTrickledReplyTimeout() {
	/* A byte every 300 ms: the whole line takes about 10 s */
	MockUpsd server;
	server.setTrickle(300);
	server.reply("GET VAR myups input.voltage", "VAR myups input.voltage \"230.1\"");
	server.start();

	upsload::Client client(config(server, 1));
	client.connect();

	std::chrono::steady_clock::time_point begin = std::chrono::steady_clock::now();
	CPPUNIT_ASSERT_THROW(client.getVariable("myups", "input.voltage"), upsload::TimeoutException);
	std::chrono::steady_clock::duration spent = std::chrono::steady_clock::now() - begin;

	if (verbose)
		std::cerr << "trickled reply timed out after "
			<< std::chrono::duration_cast<std::chrono::milliseconds>(spent).count()
			<< " ms" << std::endl;

	CPPUNIT_ASSERT_MESSAGE("Timeout restarted on each received byte",
		spent < std::chrono::milliseconds(2500));
	CPPUNIT_ASSERT(spent >= std::chrono::milliseconds(900));
	CPPUNIT_ASSERT_EQUAL(upsload::Client::DISCONNECTED, client.getState());
}


void UpsloadTransportTest::testConnectionRefused() {
	upsload::Client client(upsload::ClientConfig(
		upsload::Endpoint("127.0.0.1", MockUpsd::unusedPort(), 2)));

	CPPUNIT_ASSERT_THROW(client.connect(), upsload::ConnectionException);
	CPPUNIT_ASSERT(!client.isConnected());
	CPPUNIT_ASSERT_THROW(client.getVariable("myups", "ups.load"), upsload::NotConnectedException);
}


void UpsloadTransportTest::testConnectFailureLastAddress() {
	upsload::Endpoint endpoint("nut.example.org", 3493, 1);

	/* First address timed out, the last one refused */
	try {
		ReportingTransport::connectFailure(endpoint, ECONNREFUSED);
		CPPUNIT_FAIL("Failure not reported");
	}
	catch (upsload::TimeoutException &) {
		CPPUNIT_FAIL("Refused connection reported as a timeout");
	}
	catch (upsload::ConnectionException & e) {
		CPPUNIT_ASSERT(std::string(e.what()).find(strerror(ECONNREFUSED)) != std::string::npos);
	}

	/* First address refused, the last one timed out */
	CPPUNIT_ASSERT_THROW(ReportingTransport::connectFailure(endpoint, ETIMEDOUT),
		upsload::TimeoutException);

	/* No address could even be tried */
	try {
		ReportingTransport::connectFailure(endpoint, 0);
		CPPUNIT_FAIL("Failure not reported");
	}
	catch (upsload::ConnectionException & e) {
		CPPUNIT_ASSERT_EQUAL(std::string("Cannot connect to ") + endpoint.str(), std::string(e.what()));
	}
}


void UpsloadTransportTest::testUnknownHost() {
	upsload::TcpTransport transport;

	CPPUNIT_ASSERT_THROW(transport.connect(upsload::Endpoint("", 3493, 2)),
		upsload::UnknownHostException);
	CPPUNIT_ASSERT(!transport.isConnected());
	CPPUNIT_ASSERT_THROW(transport.read(), upsload::NotConnectedException);
}


void UpsloadTransportTest::testLogout() {
	MockUpsd server;
	server.reply("GET VAR myups ups.load", "VAR myups ups.load \"23\"");
	server.start();

	{
		upsload::Client client(config(server));
		client.connect();
		client.getVariable("myups", "ups.load");
		/* Destructor logs out */
	}

	waitReceived(server, 2);
	std::vector<std::string> received = server.getReceived();
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), received.size());
	CPPUNIT_ASSERT_EQUAL(std::string("LOGOUT"), received[1]);
}

#ifdef __clang__
# pragma clang diagnostic pop
#endif
