/* upsloadtransportmock.h - scripted in-memory transport for upsload tests

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

#ifndef UPSLOADTRANSPORTMOCK_HPP_SEEN
#define UPSLOADTRANSPORTMOCK_HPP_SEEN

#include "upsloadclient.h"

#include <deque>
#include <map>

namespace upsload
{

/**
 * Transport mock.
 * Answers each request line with the reply scripted for it, like a upsd
 * would. Unscripted requests get "ERR UNKNOWN-COMMAND", LOGOUT gets
 * "OK Goodbye".
 */
class TransportMock : public Transport
{
public:
	/**
	 * What the client did with the transport.
	 * Outlives the mock, which is owned (and deleted) by the client.
	 */
	struct Journal
	{
		std::vector<std::string> sent;
		/** Successful connect() calls. */
		int connects;
		/** Closes of an open stream. */
		int closes;

		Journal():sent(),connects(0),closes(0){}
	};

	explicit TransportMock(Journal& journal);
	virtual ~TransportMock() override;

	/**
	 * Script the next reply to a request. Replies to the same request are
	 * served in order, the last one is then kept.
	 */
	void onRequest(const std::string& req, const std::string& reply);
	/**
	 * Script a request the server never answers.
	 */
	void onRequestTimeout(const std::string& req);
	/**
	 * Make connect() fail.
	 */
	void failConnect(bool unknownHost = false);

	virtual void connect(const Endpoint& endpoint) override;
	virtual void disconnect() override;
	virtual bool isConnected()const override;

	virtual void write(const std::string& line) override;
	virtual std::string read() override;

private:
	struct Reply
	{
		std::string line;
		bool timeout;
	};

	TransportMock(const TransportMock&) = delete;
	TransportMock& operator=(const TransportMock&) = delete;

	Reply replyTo(const std::string& req);

	Journal& _journal;
	bool _connected;
	enum { CONNECT_OK, CONNECT_REFUSED, CONNECT_UNKNOWN_HOST } _connect;
	std::map<std::string, std::deque<Reply> > _script;
	std::deque<std::string> _pending;
};

} /* namespace upsload */

#endif	/* UPSLOADTRANSPORTMOCK_HPP_SEEN */
