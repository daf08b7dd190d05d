/* upsloadtransportmock.cpp - scripted in-memory transport for upsload tests

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

#include "upsloadtransportmock.h"

namespace upsload
{

/*
 *
 * Transport Mock implementation
 *
 */

TransportMock::TransportMock(Journal& journal):
Transport(),
_journal(journal),
_connected(false),
_connect(CONNECT_OK),
_script(),
_pending()
{
}

TransportMock::~TransportMock()
{
}

void TransportMock::onRequest(const std::string& req, const std::string& reply)
{
	Reply rep;
	rep.line = reply;
	rep.timeout = false;
	_script[req].push_back(rep);
}

void TransportMock::onRequestTimeout(const std::string& req)
{
	Reply rep;
	rep.timeout = true;
	_script[req].push_back(rep);
}

void TransportMock::failConnect(bool unknownHost)
{
	_connect = unknownHost ? CONNECT_UNKNOWN_HOST : CONNECT_REFUSED;
}

void TransportMock::connect(const Endpoint& endpoint)
{
	disconnect();

	switch(_connect)
	{
	case CONNECT_UNKNOWN_HOST:
		throw UnknownHostException();
	case CONNECT_REFUSED:
		throw ConnectionException("Cannot connect to " + endpoint.str() + ": Connection refused");
	case CONNECT_OK:
		break;
	}

	_connected = true;
	++_journal.connects;
}

void TransportMock::disconnect()
{
	if(_connected)
	{
		_connected = false;
		++_journal.closes;
	}
	_pending.clear();
}

bool TransportMock::isConnected()const
{
	return _connected;
}

TransportMock::Reply TransportMock::replyTo(const std::string& req)
{
	std::map<std::string, std::deque<Reply> >::iterator it = _script.find(req);
	if(it != _script.end() && !it->second.empty())
	{
		Reply rep = it->second.front();
		if(it->second.size() > 1)
			it->second.pop_front();
		return rep;
	}

	Reply rep;
	rep.timeout = false;
	rep.line = (req == "LOGOUT") ? "OK Goodbye" : "ERR UNKNOWN-COMMAND";
	return rep;
}

void TransportMock::write(const std::string& line)
{
	if(!_connected)
	{
		throw NotConnectedException();
	}

	_journal.sent.push_back(line);

	Reply rep = replyTo(line);
	if(!rep.timeout)
	{
		_pending.push_back(rep.line);
	}
}

std::string TransportMock::read()
{
	if(!_connected)
	{
		throw NotConnectedException();
	}
	if(_pending.empty())
	{
		/* Nothing will ever come */
		throw TimeoutException();
	}

	std::string res = _pending.front();
	_pending.pop_front();
	return res;
}

} /* namespace upsload */
