/* upsloadclient.cpp - upsload NUT client library implementation

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

#include "upsloadclient.h"

#include <sstream>
#include <chrono>
#include <cinttypes>

#include <errno.h>
#include <string.h>
#include <stdio.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>	/* close */
#include <netdb.h>	/* getaddrinfo */
#include <fcntl.h>

#ifndef INVALID_SOCKET
# define INVALID_SOCKET -1
#endif

#ifndef MSG_NOSIGNAL
# define MSG_NOSIGNAL 0
#endif

/* Attempts of getaddrinfo() while the resolver answers EAI_AGAIN */
#define GETADDRINFO_RETRIES	3

namespace upsload
{

SystemException::SystemException():
UpsloadException(err())
{
}

std::string SystemException::err()
{
	if(errno==0)
		return "Undefined system error";
	else
	{
		std::stringstream str;
		str << "System error " << errno << ": " << strerror(errno);
		return str.str();
	}
}

/* Implemented out-of-line to avoid "Weak vtables" warnings */
UpsloadException::~UpsloadException() noexcept {}
SystemException::~SystemException() noexcept {}
IOException::~IOException() noexcept {}
ConnectionException::~ConnectionException() noexcept {}
UnknownHostException::~UnknownHostException() noexcept {}
NotConnectedException::~NotConnectedException() noexcept {}
TimeoutException::~TimeoutException() noexcept {}
ProtocolException::~ProtocolException() noexcept {}
AuthenticationException::~AuthenticationException() noexcept {}
UnexpectedResponseException::~UnexpectedResponseException() noexcept {}


/*
 *
 * Server errors
 *
 */

namespace
{

struct ErrorToken
{
	ServerError::Code code;
	const char* token;
};

/* Error tokens sent by upsd, see its neterr.h */
const ErrorToken errorTokens[] = {
	{ ServerError::ACCESS_DENIED,          "ACCESS-DENIED" },
	{ ServerError::UNKNOWN_UPS,            "UNKNOWN-UPS" },
	{ ServerError::VAR_NOT_SUPPORTED,      "VAR-NOT-SUPPORTED" },
	{ ServerError::CMD_NOT_SUPPORTED,      "CMD-NOT-SUPPORTED" },
	{ ServerError::INVALID_ARGUMENT,       "INVALID-ARGUMENT" },
	{ ServerError::INSTCMD_FAILED,         "INSTCMD-FAILED" },
	{ ServerError::SET_FAILED,             "SET-FAILED" },
	{ ServerError::READONLY,               "READONLY" },
	{ ServerError::TOO_LONG,               "TOO-LONG" },
	{ ServerError::FEATURE_NOT_SUPPORTED,  "FEATURE-NOT-SUPPORTED" },
	{ ServerError::FEATURE_NOT_CONFIGURED, "FEATURE-NOT-CONFIGURED" },
	{ ServerError::ALREADY_SSL_MODE,       "ALREADY-SSL-MODE" },
	{ ServerError::DRIVER_NOT_CONNECTED,   "DRIVER-NOT-CONNECTED" },
	{ ServerError::DATA_STALE,             "DATA-STALE" },
	{ ServerError::ALREADY_LOGGED_IN,      "ALREADY-LOGGED-IN" },
	{ ServerError::INVALID_PASSWORD,       "INVALID-PASSWORD" },
	{ ServerError::ALREADY_SET_PASSWORD,   "ALREADY-SET-PASSWORD" },
	{ ServerError::INVALID_USERNAME,       "INVALID-USERNAME" },
	{ ServerError::ALREADY_SET_USERNAME,   "ALREADY-SET-USERNAME" },
	{ ServerError::USERNAME_REQUIRED,      "USERNAME-REQUIRED" },
	{ ServerError::PASSWORD_REQUIRED,      "PASSWORD-REQUIRED" },
	{ ServerError::UNKNOWN_COMMAND,        "UNKNOWN-COMMAND" },
	{ ServerError::INVALID_VALUE,          "INVALID-VALUE" }
};

const size_t errorTokenCount = sizeof(errorTokens) / sizeof(errorTokens[0]);

} /* anonymous namespace */

ServerError::ServerError(Code code, const std::string& token, const std::string& detail):
_code(code),
_token(token),
_detail(detail)
{
}

bool ServerError::isError(const std::string& line)
{
	return line.compare(0, 3, "ERR") == 0
		&& (line.size() == 3 || line[3] == ' ');
}

ServerError ServerError::parse(const std::string& line)
{
	/* "ERR" SP code [SP detail] */
	size_t begin = line.find_first_not_of(' ', 3);
	if(begin == std::string::npos)
	{
		return ServerError(UNKNOWN, "");
	}

	size_t end = line.find(' ', begin);
	std::string token = line.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
	std::string detail;
	if(end != std::string::npos)
	{
		size_t dbegin = line.find_first_not_of(' ', end);
		if(dbegin != std::string::npos)
			detail = line.substr(dbegin);
	}

	return ServerError(lookup(token), token, detail);
}

ServerError::Code ServerError::lookup(const std::string& token)
{
	for(size_t n=0; n<errorTokenCount; ++n)
	{
		if(token == errorTokens[n].token)
			return errorTokens[n].code;
	}
	return UNKNOWN;
}

std::string ServerError::tokenOf(Code code)
{
	for(size_t n=0; n<errorTokenCount; ++n)
	{
		if(code == errorTokens[n].code)
			return errorTokens[n].token;
	}
	return "";
}

bool ServerError::isAuthenticationError()const
{
	switch(_code)
	{
	case ACCESS_DENIED:
	case INVALID_PASSWORD:
	case INVALID_USERNAME:
	case USERNAME_REQUIRED:
	case PASSWORD_REQUIRED:
		return true;
	default:
		return false;
	}
}

std::string ServerError::str()const
{
	std::string res = _token.empty() ? "ERR" : _token;
	if(!_detail.empty())
	{
		res += ": " + _detail;
	}
	return res;
}

ProtocolException::ProtocolException(const ServerError& error):
UpsloadException(error.str()),
_error(error)
{
}

UnexpectedResponseException::UnexpectedResponseException(const std::string& request, const std::string& response):
UpsloadException("Unexpected response to '" + request + "': '" + response + "'"),
_request(request),
_response(response)
{
}

std::string instantCommandName(InstantCommand cmd)
{
	switch(cmd)
	{
	case LOAD_ON:
		return "load.on";
	case LOAD_OFF:
		return "load.off";
	}
	throw UpsloadException("Invalid instant command");
}


/*
 *
 * Endpoint
 *
 */

Endpoint::Endpoint(const std::string& host, uint16_t port, time_t timeout):
_host(host),
_port(port),
_timeout(timeout)
{
}

std::string Endpoint::str()const
{
	std::stringstream str;
	if(_host.find(':') != std::string::npos)
		str << '[' << _host << "]:" << _port;	/* IPv6 literal */
	else
		str << _host << ':' << _port;
	return str.str();
}


/*
 *
 * Transport implementation
 *
 */

Transport::Transport()
{
}

Transport::~Transport()
{
}

TcpTransport::TcpTransport():
Transport(),
_sock(INVALID_SOCKET),
_timeout(-1),
_buffer()
{
}

TcpTransport::~TcpTransport()
{
	disconnect();
}

void TcpTransport::connect(const Endpoint& endpoint)
{
	int	sock_fd;
	struct addrinfo	hints, *res, *ai;
	char	sport[NI_MAXSERV];
	int	v, tries;
	int	lastErrno = 0;

	disconnect();
	_timeout = endpoint.getTimeout();

	if (endpoint.getHost().empty()) {
		upsdebugx(2, "%s: empty host name", __func__);
		throw UnknownHostException();
	}

	snprintf(sport, sizeof(sport), "%" PRIuMAX, static_cast<uintmax_t>(endpoint.getPort()));

	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_protocol = IPPROTO_TCP;

	upsdebugx(2, "%s: getaddrinfo(%s, %s)", __func__, endpoint.getHost().c_str(), sport);

	for (tries = 0; (v = getaddrinfo(endpoint.getHost().c_str(), sport, &hints, &res)) != 0; ) {
		switch (v)
		{
		case EAI_AGAIN:
			if (++tries < GETADDRINFO_RETRIES)
				continue;
			throw ConnectionException("Temporary failure in name resolution");
		case EAI_NONAME:
			upsdebugx(2, "%s: connect not successful: unknown host", __func__);
			throw UnknownHostException();
		case EAI_MEMORY:
			throw UpsloadException("Out of memory");
		case EAI_SYSTEM:
			throw SystemException();
		default:
			upsdebugx(2, "%s: getaddrinfo: %s", __func__, gai_strerror(v));
			throw ConnectionException(std::string("Cannot resolve host: ") + gai_strerror(v));
		}
	}

	for (ai = res; ai != nullptr; ai = ai->ai_next) {

		sock_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
		upsdebugx(3, "%s: socket(%d, %d, %d) = %d", __func__,
			ai->ai_family, ai->ai_socktype, ai->ai_protocol, sock_fd);

		if (sock_fd < 0) {
			switch (errno)
			{
			case EAFNOSUPPORT:
			case EINVAL:
				continue;
			default:
				freeaddrinfo(res);
				throw SystemException();
			}
		}

		/* non blocking connect */
		if (_timeout >= 0) {
			long fd_flags = fcntl(sock_fd, F_GETFL);
			fcntl(sock_fd, F_SETFL, fd_flags | O_NONBLOCK);
		}

		while ((v = ::connect(sock_fd, ai->ai_addr, ai->ai_addrlen)) < 0) {
			if (errno == EINPROGRESS) {
				fd_set	wfds;
				struct timeval	tv;
				int	error = 0;
				socklen_t	error_size = sizeof(error);

				tv.tv_sec = _timeout;
				tv.tv_usec = 0;
				FD_ZERO(&wfds);
				FD_SET(sock_fd, &wfds);
				if (select(sock_fd+1, nullptr, &wfds, nullptr, &tv) > 0
				&&  FD_ISSET(sock_fd, &wfds)
				) {
					getsockopt(sock_fd, SOL_SOCKET, SO_ERROR, &error, &error_size);
					if (error == 0) {
						upsdebugx(3, "%s: connect-select successful", __func__);
						v = 0;
						break;
					}
					errno = error;
				} else {
					upsdebugx(2, "%s: connect-select not successful: timeout", __func__);
					errno = ETIMEDOUT;
					v = -1;
					break;
				}
			}

			if (errno == EINTR || errno == EAGAIN)
				continue;
			break;
		}

		if (v < 0) {
			/* Only the last address tried is reported */
			lastErrno = errno;
			upsdebugx(2, "%s: connect not successful: %s", __func__, strerror(lastErrno));
			::close(sock_fd);
			continue;
		}

		/* switch back to blocking operation */
		if (_timeout >= 0) {
			long fd_flags = fcntl(sock_fd, F_GETFL);
			fcntl(sock_fd, F_SETFL, fd_flags & ~O_NONBLOCK);
		}

		_sock = sock_fd;
		break;
	}

	freeaddrinfo(res);

	if (_sock == INVALID_SOCKET) {
		connectFailure(endpoint, lastErrno);
	}

	upsdebugx(2, "%s: connected to %s", __func__, endpoint.str().c_str());
}

void TcpTransport::connectFailure(const Endpoint& endpoint, int err)
{
	if (err == ETIMEDOUT) {
		throw TimeoutException();
	}
	std::string msg = "Cannot connect to " + endpoint.str();
	if (err != 0) {
		msg += std::string(": ") + strerror(err);
	}
	throw ConnectionException(msg);
}

void TcpTransport::disconnect()
{
	if(_sock != INVALID_SOCKET)
	{
		::close(_sock);
		_sock = INVALID_SOCKET;
	}
	_buffer.clear();
}

bool TcpTransport::isConnected()const
{
	return _sock!=INVALID_SOCKET;
}

TcpTransport::Deadline TcpTransport::deadline()const
{
	return std::chrono::steady_clock::now() + std::chrono::seconds(_timeout > 0 ? _timeout : 0);
}

void TcpTransport::waitReady(bool writing, const Deadline& until)
{
	if(_timeout<0)
	{
		return;
	}

	while(true)
	{
		std::chrono::microseconds left = std::chrono::duration_cast<std::chrono::microseconds>(
			until - std::chrono::steady_clock::now());
		if(left.count() < 0)
		{
			left = std::chrono::microseconds(0);
		}

		fd_set fds;
		struct timeval tv;
		tv.tv_sec = static_cast<time_t>(left.count() / 1000000);
		tv.tv_usec = static_cast<suseconds_t>(left.count() % 1000000);
		FD_ZERO(&fds);
		FD_SET(_sock, &fds);
		int ret = select(_sock+1, writing ? nullptr : &fds, writing ? &fds : nullptr, nullptr, &tv);
		if(ret > 0)
		{
			return;
		}
		if(ret == 0)
		{
			throw TimeoutException();
		}
		if(errno != EINTR)
		{
			int err = errno;
			disconnect();
			throw IOException(std::string("Error while waiting on socket: ") + strerror(err));
		}
		/* Interrupted: go on with what is left */
	}
}

size_t TcpTransport::read(void* buf, size_t sz, const Deadline& until)
{
	if(!isConnected())
	{
		throw NotConnectedException();
	}

	waitReady(false, until);

	ssize_t res = ::recv(_sock, buf, sz, 0);
	if(res==-1)
	{
		disconnect();
		throw IOException("Error while reading on socket");
	}
	return static_cast<size_t>(res);
}

size_t TcpTransport::write(const void* buf, size_t sz, const Deadline& until)
{
	if(!isConnected())
	{
		throw NotConnectedException();
	}

	waitReady(true, until);

	ssize_t res = ::send(_sock, buf, sz, MSG_NOSIGNAL);
	if(res==-1)
	{
		disconnect();
		throw IOException("Error while writing on socket");
	}
	return static_cast<size_t>(res);
}

std::string TcpTransport::read()
{
	std::string res;
	char buff[256];
	/* The timeout bounds the whole line, not each chunk of it */
	const Deadline until = deadline();

	while(true)
	{
		// Look at already read data in _buffer
		size_t idx = _buffer.find('\n');
		if(idx!=std::string::npos)
		{
			res = _buffer.substr(0, idx);
			_buffer.erase(0, idx+1);
			if(!res.empty() && res[res.size()-1]=='\r')
			{
				res.erase(res.size()-1);
			}
			return res;
		}

		// Read new buffer
		size_t sz = read(&buff, sizeof(buff), until);
		if(sz==0)
		{
			disconnect();
			throw IOException("Server closed connection unexpectedly");
		}
		_buffer.append(buff, sz);
	}
}

void TcpTransport::write(const std::string& line)
{
	std::string buff = line + "\n";
	size_t done = 0;
	const Deadline until = deadline();
	while(done < buff.size())
	{
		done += write(buff.data() + done, buff.size() - done, until);
	}
}


/*
 *
 * Client implementation
 *
 */

Client::Client(const ClientConfig& config):
_config(config),
_transport(new TcpTransport),
_state(DISCONNECTED),
_failure(ServerError::UNKNOWN, ""),
_authFailed(false)
{
	// Do not connect now
}

Client::Client(const ClientConfig& config, Transport* transport):
_config(config),
_transport(transport),
_state(DISCONNECTED),
_failure(ServerError::UNKNOWN, ""),
_authFailed(false)
{
	if(_transport == nullptr)
	{
		throw UpsloadException("No transport");
	}
}

Client::~Client()
{
	disconnect();
	delete _transport;
}

void Client::connect()
{
	if(_transport->isConnected())
	{
		disconnect();
	}

	_state = DISCONNECTED;
	_authFailed = false;
	_failure = ServerError(ServerError::UNKNOWN, "");

	upsdebugx(1, "Connecting to %s", _config.endpoint.str().c_str());
	try
	{
		_transport->connect(_config.endpoint);
	}
	catch(UpsloadException&)
	{
		_transport->disconnect();
		throw;
	}
	_state = CONNECTED;
}

void Client::disconnect()
{
	if(_transport->isConnected() && (_state == CONNECTED || _state == AUTHENTICATED))
	{
		try
		{
			upsdebugx(1, "%s: send 'LOGOUT'", __func__);
			_transport->write("LOGOUT");
			std::string reply = _transport->read();
			upsdebugx(1, "%s: recv '%s'", __func__, reply.c_str());
		}
		catch(std::exception& ex)
		{
			upsdebugx(1, "%s: LOGOUT failed, closing anyway: %s", __func__, ex.what());
		}
	}

	try
	{
		_transport->disconnect();
	}
	catch(std::exception& ex)
	{
		upsdebugx(1, "%s: error while closing connection: %s", __func__, ex.what());
	}

	if(_state != FAILED)
	{
		_state = DISCONNECTED;
	}
}

bool Client::isConnected()const
{
	return _transport->isConnected();
}

void Client::abort(State state)
{
	try
	{
		_transport->disconnect();
	}
	catch(std::exception& ex)
	{
		upsdebugx(1, "%s: error while closing connection: %s", __func__, ex.what());
	}
	_state = state;
}

void Client::requireSession()
{
	if(_state == FAILED)
	{
		if(_authFailed)
			throw AuthenticationException(_failure);
		throw NotConnectedException();
	}
	if(_state == DISCONNECTED || !_transport->isConnected())
	{
		throw NotConnectedException();
	}
}

std::string Client::sendQuery(const std::string& req)
{
	std::string reply;

	upsdebugx(1, "send '%s'", mask(req).c_str());
	try
	{
		_transport->write(req);
		reply = _transport->read();
	}
	catch(IOException& ex)
	{
		/* Nothing tells what the server got or will still send */
		upsdebugx(1, "'%s' aborted: %s", mask(req).c_str(), ex.what());
		abort(DISCONNECTED);
		throw;
	}
	upsdebugx(1, "recv '%s'", reply.c_str());

	return reply;
}

void Client::detectError(const std::string& reply)
{
	if(ServerError::isError(reply))
	{
		throw ProtocolException(ServerError::parse(reply));
	}
}

void Client::expectOk(const std::string& req, const std::string& reply)
{
	if(ServerError::isError(reply))
	{
		_failure = ServerError::parse(reply);
		_authFailed = true;
		abort(FAILED);
		throw AuthenticationException(_failure);
	}

	std::vector<std::string> res = explode(reply);
	if(res.empty() || res[0] != "OK")
	{
		abort(FAILED);
		throw UnexpectedResponseException(mask(req), reply);
	}
}

void Client::authenticate()
{
	if(_config.credentials.empty())
	{
		throw UpsloadException("No credentials configured");
	}
	authenticate(_config.credentials.username, _config.credentials.password);
}

void Client::authenticate(const std::string& user, const std::string& passwd)
{
	requireSession();

	std::string req = "USERNAME " + quoteArg(user);
	expectOk(req, sendQuery(req));

	req = "PASSWORD " + quoteArg(passwd);
	expectOk(req, sendQuery(req));

	_state = AUTHENTICATED;
}

void Client::deviceLogin(const std::string& ups)
{
	checkName("UPS", ups);
	requireSession();

	std::string req = "LOGIN " + ups;
	std::string reply = sendQuery(req);
	if(ServerError::isError(reply))
	{
		throw AuthenticationException(ServerError::parse(reply));
	}
	std::vector<std::string> res = explode(reply);
	if(res.empty() || res[0] != "OK")
	{
		abort(FAILED);
		throw UnexpectedResponseException(req, reply);
	}
}

std::string Client::getVariable(const std::string& ups, const std::string& name)
{
	checkName("UPS", ups);
	checkName("variable", name);
	requireSession();

	std::string reply = sendQuery("GET VAR " + ups + " " + name);
	detectError(reply);

	try
	{
		return decodeVariable(ups, name, reply);
	}
	catch(UnexpectedResponseException&)
	{
		abort(FAILED);
		throw;
	}
}

TrackingID Client::executeCommand(const std::string& ups, InstantCommand cmd)
{
	checkName("UPS", ups);
	requireSession();

	std::string req = "INSTCMD " + ups + " " + instantCommandName(cmd);
	std::string reply = sendQuery(req);
	if(ServerError::isError(reply))
	{
		ServerError err = ServerError::parse(reply);
		if(err.isAuthenticationError())
			throw AuthenticationException(err);
		throw ProtocolException(err);
	}

	std::vector<std::string> res = explode(reply);
	if(res.size() == 1 && res[0] == "OK")
	{
		return TrackingID("");
	}
	else if(res.size() == 3 && res[0] == "OK" && res[1] == "TRACKING")
	{
		return TrackingID(res[2]);
	}

	abort(FAILED);
	throw UnexpectedResponseException(req, reply);
}

std::string Client::decodeVariable(const std::string& ups, const std::string& name, const std::string& reply)
{
	/* VAR <ups> <name> "<value>" */
	std::string prefix = "VAR " + ups + " " + name + " \"";
	if(reply.size() < prefix.size() + 1
	|| reply.compare(0, prefix.size(), prefix) != 0
	|| reply[reply.size()-1] != '"'
	)
	{
		throw UnexpectedResponseException("GET VAR " + ups + " " + name, reply);
	}

	return reply.substr(prefix.size(), reply.size() - prefix.size() - 1);
}

void Client::checkName(const std::string& what, const std::string& name)
{
	if(name.empty())
	{
		throw UpsloadException("Empty " + what + " name");
	}
	for(size_t n=0; n<name.size(); ++n)
	{
		unsigned char c = static_cast<unsigned char>(name[n]);
		if(c <= ' ' || c == '"' || c == '\\' || c >= 0x7f)
		{
			throw UpsloadException("Invalid " + what + " name '" + name + "'");
		}
	}
}

std::string Client::quoteArg(const std::string& arg)
{
	bool quote = arg.empty();
	for(size_t n=0; n<arg.size(); ++n)
	{
		char c = arg[n];
		if(c == '\n' || c == '\r' || c == '\0')
		{
			throw UpsloadException("Invalid character in credentials");
		}
		if(c == ' ' || c == '\t' || c == '"' || c == '\\')
		{
			quote = true;
		}
	}
	return quote ? escape(arg) : arg;
}

std::string Client::mask(const std::string& req)
{
	if(req.compare(0, 9, "PASSWORD ") == 0)
		return "PASSWORD ********";
	return req;
}

std::vector<std::string> Client::explode(const std::string& str, size_t begin)
{
	std::vector<std::string> res;
	std::string temp;
	bool inToken = false;

	enum STATE {
		INIT,
		SIMPLE_STRING,
		QUOTED_STRING,
		SIMPLE_ESCAPE,
		QUOTED_ESCAPE
	} state = INIT;

	for(size_t idx=begin; idx<str.size(); ++idx)
	{
		char c = str[idx];
		switch(state)
		{
		case INIT:
			if(c==' ')
			{ /* Do nothing */ }
			else if(c=='"')
			{
				inToken = true;
				state = QUOTED_STRING;
			}
			else if(c=='\\')
			{
				inToken = true;
				state = SIMPLE_ESCAPE;
			}
			else
			{
				inToken = true;
				temp += c;
				state = SIMPLE_STRING;
			}
			break;
		case SIMPLE_STRING:
			if(c==' ')
			{
				res.push_back(temp);
				temp.clear();
				inToken = false;
				state = INIT;
			}
			else if(c=='\\')
			{
				state = SIMPLE_ESCAPE;
			}
			else
			{
				temp += c;
			}
			break;
		case QUOTED_STRING:
			if(c=='\\')
			{
				state = QUOTED_ESCAPE;
			}
			else if(c=='"')
			{
				res.push_back(temp);
				temp.clear();
				inToken = false;
				state = INIT;
			}
			else
			{
				temp += c;
			}
			break;
		case SIMPLE_ESCAPE:
			temp += c;
			state = SIMPLE_STRING;
			break;
		case QUOTED_ESCAPE:
			temp += c;
			state = QUOTED_STRING;
			break;
		}
	}

	if(inToken)
	{
		res.push_back(temp);
	}

	return res;
}

std::string Client::escape(const std::string& str)
{
	std::string res = "\"";

	for(size_t n=0; n<str.size(); n++)
	{
		char c = str[n];
		if(c=='"')
			res += "\\\"";
		else if(c=='\\')
			res += "\\\\";
		else
			res += c;
	}

	res += '"';
	return res;
}

} /* namespace upsload */
