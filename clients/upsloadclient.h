/* upsloadclient.h - definitions for the upsload NUT client library

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

#ifndef UPSLOADCLIENT_HPP_SEEN
#define UPSLOADCLIENT_HPP_SEEN

#include "upsload/common.h"

#include <string>
#include <vector>
#include <exception>
#include <chrono>
#include <cstdint>
#include <ctime>

namespace upsload
{

class Transport;
class TcpTransport;
class Client;

/**
 * Basic upsload exception.
 */
class UpsloadException : public std::exception
{
public:
	UpsloadException(const std::string& msg):_msg(msg){}
	UpsloadException(const UpsloadException&) = default;
	UpsloadException& operator=(const UpsloadException&) = default;
	virtual ~UpsloadException() noexcept override;
	virtual const char * what() const noexcept override {return this->_msg.c_str();}
	virtual std::string str() const noexcept {return this->_msg;}
private:
	std::string _msg;
};

/**
 * System error, message built from errno.
 */
class SystemException : public UpsloadException
{
public:
	SystemException();
	SystemException(const SystemException&) = default;
	SystemException& operator=(const SystemException&) = default;
	virtual ~SystemException() noexcept override;
private:
	static std::string err();
};

/**
 * IO oriented exception: read or write failure on the connection.
 */
class IOException : public UpsloadException
{
public:
	IOException(const std::string& msg):UpsloadException(msg){}
	IOException(const IOException&) = default;
	IOException& operator=(const IOException&) = default;
	virtual ~IOException() noexcept override;
};

/**
 * The TCP connection to the server could not be established.
 */
class ConnectionException : public IOException
{
public:
	ConnectionException(const std::string& msg):IOException(msg){}
	ConnectionException(const ConnectionException&) = default;
	ConnectionException& operator=(const ConnectionException&) = default;
	virtual ~ConnectionException() noexcept override;
};

/**
 * Connection exception specialized for unknown host.
 */
class UnknownHostException : public ConnectionException
{
public:
	UnknownHostException():ConnectionException("Unknown host"){}
	UnknownHostException(const UnknownHostException&) = default;
	UnknownHostException& operator=(const UnknownHostException&) = default;
	virtual ~UnknownHostException() noexcept override;
};

/**
 * IO oriented exception when client is not connected.
 */
class NotConnectedException : public IOException
{
public:
	NotConnectedException():IOException("Not connected"){}
	NotConnectedException(const NotConnectedException&) = default;
	NotConnectedException& operator=(const NotConnectedException&) = default;
	virtual ~NotConnectedException() noexcept override;
};

/**
 * IO oriented exception when there is no response in time.
 */
class TimeoutException : public IOException
{
public:
	TimeoutException():IOException("Timeout"){}
	TimeoutException(const TimeoutException&) = default;
	TimeoutException& operator=(const TimeoutException&) = default;
	virtual ~TimeoutException() noexcept override;
};

/**
 * Error reported by the server with an "ERR <code> [<detail>]" line.
 * Known codes are mapped to ServerError::Code, any other one is kept
 * as UNKNOWN along with its raw text.
 */
class ServerError
{
public:
	typedef enum
	{
		UNKNOWN = 0,
		ACCESS_DENIED,
		UNKNOWN_UPS,
		VAR_NOT_SUPPORTED,
		CMD_NOT_SUPPORTED,
		INVALID_ARGUMENT,
		INSTCMD_FAILED,
		SET_FAILED,
		READONLY,
		TOO_LONG,
		FEATURE_NOT_SUPPORTED,
		FEATURE_NOT_CONFIGURED,
		ALREADY_SSL_MODE,
		DRIVER_NOT_CONNECTED,
		DATA_STALE,
		ALREADY_LOGGED_IN,
		INVALID_PASSWORD,
		ALREADY_SET_PASSWORD,
		INVALID_USERNAME,
		ALREADY_SET_USERNAME,
		USERNAME_REQUIRED,
		PASSWORD_REQUIRED,
		UNKNOWN_COMMAND,
		INVALID_VALUE
	} Code;

	ServerError(Code code, const std::string& token, const std::string& detail = "");

	/**
	 * Test if a reply line is an error line.
	 * \param line Reply line, without terminator.
	 */
	static bool isError(const std::string& line);
	/**
	 * Decode an error line.
	 * \param line Reply line, must start with "ERR".
	 */
	static ServerError parse(const std::string& line);
	/**
	 * Map an error token to its code, UNKNOWN if not recognized.
	 */
	static Code lookup(const std::string& token);
	/**
	 * Protocol token of a known code, empty for UNKNOWN.
	 */
	static std::string tokenOf(Code code);

	Code getCode()const{return _code;}
	/** Error token as sent by the server. */
	const std::string& getToken()const{return _token;}
	const std::string& getDetail()const{return _detail;}

	/**
	 * Whether the error means the session lacks privileges (or sent
	 * bad credentials) rather than a bad request.
	 */
	bool isAuthenticationError()const;

	std::string str()const;

private:
	Code _code;
	std::string _token;
	std::string _detail;
};

/**
 * The server answered a request with an ERR line.
 */
class ProtocolException : public UpsloadException
{
public:
	ProtocolException(const ServerError& error);
	ProtocolException(const ProtocolException&) = default;
	ProtocolException& operator=(const ProtocolException&) = default;
	virtual ~ProtocolException() noexcept override;

	const ServerError& getError()const{return _error;}
	ServerError::Code getCode()const{return _error.getCode();}
	const std::string& getToken()const{return _error.getToken();}

private:
	ServerError _error;
};

/**
 * Authentication or authorization failure: USERNAME, PASSWORD or LOGIN
 * refused, or an instant command denied for lack of privileges.
 */
class AuthenticationException : public ProtocolException
{
public:
	AuthenticationException(const ServerError& error):ProtocolException(error){}
	AuthenticationException(const AuthenticationException&) = default;
	AuthenticationException& operator=(const AuthenticationException&) = default;
	virtual ~AuthenticationException() noexcept override;
};

/**
 * Reply does not match the request it should answer: the request/response
 * pairing of the connection is lost.
 */
class UnexpectedResponseException : public UpsloadException
{
public:
	UnexpectedResponseException(const std::string& request, const std::string& response);
	UnexpectedResponseException(const UnexpectedResponseException&) = default;
	UnexpectedResponseException& operator=(const UnexpectedResponseException&) = default;
	virtual ~UnexpectedResponseException() noexcept override;

	const std::string& getRequest()const{return _request;}
	const std::string& getResponse()const{return _response;}

private:
	std::string _request;
	std::string _response;
};

/**
 * Cookie returned by the server for tracked instant commands.
 * Empty when the server does not track the command.
 */
typedef std::string TrackingID;

/**
 * Instant commands the client is able to send.
 */
typedef enum
{
	LOAD_ON,
	LOAD_OFF
} InstantCommand;

/**
 * NUT name of an instant command ("load.on", "load.off").
 */
std::string instantCommandName(InstantCommand cmd);

/**
 * Address of a NUT data server.
 * Endpoint is a lightweight immutable value.
 */
class Endpoint
{
public:
	/**
	 * \param host Server host name.
	 * \param port Server port.
	 * \param timeout Timeout of network operations in seconds, negative to block.
	 */
	Endpoint(const std::string& host = UPSLOAD_DEFAULT_HOST,
		uint16_t port = UPSLOAD_DEFAULT_PORT,
		time_t timeout = UPSLOAD_DEFAULT_TIMEOUT);

	const std::string& getHost()const{return _host;}
	uint16_t getPort()const{return _port;}
	time_t getTimeout()const{return _timeout;}
	bool hasTimeout()const{return _timeout>=0;}

	/** "host:port" string for messages. */
	std::string str()const;

private:
	std::string _host;
	uint16_t _port;
	time_t _timeout;
};

/**
 * User credentials, only needed for privileged requests (INSTCMD).
 */
struct Credentials
{
	std::string username;
	std::string password;

	bool empty()const{return username.empty();}
};

/**
 * Everything a client needs to talk to one server.
 */
struct ClientConfig
{
	Endpoint endpoint;
	Credentials credentials;

	ClientConfig():endpoint(),credentials(){}
	ClientConfig(const Endpoint& ep, const Credentials& cred = Credentials()):
		endpoint(ep),credentials(cred){}
};

/**
 * Line oriented stream to a NUT server.
 */
class Transport
{
public:
	virtual ~Transport();

	/**
	 * Open the stream.
	 * \throw ConnectionException, TimeoutException
	 */
	virtual void connect(const Endpoint& endpoint) = 0;
	/**
	 * Close the stream. Can be called any number of times.
	 */
	virtual void disconnect() = 0;
	virtual bool isConnected()const = 0;

	/**
	 * Send one line, terminator is appended.
	 * \throw IOException, TimeoutException
	 */
	virtual void write(const std::string& line) = 0;
	/**
	 * Receive one line, without its terminator.
	 * \throw IOException, TimeoutException
	 */
	virtual std::string read() = 0;

protected:
	Transport();
};

/**
 * TCP transport.
 */
class TcpTransport : public Transport
{
public:
	TcpTransport();
	virtual ~TcpTransport() override;

	virtual void connect(const Endpoint& endpoint) override;
	virtual void disconnect() override;
	virtual bool isConnected()const override;

	virtual void write(const std::string& line) override;
	virtual std::string read() override;

protected:
	typedef std::chrono::steady_clock::time_point Deadline;

	/**
	 * Report a connection that no address accepted.
	 * \param err errno of the last address tried, ETIMEDOUT for a timeout
	 * \throw TimeoutException, ConnectionException
	 */
	static void connectFailure(const Endpoint& endpoint, int err);

	/** End of an operation started now */
	Deadline deadline()const;

	size_t read(void* buf, size_t sz, const Deadline& until);
	size_t write(const void* buf, size_t sz, const Deadline& until);

private:
	TcpTransport(const TcpTransport&) = delete;
	TcpTransport& operator=(const TcpTransport&) = delete;

	/** Wait for the socket to be ready before \a until, no wait when blocking */
	void waitReady(bool writing, const Deadline& until);

	int _sock;
	time_t _timeout;
	std::string _buffer; /* Received buffer, string because data should be text only. */
};

/**
 * NUT protocol client.
 * A client holds at most one connection and runs one request at a time.
 * The connection is closed when the client is destroyed.
 */
class Client
{
#ifdef _UPSLOADCLIENTTEST_BUILD
	friend class UpsloadClientTest;
#endif
public:
	typedef enum
	{
		DISCONNECTED,
		CONNECTED,
		AUTHENTICATED,
		/** Session aborted (authentication refused or lost request/response pairing). */
		FAILED
	} State;

	/**
	 * Construct a client talking TCP to config.endpoint.
	 * You must call Client::connect() after.
	 */
	explicit Client(const ClientConfig& config);
	/**
	 * Construct a client over a specific transport.
	 * \param transport Transport, owned by the client from now on.
	 */
	Client(const ClientConfig& config, Transport* transport);
	~Client();

	/**
	 * Open the connection; a previous (even failed) one is closed first.
	 */
	void connect();

	/**
	 * Close the connection, politely with LOGOUT if the session is healthy.
	 * Never fails: teardown errors are only logged.
	 */
	void disconnect();

	bool isConnected()const;
	State getState()const{return _state;}
	const ClientConfig& getConfig()const{return _config;}

	/**
	 * Authenticate with the configured credentials.
	 */
	void authenticate();
	/**
	 * Authenticate (USERNAME then PASSWORD).
	 * \throw AuthenticationException if the server refuses one of them,
	 * the session is aborted then.
	 */
	void authenticate(const std::string& user, const std::string& passwd);

	/**
	 * Register the authenticated user on the device (LOGIN).
	 * \param ups Device name.
	 */
	void deviceLogin(const std::string& ups);

	/**
	 * Retrieve the raw value of a variable.
	 * \param ups Device name.
	 * \param name Variable name.
	 * \return Value, exactly as quoted by the server.
	 */
	std::string getVariable(const std::string& ups, const std::string& name);

	/**
	 * Execute an instant command.
	 * \param ups Device name.
	 * \param cmd Command.
	 * \return Tracking ID, empty if the server does not track commands.
	 */
	TrackingID executeCommand(const std::string& ups, InstantCommand cmd);

protected:
	std::string sendQuery(const std::string& req);
	void requireSession();
	void abort(State state);
	void expectOk(const std::string& req, const std::string& reply);

	static void detectError(const std::string& reply);
	static std::string decodeVariable(const std::string& ups, const std::string& name, const std::string& reply);
	static void checkName(const std::string& what, const std::string& name);
	static std::string quoteArg(const std::string& arg);
	static std::vector<std::string> explode(const std::string& str, size_t begin=0);
	static std::string escape(const std::string& str);
	static std::string mask(const std::string& req);

private:
	Client(const Client&) = delete;
	Client& operator=(const Client&) = delete;

	ClientConfig _config;
	Transport* _transport;
	State _state;
	/* Reason of the FAILED state when it comes from the server */
	ServerError _failure;
	bool _authFailed;
};

} /* namespace upsload */

#endif	/* UPSLOADCLIENT_HPP_SEEN */
