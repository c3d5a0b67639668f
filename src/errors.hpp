#pragma once

#include <stdexcept>
#include <string>

class BulkFtpError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Unknown server name, malformed credential blob, bad setting.
class ConfigurationError : public BulkFtpError {
public:
  using BulkFtpError::BulkFtpError;
};

// Anything that fails before the session is logged in.
class AuthenticationError : public BulkFtpError {
public:
  using BulkFtpError::BulkFtpError;
};

// Destination exists and overwrite was not requested.
class AlreadyExistsError : public BulkFtpError {
public:
  using BulkFtpError::BulkFtpError;
};

// A protocol command was refused, or the connection broke mid-command.
// code() is the reply code, 0 when no reply was received.
class RemoteError : public BulkFtpError {
public:
  RemoteError(int code, const std::string& message)
    : BulkFtpError(message), code_(code) {}

  int code() const { return code_; }

private:
  int code_ = 0;
};

class LocalIOError : public BulkFtpError {
public:
  using BulkFtpError::BulkFtpError;
};
