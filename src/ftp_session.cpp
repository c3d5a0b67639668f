#include "ftp_session.hpp"

#include <openssl/ssl.h>

#include <array>
#include <istream>
#include <sstream>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kDataBlockSize = 64 * 1024;

bool is_end_of_stream(const std::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

RemoteError refused(const std::string& line, const FtpReply& reply) {
  // never echo the password back into logs or exceptions
  std::string shown = line.rfind("PASS ", 0) == 0 ? std::string("PASS ****") : line;
  return RemoteError(reply.code, fmt::format("'{}' refused: {} {}", shown, reply.code, reply.text));
}

} // namespace

std::unique_ptr<Session> FtpSession::connect(const ConnectionDescriptor& descriptor,
                                             std::shared_ptr<Logger> logger) {
  std::unique_ptr<FtpSession> session(new FtpSession(descriptor, std::move(logger)));
  session->open();
  return session;
}

SessionConnector FtpSession::connector(std::shared_ptr<Logger> logger) {
  return [logger](const ConnectionDescriptor& descriptor) {
    return FtpSession::connect(descriptor, logger);
  };
}

FtpSession::FtpSession(ConnectionDescriptor descriptor, std::shared_ptr<Logger> logger)
  : descriptor_(std::move(descriptor)),
    logger_(std::move(logger)),
    ssl_ctx_(asio::ssl::context::tls_client),
    control_(io_, ssl_ctx_) {
  ssl_ctx_.set_default_verify_paths();
  bool verify = descriptor_.options.value("verify_peer", false);
  ssl_ctx_.set_verify_mode(verify ? asio::ssl::verify_peer : asio::ssl::verify_none);
}

FtpSession::~FtpSession() {
  close();
}

void FtpSession::open() {
  try {
    tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(descriptor_.host, std::to_string(descriptor_.port));
    asio::connect(control_.next_layer(), endpoints);

    auto greeting = read_reply();
    if(!greeting.completed()) {
      throw AuthenticationError(fmt::format("{} rejected the connection: {} {}",
                                            descriptor_.host, greeting.code, greeting.text));
    }
    welcome_ = greeting.text;
    log_debug(logger_.get(), "{}", welcome_);

    if(descriptor_.use_tls) {
      expect("AUTH TLS", 234, 234);
      SSL_set_tlsext_host_name(control_.native_handle(), descriptor_.host.c_str());
      control_.handshake(asio::ssl::stream_base::client);
      tls_ = true;
    }

    auto reply = command("USER " + descriptor_.user);
    if(reply.intermediate()) {
      reply = command("PASS " + descriptor_.secret);
    }
    if(!reply.completed()) {
      throw AuthenticationError(fmt::format("login as '{}' on {} failed: {} {}",
                                            descriptor_.user, descriptor_.host, reply.code, reply.text));
    }

    if(tls_) {
      expect("PBSZ 0", 200, 299);
      expect("PROT P", 200, 299);
    }
  } catch(const AuthenticationError&) {
    throw;
  } catch(const std::exception& e) {
    throw AuthenticationError(fmt::format("cannot open session to {}:{}: {}",
                                          descriptor_.host, descriptor_.port, e.what()));
  }
}

void FtpSession::write_line(const std::string& line) {
  std::string wire = line + "\r\n";
  if(tls_) {
    asio::write(control_, asio::buffer(wire));
  } else {
    asio::write(control_.next_layer(), asio::buffer(wire));
  }
}

FtpReply FtpSession::read_reply() {
  for(;;) {
    if(tls_) {
      asio::read_until(control_, read_buf_, "\r\n");
    } else {
      asio::read_until(control_.next_layer(), read_buf_, "\r\n");
    }
    std::istream is(&read_buf_);
    std::string line;
    std::getline(is, line);
    if(parser_.feed(line)) return parser_.take();
  }
}

FtpReply FtpSession::command(const std::string& line) {
  if(closed_) throw RemoteError(0, "session is closed");
  log_debug(logger_.get(), "> {}", line.rfind("PASS ", 0) == 0 ? std::string("PASS ****") : line);
  try {
    write_line(line);
    auto reply = read_reply();
    log_debug(logger_.get(), "< {} {}", reply.code, reply.text);
    return reply;
  } catch(const std::system_error& e) {
    throw RemoteError(0, fmt::format("connection to {} lost: {}", descriptor_.host, e.what()));
  }
}

FtpReply FtpSession::expect(const std::string& line, int low, int high) {
  auto reply = command(line);
  if(reply.code < low || reply.code > high) throw refused(line, reply);
  return reply;
}

std::string FtpSession::current_directory() {
  auto reply = expect("PWD", 257, 257);
  auto path = parse_quoted_path(reply.text);
  if(!path) throw RemoteError(reply.code, "cannot parse PWD reply: " + reply.text);
  return *path;
}

void FtpSession::change_directory(const std::string& path) {
  expect("CWD " + path, 200, 299);
}

void FtpSession::make_directory(const std::string& path) {
  expect("MKD " + path, 200, 299);
}

void FtpSession::set_binary_mode() {
  expect("TYPE I", 200, 299);
}

std::unique_ptr<FtpSession::TlsStream> FtpSession::open_data_channel(const std::string& line) {
  auto pasv = expect("PASV", 227, 227);
  auto port = parse_pasv_port(pasv.text);
  if(!port) throw RemoteError(pasv.code, "cannot parse PASV reply: " + pasv.text);

  auto data = std::make_unique<TlsStream>(io_, ssl_ctx_);
  try {
    // the address inside the 227 reply is often a private one; reuse the control peer
    tcp::endpoint endpoint(control_.next_layer().remote_endpoint().address(), *port);
    data->next_layer().connect(endpoint);
  } catch(const std::system_error& e) {
    throw RemoteError(0, fmt::format("data connection to {}:{} failed: {}",
                                     descriptor_.host, *port, e.what()));
  }

  auto reply = command(line);
  if(!reply.preliminary()) throw refused(line, reply);

  if(tls_) {
    try {
      SSL_set_session(data->native_handle(), SSL_get_session(control_.native_handle()));
      data->handshake(asio::ssl::stream_base::client);
    } catch(const std::system_error& e) {
      throw RemoteError(0, fmt::format("TLS on data channel failed: {}", e.what()));
    }
  }
  return data;
}

void FtpSession::finish_data_channel(TlsStream& data) {
  std::error_code ec;
  if(tls_) {
    data.shutdown(ec);
    ec.clear();
  }
  data.next_layer().shutdown(tcp::socket::shutdown_both, ec);
  data.next_layer().close(ec);
  auto reply = read_reply();
  log_debug(logger_.get(), "< {} {}", reply.code, reply.text);
  if(!reply.completed()) {
    throw RemoteError(reply.code, fmt::format("transfer not completed: {} {}", reply.code, reply.text));
  }
}

// Drops the data connection mid-transfer and consumes the server's
// 426/451 reply so the control channel stays in step.
void FtpSession::abort_data_channel(TlsStream& data) {
  std::error_code ec;
  data.next_layer().close(ec);
  try {
    read_reply();
  } catch(const std::exception& e) {
    log_debug(logger_.get(), "no reply after aborted transfer: {}", e.what());
  }
}

void FtpSession::transfer_in(const std::string& line, const DataSink& sink) {
  auto data = open_data_channel(line);
  std::array<char, kDataBlockSize> block;
  try {
    for(;;) {
      std::error_code ec;
      std::size_t n = tls_
        ? data->read_some(asio::buffer(block), ec)
        : data->next_layer().read_some(asio::buffer(block), ec);
      if(n > 0) sink(block.data(), n);
      if(is_end_of_stream(ec)) break;
      if(ec) throw RemoteError(0, fmt::format("'{}' interrupted: {}", line, ec.message()));
    }
  } catch(const std::exception&) {
    abort_data_channel(*data);
    throw;
  }
  try {
    finish_data_channel(*data);
  } catch(const std::system_error& e) {
    throw RemoteError(0, fmt::format("connection to {} lost: {}", descriptor_.host, e.what()));
  }
}

std::vector<std::string> FtpSession::list(const std::string& path) {
  std::string raw;
  transfer_in("NLST " + path, [&raw](const char* bytes, std::size_t n) {
    raw.append(bytes, n);
  });

  std::vector<std::string> entries;
  std::istringstream lines(raw);
  std::string entry;
  while(std::getline(lines, entry)) {
    if(!entry.empty() && entry.back() == '\r') entry.pop_back();
    if(entry.empty()) continue;
    // some servers answer with bare names, others with full paths
    if(entry.find('/') == std::string::npos && !path.empty() && entry != path) {
      entry = remote_join(path, entry);
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

void FtpSession::retrieve(const std::string& path, const DataSink& sink) {
  transfer_in("RETR " + path, sink);
}

void FtpSession::store(const std::string& path, const DataSource& source) {
  std::string line = "STOR " + path;
  auto data = open_data_channel(line);
  std::array<char, kDataBlockSize> block;
  try {
    for(;;) {
      std::size_t n = source(block.data(), block.size());
      if(n == 0) break;
      if(tls_) {
        asio::write(*data, asio::buffer(block.data(), n));
      } else {
        asio::write(data->next_layer(), asio::buffer(block.data(), n));
      }
    }
  } catch(const std::system_error& e) {
    abort_data_channel(*data);
    throw RemoteError(0, fmt::format("'{}' interrupted: {}", line, e.what()));
  } catch(const std::exception&) {
    abort_data_channel(*data);
    throw;
  }
  try {
    finish_data_channel(*data);
  } catch(const std::system_error& e) {
    throw RemoteError(0, fmt::format("connection to {} lost: {}", descriptor_.host, e.what()));
  }
}

void FtpSession::close() {
  if(closed_) return;
  if(control_.next_layer().is_open()) {
    try {
      command("QUIT");
    } catch(const std::exception& e) {
      log_debug(logger_.get(), "QUIT on {} failed: {}", descriptor_.host, e.what());
    }
  }
  closed_ = true;
  std::error_code ec;
  if(tls_) {
    control_.shutdown(ec);
    ec.clear();
  }
  control_.next_layer().close(ec);
}
