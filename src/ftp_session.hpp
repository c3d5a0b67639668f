#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <memory>
#include <string>
#include <vector>

#include "ftp_reply.hpp"
#include "log.hpp"
#include "session.hpp"

// Session over a real FTP control connection. Explicit FTPS (AUTH TLS +
// PROT P) when the descriptor asks for TLS, passive data channels.
class FtpSession : public Session {
public:
  // Connects and logs in. Throws AuthenticationError on any failure.
  static std::unique_ptr<Session> connect(const ConnectionDescriptor& descriptor,
                                          std::shared_ptr<Logger> logger = nullptr);
  static SessionConnector connector(std::shared_ptr<Logger> logger = nullptr);

  ~FtpSession() override;

  FtpSession(const FtpSession&) = delete;
  FtpSession& operator=(const FtpSession&) = delete;

  std::string current_directory() override;
  void change_directory(const std::string& path) override;
  std::vector<std::string> list(const std::string& path) override;
  void make_directory(const std::string& path) override;
  void set_binary_mode() override;
  void retrieve(const std::string& path, const DataSink& sink) override;
  void store(const std::string& path, const DataSource& source) override;
  void close() override;

private:
  using tcp = asio::ip::tcp;
  using TlsStream = asio::ssl::stream<tcp::socket>;

  FtpSession(ConnectionDescriptor descriptor, std::shared_ptr<Logger> logger);

  void open();
  void write_line(const std::string& line);
  FtpReply read_reply();
  FtpReply command(const std::string& line);
  FtpReply expect(const std::string& line, int low, int high);

  std::unique_ptr<TlsStream> open_data_channel(const std::string& line);
  void finish_data_channel(TlsStream& data);
  void abort_data_channel(TlsStream& data);
  void transfer_in(const std::string& line, const DataSink& sink);

  ConnectionDescriptor descriptor_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  asio::ssl::context ssl_ctx_;
  TlsStream control_;
  asio::streambuf read_buf_;
  FtpReplyParser parser_;
  std::string welcome_;
  bool tls_ = false;
  bool closed_ = false;
};
