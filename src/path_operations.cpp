#include "path_operations.hpp"

#include <fstream>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

namespace {

bool is_missing_reply(int code) {
  return code == 450 || code == 550;
}

} // namespace

PathOperations::PathOperations(Session& session, std::shared_ptr<Logger> logger)
  : session_(session), logger_(std::move(logger)) {}

std::vector<std::string> PathOperations::list(const std::string& path) {
  return session_.list(path);
}

bool PathOperations::exists(const std::string& path) {
  try {
    return !session_.list(path).empty();
  } catch(const RemoteError& e) {
    if(is_missing_reply(e.code())) return false;
    throw;
  }
}

bool PathOperations::is_directory(const std::string& path) {
  const std::string previous = session_.current_directory();
  try {
    session_.change_directory(path);
  } catch(const RemoteError& e) {
    // a refused CWD leaves the cursor where it was
    if(e.code() == 0) throw;
    return false;
  }
  session_.change_directory(previous);
  return true;
}

void PathOperations::make_directories(const std::string& path) {
  for(const auto& dir : remote_prefixes(path)) {
    if(is_directory(dir)) continue;
    log_info(logger_.get(), "Creating remote directory {}", dir);
    session_.make_directory(dir);
  }
}

void PathOperations::download_one(const std::string& src,
                                  const std::filesystem::path& dst,
                                  bool overwrite,
                                  bool create_dirs) {
  session_.set_binary_mode();

  std::error_code ec;
  const bool dst_exists = std::filesystem::exists(dst, ec);
  if(dst_exists && !overwrite) {
    throw AlreadyExistsError("destination path already exists: " + dst.string());
  }

  const auto parent = dst.parent_path();
  if(create_dirs && !parent.empty() && !std::filesystem::exists(parent, ec)) {
    log_debug(logger_.get(), "Creating local directories {}", parent.string());
    std::filesystem::create_directories(parent, ec);
    if(ec) {
      throw LocalIOError("cannot create " + parent.string() + ": " + ec.message());
    }
  }

  if(dst_exists) {
    log_info(logger_.get(), "Downloading {} and overwrite {}", src, dst.string());
  } else {
    log_info(logger_.get(), "Downloading {} to {}", src, dst.string());
  }

  std::ofstream out(dst, std::ios::binary | std::ios::trunc);
  if(!out) throw LocalIOError("cannot open " + dst.string() + " for writing");
  try {
    session_.retrieve(src, [&out, &dst](const char* data, std::size_t length) {
      out.write(data, static_cast<std::streamsize>(length));
      if(!out) throw LocalIOError("write to " + dst.string() + " failed");
    });
  } catch(const std::exception&) {
    // a partial file we created would block the next attempt
    out.close();
    if(!dst_exists) std::filesystem::remove(dst, ec);
    throw;
  }
  out.close();
  if(!out) throw LocalIOError("cannot finish writing " + dst.string());
}

void PathOperations::upload_one(const std::filesystem::path& src,
                                const std::string& dst,
                                bool overwrite,
                                bool create_dirs,
                                bool* creating) {
  const bool dst_exists = exists(dst);
  if(dst_exists && !overwrite) {
    throw AlreadyExistsError("file already exists on remote: " + dst);
  }

  const std::string parent = remote_parent(dst);
  if(create_dirs && !parent.empty() && !is_directory(parent)) {
    make_directories(parent);
  }

  if(dst_exists) {
    log_info(logger_.get(), "Uploading {} and overwrite {}", src.string(), dst);
  } else {
    log_info(logger_.get(), "Uploading {} to {}", src.string(), dst);
  }

  session_.set_binary_mode();
  std::ifstream in(src, std::ios::binary);
  if(!in) throw LocalIOError("cannot open " + src.string() + " for reading");
  if(creating && !dst_exists) *creating = true;
  session_.store(dst, [&in, &src](char* buffer, std::size_t capacity) -> std::size_t {
    in.read(buffer, static_cast<std::streamsize>(capacity));
    if(in.bad()) throw LocalIOError("read from " + src.string() + " failed");
    return static_cast<std::size_t>(in.gcount());
  });
}
