#include "credentials.hpp"
#include "errors.hpp"
#include "fake_session.hpp"
#include "ftp_client.hpp"
#include "ftp_reply.hpp"
#include "path_operations.hpp"
#include "session_guard.hpp"
#include "session_resolver.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "tree_walker.hpp"
#include "utils.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using bulkftp::test::FakeRemote;
using bulkftp::test::FakeSession;
using bulkftp::test::TestCase;
using bulkftp::test::TestContext;
using bulkftp::test::TempDir;
using bulkftp::test::counting_connector;
using bulkftp::test::read_file;
using bulkftp::test::require;
using bulkftp::test::throws;
using bulkftp::test::write_file;

void configure(SettingsManager& settings, const std::string& key, const nlohmann::json& value) {
  std::string error;
  if(!settings.set_from_json(key, value, error)) {
    throw std::runtime_error("Failed to set setting " + key + ": " + error);
  }
}

std::shared_ptr<SettingsManager> make_settings() {
  auto settings = std::make_shared<SettingsManager>();
  configure(*settings, "servers", {
    {"main",  {{"host", "main.example"}, {"user", "alice"}, {"passwd", "pw"}}},
    {"other", {{"host", "other.example"}, {"port", 2121}, {"tls", false}}}
  });
  return settings;
}

std::set<std::string> as_set(const std::vector<std::string>& items) {
  return std::set<std::string>(items.begin(), items.end());
}

bool test_remote_paths(TestContext&) {
  require(remote_parent("a/b/c.txt") == "a/b", "parent of relative path");
  require(remote_parent("/a") == "/", "parent of top level absolute path");
  require(remote_parent("c.txt").empty(), "parent of bare name");
  require(remote_join("/", "x") == "/x", "join onto root");
  require(remote_join("a/b", "x") == "a/b/x", "join onto relative dir");

  auto prefixes = remote_prefixes("a/b/c");
  require(prefixes == std::vector<std::string>({"a", "a/b", "a/b/c"}), "relative prefixes");
  prefixes = remote_prefixes("/a//b/");
  require(prefixes == std::vector<std::string>({"/a", "/a/b"}), "absolute prefixes skip empty segments");

  require(replace_prefix("/srv/data/x.txt", "/srv/data", "out") == "out/x.txt", "prefix mapped");
  require(replace_prefix("/other/data/x.txt", "/srv/data", "out") == "/other/data/x.txt",
          "non-matching path unchanged");
  require(replace_prefix("/srv/data/srv/data", "/srv/data", "o") == "o/srv/data",
          "only the leading prefix is replaced");
  return true;
}

bool test_reply_parser(TestContext&) {
  FtpReplyParser parser;
  require(!parser.feed("220-Welcome\r\n"), "multi-line start is incomplete");
  require(!parser.feed("  to the server"), "continuation is incomplete");
  require(parser.feed("220 ready\r\n"), "closing line completes");
  auto reply = parser.take();
  require(reply.code == 220 && reply.completed(), "code 220");
  require(reply.text == "Welcome\n  to the server\nready", "joined text");

  require(parser.feed("550 No such file"), "single line reply");
  reply = parser.take();
  require(reply.failed() && reply.code == 550, "failure code");

  require(throws<std::runtime_error>([&]{ parser.feed("garbage"); }), "malformed first line");

  auto port = parse_pasv_port("Entering Passive Mode (127,0,0,1,19,137).");
  require(port && *port == 19 * 256 + 137, "pasv port");
  require(!parse_pasv_port("Entering Passive Mode"), "pasv without tuple");

  auto path = parse_quoted_path("\"/home/a \"\"b\"\"\" is current directory");
  require(path && *path == "/home/a \"b\"", "quoted path with doubled quotes");
  return true;
}

bool test_settings(TestContext&) {
  SettingsManager settings;
  require(settings.get<int>("connections") == 5, "default connections");
  require(settings.get<int>("retries") == 5, "default retries");
  require(settings.get<std::string>("default_server") == "main", "default server");
  require(settings.resolve_key("workers") == std::optional<std::string>("connections"), "alias");
  require(!settings.resolve_key("nope"), "unknown key");

  std::string error;
  require(!settings.set_from_string("connections", "many", error) && !error.empty(), "bad int");
  require(settings.set_from_string("c", "8", error), "set via alias");
  require(settings.get<int>("connections") == 8, "alias stored under key");
  require(!settings.set_from_json("servers", "not-an-object", error), "servers must be an object");
  require(throws<std::runtime_error>([&]{ settings.get<int>("nope"); }), "unknown get throws");

  TempDir dir("settings");
  settings.set_settings_path(dir / "settings.json");
  configure(settings, "host", "transient.example");
  require(settings.save(), "save");

  SettingsManager loaded;
  loaded.set_settings_path(dir / "settings.json");
  require(loaded.load(), "load");
  require(loaded.get<int>("connections") == 8, "persistent value survives");
  require(loaded.get<std::string>("host").empty(), "command line only value is not saved");
  return true;
}

bool test_credentials(TestContext&) {
  nlohmann::json login = {{"host", "ftp.example"}, {"user", "bob"}, {"passwd", "s3cret"}, {"acct", "x"}};
  auto blob = encrypt_credentials(login, "passphrase");
  require(blob.find("s3cret") == std::string::npos, "blob hides the password");

  auto decoded = make_credential_decoder("passphrase")(blob);
  require(decoded == login, "decrypt roundtrip");
  require(throws<ConfigurationError>([&]{ make_credential_decoder("wrong")(blob); }), "wrong passphrase");
  require(throws<ConfigurationError>([&]{ make_credential_decoder("passphrase")("%%%"); }), "not base64");

  auto plain = make_credential_decoder("")(login.dump());
  require(plain == login, "plain JSON without passphrase");
  require(make_credential_decoder("anything")(login) == login, "objects pass through");

  auto d = descriptor_from_login(decoded);
  require(d.host == "ftp.example" && d.user == "bob" && d.secret == "s3cret", "descriptor fields");
  require(d.use_tls && d.port == 21, "tls and port defaults");
  require(d.options.value("acct", "") == "x", "extra keys kept as options");

  auto anon = descriptor_from_login({{"host", "h"}, {"tls", false}, {"port", 2121}});
  require(anon.user == "anonymous" && !anon.use_tls && anon.port == 2121, "explicit tls and port");
  require(throws<ConfigurationError>([]{ descriptor_from_login({{"user", "x"}}); }), "missing host");
  return true;
}

bool test_add_server(TestContext&) {
  auto remote = std::make_shared<FakeRemote>();
  auto settings = make_settings();
  ConnectionDescriptor login;
  login.host = "vault.example";
  login.port = 2121;
  login.user = "carol";
  login.secret = "hunter2";
  login.use_tls = false;
  login.options["acct"] = "billing";

  add_server(*settings, "vault", login, "passphrase");
  auto servers = settings->get<nlohmann::json>("servers");
  require(servers.contains("main") && servers.contains("other"), "existing servers kept");
  require(servers.at("vault").is_string(), "entry stored as a blob");
  require(servers.at("vault").get<std::string>().find("hunter2") == std::string::npos, "blob hides the password");

  SessionResolver resolver(settings, counting_connector(remote), make_credential_decoder("passphrase"));
  SessionGuard guard(resolver, SessionRequest::named("vault"));
  auto seen = remote->logins().back();
  require(seen.host == "vault.example" && seen.port == 2121, "host and port decoded");
  require(seen.user == "carol" && seen.secret == "hunter2" && !seen.use_tls, "login decoded");
  require(seen.options.value("acct", "") == "billing", "options kept");

  add_server(*settings, "open", login, "");
  require(settings->get<nlohmann::json>("servers").at("open").is_object(), "plain object without passphrase");
  require(throws<ConfigurationError>([&]{ add_server(*settings, "nohost", ConnectionDescriptor{}, ""); }),
          "host required");
  return true;
}

bool test_resolver_precedence(TestContext&) {
  auto remote = std::make_shared<FakeRemote>();
  auto settings = make_settings();
  SessionResolver resolver(settings, counting_connector(remote), make_credential_decoder(""));

  FakeSession borrowed(remote);
  auto resolved = resolver.resolve(SessionRequest::borrow(borrowed));
  require(resolved.session == &borrowed && !resolved.owns_session(), "borrowed session returned as is");
  require(remote->connects == 0, "borrowing does not connect");

  ConnectionDescriptor explicit_login;
  explicit_login.host = "login.example";

  SessionRequest both = SessionRequest::named("other");
  both.login = explicit_login;
  resolved = resolver.resolve(both);
  require(resolved.owns_session(), "opened session is owned");
  resolved = resolver.resolve(SessionRequest::with_login(explicit_login));
  resolved = resolver.resolve({});

  auto logins = remote->logins();
  require(logins.size() == 3, "three sessions opened");
  require(logins[0].host == "other.example" && logins[0].port == 2121 && !logins[0].use_tls,
          "server wins over login");
  require(logins[1].host == "login.example", "login used when no server");
  require(logins[2].host == "main.example" && logins[2].user == "alice", "default server");

  require(throws<ConfigurationError>([&]{ resolver.resolve(SessionRequest::named("missing")); }),
          "unknown server");

  remote->connect_fault = [](const ConnectionDescriptor&) {
    throw std::runtime_error("530 Login incorrect");
  };
  require(throws<AuthenticationError>([&]{ resolver.resolve({}); }), "connector failure");
  return true;
}

bool test_guard_closes_once(TestContext& ctx) {
  auto remote = std::make_shared<FakeRemote>();
  auto logger = std::make_shared<Logger>("guard");
  ctx.logs.attach(logger);
  SessionResolver resolver(make_settings(), counting_connector(remote), make_credential_decoder(""));

  {
    SessionGuard guard(resolver, {}, logger);
    require(guard.owns_session(), "guard owns resolved session");
    require(guard->current_directory() == "/", "session usable");
  }
  require(remote->closes == 1, "owned session closed on scope exit");

  bool caught = false;
  try {
    SessionGuard guard(resolver, {}, logger);
    throw std::runtime_error("boom");
  } catch(const std::runtime_error&) {
    caught = true;
  }
  require(caught && remote->closes == 2, "owned session closed on error exit");

  FakeSession borrowed(remote);
  {
    SessionGuard guard(resolver, SessionRequest::borrow(borrowed), logger);
    require(!guard.owns_session(), "borrowed session not owned");
  }
  require(!borrowed.closed() && remote->closes == 2, "borrowed session left open");
  require(remote->open_sessions == 1, "only the borrowed session is still open");
  return true;
}

bool test_is_directory_restores_cursor(TestContext&) {
  auto remote = std::make_shared<FakeRemote>();
  remote->add_file("/data/a.txt", "a");
  FakeSession session(remote);
  session.change_directory("/data");
  PathOperations ops(session);

  require(ops.is_directory("/data"), "directory");
  require(session.current_directory() == "/data", "cursor restored after success");
  require(!ops.is_directory("/data/a.txt"), "file is not a directory");
  require(!ops.is_directory("/missing"), "missing path is not a directory");
  require(session.current_directory() == "/data", "cursor unchanged after failures");

  require(ops.exists("/data/a.txt"), "file exists");
  require(!ops.exists("/data/b.txt"), "missing file does not exist");

  remote->fault = [](const std::string& op, const std::string&) {
    if(op == "cwd") throw RemoteError(0, "connection reset");
  };
  require(throws<RemoteError>([&]{ ops.is_directory("/data"); }), "connection loss propagates");
  return true;
}

bool test_make_directories_idempotent(TestContext& ctx) {
  auto remote = std::make_shared<FakeRemote>();
  remote->add_dir("/base");
  FakeSession session(remote);
  auto logger = std::make_shared<Logger>("mkdirs");
  ctx.logs.attach(logger);
  PathOperations ops(session, logger);

  ops.make_directories("/base/a/b/c");
  require(remote->has_dir("/base/a") && remote->has_dir("/base/a/b") && remote->has_dir("/base/a/b/c"),
          "every missing level created");
  require(remote->mkds == 3, "existing level not recreated");
  require(ctx.logs.contains("Creating remote directory /base/a/b/c"), "creation logged");

  ops.make_directories("/base/a/b/c");
  require(remote->mkds == 3, "second call creates nothing");

  session.change_directory("/base");
  ops.make_directories("x/y");
  require(remote->has_dir("/base/x/y"), "relative path resolved against cursor");
  return true;
}

bool test_download_overwrite(TestContext& ctx) {
  auto remote = std::make_shared<FakeRemote>();
  remote->add_file("/r/file.bin", std::string("new\0data", 8));
  FakeSession session(remote);
  auto logger = std::make_shared<Logger>("download");
  ctx.logs.attach(logger);
  PathOperations ops(session, logger);
  TempDir dir("download");

  auto dst = dir / "file.bin";
  write_file(dst, "old");
  require(throws<AlreadyExistsError>([&]{ ops.download_one("/r/file.bin", dst, false, true); }),
          "existing local file refused");
  require(read_file(dst) == "old", "refused download leaves file alone");

  ops.download_one("/r/file.bin", dst, true, true);
  require(read_file(dst) == std::string("new\0data", 8), "overwrite replaces content");
  require(ctx.logs.contains("and overwrite"), "overwrite logged");

  auto nested = dir / "x" / "y" / "file.bin";
  require(throws<LocalIOError>([&]{ ops.download_one("/r/file.bin", nested, false, false); }),
          "missing parent without makedirs");
  ops.download_one("/r/file.bin", nested, false, true);
  require(read_file(nested).size() == 8, "parents created");
  return true;
}

bool test_upload_overwrite(TestContext&) {
  auto remote = std::make_shared<FakeRemote>();
  remote->add_file("/r/exists.txt", "remote");
  FakeSession session(remote);
  PathOperations ops(session);
  TempDir dir("upload");
  auto src = dir / "local.txt";
  write_file(src, "local content that spans several buffers");

  require(throws<AlreadyExistsError>([&]{ ops.upload_one(src, "/r/exists.txt", false, false); }),
          "existing remote file refused");
  require(remote->file("/r/exists.txt") == "remote" && remote->stores == 0, "remote untouched");

  ops.upload_one(src, "/r/exists.txt", true, false);
  require(remote->file("/r/exists.txt") == read_file(src), "overwrite replaces remote");

  require(throws<RemoteError>([&]{ ops.upload_one(src, "/new/deep/f.txt", false, false); }),
          "missing remote parent without makedirs");
  ops.upload_one(src, "/new/deep/f.txt", false, true);
  require(remote->file("/new/deep/f.txt") == read_file(src), "remote parents created");

  require(throws<LocalIOError>([&]{ ops.upload_one(dir / "missing", "/r/m.txt", false, false); }),
          "missing local source");
  return true;
}

bool test_tree_walk(TestContext&) {
  auto remote = std::make_shared<FakeRemote>();
  remote->add_file("/root/a.txt", "1");
  remote->add_file("/root/a.csv", "2");
  remote->add_file("/root/dir/b.txt", "3");
  remote->add_dir("/root/empty");
  FakeSession session(remote);

  TreeWalker all(session, "/root");
  require(as_set(all.collect()) == std::set<std::string>({"/root/a.txt", "/root/a.csv", "/root/dir/b.txt"}),
          "all files");

  TreeWalker txt(session, "/root", compile_pattern(std::string(R"(\.txt$)")));
  require(as_set(txt.collect()) == std::set<std::string>({"/root/a.txt", "/root/dir/b.txt"}),
          "pattern filters files");
  require(session.current_directory() == "/", "walk leaves cursor alone");

  require(throws<ConfigurationError>([]{ compile_pattern(std::string("(")); }), "invalid pattern");
  require(!compile_pattern(std::nullopt) && !compile_pattern(std::string()), "no pattern");
  return true;
}

bool test_tree_walk_is_lazy(TestContext&) {
  auto remote = std::make_shared<FakeRemote>();
  remote->add_file("/t/d1/x.txt", "x");
  remote->add_file("/t/d2/y.txt", "y");
  FakeSession session(remote);

  TreeWalker walker(session, "/t");
  require(remote->lists == 0, "nothing listed before the first pull");
  auto first = walker.next();
  require(first && *first == "/t/d1/x.txt", "first file");
  require(remote->lists == 2, "second directory not listed yet");
  auto second = walker.next();
  require(second && *second == "/t/d2/y.txt", "second file");
  require(!walker.next(), "exhausted");
  require(remote->lists == 3, "each directory listed once");
  return true;
}

bool test_client_tree_owns_session(TestContext&) {
  auto remote = std::make_shared<FakeRemote>();
  remote->add_file("/t/a.txt", "a");
  remote->add_file("/t/b.txt", "b");
  FtpClient client(make_settings(), counting_connector(remote), make_credential_decoder(""));

  auto walk = client.tree("/t");
  require(walk->next().has_value(), "first entry");
  require(remote->connects == 1 && remote->closes == 0, "session held while iterating");
  walk.reset();
  require(remote->closes == 1, "session closed with the walk");

  require(client.ls("/t").size() == 2, "ls");
  require(client.is_dir("/t") && !client.is_dir("/t/a.txt"), "is_dir");
  client.mkdirs("/t/new/leaf");
  require(remote->has_dir("/t/new/leaf"), "mkdirs");
  require(remote->connects == remote->closes, "every facade call closed its session");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  bulkftp::test::LogCapture logs;
  std::vector<TestCase> tests = {
    {"remote_paths", test_remote_paths},
    {"reply_parser", test_reply_parser},
    {"settings", test_settings},
    {"credentials", test_credentials},
    {"add_server", test_add_server},
    {"resolver_precedence", test_resolver_precedence},
    {"guard_closes_once", test_guard_closes_once},
    {"is_directory_restores_cursor", test_is_directory_restores_cursor},
    {"make_directories_idempotent", test_make_directories_idempotent},
    {"download_overwrite", test_download_overwrite},
    {"upload_overwrite", test_upload_overwrite},
    {"tree_walk", test_tree_walk},
    {"tree_walk_is_lazy", test_tree_walk_is_lazy},
    {"client_tree_owns_session", test_client_tree_owns_session}
  };
  return bulkftp::test::run_tests("core", tests, logs, argc, argv);
}
