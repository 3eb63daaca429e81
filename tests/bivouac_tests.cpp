#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bivouac/capture.hpp"
#include "bivouac/cas.hpp"
#include "bivouac/config.hpp"
#include "bivouac/executor.hpp"
#include "bivouac/hash.hpp"
#include "bivouac/named_caches.hpp"
#include "bivouac/observability.hpp"
#include "bivouac/platform.hpp"
#include "bivouac/runner.hpp"
#include "bivouac/sandbox.hpp"
#include "bivouac/tree.hpp"
#include "bivouac/types.hpp"
#include "bivouac/workdir.hpp"

namespace fs = std::filesystem;
using namespace bivouac;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ============================================================================
// Fixtures
// ============================================================================

const std::string kRoland = "European Burmese";
const std::string kTreats = "catnip";

fs::path test_root(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / "bivouac_tests" / name;
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

std::string find_bash() {
  for (const char* p : {"/bin/bash", "/usr/bin/bash", "/usr/local/bin/bash"}) {
    if (fs::exists(p)) return p;
  }
  expect(false, "no bash found");
  return {};
}

std::string find_cp() {
  for (const char* p : {"/bin/cp", "/usr/bin/cp"}) {
    if (fs::exists(p)) return p;
  }
  expect(false, "no cp found");
  return {};
}

RelativePath rel(const std::string& s) {
  std::string err;
  auto p = RelativePath::create(s, &err);
  expect(p.has_value(), "valid relative path " + s + ": " + err);
  return *p;
}

std::string read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void write_file(const fs::path& p, const std::string& data) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
}

std::size_t count_entries(const fs::path& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;
  std::size_t n = 0;
  for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) ++n;
  return n;
}

struct TestEnv {
  fs::path root;
  RunnerConfig config;
  std::unique_ptr<CommandRunner> runner;
};

TestEnv make_env(const std::string& name,
                 std::chrono::milliseconds kill_grace = std::chrono::milliseconds(2000),
                 int threads = 2) {
  TestEnv env;
  env.root = test_root(name);
  env.config.work_root = env.root / "work";
  env.config.preserve_root = env.root / "preserved";
  env.config.named_caches_root = env.root / "named_caches";
  env.config.store_root = env.root / "store";
  env.config.executor_threads = threads;
  env.config.kill_grace = kill_grace;
  std::string err;
  env.runner = CommandRunner::from_config(env.config, &err);
  expect(env.runner != nullptr, "runner from config: " + err);
  return env;
}

Process command(std::vector<std::string> argv) {
  Process p;
  p.argv = std::move(argv);
  return p;
}

Process bash(const std::string& script) {
  return command({find_bash(), "-c", script});
}

RunResult run_ok(TestEnv& env, Process p, bool preserve = false) {
  RunContext ctx;
  ctx.preserve_sandbox = preserve;
  RunOutcome o = env.runner->run(std::move(p), ctx).get();
  expect(o.ok(), "run failed: " + to_string(o.error_code) + ": " + o.error_message);
  return *o.result;
}

std::string load(TestEnv& env, const Digest& d) {
  auto bytes = env.runner->store().load_file_bytes(d);
  expect(bytes.has_value(), "digest " + to_string(d) + " missing from store");
  return *bytes;
}

struct ExpectedFile {
  std::string path;
  std::string content;
  bool executable;
};

Digest expected_tree(TreeStore& store, const std::vector<ExpectedFile>& files,
                     const std::vector<std::string>& dirs = {}) {
  TreeBuilder b;
  for (const auto& f : files) {
    auto d = store.store_file_bytes(f.content);
    expect(d.has_value(), "store expected file");
    expect(b.add_file(rel(f.path), FileNode{*d, f.executable}, nullptr), "add expected file");
  }
  for (const auto& d : dirs)
    expect(b.add_directory(rel(d), nullptr), "add expected dir");
  auto root = b.record(store, nullptr);
  expect(root.has_value(), "record expected tree");
  return *root;
}

// Input tree holding cats/roland.ext.
Digest nested_input(TreeStore& store) {
  return expected_tree(store, {{"cats/roland.ext", kRoland, false}});
}

// ============================================================================
// Hashing & store
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(!blake3_library_version().empty(), "BLAKE3 version reported");
}

void test_domain_separation() {
  const std::string data = "test data";
  expect(hash_domain("cas:", data) == cas_content_hash(data), "cas key uses cas: domain");
  expect(cas_content_hash(data) != blake3_hex(data), "cas key differs from plain hash");
  expect(hash_domain("req:", data) != hash_domain("cas:", data), "domains must differ");
}

void test_file_hashing() {
  const fs::path tmp = test_root("file_hash");
  const std::string content = "test content for file hashing";
  write_file(tmp / "f.txt", content);

  std::uint64_t size = 0;
  const std::string h = cas_file_hash((tmp / "f.txt").string(), &size);
  expect(h == cas_content_hash(content), "streamed file hash == bytes hash");
  expect(size == content.size(), "streamed size reported");
  expect(cas_file_hash("/nonexistent/bivouac").empty(), "missing file returns empty");
  fs::remove_all(tmp);
}

void test_cas_put_get_integrity() {
  const fs::path tmp = test_root("cas_put_get");
  CasStore cas(tmp.string());
  const std::string data = "artifact data for CAS test";
  const std::string d1 = cas.put(data, "off");
  expect(valid_digest(d1), "CAS put returns digest");
  expect(d1 == cas.put(data, "off"), "CAS key is content-derived");
  expect(cas.contains(d1), "CAS contains stored object");

  auto got = cas.get(d1);
  expect(got.has_value() && *got == data, "CAS round-trip matches");

  auto info = cas.info(d1);
  expect(info.has_value(), "CAS info available");
  expect(info->original_size == data.size(), "CAS info size matches");
  expect(info->encoding == "identity", "uncompressed encoding is identity");
  expect(cas.backend_id() == "local_fs", "backend id");
  fs::remove_all(tmp);
}

void test_cas_corruption_detection() {
  const fs::path tmp = test_root("cas_corrupt");
  CasStore cas(tmp.string());
  const std::string data = "test data for corruption check";
  const std::string digest = cas.put(data, "off");
  expect(!digest.empty(), "CAS put returns digest");

  {
    std::fstream file(cas.object_path(digest), std::ios::in | std::ios::out | std::ios::binary);
    expect(file.good(), "can open object file");
    char byte;
    file.read(&byte, 1);
    byte ^= 0xFF;
    file.seekp(0);
    file.write(&byte, 1);
  }
  expect(!cas.get(digest).has_value(), "CAS detects corruption");

  // A later put of the same content repairs the object.
  expect(cas.put(data, "off") == digest, "re-put returns same key");
  expect(cas.get(digest).value_or("") == data, "re-put repaired object");
  fs::remove_all(tmp);
}

void test_cas_invalid_digest_rejected() {
  const fs::path tmp = test_root("cas_invalid");
  CasStore cas(tmp.string());
  expect(!cas.get("../../etc/passwd").has_value(), "traversal digest rejected");
  expect(!cas.get(std::string(64, 'G')).has_value(), "non-hex digest rejected");
  expect(!cas.contains("abc"), "short digest rejected");
  fs::remove_all(tmp);
}

void test_cas_zstd() {
  const fs::path tmp = test_root("cas_zstd");
  CasStore cas(tmp.string());
  const std::string data(4096, 'z');
  const std::string d = cas.put(data, "zstd");
  expect(d == cas_content_hash(data), "key ignores compression");
  auto info = cas.info(d);
  expect(info.has_value(), "info for compressed object");
  if (cas_zstd_available()) {
    expect(info->encoding == "zstd", "zstd encoding recorded");
    expect(info->stored_size < data.size(), "zstd shrinks repetitive data");
  } else {
    expect(info->encoding == "identity", "falls back to identity without zstd");
  }
  expect(cas.get(d).value_or("") == data, "compressed round-trip");
  fs::remove_all(tmp);
}

// ============================================================================
// Merkle trees
// ============================================================================

void test_tree_encoding_is_canonical() {
  Directory a;
  a.files["b.txt"] = FileNode{Digest{cas_content_hash("b"), 1}, false};
  a.files["a.sh"] = FileNode{Digest{cas_content_hash("a"), 1}, true};
  a.directories["sub"] = empty_directory_digest();

  const std::string enc = encode_directory(a);
  expect(enc.rfind("bivouac-tree 1\n", 0) == 0, "tree header");
  expect(enc.find("f 4:a.sh ") < enc.find("f 5:b.txt "), "files sorted by name");
  expect(enc.find("f 5:b.txt ") < enc.find("d 3:sub "), "files before directories");

  std::string err;
  auto back = decode_directory(enc, &err);
  expect(back.has_value(), "decode canonical encoding: " + err);
  expect(back->files == a.files && back->directories == a.directories, "decode restores entries");
}

void test_tree_decode_rejects_malformed() {
  const std::string h(64, 'a');
  std::string err;
  expect(!decode_directory("other-format 1\n", &err), "unknown header rejected");
  expect(!decode_directory("bivouac-tree 1\nf 2:.. " + h + " 1 -\n", &err), "'..' rejected");
  expect(!decode_directory("bivouac-tree 1\nf 1:b " + h + " 1 -\nf 1:a " + h + " 1 -\n", &err),
         "unsorted files rejected");
  expect(!decode_directory("bivouac-tree 1\nf 1:a " + h + " 1 ?\n", &err), "bad flag rejected");
  expect(!decode_directory("bivouac-tree 1\nf 9:a " + h + " 1 -\n", &err),
         "overlong name rejected");
  expect(!err.empty(), "decode reports an error");
}

void test_empty_directory_digest() {
  const fs::path tmp = test_root("tree_empty");
  TreeStore store(std::make_shared<CasStore>(tmp.string()));
  auto d = store.record_directory(Directory{});
  expect(d.has_value() && *d == empty_directory_digest(), "empty dir digest is canonical");
  expect(store.backend().contains(d->hash), "encoded tree stored as a blob");
  expect(store.backend().backend_id() == "local_fs", "tree store uses the given backend");
  TreeBuilder b;
  expect(b.empty(), "new builder is empty");
  expect(b.record(store, nullptr).value() == empty_directory_digest(), "empty builder root");
  fs::remove_all(tmp);
}

void test_tree_builder_merges_overlap() {
  const fs::path tmp = test_root("tree_overlap");
  TreeStore store(std::make_shared<CasStore>(tmp.string()));
  const Digest roland = *store.store_file_bytes(kRoland);

  TreeBuilder b1;
  expect(b1.add_file(rel("cats/roland.ext"), FileNode{roland, false}, nullptr), "add file");
  expect(b1.add_directory(rel("cats"), nullptr), "add enclosing dir");
  expect(b1.add_file(rel("cats/roland.ext"), FileNode{roland, false}, nullptr), "add file again");

  TreeBuilder b2;
  expect(b2.add_file(rel("cats/roland.ext"), FileNode{roland, false}, nullptr), "add file once");
  expect(b1.record(store, nullptr) == b2.record(store, nullptr), "overlap adds no entries");

  std::string err;
  expect(!b2.add_directory(rel("cats/roland.ext"), &err), "file cannot become a directory");
  expect(!b2.add_file(rel("cats"), FileNode{roland, false}, &err), "dir cannot become a file");
  fs::remove_all(tmp);
}

void test_materialize_preserves_structure_and_modes() {
  const fs::path tmp = test_root("materialize");
  TreeStore store(std::make_shared<CasStore>((tmp / "store").string()));
  const Digest root = expected_tree(store, {{"bin/run.sh", "#!/bin/sh\n", true},
                                            {"cats/roland.ext", kRoland, false}},
                                    {"empty"});
  fs::create_directories(tmp / "out");
  std::string err;
  expect(store.materialize_directory(root, tmp / "out", &err), "materialize: " + err);
  expect(read_file(tmp / "out" / "cats" / "roland.ext") == kRoland, "file bytes materialized");
  expect(fs::is_directory(tmp / "out" / "empty"), "empty directory materialized");
  const auto perms = fs::status(tmp / "out" / "bin" / "run.sh").permissions();
  expect((perms & fs::perms::owner_exec) != fs::perms::none, "executable bit preserved");
  const auto plain = fs::status(tmp / "out" / "cats" / "roland.ext").permissions();
  expect((plain & fs::perms::owner_exec) == fs::perms::none, "plain file not executable");

  Digest missing{std::string(64, 'a'), 10};
  expect(!store.materialize_directory(missing, tmp / "out", &err), "unknown tree fails");
  fs::remove_all(tmp);
}

// ============================================================================
// Data model
// ============================================================================

void test_relative_path_rules() {
  std::string err;
  expect(rel("a/./b//c").str() == "a/b/c", "path normalized");
  expect(rel(".").is_root() && rel("").is_root(), "root spellings");
  expect(!RelativePath::create("/etc", &err), "absolute path rejected");
  expect(!RelativePath::create("a/../../b", &err), "parent traversal rejected");
  expect(rel("a/b").components() == std::vector<std::string>({"a", "b"}), "components");
}

void test_cache_name_and_dest_validation() {
  std::string err;
  expect(CacheName::create("geo", &err).has_value(), "plain cache name ok");
  expect(!CacheName::create("", &err), "empty name rejected");
  expect(!CacheName::create("a/b", &err), "separator rejected");
  expect(!CacheName::create("..", &err), "dot-dot name rejected");
  expect(CacheDest::create(".cache/geo", &err).has_value(), "relative dest ok");
  expect(!CacheDest::create("/abs", &err), "absolute dest rejected");
  expect(!CacheDest::create("../x", &err), "escaping dest rejected");
  expect(!CacheDest::create(".", &err), "root dest rejected");
}

void test_validate_process() {
  std::string err;
  Process p;
  expect(validate_process(p, &err) == ErrorCode::validation_failed, "empty argv rejected");
  p.argv = {"/bin/true"};
  expect(validate_process(p, &err) == ErrorCode::none, "minimal process valid");
  p.jdk_home = fs::path("relative/jdk");
  expect(validate_process(p, &err) == ErrorCode::validation_failed, "relative jdk rejected");
  p.jdk_home.reset();
  p.timeout = std::chrono::milliseconds(0);
  expect(validate_process(p, &err) == ErrorCode::validation_failed, "zero timeout rejected");
}

void test_platform_identity() {
  auto p = current_platform();
  expect(p.has_value(), "host platform known");
  expect(platform_from_string(to_string(*p)) == p, "platform name round-trips");
  expect(!platform_from_string("plan9_mips"), "unknown platform rejected");
}

// ============================================================================
// Collaborators
// ============================================================================

void test_executor_futures() {
  Executor ex(3);
  expect(ex.thread_count() == 3, "thread count honoured");
  std::vector<std::future<int>> futs;
  for (int i = 0; i < 20; ++i)
    futs.push_back(ex.spawn_blocking([i] { return i * i; }));
  int sum = 0;
  for (auto& f : futs) sum += f.get();
  expect(sum == 2470, "all tasks ran");

  auto bad = ex.spawn_blocking([]() -> int { throw std::runtime_error("boom"); });
  bool threw = false;
  try {
    bad.get();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect(threw, "task exception surfaces from future");
  expect(ex.queue_depth() == 0, "queue drained");
}

void test_executor_queue_depth() {
  Executor ex(1);
  std::promise<void> started;
  std::promise<void> gate;
  std::shared_future<void> open = gate.get_future().share();
  auto busy = ex.spawn_blocking([&started, open] {
    started.set_value();
    open.wait();
    return 0;
  });
  started.get_future().wait();
  auto a = ex.spawn_blocking([] { return 1; });
  auto b = ex.spawn_blocking([] { return 2; });
  expect(ex.queue_depth() == 2, "tasks wait behind the busy worker");
  gate.set_value();
  expect(busy.get() + a.get() + b.get() == 3, "queued tasks ran");
  expect(ex.queue_depth() == 0, "queue empty afterwards");
}

void test_named_caches_idempotent_and_concurrent() {
  const fs::path tmp = test_root("named_caches");
  NamedCaches caches(tmp / "base");
  auto name = *CacheName::create("geo", nullptr);

  std::vector<std::thread> threads;
  std::atomic<int> ok{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      std::string err;
      if (caches.path_for(name, &err) == tmp / "base" / "geo") ok++;
    });
  }
  for (auto& t : threads) t.join();
  expect(ok == 8, "racing creators all succeed");

  write_file(tmp / "base" / "geo" / "kept", "x");
  expect(caches.path_for(name, nullptr).has_value(), "second lookup ok");
  expect(fs::exists(tmp / "base" / "geo" / "kept"), "existing contents untouched");
  fs::remove_all(tmp);
}

void test_config_from_env() {
  ::setenv("BIVOUAC_WORK_ROOT", "/tmp/bivouac-env-work", 1);
  ::setenv("BIVOUAC_EXECUTOR_THREADS", "3", 1);
  ::setenv("BIVOUAC_KILL_GRACE_MS", "250", 1);
  RunnerConfig c = RunnerConfig::from_env();
  expect(c.work_root == "/tmp/bivouac-env-work", "work root from env");
  expect(c.executor_threads == 3, "threads from env");
  expect(c.kill_grace == std::chrono::milliseconds(250), "kill grace from env");
  expect(c.cas_compression == "off", "compression default");
  std::string err;
  expect(validate_config(c, &err) == ErrorCode::none, "env config valid: " + err);

  ::setenv("BIVOUAC_EXECUTOR_THREADS", "many", 1);
  c = RunnerConfig::from_env();
  expect(validate_config(c, &err) == ErrorCode::config_invalid, "bad thread count reported");

  ::unsetenv("BIVOUAC_WORK_ROOT");
  ::unsetenv("BIVOUAC_EXECUTOR_THREADS");
  ::unsetenv("BIVOUAC_KILL_GRACE_MS");

  c = RunnerConfig::defaults();
  c.cas_compression = "lz4";
  expect(validate_config(c, &err) == ErrorCode::config_invalid, "unknown compression rejected");
  expect(CommandRunner::from_config(c, &err) == nullptr, "runner refuses invalid config");
}

void test_shell_quote() {
  expect(shell_quote("plain") == "'plain'", "plain word quoted");
  expect(shell_quote("it's") == "'it'\\''s'", "embedded quote escaped");
  expect(shell_quote("") == "''", "empty argument kept");

  const std::string script =
      render_run_script({"/bin/echo", "a b", "$HOME"}, {{"FOO", "x y"}}, "/tmp/p/cats");
  expect(script.rfind("#!/bin/bash\n", 0) == 0, "script has shebang");
  expect(script.find("export 'FOO=x y'\n") != std::string::npos, "env exported");
  expect(script.find("cd '/tmp/p/cats'\n") != std::string::npos, "cwd set");
  expect(script.find("'/bin/echo' 'a b' '$HOME'\n") != std::string::npos, "argv quoted");
}

// ============================================================================
// Process launcher
// ============================================================================

void test_launcher_reports_spawn_failure() {
  ProcessSpec spec;
  spec.argv = {"/nonexistent/bivouac-binary"};
  ProcessResult r = run_process(spec);
  expect(!r.spawned, "missing binary never spawned");
  expect(r.error_message.find("Failed to execute") != std::string::npos, "spawn failure text");
  expect(r.error_message.find("/nonexistent/bivouac-binary") != std::string::npos,
         "spawn failure names binary");

  spec.argv = {find_bash(), "-c", "true"};
  spec.cwd = "/nonexistent/bivouac-dir";
  r = run_process(spec);
  expect(!r.spawned, "bad cwd never spawned");
  expect(r.error_message.find("/nonexistent/bivouac-dir") != std::string::npos,
         "chdir failure names directory");
}

void test_launcher_large_output() {
  ProcessSpec spec;
  spec.argv = {find_bash(), "-c", "head -c 300000 /dev/zero; head -c 200000 /dev/zero >&2"};
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  ProcessResult r = run_process(spec);
  expect(r.spawned && r.exit_code == 0, "large output run ok");
  expect(r.stdout_text.size() == 300000, "all stdout captured");
  expect(r.stderr_text.size() == 200000, "all stderr captured");
}

void test_timeout_message_format() {
  expect(timeout_message(std::chrono::milliseconds(1500), "desc") ==
             "Exceeded timeout of 1.5 seconds when executing local process: desc",
         "timeout message format");
}

// ============================================================================
// Runner: process outcome
// ============================================================================

void test_stdout() {
  TestEnv env = make_env("stdout");
  RunResult r = run_ok(env, command({"/bin/echo", "-n", "foo"}));
  expect(load(env, r.stdout_digest) == "foo", "stdout captured");
  expect(r.stderr_digest == empty_file_digest(), "stderr is the empty blob");
  expect(load(env, r.stderr_digest).empty(), "stderr empty");
  expect(r.exit_code == 0, "exit 0");
  expect(r.output_directory == empty_directory_digest(), "no outputs declared");
  expect(r.platform == *current_platform(), "platform recorded");
}

void test_stdout_and_stderr_and_exit_code() {
  TestEnv env = make_env("stdout_stderr_exit");
  RunResult r = run_ok(env, bash("echo -n foo ; echo >&2 -n bar ; exit 1"));
  expect(load(env, r.stdout_digest) == "foo", "stdout captured");
  expect(load(env, r.stderr_digest) == "bar", "stderr captured");
  expect(r.exit_code == 1, "nonzero exit is a result, not an error");
}

void test_capture_exit_code_signal() {
  TestEnv env = make_env("signal");
  RunResult r = run_ok(env, bash("kill $$"));
  expect(r.exit_code == -15, "SIGTERM death yields -15");
  expect(load(env, r.stdout_digest).empty(), "no stdout");
}

void test_env() {
  TestEnv env = make_env("env");
  Process p = command({"/usr/bin/env"});
  p.env = {{"FOO", "foo"}, {"BAR", "not foo"}};
  RunResult r = run_ok(env, p);
  expect(load(env, r.stdout_digest) == "BAR=not foo\nFOO=foo\n", "exact env, nothing inherited");
}

void test_env_is_deterministic() {
  TestEnv env = make_env("env_deterministic");
  Process p = command({"/usr/bin/env"});
  p.env = {{"FOO", "foo"}, {"BAR", "not foo"}};
  RunResult a = run_ok(env, p);
  RunResult b = run_ok(env, p);
  expect(a == b, "identical processes yield identical results");
}

void test_binary_not_found() {
  TestEnv env = make_env("binary_not_found");
  RunOutcome o = env.runner->run(command({"echo", "-n", "foo"})).get();
  expect(!o.ok(), "relative binary not found");
  expect(o.error_code == ErrorCode::spawn_failed, "spawn_failed code");
  expect(o.error_message.find("Failed to execute") != std::string::npos, "failure text");
  expect(o.error_message.find("echo") != std::string::npos, "names the executable");
  expect(count_entries(env.config.work_root) == 0, "sandbox released after spawn failure");
}

void test_validation_failure_touches_nothing() {
  TestEnv env = make_env("validation");
  RunOutcome o = env.runner->run_blocking(Process{});
  expect(o.error_code == ErrorCode::validation_failed, "empty argv rejected");
  expect(!fs::exists(env.config.work_root), "no sandbox for invalid process");
}

void test_timeout() {
  TestEnv env = make_env("timeout");
  Process p = bash("/bin/sleep 0.2; /bin/echo -n 'European Burmese'");
  p.timeout = std::chrono::milliseconds(100);
  p.description = "sleepy-cat";
  RunResult r = run_ok(env, p);
  expect(r.exit_code == -15, "timed out process killed by SIGTERM");
  const std::string out = load(env, r.stdout_digest);
  expect(out.find("Exceeded timeout") != std::string::npos, "timeout diagnostic in stdout");
  expect(out.find("sleepy-cat") != std::string::npos, "description in stdout");
  expect(out.find("European Burmese") == std::string::npos, "process did not finish");
}

void test_timeout_not_reached() {
  TestEnv env = make_env("timeout_not_reached");
  Process p = bash("echo -n quick");
  p.timeout = std::chrono::milliseconds(5000);
  RunResult r = run_ok(env, p);
  expect(r.exit_code == 0, "fast process exits normally");
  expect(load(env, r.stdout_digest) == "quick", "no diagnostic when in time");
}

void test_finished_process_with_lingering_descendant() {
  TestEnv env = make_env("lingering_descendant");
  Process p = bash("(/bin/sleep 3 &) ; echo -n done");
  p.timeout = std::chrono::milliseconds(300);
  p.description = "lingering-child";
  const auto t0 = std::chrono::steady_clock::now();
  RunResult r = run_ok(env, p);
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(r.exit_code == 0, "real exit status kept");
  expect(load(env, r.stdout_digest) == "done", "no timeout diagnostic for a finished process");
  expect(elapsed < std::chrono::milliseconds(2500), "descendants holding the pipes are killed");
}

void test_timeout_escalates_to_sigkill() {
  TestEnv env = make_env("timeout_sigkill", std::chrono::milliseconds(200));
  Process p = bash("trap '' TERM; /bin/sleep 5; /bin/sleep 5");
  p.timeout = std::chrono::milliseconds(200);
  p.description = "stubborn-cat";
  const auto t0 = std::chrono::steady_clock::now();
  RunResult r = run_ok(env, p);
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(r.exit_code == -9, "ignored SIGTERM escalates to SIGKILL");
  const std::string out = load(env, r.stdout_digest);
  expect(out.find("Exceeded timeout") != std::string::npos, "timeout diagnostic in stdout");
  expect(out.find("stubborn-cat") != std::string::npos, "description in stdout");
  expect(elapsed < std::chrono::milliseconds(3000), "kill grace bounds the wait");
}

// ============================================================================
// Runner: outputs
// ============================================================================

void test_output_files_none() {
  TestEnv env = make_env("outputs_none");
  RunResult r = run_ok(env, bash("echo -n " + kRoland + " > roland.ext"));
  expect(r.exit_code == 0, "exit 0");
  expect(r.output_directory == empty_directory_digest(), "undeclared files not captured");
}

void test_output_files_one() {
  TestEnv env = make_env("outputs_one");
  Process p = bash("echo -n " + kRoland + " > roland.ext");
  p.output_files = {rel("roland.ext")};
  RunResult r = run_ok(env, p);
  expect(r.output_directory == expected_tree(env.runner->store(), {{"roland.ext", kRoland, false}}),
         "one file captured");
}

void test_output_dirs() {
  TestEnv env = make_env("outputs_dirs");
  Process p = bash("/bin/mkdir cats && echo -n " + kRoland + " > cats/roland.ext");
  p.output_directories = {rel("cats")};
  RunResult r = run_ok(env, p);
  expect(r.output_directory ==
             expected_tree(env.runner->store(), {{"cats/roland.ext", kRoland, false}}),
         "directory walked");
}

void test_output_files_many() {
  TestEnv env = make_env("outputs_many");
  Process p = bash("echo -n " + kRoland + " > cats/roland.ext ; echo -n " + kTreats +
                   " > treats.ext");
  p.output_files = {rel("cats/roland.ext"), rel("treats.ext")};
  RunResult r = run_ok(env, p);
  expect(r.output_directory == expected_tree(env.runner->store(),
                                             {{"cats/roland.ext", kRoland, false},
                                              {"treats.ext", kTreats, false}}),
         "many files captured");
}

void test_output_files_execution_failure() {
  TestEnv env = make_env("outputs_failure");
  Process p = bash("echo -n " + kRoland + " > roland.ext ; exit 1");
  p.output_files = {rel("roland.ext")};
  RunResult r = run_ok(env, p);
  expect(r.exit_code == 1, "exit 1");
  expect(r.output_directory == expected_tree(env.runner->store(), {{"roland.ext", kRoland, false}}),
         "outputs captured from failed process");
}

void test_output_files_partial_output() {
  TestEnv env = make_env("outputs_partial");
  Process p = bash("echo -n " + kRoland + " > roland.ext");
  p.output_files = {rel("roland.ext"), rel("susannah")};
  RunResult r = run_ok(env, p);
  expect(r.output_directory == expected_tree(env.runner->store(), {{"roland.ext", kRoland, false}}),
         "missing declared file omitted");
}

void test_output_overlapping_file_and_dir() {
  TestEnv env = make_env("outputs_overlap");
  Process p = bash("echo -n " + kRoland + " > cats/roland.ext");
  p.output_files = {rel("cats/roland.ext")};
  p.output_directories = {rel("cats")};
  RunResult r = run_ok(env, p);
  expect(r.output_directory ==
             expected_tree(env.runner->store(), {{"cats/roland.ext", kRoland, false}}),
         "overlap merged into one tree");
}

void test_output_empty_dir() {
  TestEnv env = make_env("outputs_empty_dir");
  Process p = bash("/bin/mkdir falcons");
  p.output_directories = {rel("falcons")};
  RunResult r = run_ok(env, p);
  expect(r.output_directory == expected_tree(env.runner->store(), {}, {"falcons"}),
         "empty directory recorded");
}

void test_output_executable_bit() {
  TestEnv env = make_env("outputs_exec");
  Process p = bash("echo -n " + kTreats + " > tool.sh && /bin/chmod 755 tool.sh");
  p.output_files = {rel("tool.sh")};
  RunResult r = run_ok(env, p);
  expect(r.output_directory == expected_tree(env.runner->store(), {{"tool.sh", kTreats, true}}),
         "executable bit captured");
}

void test_all_containing_directories_for_outputs_are_created() {
  TestEnv env = make_env("outputs_parents");
  Process p = bash("/bin/mkdir birds/falcons && echo -n " + kRoland + " > cats/roland.ext");
  p.output_files = {rel("cats/roland.ext")};
  p.output_directories = {rel("birds/falcons")};
  RunResult r = run_ok(env, p);
  expect(r.exit_code == 0, "parents pre-created so mkdir and redirect succeed");
  expect(r.output_directory == expected_tree(env.runner->store(),
                                             {{"cats/roland.ext", kRoland, false}},
                                             {"birds/falcons"}),
         "tree holds both outputs");
}

// ============================================================================
// Runner: sandbox construction
// ============================================================================

void test_working_directory() {
  TestEnv env = make_env("working_directory");
  Process p = bash("/bin/ls");
  p.input_files = nested_input(env.runner->store());
  p.working_directory = rel("cats");
  p.output_directories = {rel("cats")};
  p.timeout = std::chrono::milliseconds(1000);
  p.description = "confused-cat";
  RunResult r = run_ok(env, p);
  expect(load(env, r.stdout_digest) == "roland.ext\n", "ran inside cats/");
  expect(r.output_directory == p.input_files, "outputs are sandbox-relative");
}

void test_working_directory_escape_rejected() {
  TestEnv env = make_env("working_directory_escape");
  Process p = command({"/bin/pwd"});
  p.jdk_home = env.root / "jdk";
  fs::create_directories(*p.jdk_home);
  p.working_directory = rel(kJdkSymlinkName);
  RunOutcome o = env.runner->run(p).get();
  expect(o.error_code == ErrorCode::path_escape, "symlinked cwd outside sandbox rejected");
  expect(count_entries(env.config.work_root) == 0, "sandbox released");
  expect(fs::exists(*p.jdk_home), "jdk target untouched");
}

void test_append_only_cache_created() {
  TestEnv env = make_env("append_only_cache");
  Process p = bash("echo -n hello > .cache/geo/greeting && /bin/ls .cache/geo");
  p.append_only_caches.emplace(*CacheName::create("geo", nullptr),
                               *CacheDest::create(".cache/geo", nullptr));
  RunResult r = run_ok(env, p);
  expect(load(env, r.stdout_digest) == "greeting\n", "cache mounted at dest");
  expect(r.output_directory == empty_directory_digest(), "no outputs");
  expect(read_file(env.config.named_caches_root / "geo" / "greeting") == "hello",
         "writes land in the persistent directory");

  Process again = command({"/bin/cat", ".cache/geo/greeting"});
  again.append_only_caches = p.append_only_caches;
  RunResult r2 = run_ok(env, again);
  expect(load(env, r2.stdout_digest) == "hello", "cache survives across runs");
}

void test_jdk_symlink() {
  TestEnv env = make_env("jdk_symlink");
  const fs::path jdk = env.root / "jdk";
  write_file(jdk / "roland.ext", kRoland);
  Process p = command({"/bin/cat", ".jdk/roland.ext"});
  p.timeout = std::chrono::milliseconds(1000);
  p.description = "cat roland.ext";
  p.jdk_home = jdk;
  RunResult r = run_ok(env, p);
  expect(load(env, r.stdout_digest) == kRoland, "jdk mounted at .jdk");
  expect(load(env, r.stderr_digest).empty(), "no stderr");
  expect(r.output_directory == empty_directory_digest(), "no outputs");
  expect(read_file(jdk / "roland.ext") == kRoland, "jdk contents survive discard");
}

void test_missing_input_tree_fails_setup() {
  TestEnv env = make_env("missing_input");
  Process p = command({"/bin/true"});
  p.input_files = Digest{std::string(64, 'b'), 42};
  RunOutcome o = env.runner->run(p).get();
  expect(o.error_code == ErrorCode::sandbox_setup_failed, "unknown input tree fails setup");
  expect(count_entries(env.config.work_root) == 0, "sandbox released");
}

// ============================================================================
// Runner: finalization
// ============================================================================

void test_sandbox_discarded() {
  TestEnv env = make_env("discard");
  run_ok(env, bash("echo -n x > junk"));
  expect(count_entries(env.config.work_root) == 0, "sandbox removed after run");
  expect(count_entries(env.config.preserve_root) == 0, "nothing preserved");
}

void test_directory_preservation() {
  TestEnv env = make_env("preservation");
  const std::string contents = "echo $PWD && " + find_cp() + " roland.ext ..";
  Process p = command({find_bash(), "-c", contents});
  p.output_files = {rel("roland.ext")};
  p.input_files = nested_input(env.runner->store());
  p.working_directory = rel("cats");

  RunResult r = run_ok(env, p, /*preserve=*/true);
  expect(r.output_directory == expected_tree(env.runner->store(), {{"roland.ext", kRoland, false}}),
         "output captured before preservation");
  expect(count_entries(env.config.work_root) == 0, "sandbox moved out of the work root");
  expect(count_entries(env.config.preserve_root) == 1, "exactly one preserved sandbox");

  const fs::path preserved = fs::directory_iterator(env.config.preserve_root)->path();
  const fs::path rolands_path = preserved / "roland.ext";
  const fs::path script = preserved / kRunScriptName;
  expect(fs::exists(rolands_path), "outputs kept in preserved sandbox");
  expect(fs::exists(script), "run script written");

  fs::remove(rolands_path);
  const int rc = std::system((shell_quote(script.string()) + " > /dev/null").c_str());
  expect(rc == 0, "run script exits 0");
  expect(fs::exists(rolands_path), "run script reproduces side effects");
  expect(read_file(script).find(shell_quote(contents)) != std::string::npos,
         "script holds the quoted command line");
}

void test_directory_preservation_error() {
  TestEnv env = make_env("preservation_error");
  expect(count_entries(env.config.preserve_root) == 0, "preserve root starts empty");
  RunContext ctx;
  ctx.preserve_sandbox = true;
  RunOutcome o = env.runner->run(command({"doesnotexist"}), ctx).get();
  expect(!o.ok(), "want process to fail");
  expect(count_entries(env.config.preserve_root) == 1, "failed sandbox preserved");
  expect(count_entries(env.config.work_root) == 0, "work root left clean");
}

void test_preserve_leaves_no_source_behind() {
  const fs::path tmp = test_root("preserve_source");
  const fs::path work_root = tmp / "work";
  std::vector<fs::path> preserve_roots = {tmp / "preserved"};
  struct stat tmp_st {};
  struct stat shm_st {};
  // /dev/shm is usually another filesystem, which forces the copy path.
  if (::stat(tmp.c_str(), &tmp_st) == 0 && ::stat("/dev/shm", &shm_st) == 0 &&
      tmp_st.st_dev != shm_st.st_dev && ::access("/dev/shm", W_OK) == 0) {
    const fs::path shm = fs::path("/dev/shm") / "bivouac_tests_preserve";
    fs::remove_all(shm);
    preserve_roots.push_back(shm);
  }

  Process p = command({"/bin/true"});
  for (const auto& root : preserve_roots) {
    fs::path source;
    std::optional<fs::path> preserved;
    {
      std::string err;
      auto wd = WorkDir::create(work_root, &err);
      expect(wd.has_value(), "workdir: " + err);
      source = wd->path();
      write_file(source / "cats" / "roland.ext", kRoland);
      preserved = preserve_workdir(*wd, root, p, &err);
      expect(preserved.has_value(), "preserve: " + err);
    }
    expect(!fs::exists(source), "source sandbox removed after preserving");
    expect(read_file(*preserved / "cats" / "roland.ext") == kRoland, "contents preserved");
    expect(fs::exists(*preserved / kRunScriptName), "run script written");
    fs::remove_all(root);
  }
  fs::remove_all(tmp);
}

// ============================================================================
// Concurrency & observability
// ============================================================================

void test_concurrent_runs() {
  TestEnv env = make_env("concurrent");
  std::vector<std::future<RunOutcome>> futs;
  for (int i = 0; i < 8; ++i) {
    Process p = bash("echo -n " + std::to_string(i) + " > out.txt");
    p.output_files = {rel("out.txt")};
    futs.push_back(env.runner->run(std::move(p)));
  }
  for (int i = 0; i < 8; ++i) {
    RunOutcome o = futs[static_cast<size_t>(i)].get();
    expect(o.ok(), "concurrent run ok");
    expect(o.result->output_directory ==
               expected_tree(env.runner->store(), {{"out.txt", std::to_string(i), false}}),
           "runs do not share sandboxes");
  }
  expect(count_entries(env.config.work_root) == 0, "all sandboxes released");
}

void test_dropped_futures_finish_on_teardown() {
  TestEnv env = make_env("dropped_futures", std::chrono::milliseconds(2000), 1);
  const uint64_t total0 = global_engine_stats().total_runs.load();
  for (int i = 0; i < 3; ++i)
    (void)env.runner->run(command({"/bin/sleep", "0.2"}));
  env.runner.reset();
  expect(global_engine_stats().total_runs.load() == total0 + 3, "queued runs completed");
  expect(count_entries(env.config.work_root) == 0, "their sandboxes were removed");
}

std::atomic<int> g_hook_events{0};
std::atomic<int> g_hook_timeouts{0};

void counting_hook(const RunEvent& ev) {
  g_hook_events++;
  if (ev.timed_out) g_hook_timeouts++;
}

void test_run_events() {
  TestEnv env = make_env("events");
  EngineStats& stats = global_engine_stats();
  const uint64_t total0 = stats.total_runs.load();
  const uint64_t failed0 = stats.failed_runs.load();
  const uint64_t spawn0 = stats.spawn_failures.load();

  set_run_event_hook(counting_hook);
  g_hook_events = 0;
  run_ok(env, command({"/bin/echo", "-n", "foo"}));
  RunOutcome o = env.runner->run(command({"doesnotexist"})).get();
  expect(!o.ok(), "spawn failure");
  set_run_event_hook(nullptr);

  expect(g_hook_events == 2, "one event per run");
  expect(stats.total_runs.load() == total0 + 2, "runs counted");
  expect(stats.failed_runs.load() == failed0 + 1, "failure counted");
  expect(stats.spawn_failures.load() == spawn0 + 1, "spawn failure counted");
  expect(stats.to_json().find("\"total_runs\":") != std::string::npos, "stats JSON");

  RunEvent ev;
  ev.run_id = "r-1";
  ev.description = "quote \" and \\ slash";
  const std::string json = run_event_to_json(ev);
  expect(json.find("quote \\\" and \\\\ slash") != std::string::npos, "description escaped");
  expect(next_run_id() != next_run_id(), "run ids unique");
}

void test_latency_histogram() {
  LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 100; ++i) h.record(1'000'000);  // 1ms
  expect(h.count() == 100, "count");
  expect(h.mean_us() == 1000.0, "mean");
  const double p50 = h.percentile(0.5);
  expect(p50 >= 512.0 && p50 <= 1024.0, "p50 in the 1ms bucket");
}

}  // namespace

int main() {
  std::cout << "=== bivouac Test Suite ===\n";

  std::cout << "\n[Hashing & store]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("file hashing", test_file_hashing);
  run_test("CAS put/get integrity", test_cas_put_get_integrity);
  run_test("CAS corruption detection", test_cas_corruption_detection);
  run_test("CAS invalid digest rejected", test_cas_invalid_digest_rejected);
  run_test("CAS zstd encoding", test_cas_zstd);

  std::cout << "\n[Merkle trees]\n";
  run_test("tree encoding is canonical", test_tree_encoding_is_canonical);
  run_test("tree decode rejects malformed", test_tree_decode_rejects_malformed);
  run_test("empty directory digest", test_empty_directory_digest);
  run_test("tree builder merges overlap", test_tree_builder_merges_overlap);
  run_test("materialize structure and modes", test_materialize_preserves_structure_and_modes);

  std::cout << "\n[Data model]\n";
  run_test("relative path rules", test_relative_path_rules);
  run_test("cache name/dest validation", test_cache_name_and_dest_validation);
  run_test("process validation", test_validate_process);
  run_test("platform identity", test_platform_identity);

  std::cout << "\n[Collaborators]\n";
  run_test("executor futures", test_executor_futures);
  run_test("executor queue depth", test_executor_queue_depth);
  run_test("named caches idempotent + concurrent", test_named_caches_idempotent_and_concurrent);
  run_test("config from env", test_config_from_env);
  run_test("shell quoting + run script", test_shell_quote);

  std::cout << "\n[Process launcher]\n";
  run_test("spawn failure reported", test_launcher_reports_spawn_failure);
  run_test("large output captured", test_launcher_large_output);
  run_test("timeout message format", test_timeout_message_format);

  std::cout << "\n[Runner] Process outcome\n";
  run_test("stdout", test_stdout);
  run_test("stdout, stderr and exit code", test_stdout_and_stderr_and_exit_code);
  run_test("signal exit code", test_capture_exit_code_signal);
  run_test("env", test_env);
  run_test("env is deterministic", test_env_is_deterministic);
  run_test("binary not found", test_binary_not_found);
  run_test("validation failure touches nothing", test_validation_failure_touches_nothing);
  run_test("timeout", test_timeout);
  run_test("timeout not reached", test_timeout_not_reached);
  run_test("finished process with lingering descendant",
           test_finished_process_with_lingering_descendant);
  run_test("timeout escalates to SIGKILL", test_timeout_escalates_to_sigkill);

  std::cout << "\n[Runner] Outputs\n";
  run_test("output files none", test_output_files_none);
  run_test("output files one", test_output_files_one);
  run_test("output dirs", test_output_dirs);
  run_test("output files many", test_output_files_many);
  run_test("output files execution failure", test_output_files_execution_failure);
  run_test("output files partial output", test_output_files_partial_output);
  run_test("output overlapping file and dir", test_output_overlapping_file_and_dir);
  run_test("output empty dir", test_output_empty_dir);
  run_test("output executable bit", test_output_executable_bit);
  run_test("containing directories created",
           test_all_containing_directories_for_outputs_are_created);

  std::cout << "\n[Runner] Sandbox construction\n";
  run_test("working directory", test_working_directory);
  run_test("working directory escape rejected", test_working_directory_escape_rejected);
  run_test("append-only cache", test_append_only_cache_created);
  run_test("jdk symlink", test_jdk_symlink);
  run_test("missing input tree", test_missing_input_tree_fails_setup);

  std::cout << "\n[Runner] Finalization\n";
  run_test("sandbox discarded", test_sandbox_discarded);
  run_test("directory preservation", test_directory_preservation);
  run_test("directory preservation on error", test_directory_preservation_error);
  run_test("preserve leaves no source behind", test_preserve_leaves_no_source_behind);

  std::cout << "\n[Concurrency & observability]\n";
  run_test("concurrent runs", test_concurrent_runs);
  run_test("dropped futures finish on teardown", test_dropped_futures_finish_on_teardown);
  run_test("run events + stats", test_run_events);
  run_test("latency histogram", test_latency_histogram);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
