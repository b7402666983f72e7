#include <catch2/catch_test_macros.hpp>

#define STRINGIFY_HELPER(x) #x
#define STRINGIFY(x) STRINGIFY_HELPER(x)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

static const std::string eqp_cli = STRINGIFY(EQP_CLI);
static const std::string data_dir = STRINGIFY(EQP_TEST_DATA_DIR);

// Portable exit code extraction: WEXITSTATUS on POSIX, raw value on Windows
static int
exit_code(int status) {
#ifdef _WIN32
  return status;
#else
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
#endif
}

static std::string
slurp(const fs::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

static int
run_cli(const std::string& args) {
  std::string cmd = eqp_cli + " " + args + " >/dev/null 2>/dev/null";
  return exit_code(std::system(cmd.c_str()));
}

// Runs the tool and captures both output streams.
static int
run_cli_capture(const std::string& args, std::string& out, std::string& err) {
  auto out_file = fs::temp_directory_path() / "eqp_cli_stdout.txt";
  auto err_file = fs::temp_directory_path() / "eqp_cli_stderr.txt";
  std::string cmd = eqp_cli + " " + args + " >" + out_file.string() + " 2>" +
                    err_file.string();
  int rc = exit_code(std::system(cmd.c_str()));
  out = slurp(out_file);
  err = slurp(err_file);
  fs::remove(out_file);
  fs::remove(err_file);
  return rc;
}

TEST_CASE("--help exits 0 and produces output", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("--help", out, err);
  CHECK(rc == 0);
  CHECK(err.find("Usage") != std::string::npos);
}

TEST_CASE("-h exits 0", "[cli]") {
  CHECK(run_cli("-h") == 0);
}

TEST_CASE("--version exits 0 and names the tool", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("--version", out, err);
  CHECK(rc == 0);
  CHECK(err.find("eqp") != std::string::npos);
}

TEST_CASE("no arguments exits 1 (usage error)", "[cli]") {
  CHECK(run_cli("") == 1);
}

TEST_CASE("unknown option exits 1", "[cli]") {
  CHECK(run_cli("--bogus") == 1);
}

TEST_CASE("-f without a file exits 1", "[cli]") {
  CHECK(run_cli("-f") == 1);
}

TEST_CASE("nonexistent input file exits 2 (file error)", "[cli]") {
  CHECK(run_cli("-f nonexistent.txt") == 2);
}

TEST_CASE("expression argument prints the tree", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("'x+t*5'", out, err);
  CHECK(rc == 0);
  CHECK(out == "(x + (t * 5))\n");
  CHECK(err.empty());
}

TEST_CASE("several expressions print in order", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("'log(x)' 't'", out, err);
  CHECK(rc == 0);
  CHECK(out == "(ln(x) / ln(10))\nt\n");
}

TEST_CASE("invalid expression exits 3 with a position", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("'5 5'", out, err);
  CHECK(rc == 3);
  CHECK(err.find("argument 1") != std::string::npos);
  CHECK(err.find("line 1, column 3") != std::string::npos);
}

TEST_CASE("unknown character exits 3", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("'5 $'", out, err);
  CHECK(rc == 3);
  CHECK(err.find("no pattern matches") != std::string::npos);
}

TEST_CASE("later expressions are processed after a failure", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("'5+' 't'", out, err);
  CHECK(rc == 3);
  CHECK(out == "t\n");
}

TEST_CASE("-- ends option processing", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("-- -x", out, err);
  CHECK(rc == 3);
  CHECK(err.find("unknown option") == std::string::npos);
}

TEST_CASE("--tokens prints the token stream", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("--tokens 'x + 2'", out, err);
  CHECK(rc == 0);
  CHECK(out == "parameter 'x' @0\nadd '+' @2\nint '2' @4\n");
}

TEST_CASE("-f reads expressions and skips comments", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("-f " + data_dir + "/expressions.txt", out, err);
  CHECK(rc == 0);
  CHECK(out == "(k1 * x)\n((a + b) * t)\n(ln(c) / ln(10))\n");
}

TEST_CASE("-f reports the failing line", "[cli]") {
  std::string out, err;
  int rc = run_cli_capture("-f " + data_dir + "/bad_expression.txt", out, err);
  CHECK(rc == 3);
  CHECK(out == "(x + 1)\n");
  CHECK(err.find("bad_expression.txt:2") != std::string::npos);
}
