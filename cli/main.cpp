/**
 * @file main.cpp
 * @brief escrle-cli: one-shot line encoder/decoder around the escrle codec.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); fall back to the environment for defaults.
 *  - Take the text from the positional argument or read one line from stdin
 *    (re-prompting on an empty line when stdin is a terminal).
 *  - Pick a direction: header present -> decode, otherwise encode; or forced by
 *    --encode / --decode. The plain scheme decodes whenever a digit is present.
 *  - Print the result as pretty text, JSON or raw output.
 *
 * Notes:
 *  - The library never prints; all presentation lives here.
 *  - Diagnostics go to stderr as `status=... key=value` lines with --verbose.
 *  - Exit status: 0 success, 2 codec error, CLI11 codes for usage errors.
 *
 * Examples:
 * @code
 *   escrle-cli AAAA                 # Encoded => ##00A4
 *   escrle-cli '##00Z#0##2A'        # Decoded => Z0##A
 *   escrle-cli --scheme plain A3BC2 # Decoded => AAABCC
 *   echo 'B12' | escrle-cli --format json --tokens
 * @endcode
 */

#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <vector>
#include <limits>
#include <iostream>
#include <iomanip>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"

#include "escrle/codec.hpp"
#include "escrle/plain.hpp"
#include "escrle/report.hpp"
#include "escrle/token.hpp"
#include "escrle/utf8.hpp"

using namespace escrle;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }
static bool is_tty_stdin()  { return ::isatty(fileno(stdin)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

// ESCRLE_MAX_OUTPUT=<bytes>; anything unparsable keeps the built-in default.
static size_t max_output_from_env(bool verbose) {
  const char* v = std::getenv("ESCRLE_MAX_OUTPUT");
  if (!v || !*v) return DEFAULT_MAX_OUTPUT;
  char* end = nullptr;
  unsigned long long n = std::strtoull(v, &end, 10);
  if (*end != '\0' || n == 0 || n > std::numeric_limits<size_t>::max()) {
    if (verbose) std::cerr << "status=warn reason=bad_env name=ESCRLE_MAX_OUTPUT value=" << v << "\n";
    return DEFAULT_MAX_OUTPUT;
  }
  return static_cast<size_t>(n);
}

static void strip_cr(std::string& s) {
  if (!s.empty() && s.back() == '\r') s.pop_back();
}

// Interactive: keep asking until a non-empty line arrives. Piped: take one line as-is.
// Returns false only when stdin ends before any line.
static bool read_input_line(std::string& out) {
  if (!is_tty_stdin()) {
    if (!std::getline(std::cin, out)) return false;
    strip_cr(out);
    return true;
  }
  while (true) {
    std::cout << "Enter text (starts with '##00' to decode; otherwise encode): " << std::flush;
    if (!std::getline(std::cin, out)) return false;
    strip_cr(out);
    if (!out.empty()) return true;
    std::cout << "Invalid input: input cannot be empty.\n";
  }
}

static void print_tokens_pretty(const std::vector<Token>& toks, const Ansi& ansi) {
  std::cout << ansi.bold("Tokens") << " (" << toks.size() << ")\n";
  size_t idx = 0;
  for (const auto& t : toks) {
    std::cout << "  " << std::right << std::setw(4) << idx++ << "  "
              << std::left << std::setw(10) << to_text(t)
              << "literal=" << t.literal_str()
              << "  count=" << t.count
              << (t.escaped ? ansi.dim("  escaped") : std::string())
              << ansi.dim("  @" + std::to_string(t.offset)) << "\n";
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_text;
  bool opt_encode = false;
  bool opt_decode = false;
  std::string opt_scheme = "escaped";   // escaped|plain
  std::string opt_format = "pretty";    // pretty|json|raw
  bool opt_tokens = false;
  bool opt_no_color = false;
  bool opt_verbose = false;
  size_t opt_max_output = 0;            // 0 => env / default

  CLI::App app{"escrle: escaped run-length text codec"};

  auto* in_opt = app.add_option("text", opt_text,
      "Text to encode, or a '##00' stream to decode (default: one line from stdin)");
  auto* enc = app.add_flag("-e,--encode", opt_encode, "Always encode");
  auto* dec = app.add_flag("-d,--decode", opt_decode, "Always decode");
  enc->excludes(dec);

  app.add_option("--scheme", opt_scheme, "Codec: escaped|plain")
     ->capture_default_str()
     ->check(CLI::IsMember({"escaped", "plain"}));
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")
     ->capture_default_str()
     ->check(CLI::IsMember({"pretty", "json", "raw"}));
  app.add_flag("--tokens", opt_tokens, "List the tokens of the encoded stream (escaped scheme)");
  app.add_option("--max-output", opt_max_output,
                 "Decoded size limit in bytes (env ESCRLE_MAX_OUTPUT, default 64 MiB)")
     ->check(CLI::Range(size_t{1}, std::numeric_limits<size_t>::max()));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("-v,--verbose", opt_verbose, "Print status lines on stderr");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";

  Limits limits;
  limits.max_output = opt_max_output ? opt_max_output : max_output_from_env(opt_verbose);

  // Input
  std::string input;
  if (in_opt->count() > 0) {
    input = opt_text;
  } else if (!read_input_line(input)) {
    std::cerr << "status=error reason=no_input\n";
    return 2;
  }

  // Direction
  const bool plain_scheme = (opt_scheme == "plain");
  Direction dir;
  if (opt_encode)      dir = Direction::Encode;
  else if (opt_decode) dir = Direction::Decode;
  else if (plain_scheme) dir = plain::looks_encoded(input) ? Direction::Decode : Direction::Encode;
  else                 dir = classify(input);

  // Run
  std::string output;
  Fault fault;
  bool ok;
  if (plain_scheme) {
    ok = (dir == Direction::Decode) ? plain::decode(input, output, fault, limits)
                                    : plain::encode(input, output, fault);
  } else {
    ok = (dir == Direction::Decode) ? decode(input, output, fault, limits)
                                    : encode(input, output, fault);
  }

  const std::string op = direction_name(dir);

  if (!ok) {
    if (opt_verbose) {
      std::cerr << "status=error op=" << op << " scheme=" << opt_scheme
                << " reason=" << error_name(fault.code)
                << " offset=" << fault.offset << "\n";
    }
    if (opt_format == "json") {
      std::cout << report::fault_json(op, opt_scheme, input, fault, 2) << "\n";
    } else {
      std::cerr << ansi.red(std::string("Error: ") + error_message(fault.code)) << "\n";
    }
    return 2;
  }

  // Tokens of whichever side is the encoded stream. It was already validated
  // by the codec, so tokenize cannot fail here.
  std::vector<Token> toks;
  const bool want_tokens = opt_tokens && !plain_scheme;
  if (want_tokens) {
    const std::string& stream = (dir == Direction::Decode) ? input : output;
    Fault tf;
    if (!tokenize(stream, toks, tf)) {
      std::cerr << "status=error reason=" << error_name(tf.code) << " stage=tokens\n";
      return 2;
    }
  }

  if (opt_verbose) {
    std::cerr << "status=ok op=" << op << " scheme=" << opt_scheme
              << " in_bytes=" << input.size()
              << " out_bytes=" << output.size()
              << " out_chars=" << utf8::count_code_points(output) << "\n";
  }

  if (opt_format == "json") {
    std::cout << report::result_json(op, opt_scheme, input, output,
                                     want_tokens ? &toks : nullptr, 2) << "\n";
  } else if (opt_format == "raw") {
    std::cout << output << "\n";
  } else {
    const char* label = (dir == Direction::Decode) ? "Decoded => " : "Encoded => ";
    std::cout << ansi.bold(label) << output << "\n";
    if (want_tokens) print_tokens_pretty(toks, ansi);
  }

  return 0;
}
