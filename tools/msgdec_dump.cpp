#include <msgdec/core/config.h>
#include <msgdec/core/diagnostics.h>
#include <msgdec/decode/decoder.h>
#include <msgdec/decode/resolver.h>
#include <msgdec/io/byte_source.h>
#include <msgdec/io/fd_source.h>
#include <msgdec/io/zlib_source.h>
#include <msgdec/value/value.h>

#include <unistd.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFault = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& stream) {
  stream << "usage: " << msgdec::core::config::kToolName
         << " [--gzip] [--bytes-literal=on|off] [--bytes-in-seq=on|off]"
            " [--bytes-in-map=on|off] [--verbose] <file|->\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

// "--name=on" / "--name=off". Returns nullopt when the argument is not this
// flag; sets ok to false when it is but the value is malformed.
std::optional<bool> parse_switch(std::string_view argument, std::string_view name, bool& ok) {
  if (!starts_with(argument, name) || argument.size() <= name.size() ||
      argument[name.size()] != '=') {
    return std::nullopt;
  }
  const std::string_view value = argument.substr(name.size() + 1);
  if (value == "on") {
    return true;
  }
  if (value == "off") {
    return false;
  }
  ok = false;
  return std::nullopt;
}

struct DumpOptions {
  bool gzip = false;
  bool verbose = false;
  msgdec::decode::ResolverOptions resolver;
  std::string input;
};

int dump(msgdec::io::ByteSource& source, const DumpOptions& options) {
  msgdec::core::DiagnosticEmitter diagnostics;
  if (options.verbose) {
    diagnostics.add_observer([](const msgdec::core::DiagnosticEvent& event) {
      std::cerr << msgdec::core::format_diagnostic(event) << "\n";
    });
  }

  msgdec::decode::DecoderOptions decoder_options;
  decoder_options.resolver =
      std::make_shared<msgdec::decode::SimpleContainerResolver>(options.resolver);
  decoder_options.diagnostics = &diagnostics;
  msgdec::decode::Decoder decoder(source, decoder_options);

  while (true) {
    const std::uint64_t before = decoder.bytes_consumed();
    msgdec::value::Value value;
    const msgdec::core::DecodeResult result = decoder.decode(&value);
    if (result.ok) {
      std::cout << value.to_string() << "\n";
      continue;
    }

    // Running dry exactly at a value boundary is the normal end of input.
    if (result.kind == msgdec::core::ErrorKind::Read && decoder.bytes_consumed() == before) {
      return kExitOk;
    }

    msgdec::core::FailureTrace trace =
        msgdec::core::capture_failure(diagnostics, decoder.call_count(), result);
    trace.add_context("input", options.input);
    trace.add_context("value_index", std::to_string(decoder.call_count() - 1));
    trace.add_context("value_offset", std::to_string(before));
    std::cerr << trace.format();
    return kExitFault;
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return kExitOk;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << msgdec::core::config::kVersionString << "\n";
    return kExitOk;
  }

  DumpOptions options;
  bool has_input = false;
  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (argument == "--gzip") {
      options.gzip = true;
      continue;
    }
    if (argument == "--verbose") {
      options.verbose = true;
      continue;
    }

    bool ok = true;
    if (auto flag = parse_switch(argument, "--bytes-literal", ok)) {
      options.resolver.bytes_as_string_top_level = *flag;
      continue;
    }
    if (auto flag = parse_switch(argument, "--bytes-in-seq", ok)) {
      options.resolver.bytes_as_string_in_sequence = *flag;
      continue;
    }
    if (auto flag = parse_switch(argument, "--bytes-in-map", ok)) {
      options.resolver.bytes_as_string_in_map = *flag;
      continue;
    }
    if (!ok) {
      std::cerr << "Invalid flag value: '" << argument << "' (expected on or off)\n";
      print_usage(std::cerr);
      return kExitUsage;
    }

    if ((starts_with(argument, "-") && argument != "-") || has_input) {
      std::cerr << "Unexpected argument: '" << argument << "'\n";
      print_usage(std::cerr);
      return kExitUsage;
    }
    options.input = std::string(argument);
    has_input = true;
  }

  if (!has_input) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  std::unique_ptr<msgdec::io::ByteSource> raw;
  std::ifstream file;
  if (options.input == "-") {
    raw = std::make_unique<msgdec::io::FdSource>(STDIN_FILENO);
  } else {
    file.open(options.input, std::ios::binary);
    if (!file) {
      std::cerr << "Cannot open input: " << options.input << "\n";
      return kExitUsage;
    }
    raw = std::make_unique<msgdec::io::StreamSource>(file);
  }

  if (options.gzip) {
    msgdec::io::ZlibSource inflated(*raw);
    return dump(inflated, options);
  }
  return dump(*raw, options);
}
