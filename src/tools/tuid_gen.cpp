#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <gflags/gflags.h>

#include "codegen/emit.hpp"
#include "codegen/enum_decl.hpp"
#include "codegen/validate.hpp"
#include "common/logging/log.hpp"

DEFINE_string(input, "", "Kind description file (JSON)");
DEFINE_string(output, "", "Header to write; required unless --check is set");
DEFINE_bool(check, false, "Validate the description without writing a header");
DEFINE_string(kind_header, "core/kind.hpp", "Include path of the KindTraits declaration");

namespace {

namespace codegen = tuid::codegen;

auto read_file(const std::filesystem::path& path, std::string& content) -> bool {
  std::ifstream file(path);
  if (!file) {
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  content = buffer.str();
  return true;
}

// Leaves an up-to-date header alone so dependent targets do not rebuild.
auto write_if_changed(const std::filesystem::path& path, const std::string& content) -> bool {
  std::string existing;
  if (read_file(path, existing) && existing == content) {
    tuid::log::debug("{} is up to date", path.string());
    return true;
  }
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return false;
    }
  }
  std::ofstream file(path, std::ios::trunc | std::ios::binary);
  if (!file) {
    return false;
  }
  file << content;
  return static_cast<bool>(file);
}

auto report(const codegen::CodegenError& error) -> int {
  const auto diagnostic = codegen::format_diagnostic(error);
  tuid::log::debug("generation failed for {}", FLAGS_input);
  std::cerr << FLAGS_input << ": " << diagnostic << "\n";
  return 1;
}

auto run() -> int {
  if (FLAGS_input.empty()) {
    std::cerr << "error: --input is required\n";
    return 2;
  }
  if (FLAGS_output.empty() && !FLAGS_check) {
    std::cerr << "error: --output is required unless --check is set\n";
    return 2;
  }

  const std::filesystem::path input_path(FLAGS_input);
  std::string text;
  if (!read_file(input_path, text)) {
    std::cerr << "error: cannot read " << FLAGS_input << "\n";
    return 1;
  }

  codegen::Json json;
  try {
    json = codegen::Json::parse(text);
  } catch (const std::exception& ex) {
    return report(codegen::make_error(codegen::CodegenErrorCode::InvalidInput, "",
                                      std::format("malformed JSON: {}", ex.what())));
  }

  auto decls = codegen::parse_enum_decls(json);
  if (!decls) {
    return report(decls.error());
  }

  // Every description must pass before anything is written.
  std::vector<codegen::KindTable> tables;
  tables.reserve(decls->size());
  for (const auto& decl : *decls) {
    auto table = codegen::derive_kind_table(decl);
    if (!table) {
      return report(table.error());
    }
    tables.push_back(std::move(*table));
  }

  if (FLAGS_check) {
    tuid::log::info("{}: {} kind table(s) valid", FLAGS_input, tables.size());
    return 0;
  }

  codegen::EmitOptions options;
  options.source_name = input_path.filename().string();
  options.kind_header = FLAGS_kind_header;
  const auto header = codegen::emit_header(tables, options);

  if (!write_if_changed(FLAGS_output, header)) {
    std::cerr << "error: cannot write " << FLAGS_output << "\n";
    return 1;
  }
  tuid::log::info("generated", {{"input", FLAGS_input},
                                {"output", FLAGS_output},
                                {"tables", std::to_string(tables.size())}});
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("tuid_gen --input=<kinds.json> --output=<kinds.hpp>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  tuid::log::init();

  const int status = run();

  tuid::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return status;
}
