#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <core/document_loader.hpp>
#include <core/error.hpp>
#include <core/options.hpp>
#include <processor.hpp>
#include <rdf/number_format.hpp>

using std::string;
using std::vector;
using std::cin, std::cout, std::cerr, std::endl;
using namespace ldmill;

namespace {

  constexpr auto usage =
    "usage: ldmill <command> [flags] <input> [context|frame]\n"
    "commands: expand compact flatten frame tordf fromrdf normalize format-number\n"
    "flags: --base=<iri> --options=<file> --native-types --rdf-type --generalized --urgna2012 --verbose\n"
    "An input of \"-\" reads standard input.\n";

  // See: https://stackoverflow.com/questions/116038/how-do-i-read-an-entire-file-into-a-stdstring-in-c
  auto readFile(string const& path) -> string {
    auto sstr = std::ostringstream();
    if (path == "-") {
      sstr << cin.rdbuf();
      return sstr.str();
    }
    auto in = std::ifstream(path);
    if (!in) throw core::JsonLdError(core::ErrorCode::ioError, "cannot open " + path);
    sstr << in.rdbuf();
    return sstr.str();
  }

  auto readJson(string const& path) -> Json {
    try {
      return Json::parse(readFile(path));
    } catch (Json::parse_error& e) {
      throw core::JsonLdError(core::ErrorCode::parseError, path + ": " + e.what());
    }
  }

  auto run(string const& command, core::Options opts, vector<string> const& operands) -> int {
    if (command == "format-number") {
      if (operands.size() != 1) throw core::JsonLdError(core::ErrorCode::invalidInput, "format-number takes one number");
      auto value = 0.0;
      try {
        value = std::stod(operands[0]);
      } catch (std::logic_error&) {
        throw core::JsonLdError(core::ErrorCode::invalidInput, "not a number: " + operands[0]);
      }
      cout << rdf::formatNumber(value) << endl;
      return 0;
    }

    auto const needs = (command == "compact" || command == "frame") ? 2uz : 1uz;
    if (operands.size() < needs || operands.size() > 2) {
      cerr << usage;
      return 2;
    }

    auto const& input = operands[0];
    if (opts.base.empty() && input != "-") opts.base = "file://" + std::filesystem::absolute(input).string();
    if (command == "tordf" || command == "normalize") opts.format = string(core::nquadsFormat);

    auto const printRdf = [](RdfDocument const& doc) {
      cout << std::get<string>(doc);
    };

    if (command == "fromrdf") {
      cout << Processor(opts).fromRdf(readFile(input)).dump(2) << endl;
    } else if (command == "normalize" && core::isNQuadsFormat(opts.inputFormat)) {
      printRdf(Processor(opts).normalize(Json(readFile(input))));
    } else {
      auto const document = readJson(input);
      auto const processor = Processor(opts);
      auto const second = operands.size() == 2 ? readJson(operands[1]) : Json();
      if (command == "expand") cout << processor.expand(document).dump(2) << endl;
      else if (command == "compact") cout << processor.compact(document, second).dump(2) << endl;
      else if (command == "flatten") cout << processor.flatten(document, second).dump(2) << endl;
      else if (command == "frame") cout << processor.frame(document, second).dump(2) << endl;
      else if (command == "tordf") printRdf(processor.toRdf(document));
      else if (command == "normalize") printRdf(processor.normalize(document));
      else {
        cerr << "unknown command: " << command << endl << usage;
        return 2;
      }
    }
    return 0;
  }

}

auto main(int argc, char* argv[]) -> int {
  auto const args = std::span(argv, static_cast<size_t>(argc));
  if (args.size() < 2) {
    cerr << usage;
    return 2;
  }

  auto const command = string(args[1]);
  auto opts = core::Options();
  opts.documentLoader = std::make_shared<core::CachingDocumentLoader>(std::make_shared<core::FileDocumentLoader>());
  auto operands = vector<string>();

  try {
    for (auto i = 2uz; i < args.size(); i++) {
      auto const arg = string(args[i]);
      if (arg.starts_with("--base=")) opts.base = arg.substr(7);
      else if (arg.starts_with("--options=")) core::from_json(readJson(arg.substr(10)), opts);
      else if (arg == "--native-types") opts.useNativeTypes = true;
      else if (arg == "--rdf-type") opts.useRdfType = true;
      else if (arg == "--generalized") opts.produceGeneralizedRdf = true;
      else if (arg == "--urgna2012") opts.algorithm = core::Algorithm::urgna2012;
      else if (arg == "--verbose") opts.log = &cerr;
      else if (arg.starts_with("--")) {
        cerr << "unknown flag: " << arg << endl << usage;
        return 2;
      } else operands.push_back(arg);
    }
    return run(command, std::move(opts), operands);
  } catch (core::JsonLdError& e) {
    cerr << "error: " << e.what() << endl;
    return 1;
  }
}
