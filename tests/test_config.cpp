#include "localderiv/io/config_manager.hpp"
#include "localderiv/io/yaml_parser.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <string>

using namespace localderiv;

namespace {

const std::string valid_document = R"(
image:
  dimensions: [80, 13, 40]
field:
  type: separable
  profiles: [reciprocal, constant, linear]
  constant: 100
region:
  min: [50, 6, 20]
  max: [70, 6, 30]
runs:
  - operator: gradient
    kind: central
    order: 4
    tolerance: 1.0e-6
  - operator: gradient
    kind: Backward
    tolerance: 1.0e-2
  - operator: hessian
    order: 4
    tolerance: 1.0e-6
output:
  directory: out
  case_name: smooth
  formats: [csv, h5, hdf5]
verbose: true
)";

auto parse(const std::string& document) -> std::expected<io::Configuration, core::ConfigurationError> {
  io::YamlParser parser("<inline>");
  if (auto loaded = parser.load_string(document); !loaded) {
    return std::unexpected(core::ConfigurationError(loaded.error().message()));
  }
  return parser.parse();
}

// Replaces the first occurrence of `from` in the valid document.
auto variant(const std::string& from, const std::string& to) -> std::string {
  auto document = valid_document;
  const auto at = document.find(from);
  if (at != std::string::npos) {
    document.replace(at, from.size(), to);
  }
  return document;
}

void expect_rejected(const std::string& document, const std::string& fragment, const std::string& what,
                     int& failures) {
  auto config = parse(document);
  test::expect(!config, what + " should be rejected", failures);
  if (!config) {
    test::expect(config.error().message().find(fragment) != std::string::npos,
                 what + ": unexpected message: " + config.error().message(), failures);
  }
}

} // namespace

int main() {
  int failures = 0;

  try {
    auto config = parse(valid_document);
    if (!config) {
      std::cerr << config.error().full_message() << "\n";
      return 1;
    }

    test::expect(config->image.dimensions == std::vector<core::Index>{80, 13, 40}, "image dimensions", failures);
    test::expect(config->field.type == io::FieldConfig::Type::Separable && config->field.profiles.size() == 3 &&
                     config->field.profiles[0] == fields::Profile::Type::Reciprocal && config->field.constant == 100.0,
                 "separable field", failures);
    test::expect(config->region.min == std::vector<core::Index>{50, 6, 20}, "region min", failures);
    test::expect(config->runs.size() == 3, "three runs", failures);
    test::expect(config->runs[0].op == io::RunConfig::Operator::Gradient && config->runs[0].order == 4 &&
                     config->runs[0].tolerance == 1.0e-6,
                 "first run", failures);
    test::expect(config->runs[1].kind == stencil::DifferenceKind::Backward && config->runs[1].order == 2,
                 "kind names are case-insensitive and order defaults to 2", failures);
    test::expect(config->runs[2].op == io::RunConfig::Operator::Hessian &&
                     config->runs[2].kind == stencil::DifferenceKind::Central,
                 "hessian run defaults to central", failures);
    test::expect(config->output.directory == "out" && config->output.case_name == "smooth", "output names",
                 failures);
    test::expect(config->output.formats.size() == 2, "duplicate format aliases collapse", failures);
    test::expect(config->verbose, "verbose flag", failures);

    // Output section is optional.
    const auto without_output = valid_document.substr(0, valid_document.find("output:"));
    auto defaults = parse(without_output);
    test::expect(defaults.has_value() && defaults->output.case_name == constants::defaults::case_name &&
                     defaults->output.formats == std::vector{io::OutputConfig::Format::CSV},
                 "output defaults", failures);

    auto quadratic = parse(variant("  type: separable\n  profiles: [reciprocal, constant, linear]\n  constant: 100\n",
                                   "  type: quadratic_form\n  theta: 0.5\n  sigma: [2.0, 1.0]\n  center: [60, 6]\n"));
    test::expect(quadratic.has_value() && quadratic->field.type == io::FieldConfig::Type::QuadraticForm &&
                     quadratic->field.sigma[0] == 2.0 && quadratic->field.theta == 0.5,
                 "quadratic form field", failures);

    expect_rejected(variant("  - operator: gradient\n    kind: central\n    order: 4",
                            "  - operator: gradient\n    kind: central\n    order: 3"),
                    "Supported orders: 2, 4, 6, 8", "central order 3", failures);
    expect_rejected(variant("  - operator: hessian\n    order: 4", "  - operator: hessian\n    order: 6"),
                    "Supported orders: 2, 4", "hessian order 6", failures);
    expect_rejected(variant("  - operator: hessian\n", "  - operator: hessian\n    kind: forward\n"),
                    "central differences only", "forward hessian", failures);
    expect_rejected(variant("kind: central", "kind: sideways"), "Valid options: backward, central, forward",
                    "unknown kind", failures);
    // Bytes above 0x7f go through the case folding untouched and match no option.
    expect_rejected(variant("kind: central", "kind: C\xC3\x89NTRAL"), "Valid options: backward, central, forward",
                    "non-ASCII kind", failures);
    expect_rejected(variant("tolerance: 1.0e-6", "tolerance: 0"), "must be > 0", "zero tolerance", failures);
    expect_rejected(variant("[reciprocal, constant, linear]", "[reciprocal, linear]"), "one per axis",
                    "profile count", failures);
    expect_rejected(variant("max: [70, 6, 30]", "max: [70, 5, 30]"), "min > max", "inverted region", failures);
    expect_rejected(variant("dimensions: [80, 13, 40]", "dimensions: [72, 13, 40]"), "exceeds the image",
                    "padding past the image", failures);
    expect_rejected(variant("dimensions: [80, 13, 40]", "dimensions: [80, 0, 40]"), "sizes must be > 0",
                    "zero-size axis", failures);
    expect_rejected(variant("region:", "area:"), "Missing required 'region' section", "missing region", failures);
    expect_rejected(variant("formats: [csv, h5, hdf5]", "formats: [vtk]"), "Valid options", "unknown format",
                    failures);

    io::YamlParser broken("<inline>");
    test::expect(!broken.load_string("image: [unclosed"), "malformed YAML rejected", failures);

    // Files on disk go through the configuration manager.
    io::ConfigurationManager manager;
    test::expect(!manager.load("does/not/exist.yaml"), "missing file rejected", failures);

    const std::filesystem::path sample = std::filesystem::path(LOCALDERIV_CONFIG_DIR) / "default.yaml";
    auto from_file = manager.load(sample.string());
    test::expect(from_file.has_value(), from_file ? "" : from_file.error().message(), failures);
    test::expect(manager.config_file_path() == std::filesystem::absolute(sample), "resolved config path", failures);

    // Bare file names fall back to the search directories.
    io::ConfigurationManager searching(std::vector<std::filesystem::path>{LOCALDERIV_CONFIG_DIR});
    auto by_name = searching.load("quadratic_form.yaml", io::ConfigOverrides{"renamed"});
    test::expect(by_name.has_value() && by_name->output.case_name == "renamed", "found in a search directory",
                 failures);
    test::expect(searching.config_file_path() ==
                     std::filesystem::absolute(std::filesystem::path(LOCALDERIV_CONFIG_DIR) / "quadratic_form.yaml"),
                 "search directory path", failures);

    auto missing = searching.load("absent.yaml");
    test::expect(!missing && missing.error().message().find(LOCALDERIV_CONFIG_DIR) != std::string::npos,
                 "searched directories are reported", failures);

    for (const std::string bad : {"", "..", "a/b", "a\\b"}) {
      auto rejected = searching.load("default.yaml", io::ConfigOverrides{bad});
      test::expect(!rejected && rejected.error().message().find("case_name") != std::string::npos,
                   "case name '" + bad + "' rejected", failures);
    }

  } catch (const core::LocalDerivException& e) {
    std::cerr << "Unexpected exception: " << e.full_message() << "\n";
    return 1;
  }

  if (failures > 0) {
    std::cerr << failures << " config check(s) failed\n";
    return 1;
  }
  std::cout << "config OK\n";
  return 0;
}
